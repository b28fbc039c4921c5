// sensor_thresholds.h - color bucket thresholds per sensor.
//
// Buckets use an inclusive lower bound unless stated. Every chain is checked
// for strict ordering at compile time.
#pragma once

namespace obd_dash {
namespace config {

// Oil and DSG share one chain. Below kOilDsgElevated the cell is black.
constexpr float kOilDsgElevated = 90.0f;
constexpr float kOilDsgHigh = 100.0f;
constexpr float kOilDsgCritical = 110.0f;
static_assert(kOilDsgElevated < kOilDsgHigh, "oil/dsg: elevated must be below high");
static_assert(kOilDsgHigh < kOilDsgCritical, "oil/dsg: high must be below critical");

// Oil below this shows the LOW badge.
constexpr float kOilLowTemp = 75.0f;
static_assert(kOilLowTemp < kOilDsgElevated, "oil low badge overlaps elevated bucket");

// Coolant: cold below kCoolantColdMax, critical strictly above kCoolantCritical.
constexpr float kCoolantColdMax = 75.0f;
constexpr float kCoolantCritical = 90.0f;
static_assert(kCoolantColdMax < kCoolantCritical, "coolant: cold max must be below critical");

// Intake air.
constexpr float kIatExtremeCold = -20.0f;
constexpr float kIatCold = 0.0f;
constexpr float kIatWarm = 25.0f;
constexpr float kIatHot = 45.0f;
constexpr float kIatCritical = 60.0f;
static_assert(kIatExtremeCold < kIatCold, "iat: extreme cold must be below cold");
static_assert(kIatCold < kIatWarm, "iat: cold must be below warm");
static_assert(kIatWarm < kIatHot, "iat: warm must be below hot");
static_assert(kIatHot < kIatCritical, "iat: hot must be below critical");

// Exhaust gas.
constexpr float kEgtColdMax = 300.0f;
constexpr float kEgtSpirited = 500.0f;
constexpr float kEgtHighLoad = 700.0f;
constexpr float kEgtCritical = 850.0f;
constexpr float kEgtDangerManifold = 1100.0f;
static_assert(kEgtColdMax < kEgtSpirited, "egt: cold max must be below spirited");
static_assert(kEgtSpirited < kEgtHighLoad, "egt: spirited must be below high load");
static_assert(kEgtHighLoad < kEgtCritical, "egt: high load must be below critical");
static_assert(kEgtCritical < kEgtDangerManifold, "egt: critical must be below manifold danger");

// Battery: critical strictly below kBattCritical.
constexpr float kBattCritical = 12.0f;
constexpr float kBattWarning = 12.5f;
static_assert(kBattCritical < kBattWarning, "battery: critical must be below warning");

// AFR: lean critical strictly above kAfrLeanCritical.
constexpr float kAfrRichAf = 12.0f;
constexpr float kAfrRich = 14.0f;
constexpr float kAfrOptimalMax = 14.9f;
constexpr float kAfrLeanCritical = 15.5f;
constexpr float kAfrStoich = 14.7f;
static_assert(kAfrRichAf < kAfrRich, "afr: rich af must be below rich");
static_assert(kAfrRich < kAfrOptimalMax, "afr: rich must be below optimal max");
static_assert(kAfrOptimalMax < kAfrLeanCritical, "afr: optimal max must be below lean critical");
static_assert(kAfrRich < kAfrStoich && kAfrStoich < kAfrOptimalMax, "afr: stoich outside optimal band");

// Boost.
constexpr float kBoostEasterEggBar = 1.95f;
constexpr float kBoostEasterEggPsi = 29.0f;
constexpr float kBarToPsi = 14.5038f;

// Temperatures at or above this use the medium value font.
constexpr float kTempLargeValue = 999.5f;

}  // namespace config
}  // namespace obd_dash
