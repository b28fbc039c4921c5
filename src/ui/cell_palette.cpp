#include "obd_dash/ui/cell_palette.h"

#include "obd_dash/config/sensor_thresholds.h"

namespace obd_dash {
namespace ui {

using gfx::Color565;
namespace color = gfx::color;

Color565 oilDsgBackground(float temp_c) {
  if (temp_c >= config::kOilDsgCritical) {
    return color::kRed;
  }
  if (temp_c >= config::kOilDsgHigh) {
    return color::kOrange;
  }
  if (temp_c >= config::kOilDsgElevated) {
    return color::kYellow;
  }
  return color::kBlack;
}

Color565 coolantBackground(float temp_c) {
  if (temp_c > config::kCoolantCritical) {
    return color::kRed;
  }
  if (temp_c >= config::kCoolantColdMax) {
    return color::kGreen;
  }
  return color::kOrange;
}

Color565 iatBackground(float temp_c) {
  if (temp_c >= config::kIatCritical) {
    return color::kRed;
  }
  if (temp_c >= config::kIatHot) {
    return color::kOrange;
  }
  if (temp_c >= config::kIatWarm) {
    return color::kYellow;
  }
  if (temp_c >= config::kIatCold) {
    return color::kGreen;
  }
  return color::kBlue;
}

Color565 egtBackground(float temp_c) {
  if (temp_c >= config::kEgtCritical) {
    return color::kRed;
  }
  if (temp_c >= config::kEgtHighLoad) {
    return color::kOrange;
  }
  if (temp_c >= config::kEgtSpirited) {
    return color::kYellow;
  }
  if (temp_c >= config::kEgtColdMax) {
    return color::kGreen;
  }
  return color::kBlue;
}

Color565 batteryBackground(float volts) {
  if (volts < config::kBattCritical) {
    return color::kRed;
  }
  if (volts < config::kBattWarning) {
    return color::kOrange;
  }
  return color::kBlack;
}

Color565 afrBackground(float afr) {
  if (afr < config::kAfrRichAf) {
    return color::kBlue;
  }
  if (afr < config::kAfrRich) {
    return color::kDarkTeal;
  }
  if (afr < config::kAfrOptimalMax) {
    return color::kGreen;
  }
  if (afr <= config::kAfrLeanCritical) {
    return color::kOrange;
  }
  return color::kRed;
}

const char* afrStatus(float afr) {
  if (afr < config::kAfrRichAf) {
    return "RICH AF";
  }
  if (afr < config::kAfrRich) {
    return "RICH";
  }
  if (afr < config::kAfrOptimalMax) {
    return "OPTIMAL";
  }
  if (afr <= config::kAfrLeanCritical) {
    return "LEAN";
  }
  return "LEAN AF";
}

Color565 cellBackground(sensors::SensorId id, float value) {
  switch (id) {
    case sensors::SensorId::kBoost:
      return color::kBlack;
    case sensors::SensorId::kAfr:
      return afrBackground(value);
    case sensors::SensorId::kBattery:
      return batteryBackground(value);
    case sensors::SensorId::kCoolant:
      return coolantBackground(value);
    case sensors::SensorId::kOil:
    case sensors::SensorId::kDsg:
      return oilDsgBackground(value);
    case sensors::SensorId::kIat:
      return iatBackground(value);
    case sensors::SensorId::kEgt:
      return egtBackground(value);
    case sensors::SensorId::kCount:
      break;
  }
  return color::kBlack;
}

bool isCritical(sensors::SensorId id, float value) {
  switch (id) {
    case sensors::SensorId::kBoost:
      return false;
    case sensors::SensorId::kAfr:
      return value > config::kAfrLeanCritical;
    case sensors::SensorId::kBattery:
      return value < config::kBattCritical;
    case sensors::SensorId::kCoolant:
      return value > config::kCoolantCritical;
    case sensors::SensorId::kOil:
    case sensors::SensorId::kDsg:
      return value >= config::kOilDsgCritical;
    case sensors::SensorId::kIat:
      return value >= config::kIatCritical || value <= config::kIatExtremeCold;
    case sensors::SensorId::kEgt:
      return value >= config::kEgtCritical;
    case sensors::SensorId::kCount:
      break;
  }
  return false;
}

bool isOilLow(float temp_c) {
  return temp_c < config::kOilLowTemp;
}

bool isEgtDanger(float temp_c) {
  return temp_c >= config::kEgtDangerManifold;
}

bool isBoostEasterEgg(float boost_bar, bool show_psi) {
  if (show_psi) {
    return boost_bar * config::kBarToPsi >= config::kBoostEasterEggPsi;
  }
  return boost_bar >= config::kBoostEasterEggBar;
}

}  // namespace ui
}  // namespace obd_dash
