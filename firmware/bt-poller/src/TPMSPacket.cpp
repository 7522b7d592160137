#include "TPMSPacket.hpp"

namespace tpms {

static constexpr size_t kIDOffset = 1;
static constexpr size_t kTemperatureOffset = 7;
static constexpr size_t kPressureOffset = 9;
static constexpr size_t kMinPressureOffset = 7;
static constexpr size_t kMaxPressureOffset = 9;
static constexpr size_t kMaxTemperatureOffset = 11;
static constexpr size_t kMaxTempChangeOffset = 13;

// static
StatusOr<TPMSPacket> TPMSPacket::Parse(Str raw) {
  if (raw.len < kMinLen) {
    return Errorf((int) ParseErrors::kTooShort, "packet too short (%d)",
                  (int) raw.len);
  }
  TPMSPacket res;
  const uint8_t tag = raw[0];
  switch (tag) {
    case kTagData:
      res.type = Type::kData;
      res.temperature = raw[kTemperatureOffset];
      res.pressure = raw[kPressureOffset];
      break;
    case kTagConfig:
      res.type = Type::kConfig;
      res.thresholds.min_pressure = raw[kMinPressureOffset];
      res.thresholds.max_pressure = raw[kMaxPressureOffset];
      if (raw.len > kMaxTemperatureOffset) {
        res.thresholds.has_max_temperature = true;
        res.thresholds.max_temperature = raw[kMaxTemperatureOffset];
      }
      if (raw.len > kMaxTempChangeOffset) {
        res.thresholds.has_max_temp_change = true;
        res.thresholds.max_temp_change = raw[kMaxTempChangeOffset];
      }
      break;
    case kTagHeadUnit:
    case kTagStatus:
      return Errorf((int) ParseErrors::kNonSensorTag,
                    "not a sensor packet (0x%02x)", tag);
    default:
      return Errorf((int) ParseErrors::kUnknownTag, "unknown tag 0x%02x", tag);
  }
  res.sensor_id = SensorID(raw.up() + kIDOffset);
  return res;
}

std::string TPMSPacket::ToString() const {
  if (type == Type::kData) {
    return blepoll::SPrintf("{data %s T=%u P=%u}",
                            sensor_id.ToString().c_str(), temperature,
                            pressure);
  }
  std::string mt = "-", mtc = "-";
  if (thresholds.has_max_temperature) {
    mt = blepoll::SPrintf("%u", thresholds.max_temperature);
  }
  if (thresholds.has_max_temp_change) {
    mtc = blepoll::SPrintf("%u", thresholds.max_temp_change);
  }
  return blepoll::SPrintf("{config %s Pmin=%u Pmax=%u Tmax=%s dTmax=%s}",
                          sensor_id.ToString().c_str(),
                          thresholds.min_pressure, thresholds.max_pressure,
                          mt.c_str(), mtc.c_str());
}

}  // namespace tpms
