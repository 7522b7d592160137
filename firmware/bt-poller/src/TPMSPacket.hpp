#pragma once

#include <cstdint>
#include <string>

#include "TPMSSensorID.hpp"

namespace tpms {

static constexpr uint8_t kTagData = 0x00;
static constexpr uint8_t kTagHeadUnit = 0x01;
static constexpr uint8_t kTagConfig = 0x02;
static constexpr uint8_t kTagStatus = 0x04;

// One notification from the head unit.
//
// Layout (offsets in bytes):
//  0     tag
//  1..4  sensor id
//  7     data: temperature, config: min pressure alert
//  9     data: pressure, config: max pressure alert
//  11    config: max temperature alert (optional)
//  13    config: max temperature change alert (optional)
struct TPMSPacket {
  enum class ParseErrors {
    kTooShort = -301,
    kNonSensorTag = -302,
    kUnknownTag = -303,
  };

  enum class Type {
    kData,
    kConfig,
  };

  struct Thresholds {
    uint8_t min_pressure = 0;
    uint8_t max_pressure = 0;
    bool has_max_temperature = false;
    uint8_t max_temperature = 0;
    bool has_max_temp_change = false;
    uint8_t max_temp_change = 0;
  };

  static constexpr size_t kMinLen = 10;

  Type type = Type::kData;
  SensorID sensor_id;
  // Raw device units, kData only.
  uint8_t temperature = 0;
  uint8_t pressure = 0;
  // kConfig only.
  Thresholds thresholds;

  // Never reads past the end of raw.
  static StatusOr<TPMSPacket> Parse(Str raw);

  std::string ToString() const;
};

}  // namespace tpms
