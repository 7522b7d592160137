#pragma once

#include <string>
#include <vector>

#include "DeviceProfile.hpp"
#include "TPMSSensorID.hpp"
#include "TireRotation.hpp"

#include "blepoll_bt_addr.hpp"

namespace tpms {

// List of polled devices, stored as JSON:
//
// {"devices": [
//   {"id": "trailer", "addr": "aa:bb:cc:dd:ee:ff", "family": "tirelinc",
//    "moving": false, "expected_data": 4, "expected_config": 4,
//    "sensors": {"tire_1": "0E-B3-0B-02", ...},
//    "names": {"tire_1": "Front Left", ...}}
// ]}
class DeviceConfig {
 public:
  struct Device {
    std::string id;
    blepoll::bt::Addr addr;
    const DeviceProfile *profile = nullptr;
    bool moving = false;
    // Profile defaults if < 0.
    int expected_data = -1;
    int expected_config = -1;
    PositionMap sensors;
    TireNames names;

    int GetExpectedData() const;
    int GetExpectedConfig() const;

    std::string ToJSON() const;
  };

  DeviceConfig() = default;

  static StatusOr<DeviceConfig> Parse(Str json);
  // Returns NOT_FOUND if the file does not exist.
  static StatusOr<DeviceConfig> Load(const std::string &path);

  std::string ToJSON() const;
  Status Save(const std::string &path) const;

  Device *Find(Str id);
  const Device *Find(Str id) const;

  std::vector<Device> devices;

 private:
  static StatusOr<Device> ParseDevice(Str json);
};

}  // namespace tpms
