#include "DeviceProfile.hpp"

namespace tpms {

static const DeviceProfile *MakeTireLinc() {
  static DeviceProfile p;
  p.family = Family::kTireLinc;
  p.name = "tirelinc";
  p.adv_name_prefix = "TireLinc";
  p.notify_chr = blepoll::bt::UUID("00000002-00b7-4807-beee-e0b0879cf3dd");
  p.has_trigger = true;
  p.write_chr = blepoll::bt::UUID("00000001-00b7-4807-beee-e0b0879cf3dd");
  p.trigger_cmd = 0x01;
  p.trigger_delay_ms = 500;
  p.subscribe_failure_fatal = false;
  p.deadline_ms = 5000;
  p.connect_timeout_ms = 10000;
  p.connect_attempts = 3;
  p.connect_retry_delay_ms = 1000;
  p.expected_data = 4;
  p.expected_config = 4;
  return &p;
}

static const DeviceProfile *MakeMedisanaBP() {
  static DeviceProfile p;
  p.family = Family::kMedisanaBP;
  p.name = "medisanabp";
  p.adv_name_prefix = "Medisana";
  // Blood Pressure Measurement.
  p.notify_chr = blepoll::bt::UUID(static_cast<uint16_t>(0x2A35));
  p.has_trigger = false;
  p.trigger_cmd = 0;
  p.trigger_delay_ms = 0;
  p.subscribe_failure_fatal = true;
  p.deadline_ms = 15000;
  p.connect_timeout_ms = 10000;
  p.connect_attempts = 3;
  p.connect_retry_delay_ms = 1000;
  p.expected_data = 1;
  p.expected_config = 0;
  return &p;
}

// static
const std::vector<const DeviceProfile *> &DeviceProfile::All() {
  static const std::vector<const DeviceProfile *> s_profiles = {
      MakeTireLinc(),
      MakeMedisanaBP(),
  };
  return s_profiles;
}

// static
const DeviceProfile &DeviceProfile::Get(Family family) {
  for (const DeviceProfile *p : All()) {
    if (p->family == family) return *p;
  }
  return *All().front();
}

// static
StatusOr<const DeviceProfile *> DeviceProfile::Find(Str name) {
  for (const DeviceProfile *p : All()) {
    if (name.CaseCmp(p->name) == 0) return p;
  }
  return Errorf(STATUS_INVALID_ARGUMENT, "unknown family '%.*s'",
                BLEPOLLSTRF(name));
}

// static
StatusOr<const DeviceProfile *> DeviceProfile::FindByAdvName(Str adv_name) {
  for (const DeviceProfile *p : All()) {
    if (adv_name.StartsWith(p->adv_name_prefix)) return p;
  }
  return Status::NOT_FOUND();
}

}  // namespace tpms
