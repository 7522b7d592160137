#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "blepoll_bt_uuid.hpp"
#include "blepoll_str.hpp"

namespace tpms {

using blepoll::Errorf;
using blepoll::Status;
using blepoll::StatusOr;
using blepoll::Str;

enum class Family {
  kTireLinc = 0,
  kMedisanaBP = 1,
};

// Per-family parameters of a poll.
struct DeviceProfile {
  Family family;
  const char *name;
  const char *adv_name_prefix;

  blepoll::bt::UUID notify_chr;
  bool has_trigger;
  blepoll::bt::UUID write_chr;
  uint8_t trigger_cmd;
  int trigger_delay_ms;

  // If false, the session proceeds without waiting.
  bool subscribe_failure_fatal;

  int deadline_ms;
  int connect_timeout_ms;
  int connect_attempts;
  int connect_retry_delay_ms;

  int expected_data;
  int expected_config;

  static const DeviceProfile &Get(Family family);
  // Case-insensitive family name, "tirelinc" or "medisanabp".
  static StatusOr<const DeviceProfile *> Find(Str name);
  // Matches the name a device advertises.
  static StatusOr<const DeviceProfile *> FindByAdvName(Str adv_name);

  static const std::vector<const DeviceProfile *> &All();
};

}  // namespace tpms
