/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#pragma once

#include "mgos_bt.h"
#include "blepoll_str.hpp"

namespace blepoll::bt {

#define blepoll_bt_uuid mgos_bt_uuid

struct UUID : public blepoll_bt_uuid {
  UUID();
  explicit UUID(uint16_t u16);
  UUID(const blepoll_bt_uuid &other);
  UUID(const char uuid_str[]) : UUID(Str(uuid_str)) {}
  UUID(Str uuid_str);  // 16-bit hex or canonical 128-bit form.

  std::string ToString() const;

  friend bool operator<(const UUID &a, const UUID &b) {
    return (mgos_bt_uuid_cmp(&a, &b) < 0);
  }
  friend bool operator==(const UUID &a, const UUID &b) {
    return (mgos_bt_uuid_cmp(&a, &b) == 0);
  }
  friend bool operator!=(const UUID &a, const UUID &b) {
    return (mgos_bt_uuid_cmp(&a, &b) != 0);
  }
};

static_assert(sizeof(UUID) == sizeof(struct blepoll_bt_uuid),
              "Unexpected size of UUID");

}  // namespace blepoll::bt
