/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#pragma once

#include "mgos_bt.h"
#include "blepoll_str.hpp"

namespace blepoll::bt {

#define blepoll_bt_addr mgos_bt_addr

struct Addr : public blepoll_bt_addr {
  Addr();
  Addr(const blepoll_bt_addr *other);
  Addr(const blepoll_bt_addr &other);
  Addr(const void *addr, bool little_endian);
  Addr(Str addr_str);  // "aa:bb:cc:dd:ee:ff", zero if invalid.

  bool IsZero() const { return mgos_bt_addr_is_zero(this); }
  bool IsValid() const { return !IsZero(); }
  // Lower case, colon separated.
  std::string ToString() const;

  friend bool operator<(const Addr &a, const Addr &b) {
    return (mgos_bt_addr_cmp(&a, &b) < 0);
  }
  friend bool operator==(const Addr &a, const Addr &b) {
    return (mgos_bt_addr_cmp(&a, &b) == 0);
  }
  friend bool operator!=(const Addr &a, const Addr &b) {
    return (mgos_bt_addr_cmp(&a, &b) != 0);
  }
};

static_assert(sizeof(Addr) == sizeof(struct blepoll_bt_addr),
              "Unexpected size of Addr");

}  // namespace blepoll::bt
