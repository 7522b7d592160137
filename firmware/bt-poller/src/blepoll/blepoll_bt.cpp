/*
 * Copyright (c) 2021 Deomid "rojer" Ryabkov
 * All rights reserved
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "blepoll_bt_addr.hpp"
#include "blepoll_bt_uuid.hpp"

#include <cstring>

namespace blepoll::bt {

Addr::Addr() {
  std::memset(addr, 0, sizeof(addr));
  type = MGOS_BT_ADDR_TYPE_NONE;
}

Addr::Addr(const blepoll_bt_addr *other) {
  std::memcpy(addr, other->addr, sizeof(addr));
  type = other->type;
}

Addr::Addr(const blepoll_bt_addr &other) : Addr(&other) {}

Addr::Addr(Str addr_str) : Addr() {
  if (!mgos_bt_addr_from_str(addr_str, this)) {
    std::memset(addr, 0, sizeof(addr));
    type = MGOS_BT_ADDR_TYPE_NONE;
  }
}

Addr::Addr(const void *addrv, bool little_endian) {
  const uint8_t *ab = static_cast<const uint8_t *>(addrv);
  for (size_t i = 0; i < sizeof(addr); i++) {
    addr[i] = (little_endian ? ab[sizeof(addr) - 1 - i] : ab[i]);
  }
  type = MGOS_BT_ADDR_TYPE_NONE;
}

std::string Addr::ToString() const {
  char buf[MGOS_BT_ADDR_STR_LEN];
  return mgos_bt_addr_to_str(this, 0, buf);
}

UUID::UUID() {
  std::memset(uuid.uuid128, 0, sizeof(uuid.uuid128));
  len = 0;
}

UUID::UUID(uint16_t u16) : UUID() {
  uuid.uuid16 = u16;
  len = 2;
}

UUID::UUID(const blepoll_bt_uuid &other) {
  std::memcpy(uuid.uuid128, other.uuid.uuid128, sizeof(uuid.uuid128));
  len = other.len;
}

UUID::UUID(Str uuid_str) : UUID() {
  if (!mgos_bt_uuid_from_str(uuid_str, this)) {
    len = 0;
  }
}

std::string UUID::ToString() const {
  char buf[MGOS_BT_UUID_STR_LEN];
  return mgos_bt_uuid_to_str(this, buf);
}

}  // namespace blepoll::bt
