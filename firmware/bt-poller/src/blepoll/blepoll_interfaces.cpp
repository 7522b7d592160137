/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#include "blepoll_bt_gattc.hpp"
#include "blepoll_timers.hpp"

namespace blepoll {

Scheduler::~Scheduler() {}

namespace bt::gattc {

Connection::~Connection() {}

Client::~Client() {}

}  // namespace bt::gattc

}  // namespace blepoll
