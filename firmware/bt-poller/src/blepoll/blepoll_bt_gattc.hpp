/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#pragma once

#include <functional>
#include <memory>

#include "blepoll_bt_addr.hpp"
#include "blepoll_bt_uuid.hpp"
#include "blepoll_str.hpp"

namespace blepoll::bt::gattc {

// An open GATT client connection to a peripheral.
// Destroying the object does not close the link, Disconnect() must be called.
class Connection {
 public:
  typedef std::function<void(Str data)> NotifyCB;

  virtual ~Connection();

  virtual const Addr &addr() const = 0;

  // Enables notifications on the characteristic, cb is invoked for each.
  virtual Status Subscribe(const UUID &chr, NotifyCB cb) = 0;
  virtual Status Unsubscribe(const UUID &chr) = 0;

  virtual Status Write(const UUID &chr, Str data, bool resp_required) = 0;

  virtual Status Disconnect() = 0;
};

class Client {
 public:
  // Invoked exactly once per accepted Connect(). conn is null on failure.
  typedef std::function<void(const Status &st,
                             std::unique_ptr<Connection> conn)>
      ConnectCB;

  virtual ~Client();

  virtual Status Connect(const Addr &addr, ConnectCB cb) = 0;
};

}  // namespace blepoll::bt::gattc
