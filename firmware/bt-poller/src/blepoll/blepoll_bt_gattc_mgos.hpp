/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#pragma once

#include <map>
#include <memory>
#include <vector>

#include "blepoll_bt_gattc.hpp"

namespace blepoll::bt::gattc {

// Client over the mgos_bt_gattc API.
// Connect() completes after service discovery, so characteristics can be
// addressed by UUID for the lifetime of the connection.
// A Connect() to an address the stack is still connecting to takes over
// that attempt; the previous callback fails with DEADLINE_EXCEEDED.
class MgosClient : public Client {
 public:
  MgosClient();
  virtual ~MgosClient();

  Status Connect(const Addr &addr, ConnectCB cb) override;

 private:
  class MgosConnection;
  struct PendingConnect {
    Addr addr;
    ConnectCB cb;
    bool connected = false;
    uint16_t conn_id = 0;
    std::map<UUID, uint16_t> handles;
  };

  static void GATTCEventHandler(int ev, void *ev_data, void *userdata);
  static void DropLink(uint16_t conn_id);
  void HandleEvent(int ev, void *ev_data);

  PendingConnect *FindPending(const Addr &addr);
  PendingConnect *FindPending(uint16_t conn_id);
  void FinishPending(PendingConnect *pc, const Status &st);

  std::vector<std::unique_ptr<PendingConnect>> pending_;
  std::map<uint16_t, MgosConnection *> conns_;
};

}  // namespace blepoll::bt::gattc
