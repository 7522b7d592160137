/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#include "blepoll_bt_gattc_mgos.hpp"

#include <algorithm>

#include "common/cs_dbg.h"
#include "mgos_bt_gattc.h"
#include "mgos_event.h"

namespace blepoll::bt::gattc {

// Client Characteristic Configuration descriptor follows the value handle.
static constexpr uint16_t kCCCDOffset = 1;

class MgosClient::MgosConnection : public Connection {
 public:
  MgosConnection(MgosClient *client, const Addr &addr, uint16_t conn_id,
                 std::map<UUID, uint16_t> handles)
      : client_(client), addr_(addr), conn_id_(conn_id),
        handles_(std::move(handles)) {
    client_->conns_[conn_id_] = this;
  }

  virtual ~MgosConnection() {
    auto it = client_->conns_.find(conn_id_);
    if (it != client_->conns_.end() && it->second == this) {
      client_->conns_.erase(it);
    }
  }

  const Addr &addr() const override {
    return addr_;
  }

  Status Subscribe(const UUID &chr, NotifyCB cb) override {
    auto hs = GetHandle(chr);
    if (!hs.ok()) return hs.status();
    const uint16_t handle = hs.ValueOrDie();
    if (!mgos_bt_gattc_subscribe(conn_id_, handle)) {
      return Errorf(STATUS_UNAVAILABLE, "%s: subscribe to %s failed",
                    addr_.ToString().c_str(), chr.ToString().c_str());
    }
    subs_[handle] = cb;
    return Status::OK();
  }

  Status Unsubscribe(const UUID &chr) override {
    auto hs = GetHandle(chr);
    if (!hs.ok()) return hs.status();
    const uint16_t handle = hs.ValueOrDie();
    subs_.erase(handle);
    const uint8_t disable[2] = {0, 0};
    if (!mgos_bt_gattc_write(conn_id_, handle + kCCCDOffset,
                             mg_mk_str_n((const char *) disable, 2), true)) {
      return Errorf(STATUS_UNAVAILABLE, "%s: unsubscribe from %s failed",
                    addr_.ToString().c_str(), chr.ToString().c_str());
    }
    return Status::OK();
  }

  Status Write(const UUID &chr, Str data, bool resp_required) override {
    auto hs = GetHandle(chr);
    if (!hs.ok()) return hs.status();
    if (!mgos_bt_gattc_write(conn_id_, hs.ValueOrDie(), data,
                             resp_required)) {
      return Errorf(STATUS_UNAVAILABLE, "%s: write to %s failed",
                    addr_.ToString().c_str(), chr.ToString().c_str());
    }
    return Status::OK();
  }

  Status Disconnect() override {
    if (!connected_) return Status::OK();
    connected_ = false;
    subs_.clear();
    if (!mgos_bt_gattc_disconnect(conn_id_)) {
      return Errorf(STATUS_UNAVAILABLE, "%s: disconnect failed",
                    addr_.ToString().c_str());
    }
    return Status::OK();
  }

  void OnNotify(uint16_t handle, Str data) {
    auto it = subs_.find(handle);
    if (it == subs_.end()) return;
    // Copy, the callback may unsubscribe.
    NotifyCB cb = it->second;
    cb(data);
  }

  void OnDisconnect() {
    LOG(LL_DEBUG, ("%s: link closed", addr_.ToString().c_str()));
    connected_ = false;
    subs_.clear();
  }

 private:
  StatusOr<uint16_t> GetHandle(const UUID &chr) const {
    if (!connected_) {
      return Errorf(STATUS_UNAVAILABLE, "%s: not connected",
                    addr_.ToString().c_str());
    }
    auto it = handles_.find(chr);
    if (it == handles_.end()) {
      return Errorf(STATUS_NOT_FOUND, "%s: no characteristic %s",
                    addr_.ToString().c_str(), chr.ToString().c_str());
    }
    return it->second;
  }

  MgosClient *const client_;
  const Addr addr_;
  const uint16_t conn_id_;
  const std::map<UUID, uint16_t> handles_;
  bool connected_ = true;
  std::map<uint16_t, NotifyCB> subs_;
};

MgosClient::MgosClient() {
  if (!mgos_event_add_group_handler(MGOS_BT_GATTC_EV_BASE, GATTCEventHandler,
                                    this)) {
    LOG(LL_ERROR, ("Failed to add GATTC event handler"));
  }
}

MgosClient::~MgosClient() {
  if (!mgos_event_remove_group_handler(MGOS_BT_GATTC_EV_BASE,
                                       GATTCEventHandler, this)) {
    LOG(LL_ERROR, ("Failed to remove GATTC event handler"));
  }
}

Status MgosClient::Connect(const Addr &addr, ConnectCB cb) {
  PendingConnect *pc = FindPending(addr);
  if (pc != nullptr) {
    // The stack is still working on an earlier attempt, take it over.
    LOG(LL_DEBUG, ("%s: connect in progress, taking over",
                   addr.ToString().c_str()));
    ConnectCB prev_cb = std::move(pc->cb);
    pc->cb = cb;
    if (prev_cb) {
      prev_cb(Errorf(STATUS_DEADLINE_EXCEEDED, "%s: superseded",
                     addr.ToString().c_str()),
              nullptr);
    }
    return Status::OK();
  }
  if (!mgos_bt_gattc_connect(&addr)) {
    return Errorf(STATUS_UNAVAILABLE, "%s: connect failed",
                  addr.ToString().c_str());
  }
  std::unique_ptr<PendingConnect> npc(new PendingConnect());
  npc->addr = addr;
  npc->cb = cb;
  pending_.emplace_back(std::move(npc));
  return Status::OK();
}

MgosClient::PendingConnect *MgosClient::FindPending(const Addr &addr) {
  for (auto &pc : pending_) {
    if (pc->addr == addr) return pc.get();
  }
  return nullptr;
}

MgosClient::PendingConnect *MgosClient::FindPending(uint16_t conn_id) {
  for (auto &pc : pending_) {
    if (pc->connected && pc->conn_id == conn_id) return pc.get();
  }
  return nullptr;
}

void MgosClient::FinishPending(PendingConnect *pc, const Status &st) {
  std::unique_ptr<Connection> conn;
  if (st.ok()) {
    conn.reset(new MgosConnection(this, pc->addr, pc->conn_id,
                                  std::move(pc->handles)));
  }
  ConnectCB cb = std::move(pc->cb);
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [pc](const std::unique_ptr<PendingConnect> &p) {
                                  return p.get() == pc;
                                }),
                 pending_.end());
  cb(st, std::move(conn));
}

// static
void MgosClient::DropLink(uint16_t conn_id) {
  if (!mgos_bt_gattc_disconnect(conn_id)) {
    LOG(LL_WARN, ("%d: disconnect failed", conn_id));
  }
}

// static
void MgosClient::GATTCEventHandler(int ev, void *ev_data, void *userdata) {
  static_cast<MgosClient *>(userdata)->HandleEvent(ev, ev_data);
}

void MgosClient::HandleEvent(int ev, void *ev_data) {
  switch (ev) {
    case MGOS_BT_GATTC_EV_CONNECT: {
      auto *ca = static_cast<struct mgos_bt_gattc_connect_arg *>(ev_data);
      const Addr addr(&ca->conn.addr);
      PendingConnect *pc = FindPending(addr);
      if (pc == nullptr) break;
      if (!ca->ok) {
        FinishPending(pc, Errorf(STATUS_UNAVAILABLE, "%s: connect failed",
                                 addr.ToString().c_str()));
        break;
      }
      pc->connected = true;
      pc->conn_id = ca->conn.conn_id;
      LOG(LL_DEBUG, ("%s: connected, id %d, mtu %d", addr.ToString().c_str(),
                     ca->conn.conn_id, ca->conn.mtu));
      if (!mgos_bt_gattc_discover(pc->conn_id)) {
        DropLink(pc->conn_id);
        FinishPending(pc, Errorf(STATUS_UNAVAILABLE, "%s: discovery failed",
                                 addr.ToString().c_str()));
      }
      break;
    }
    case MGOS_BT_GATTC_EV_DISCOVERY_RESULT: {
      auto *dra =
          static_cast<struct mgos_bt_gattc_discovery_result_arg *>(ev_data);
      PendingConnect *pc = FindPending(dra->conn.conn_id);
      if (pc == nullptr) break;
      const UUID chr(dra->chr);
      LOG(LL_VERBOSE_DEBUG, ("%d: chr %s handle %d", dra->conn.conn_id,
                             chr.ToString().c_str(), dra->handle));
      pc->handles[chr] = dra->handle;
      break;
    }
    case MGOS_BT_GATTC_EV_DISCOVERY_DONE: {
      auto *dda =
          static_cast<struct mgos_bt_gattc_discovery_done_arg *>(ev_data);
      PendingConnect *pc = FindPending(dda->conn.conn_id);
      if (pc == nullptr) break;
      if (!dda->ok) {
        DropLink(pc->conn_id);
        FinishPending(pc, Errorf(STATUS_UNAVAILABLE, "%s: discovery failed",
                                 pc->addr.ToString().c_str()));
        break;
      }
      FinishPending(pc, Status::OK());
      break;
    }
    case MGOS_BT_GATTC_EV_NOTIFY: {
      auto *na = static_cast<struct mgos_bt_gattc_notify_arg *>(ev_data);
      auto it = conns_.find(na->conn.conn_id);
      if (it == conns_.end()) break;
      it->second->OnNotify(na->handle, Str(na->data));
      break;
    }
    case MGOS_BT_GATTC_EV_WRITE_RESULT: {
      auto *wa = static_cast<struct mgos_bt_gattc_write_result_arg *>(ev_data);
      if (!wa->ok) {
        LOG(LL_WARN, ("%d: write to handle %d failed", wa->conn.conn_id,
                      wa->handle));
      }
      break;
    }
    case MGOS_BT_GATTC_EV_DISCONNECT: {
      auto *da = static_cast<struct mgos_bt_gattc_disconnect_arg *>(ev_data);
      PendingConnect *pc = FindPending(da->conn.conn_id);
      if (pc != nullptr) {
        FinishPending(pc, Errorf(STATUS_UNAVAILABLE,
                                 "%s: disconnected during discovery",
                                 pc->addr.ToString().c_str()));
        break;
      }
      auto it = conns_.find(da->conn.conn_id);
      if (it != conns_.end()) {
        it->second->OnDisconnect();
      }
      break;
    }
  }
}

}  // namespace blepoll::bt::gattc
