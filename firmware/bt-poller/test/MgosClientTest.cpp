#include "blepoll_bt_gattc_mgos.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mgos_bt_gattc.h"
#include "mgos_event.h"

#include "TestUtil.hpp"

// The BT stack and the event bus, recorded for inspection.
namespace {

struct StackState {
  bool connect_ok = true;
  int num_connects = 0;
  std::vector<uint16_t> discovers;
  std::vector<uint16_t> subscribes;
  std::vector<uint16_t> disconnects;
  struct Write {
    uint16_t conn_id;
    uint16_t handle;
    std::string data;
  };
  std::vector<Write> writes;
  mgos_event_handler_t handler = nullptr;
  void *handler_arg = nullptr;
};

StackState s_stack;

}  // namespace

extern "C" {

bool mgos_bt_gattc_connect(const struct mgos_bt_addr *addr) {
  (void) addr;
  s_stack.num_connects++;
  return s_stack.connect_ok;
}

bool mgos_bt_gattc_discover(uint16_t conn_id) {
  s_stack.discovers.push_back(conn_id);
  return true;
}

bool mgos_bt_gattc_subscribe(uint16_t conn_id, uint16_t handle) {
  (void) conn_id;
  s_stack.subscribes.push_back(handle);
  return true;
}

bool mgos_bt_gattc_write(uint16_t conn_id, uint16_t handle,
                         struct mg_str data, bool resp_required) {
  (void) resp_required;
  s_stack.writes.push_back({conn_id, handle, std::string(data.p, data.len)});
  return true;
}

bool mgos_bt_gattc_disconnect(uint16_t conn_id) {
  s_stack.disconnects.push_back(conn_id);
  return true;
}

bool mgos_event_add_group_handler(int evgrp, mgos_event_handler_t cb,
                                  void *userdata) {
  (void) evgrp;
  s_stack.handler = cb;
  s_stack.handler_arg = userdata;
  return true;
}

bool mgos_event_remove_group_handler(int evgrp, mgos_event_handler_t cb,
                                     void *userdata) {
  (void) evgrp;
  (void) cb;
  (void) userdata;
  s_stack.handler = nullptr;
  s_stack.handler_arg = nullptr;
  return true;
}

}  // extern "C"

namespace blepoll::bt::gattc {
namespace {

using tpms::test::TestAddr;

static const uint16_t kConnID = 5;
static const uint16_t kValueHandle = 42;

class MgosClientTest : public ::testing::Test {
 protected:
  struct Result {
    Status st;
    std::unique_ptr<Connection> conn;
  };

  MgosClientTest() {
    s_stack = StackState();
    client_.reset(new MgosClient());
  }

  Client::ConnectCB Collect(std::vector<Result> *results) {
    return [results](const Status &st, std::unique_ptr<Connection> conn) {
      Result r;
      r.st = st;
      r.conn = std::move(conn);
      results->push_back(std::move(r));
    };
  }

  void Dispatch(int ev, void *ev_data) {
    ASSERT_NE(nullptr, s_stack.handler);
    s_stack.handler(ev, ev_data, s_stack.handler_arg);
  }

  static struct mgos_bt_gattc_conn Conn(uint16_t conn_id = kConnID) {
    struct mgos_bt_gattc_conn c = {};
    c.addr = TestAddr();
    c.conn_id = conn_id;
    c.mtu = 23;
    return c;
  }

  void LinkUp(bool ok = true) {
    struct mgos_bt_gattc_connect_arg arg = {};
    arg.conn = Conn();
    arg.ok = ok;
    Dispatch(MGOS_BT_GATTC_EV_CONNECT, &arg);
  }

  void Discovered(const UUID &chr, uint16_t handle) {
    struct mgos_bt_gattc_discovery_result_arg arg = {};
    arg.conn = Conn();
    arg.chr = chr;
    arg.handle = handle;
    Dispatch(MGOS_BT_GATTC_EV_DISCOVERY_RESULT, &arg);
  }

  void DiscoveryDone(bool ok = true) {
    struct mgos_bt_gattc_discovery_done_arg arg = {};
    arg.conn = Conn();
    arg.ok = ok;
    Dispatch(MGOS_BT_GATTC_EV_DISCOVERY_DONE, &arg);
  }

  void LinkDown() {
    struct mgos_bt_gattc_disconnect_arg arg = {};
    arg.conn = Conn();
    Dispatch(MGOS_BT_GATTC_EV_DISCONNECT, &arg);
  }

  void Notify(uint16_t conn_id, uint16_t handle, const std::string &data) {
    struct mgos_bt_gattc_notify_arg arg = {};
    arg.conn = Conn(conn_id);
    arg.handle = handle;
    arg.data = mg_mk_str_n(data.data(), data.size());
    Dispatch(MGOS_BT_GATTC_EV_NOTIFY, &arg);
  }

  // Brings up a connection with one characteristic.
  std::unique_ptr<Connection> Establish() {
    std::vector<Result> results;
    EXPECT_TRUE(client_->Connect(TestAddr(), Collect(&results)).ok());
    LinkUp();
    Discovered(UUID(static_cast<uint16_t>(0x2A35)), kValueHandle);
    DiscoveryDone();
    EXPECT_EQ(1u, results.size());
    if (results.empty()) return nullptr;
    EXPECT_TRUE(results[0].st.ok()) << results[0].st.ToString();
    return std::move(results[0].conn);
  }

  std::unique_ptr<MgosClient> client_;
};

TEST_F(MgosClientTest, ConnectsAfterDiscovery) {
  std::vector<Result> results;
  ASSERT_TRUE(client_->Connect(TestAddr(), Collect(&results)).ok());
  EXPECT_EQ(1, s_stack.num_connects);
  LinkUp();
  ASSERT_EQ(1u, s_stack.discovers.size());
  EXPECT_EQ(kConnID, s_stack.discovers[0]);
  Discovered(UUID(static_cast<uint16_t>(0x2A35)), kValueHandle);
  EXPECT_TRUE(results.empty());
  DiscoveryDone();
  ASSERT_EQ(1u, results.size());
  EXPECT_TRUE(results[0].st.ok());
  ASSERT_NE(nullptr, results[0].conn);
  EXPECT_EQ(TestAddr(), results[0].conn->addr());
}

TEST_F(MgosClientTest, RetryTakesOverPendingConnect) {
  std::vector<Result> first, second;
  ASSERT_TRUE(client_->Connect(TestAddr(), Collect(&first)).ok());
  // The caller gave up on the first attempt and tries again.
  ASSERT_TRUE(client_->Connect(TestAddr(), Collect(&second)).ok());
  EXPECT_EQ(1, s_stack.num_connects);
  ASSERT_EQ(1u, first.size());
  EXPECT_EQ(STATUS_DEADLINE_EXCEEDED, first[0].st.error_code());
  EXPECT_EQ(nullptr, first[0].conn);
  EXPECT_TRUE(second.empty());

  LinkUp();
  Discovered(UUID(static_cast<uint16_t>(0x2A35)), kValueHandle);
  DiscoveryDone();
  EXPECT_EQ(1u, first.size());
  ASSERT_EQ(1u, second.size());
  EXPECT_TRUE(second[0].st.ok());
  EXPECT_NE(nullptr, second[0].conn);
}

TEST_F(MgosClientTest, ConnectRefusedByStack) {
  s_stack.connect_ok = false;
  std::vector<Result> results;
  Status st = client_->Connect(TestAddr(), Collect(&results));
  EXPECT_EQ(STATUS_UNAVAILABLE, st.error_code());
  EXPECT_TRUE(results.empty());
  // Nothing is left pending.
  s_stack.connect_ok = true;
  EXPECT_TRUE(client_->Connect(TestAddr(), Collect(&results)).ok());
  EXPECT_EQ(2, s_stack.num_connects);
  EXPECT_TRUE(results.empty());
}

TEST_F(MgosClientTest, ConnectEventFailure) {
  std::vector<Result> results;
  ASSERT_TRUE(client_->Connect(TestAddr(), Collect(&results)).ok());
  LinkUp(false);
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ(STATUS_UNAVAILABLE, results[0].st.error_code());
  EXPECT_EQ(nullptr, results[0].conn);
  EXPECT_TRUE(s_stack.discovers.empty());
}

TEST_F(MgosClientTest, DiscoveryFailure) {
  std::vector<Result> results;
  ASSERT_TRUE(client_->Connect(TestAddr(), Collect(&results)).ok());
  LinkUp();
  DiscoveryDone(false);
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ(STATUS_UNAVAILABLE, results[0].st.error_code());
  ASSERT_EQ(1u, s_stack.disconnects.size());
  EXPECT_EQ(kConnID, s_stack.disconnects[0]);
}

TEST_F(MgosClientTest, DisconnectDuringDiscovery) {
  std::vector<Result> results;
  ASSERT_TRUE(client_->Connect(TestAddr(), Collect(&results)).ok());
  LinkUp();
  LinkDown();
  ASSERT_EQ(1u, results.size());
  EXPECT_EQ(STATUS_UNAVAILABLE, results[0].st.error_code());
  // A later discovery result for the dead link goes nowhere.
  DiscoveryDone();
  EXPECT_EQ(1u, results.size());
}

TEST_F(MgosClientTest, RoutesNotifications) {
  auto conn = Establish();
  ASSERT_NE(nullptr, conn);
  std::vector<std::string> received;
  ASSERT_TRUE(conn->Subscribe(UUID(static_cast<uint16_t>(0x2A35)),
                              [&received](Str data) {
                                received.push_back(data.ToString());
                              })
                  .ok());
  ASSERT_EQ(1u, s_stack.subscribes.size());
  EXPECT_EQ(kValueHandle, s_stack.subscribes[0]);

  Notify(kConnID, kValueHandle, "abc");
  Notify(kConnID + 1, kValueHandle, "other link");
  Notify(kConnID, kValueHandle + 5, "other handle");
  EXPECT_EQ(std::vector<std::string>({"abc"}), received);

  ASSERT_TRUE(conn->Unsubscribe(UUID(static_cast<uint16_t>(0x2A35))).ok());
  ASSERT_EQ(1u, s_stack.writes.size());
  EXPECT_EQ(kValueHandle + 1, s_stack.writes[0].handle);
  EXPECT_EQ(std::string("\x00\x00", 2), s_stack.writes[0].data);
  Notify(kConnID, kValueHandle, "late");
  EXPECT_EQ(1u, received.size());
}

TEST_F(MgosClientTest, UnknownCharacteristic) {
  auto conn = Establish();
  ASSERT_NE(nullptr, conn);
  Status st = conn->Write(UUID(static_cast<uint16_t>(0x2A36)), Str("x"),
                          false /* resp_required */);
  EXPECT_EQ(STATUS_NOT_FOUND, st.error_code());
  EXPECT_TRUE(s_stack.writes.empty());
}

TEST_F(MgosClientTest, LinkLoss) {
  auto conn = Establish();
  ASSERT_NE(nullptr, conn);
  LinkDown();
  Status st = conn->Write(UUID(static_cast<uint16_t>(0x2A35)), Str("x"),
                          false /* resp_required */);
  EXPECT_EQ(STATUS_UNAVAILABLE, st.error_code());
  EXPECT_TRUE(conn->Disconnect().ok());
  EXPECT_TRUE(s_stack.disconnects.empty());
}

TEST_F(MgosClientTest, Disconnect) {
  auto conn = Establish();
  ASSERT_NE(nullptr, conn);
  EXPECT_TRUE(conn->Disconnect().ok());
  ASSERT_EQ(1u, s_stack.disconnects.size());
  EXPECT_EQ(kConnID, s_stack.disconnects[0]);
  // Only once.
  EXPECT_TRUE(conn->Disconnect().ok());
  EXPECT_EQ(1u, s_stack.disconnects.size());
}

}  // namespace
}  // namespace blepoll::bt::gattc
