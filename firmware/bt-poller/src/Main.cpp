#include <memory>
#include <string>

#include "common/cs_dbg.h"

#include "mgos.hpp"
#include "mgos_app.h"
#include "mgos_bt_gap.h"
#include "mgos_event.h"
#include "mgos_rpc.h"
#include "mgos_timers.hpp"

#include "blepoll_bt_addr.hpp"
#include "blepoll_bt_gattc_mgos.hpp"
#include "blepoll_timers_mgos.hpp"

#include "Coordinator.hpp"
#include "DeviceConfig.hpp"
#include "DeviceProfile.hpp"
#include "Poller.hpp"

static const char *kDevicesFile = "devices.json";
static constexpr int kScanIntervalMs = 60000;
static constexpr int kScanDurationMs = 5000;

static std::unique_ptr<blepoll::bt::gattc::MgosClient> s_client;
static std::unique_ptr<blepoll::MgosScheduler> s_sched;
static std::unique_ptr<tpms::Poller> s_poller;
static std::unique_ptr<tpms::Coordinator> s_coord;
static bool s_scanning = false;

static void SendStatus(struct mg_rpc_request_info *ri,
                       const blepoll::Status &st) {
  if (st.ok()) {
    mg_rpc_send_responsef(ri, nullptr);
  } else {
    mg_rpc_send_errorf(ri, st.error_code(), "%s", st.error_message().c_str());
  }
}

static std::string StrListJSON(const std::vector<std::string> &l) {
  std::string res("[");
  for (const auto &s : l) {
    if (res.size() > 1) res.append(", ");
    mgos::JSONAppendStringf(&res, "%Q", s.c_str());
  }
  res.append("]");
  return res;
}

static void GAPEventCB(int ev, void *ev_data, void *userdata UNUSED_ARG) {
  switch (ev) {
    case MGOS_BT_GAP_EVENT_SCAN_RESULT: {
      auto *sr = static_cast<struct mgos_bt_gap_scan_result *>(ev_data);
      const blepoll::bt::Addr addr(&sr->addr);
      blepoll::Str name(mgos_bt_gap_parse_name(sr->adv_data));
      auto ps = tpms::DeviceProfile::FindByAdvName(name);
      if (!ps.ok()) break;
      LOG(LL_DEBUG, ("%s: %.*s (%s) RSSI %d", addr.ToString().c_str(),
                     BLEPOLLSTRF(name), ps.ValueOrDie()->name, sr->rssi));
      if (s_coord != nullptr) {
        s_coord->UpdateRSSI(addr, sr->rssi);
      }
      break;
    }
    case MGOS_BT_GAP_EVENT_SCAN_STOP:
      LOG(LL_DEBUG, ("Scan finished"));
      s_scanning = false;
      break;
  }
}

// Scanning only runs between polls, it competes with connections for radio.
static void CheckScan() {
  if (s_scanning || s_poller == nullptr || s_poller->busy()) return;
  struct mgos_bt_gap_scan_opts opts = {};
  opts.duration_ms = kScanDurationMs;
  opts.active = true;
  if (!mgos_bt_gap_scan(&opts)) {
    LOG(LL_WARN, ("Failed to start scan"));
    return;
  }
  s_scanning = true;
}

static mgos::Timer s_scan_timer(CheckScan);

static void TPMSListHandler(struct mg_rpc_request_info *ri,
                            void *cb_arg UNUSED_ARG,
                            struct mg_rpc_frame_info *fi UNUSED_ARG,
                            struct mg_str args UNUSED_ARG) {
  mg_rpc_send_responsef(ri, "%s", s_coord->ListJSON().c_str());
}

static void TPMSGetDataHandler(struct mg_rpc_request_info *ri,
                               void *cb_arg UNUSED_ARG,
                               struct mg_rpc_frame_info *fi UNUSED_ARG,
                               struct mg_str args) {
  char *id = nullptr;
  json_scanf(args.p, args.len, ri->args_fmt, &id);
  mgos::ScopedCPtr id_owner(id);
  auto res = s_coord->GetDataJSON(blepoll::Str(id));
  if (!res.ok()) {
    SendStatus(ri, res.status());
    return;
  }
  mg_rpc_send_responsef(ri, "%s", res.ValueOrDie().c_str());
}

static void TPMSPollHandler(struct mg_rpc_request_info *ri, void *cb_arg,
                            struct mg_rpc_frame_info *fi UNUSED_ARG,
                            struct mg_str args) {
  const bool learning = (cb_arg != nullptr);
  char *id = nullptr;
  json_scanf(args.p, args.len, ri->args_fmt, &id);
  mgos::ScopedCPtr id_owner(id);
  SendStatus(ri, s_coord->RequestPoll(blepoll::Str(id), learning));
}

static void TPMSGetLearnedHandler(struct mg_rpc_request_info *ri,
                                  void *cb_arg UNUSED_ARG,
                                  struct mg_rpc_frame_info *fi UNUSED_ARG,
                                  struct mg_str args) {
  char *id = nullptr;
  json_scanf(args.p, args.len, ri->args_fmt, &id);
  mgos::ScopedCPtr id_owner(id);
  auto res = s_coord->GetLearned(blepoll::Str(id));
  if (!res.ok()) {
    SendStatus(ri, res.status());
    return;
  }
  mg_rpc_send_responsef(ri, "{sensors: %s}",
                        StrListJSON(res.ValueOrDie()).c_str());
}

static void TPMSSetSensorsHandler(struct mg_rpc_request_info *ri,
                                  void *cb_arg UNUSED_ARG,
                                  struct mg_rpc_frame_info *fi UNUSED_ARG,
                                  struct mg_str args) {
  char *id = nullptr;
  json_scanf(args.p, args.len, "{id: %Q}", &id);
  mgos::ScopedCPtr id_owner(id);
  tpms::PositionMap sensors;
  void *h = nullptr;
  struct json_token key, val;
  while ((h = json_next_key(args.p, args.len, h, ".sensors", &key, &val)) !=
         nullptr) {
    auto poss = tpms::ParsePositionLabel(blepoll::Str(key.ptr, key.len));
    if (!poss.ok()) {
      SendStatus(ri, poss.status());
      return;
    }
    auto ids = tpms::SensorID::Parse(blepoll::Str(val.ptr, val.len));
    if (!ids.ok()) {
      SendStatus(ri, ids.status());
      return;
    }
    blepoll::Status st = sensors.Add(poss.ValueOrDie(), ids.ValueOrDie());
    if (!st.ok()) {
      SendStatus(ri, st);
      return;
    }
  }
  if (sensors.empty()) {
    mg_rpc_send_errorf(ri, STATUS_INVALID_ARGUMENT, "sensors are required");
    return;
  }
  SendStatus(ri, s_coord->AssignSensors(blepoll::Str(id), sensors));
}

static void TPMSRotateHandler(struct mg_rpc_request_info *ri,
                              void *cb_arg UNUSED_ARG,
                              struct mg_rpc_frame_info *fi UNUSED_ARG,
                              struct mg_str args) {
  char *id = nullptr, *pattern = nullptr;
  json_scanf(args.p, args.len, ri->args_fmt, &id, &pattern);
  mgos::ScopedCPtr id_owner(id), pattern_owner(pattern);
  if (pattern == nullptr) {
    mg_rpc_send_errorf(ri, STATUS_INVALID_ARGUMENT, "pattern is required");
    return;
  }
  SendStatus(ri, s_coord->Rotate(blepoll::Str(id), blepoll::Str(pattern)));
}

static void TPMSGetPatternsHandler(struct mg_rpc_request_info *ri,
                                   void *cb_arg UNUSED_ARG,
                                   struct mg_rpc_frame_info *fi UNUSED_ARG,
                                   struct mg_str args) {
  char *id = nullptr;
  json_scanf(args.p, args.len, ri->args_fmt, &id);
  mgos::ScopedCPtr id_owner(id);
  auto res = s_coord->GetPatterns(blepoll::Str(id));
  if (!res.ok()) {
    SendStatus(ri, res.status());
    return;
  }
  mg_rpc_send_responsef(ri, "{patterns: %s}",
                        StrListJSON(res.ValueOrDie()).c_str());
}

static void TPMSSetMovingHandler(struct mg_rpc_request_info *ri,
                                 void *cb_arg UNUSED_ARG,
                                 struct mg_rpc_frame_info *fi UNUSED_ARG,
                                 struct mg_str args) {
  char *id = nullptr;
  int8_t moving = -1;
  json_scanf(args.p, args.len, ri->args_fmt, &id, &moving);
  mgos::ScopedCPtr id_owner(id);
  if (moving < 0) {
    mg_rpc_send_errorf(ri, STATUS_INVALID_ARGUMENT, "moving is required");
    return;
  }
  SendStatus(ri, s_coord->SetMoving(blepoll::Str(id), moving != 0));
}

enum mgos_app_init_result mgos_app_init(void) {
  enum mgos_app_init_result res = MGOS_APP_INIT_ERROR;
  struct mg_rpc *c = mgos_rpc_get_global();

  tpms::DeviceConfig cfg;
  auto cfgs = tpms::DeviceConfig::Load(kDevicesFile);
  if (cfgs.ok()) {
    cfg = cfgs.MoveValueOrDie();
  } else if (cfgs.status().error_code() == STATUS_NOT_FOUND) {
    LOG(LL_WARN, ("%s not found, no devices", kDevicesFile));
  } else {
    LOG(LL_ERROR, ("Invalid config: %s", cfgs.status().ToString().c_str()));
    goto out;
  }

  s_client.reset(new blepoll::bt::gattc::MgosClient());
  s_sched.reset(new blepoll::MgosScheduler());
  s_poller.reset(new tpms::Poller(s_client.get(), s_sched.get()));
  s_coord.reset(
      new tpms::Coordinator(cfg, kDevicesFile, s_poller.get(), s_sched.get()));

  mg_rpc_add_handler(c, "TPMS.List", "", TPMSListHandler, nullptr);
  mg_rpc_add_handler(c, "TPMS.GetData", "{id: %Q}", TPMSGetDataHandler,
                     nullptr);
  mg_rpc_add_handler(c, "TPMS.Poll", "{id: %Q}", TPMSPollHandler, nullptr);
  mg_rpc_add_handler(c, "TPMS.Learn", "{id: %Q}", TPMSPollHandler,
                     (void *) 1);
  mg_rpc_add_handler(c, "TPMS.GetLearned", "{id: %Q}", TPMSGetLearnedHandler,
                     nullptr);
  mg_rpc_add_handler(c, "TPMS.SetSensors", "{id: %Q, sensors: %T}",
                     TPMSSetSensorsHandler, nullptr);
  mg_rpc_add_handler(c, "TPMS.Rotate", "{id: %Q, pattern: %Q}",
                     TPMSRotateHandler, nullptr);
  mg_rpc_add_handler(c, "TPMS.GetPatterns", "{id: %Q}", TPMSGetPatternsHandler,
                     nullptr);
  mg_rpc_add_handler(c, "TPMS.SetMoving", "{id: %Q, moving: %B}",
                     TPMSSetMovingHandler, nullptr);

  mgos_event_add_group_handler(MGOS_BT_GAP_EVENT_BASE, GAPEventCB, nullptr);
  s_scan_timer.Reset(kScanIntervalMs, MGOS_TIMER_REPEAT);

  s_coord->Start();

  res = MGOS_APP_INIT_SUCCESS;

out:
  return res;
}
