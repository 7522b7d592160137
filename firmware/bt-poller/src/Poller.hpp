#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "DeviceProfile.hpp"
#include "PollSession.hpp"
#include "TPMSSensorID.hpp"

#include "blepoll_bt_addr.hpp"
#include "blepoll_bt_gattc.hpp"
#include "blepoll_timers.hpp"

namespace tpms {

// Runs one poll at a time: connect, subscribe, trigger, collect
// notifications until complete or deadline, then disconnect.
// Never blocks, all steps are driven by transport and timer callbacks.
class Poller {
 public:
  enum class State {
    kIdle = 0,
    kConnecting = 1,
    kSubscribing = 2,
    kTriggering = 3,
    kWaiting = 4,
    kDraining = 5,
    kDisconnecting = 6,
    kDone = 7,
  };

  struct Request {
    blepoll::bt::Addr addr;
    const DeviceProfile *profile = nullptr;
    PositionMap mapping;
    bool learning = false;
    // Profile defaults are used if < 0.
    int expected_data = -1;
    int expected_config = -1;
    // From advertisements, reported as signal_strength if set.
    bool has_rssi = false;
    int rssi = 0;
  };

  struct Outcome {
    PollResult result;
    std::vector<std::string> discovered;
  };

  typedef std::function<void(const Outcome &outcome)> DoneCB;

  Poller(blepoll::bt::gattc::Client *client, blepoll::Scheduler *sched);
  ~Poller();
  Poller(const Poller &other) = delete;

  // Starts a poll. If OK is returned, cb will be invoked exactly once,
  // possibly before Poll() returns.
  Status Poll(const Request &req, DoneCB cb);

  State state() const;
  bool busy() const;
  static const char *StateName(State state);

 private:
  void SetState(State state);
  // On failure the caller ends the poll, it cannot make progress.
  bool SetTimer(int msecs, std::function<void()> cb);
  void ClearTimer();

  void StartConnect();
  void ConnectFailed(const Status &st);
  void Fail(const Status &st);
  void ConnectCB(uint32_t gen, int attempt, const Status &st,
                 std::unique_ptr<blepoll::bt::gattc::Connection> conn);
  void Subscribe();
  void Trigger();
  void Wait(int deadline_ms);
  void SessionComplete();
  void Finish();

  blepoll::bt::gattc::Client *const client_;
  blepoll::Scheduler *const sched_;

  State state_ = State::kIdle;
  // Incremented on every poll, callbacks of earlier polls are ignored.
  uint32_t gen_ = 0;
  int attempt_ = 0;
  // Attempt whose result is awaited, 0 if none.
  int pending_attempt_ = 0;
  bool subscribed_ = false;
  blepoll::Scheduler::TimerID timer_id_ = blepoll::Scheduler::kInvalidTimerID;

  Request req_;
  DoneCB done_cb_;
  std::unique_ptr<PollSession> session_;
  std::unique_ptr<blepoll::bt::gattc::Connection> conn_;
};

}  // namespace tpms
