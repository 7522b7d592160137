#include "Poller.hpp"

#include "common/cs_dbg.h"

namespace tpms {

using blepoll::bt::gattc::Connection;

Poller::Poller(blepoll::bt::gattc::Client *client, blepoll::Scheduler *sched)
    : client_(client), sched_(sched) {}

Poller::~Poller() {
  ClearTimer();
  if (conn_ != nullptr) {
    Status st = conn_->Disconnect();
    if (!st.ok()) {
      LOG(LL_WARN, ("Disconnect failed: %s", st.ToString().c_str()));
    }
  }
}

Poller::State Poller::state() const {
  return state_;
}

bool Poller::busy() const {
  return (state_ != State::kIdle);
}

// static
const char *Poller::StateName(State state) {
  switch (state) {
    case State::kIdle: return "idle";
    case State::kConnecting: return "connecting";
    case State::kSubscribing: return "subscribing";
    case State::kTriggering: return "triggering";
    case State::kWaiting: return "waiting";
    case State::kDraining: return "draining";
    case State::kDisconnecting: return "disconnecting";
    case State::kDone: return "done";
  }
  return "";
}

Status Poller::Poll(const Request &req, DoneCB cb) {
  if (busy()) {
    return Errorf(STATUS_FAILED_PRECONDITION, "poll in progress (%s)",
                  StateName(state_));
  }
  if (req.addr.IsZero()) {
    return Errorf(STATUS_INVALID_ARGUMENT, "no address");
  }
  if (req.profile == nullptr) {
    return Errorf(STATUS_INVALID_ARGUMENT, "no profile");
  }
  gen_++;
  req_ = req;
  done_cb_ = cb;
  PollSession::Options opts;
  opts.mapping = req.mapping;
  opts.learning = req.learning;
  opts.expected_data =
      (req.expected_data >= 0 ? req.expected_data : req.profile->expected_data);
  opts.expected_config =
      (req.expected_config >= 0 ? req.expected_config
                                : req.profile->expected_config);
  session_.reset(new PollSession(opts, [this]() { SessionComplete(); }));
  attempt_ = 0;
  subscribed_ = false;
  LOG(LL_INFO, ("%s: polling (%s%s), %d sensors",
                req_.addr.ToString().c_str(), req_.profile->name,
                (req_.learning ? ", learning" : ""),
                (int) req_.mapping.size()));
  StartConnect();
  return Status::OK();
}

void Poller::SetState(State state) {
  LOG(LL_VERBOSE_DEBUG, ("%s -> %s", StateName(state_), StateName(state)));
  state_ = state;
}

bool Poller::SetTimer(int msecs, std::function<void()> cb) {
  ClearTimer();
  timer_id_ = sched_->SetTimer(msecs, cb);
  if (timer_id_ == blepoll::Scheduler::kInvalidTimerID) {
    LOG(LL_ERROR, ("%s: failed to set timer", req_.addr.ToString().c_str()));
    return false;
  }
  return true;
}

void Poller::Fail(const Status &st) {
  session_->ClearValues();
  session_->SetStatus(st);
  Finish();
}

static Status NoTimer() {
  return Errorf(STATUS_RESOURCE_EXHAUSTED, "no timer");
}

void Poller::ClearTimer() {
  if (timer_id_ == blepoll::Scheduler::kInvalidTimerID) return;
  sched_->ClearTimer(timer_id_);
  timer_id_ = blepoll::Scheduler::kInvalidTimerID;
}

void Poller::StartConnect() {
  SetState(State::kConnecting);
  const uint32_t gen = gen_;
  const int attempt = ++attempt_;
  pending_attempt_ = attempt;
  LOG(LL_DEBUG, ("%s: connect attempt %d/%d", req_.addr.ToString().c_str(),
                 attempt, req_.profile->connect_attempts));
  Status st = client_->Connect(
      req_.addr, [this, gen, attempt](const Status &cst,
                                      std::unique_ptr<Connection> conn) {
        ConnectCB(gen, attempt, cst, std::move(conn));
      });
  // A connect callback invoked synchronously may have moved us on already.
  if (gen != gen_ || attempt != pending_attempt_) return;
  if (!st.ok()) {
    ConnectFailed(st);
    return;
  }
  const bool ok =
      SetTimer(req_.profile->connect_timeout_ms, [this, gen, attempt]() {
        timer_id_ = blepoll::Scheduler::kInvalidTimerID;
        if (gen != gen_ || attempt != pending_attempt_) return;
        ConnectFailed(Errorf(STATUS_DEADLINE_EXCEEDED, "connect timed out"));
      });
  // Whatever the attempt yields from now on is discarded as late.
  if (!ok) Fail(NoTimer());
}

void Poller::ConnectFailed(const Status &st) {
  LOG(LL_WARN, ("%s: attempt %d: %s", req_.addr.ToString().c_str(), attempt_,
                st.ToString().c_str()));
  // From now on, a result of this attempt is late.
  pending_attempt_ = 0;
  if (attempt_ < req_.profile->connect_attempts) {
    const uint32_t gen = gen_;
    const bool ok = SetTimer(req_.profile->connect_retry_delay_ms,
                             [this, gen]() {
                               timer_id_ =
                                   blepoll::Scheduler::kInvalidTimerID;
                               if (gen != gen_) return;
                               StartConnect();
                             });
    if (!ok) Fail(NoTimer());
    return;
  }
  Fail(Errorf(STATUS_UNAVAILABLE, "%s: unreachable",
              req_.addr.ToString().c_str()));
}

void Poller::ConnectCB(uint32_t gen, int attempt, const Status &st,
                       std::unique_ptr<Connection> conn) {
  if (gen != gen_ || attempt != pending_attempt_) {
    if (conn != nullptr) {
      LOG(LL_INFO, ("%s: late connection, closing",
                    conn->addr().ToString().c_str()));
      Status dst = conn->Disconnect();
      if (!dst.ok()) {
        LOG(LL_WARN, ("Disconnect failed: %s", dst.ToString().c_str()));
      }
    }
    return;
  }
  ClearTimer();
  pending_attempt_ = 0;
  if (!st.ok() || conn == nullptr) {
    ConnectFailed(st.ok() ? Status(Errorf(STATUS_UNAVAILABLE, "no connection"))
                          : st);
    return;
  }
  conn_ = std::move(conn);
  LOG(LL_DEBUG, ("%s: connected", req_.addr.ToString().c_str()));
  if (req_.has_rssi) {
    session_->SetValue(PollResult::kSignalStrengthKey, req_.rssi);
  }
  Subscribe();
}

void Poller::Subscribe() {
  SetState(State::kSubscribing);
  const uint32_t gen = gen_;
  Status st = conn_->Subscribe(req_.profile->notify_chr, [this, gen](Str data) {
    if (gen != gen_ || session_ == nullptr) return;
    session_->HandleNotification(data);
  });
  if (!st.ok()) {
    LOG(LL_WARN, ("%s: subscribe failed: %s", req_.addr.ToString().c_str(),
                  st.ToString().c_str()));
    if (req_.profile->subscribe_failure_fatal) {
      Fail(st);
    } else {
      Wait(0);
    }
    return;
  }
  subscribed_ = true;
  if (!req_.profile->has_trigger) {
    Wait(req_.profile->deadline_ms);
    return;
  }
  SetState(State::kTriggering);
  const bool ok = SetTimer(req_.profile->trigger_delay_ms, [this, gen]() {
    timer_id_ = blepoll::Scheduler::kInvalidTimerID;
    if (gen != gen_) return;
    Trigger();
  });
  if (!ok) Finish();
}

void Poller::Trigger() {
  const uint8_t cmd = req_.profile->trigger_cmd;
  Status st = conn_->Write(req_.profile->write_chr, Str(&cmd, 1),
                           false /* resp_required */);
  if (!st.ok()) {
    LOG(LL_WARN, ("%s: trigger write failed: %s",
                  req_.addr.ToString().c_str(), st.ToString().c_str()));
  }
  Wait(req_.profile->deadline_ms);
}

void Poller::Wait(int deadline_ms) {
  SetState(State::kWaiting);
  if (session_->complete() || deadline_ms <= 0) {
    Finish();
    return;
  }
  const uint32_t gen = gen_;
  const bool ok = SetTimer(deadline_ms, [this, gen, deadline_ms]() {
    timer_id_ = blepoll::Scheduler::kInvalidTimerID;
    if (gen != gen_ || state_ != State::kWaiting) return;
    if (!session_->learning()) {
      LOG(LL_WARN, ("%s: timed out after %d ms, %d data %d config",
                    req_.addr.ToString().c_str(), deadline_ms,
                    session_->data_count(), session_->config_count()));
    }
    Finish();
  });
  if (!ok) Finish();
}

void Poller::SessionComplete() {
  if (state_ != State::kWaiting) return;
  // Runs inside the notification callback, finish outside of it.
  const uint32_t gen = gen_;
  const auto id = sched_->SetTimer(0, [this, gen]() {
    timer_id_ = blepoll::Scheduler::kInvalidTimerID;
    if (gen != gen_ || state_ != State::kWaiting) return;
    Finish();
  });
  if (id == blepoll::Scheduler::kInvalidTimerID) {
    // The deadline timer stays armed and ends the poll.
    LOG(LL_ERROR, ("%s: failed to set timer", req_.addr.ToString().c_str()));
    return;
  }
  ClearTimer();
  timer_id_ = id;
}

void Poller::Finish() {
  ClearTimer();
  SetState(State::kDraining);
  if (subscribed_) {
    subscribed_ = false;
    Status st = conn_->Unsubscribe(req_.profile->notify_chr);
    if (!st.ok()) {
      LOG(LL_WARN, ("%s: unsubscribe failed: %s",
                    req_.addr.ToString().c_str(), st.ToString().c_str()));
    }
  }
  SetState(State::kDisconnecting);
  if (conn_ != nullptr) {
    Status st = conn_->Disconnect();
    if (!st.ok()) {
      LOG(LL_WARN, ("%s: disconnect failed: %s",
                    req_.addr.ToString().c_str(), st.ToString().c_str()));
    }
    conn_.reset();
  }
  SetState(State::kDone);
  Outcome outcome;
  outcome.discovered = session_->discovered();
  outcome.result = session_->TakeResult();
  LOG(LL_INFO, ("%s: done, %s, %d data %d config, %d values",
                req_.addr.ToString().c_str(),
                outcome.result.status.ToString().c_str(),
                session_->data_count(), session_->config_count(),
                (int) outcome.result.values.size()));
  session_.reset();
  DoneCB cb = std::move(done_cb_);
  done_cb_ = nullptr;
  // Invalidate pending callbacks of this poll.
  gen_++;
  SetState(State::kIdle);
  cb(outcome);
}

}  // namespace tpms
