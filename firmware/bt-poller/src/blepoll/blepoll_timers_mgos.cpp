/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#include "blepoll_timers_mgos.hpp"

#include "mgos_system.h"
#include "mgos_timers.h"

namespace blepoll {

MgosScheduler::MgosScheduler() {}

MgosScheduler::~MgosScheduler() {
  for (const auto &it : timers_) {
    mgos_clear_timer(it.first);
  }
}

Scheduler::TimerID MgosScheduler::SetTimer(int msecs,
                                           std::function<void()> cb) {
  std::unique_ptr<Entry> e(new Entry());
  e->sched = this;
  e->cb = std::move(cb);
  mgos_timer_id id = mgos_set_timer(msecs, 0, TimerCB, e.get());
  if (id == MGOS_INVALID_TIMER_ID) return kInvalidTimerID;
  e->id = id;
  timers_[id] = std::move(e);
  return id;
}

void MgosScheduler::ClearTimer(TimerID id) {
  auto it = timers_.find(id);
  if (it == timers_.end()) return;
  mgos_clear_timer(id);
  timers_.erase(it);
}

int64_t MgosScheduler::NowMs() const {
  return mgos_uptime_micros() / 1000;
}

// static
void MgosScheduler::TimerCB(void *arg) {
  Entry *e = static_cast<Entry *>(arg);
  MgosScheduler *self = e->sched;
  auto it = self->timers_.find(e->id);
  if (it == self->timers_.end()) return;
  // The callback may set new timers, so release the entry first.
  std::function<void()> cb = std::move(e->cb);
  self->timers_.erase(it);
  cb();
}

}  // namespace blepoll
