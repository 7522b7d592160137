/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#pragma once

#include <map>
#include <memory>

#include "blepoll_timers.hpp"

namespace blepoll {

class MgosScheduler : public Scheduler {
 public:
  MgosScheduler();
  virtual ~MgosScheduler();

  TimerID SetTimer(int msecs, std::function<void()> cb) override;
  void ClearTimer(TimerID id) override;
  int64_t NowMs() const override;

 private:
  struct Entry {
    MgosScheduler *sched;
    TimerID id;
    std::function<void()> cb;
  };

  static void TimerCB(void *arg);

  std::map<TimerID, std::unique_ptr<Entry>> timers_;
};

}  // namespace blepoll
