/*
 * Copyright (c) 2024 Shelly Group
 * All rights reserved
 */

#pragma once

#include <cstdint>
#include <functional>

namespace blepoll {

// One-shot timers on the event loop.
class Scheduler {
 public:
  typedef uintptr_t TimerID;
  static constexpr TimerID kInvalidTimerID = 0;

  virtual ~Scheduler();

  virtual TimerID SetTimer(int msecs, std::function<void()> cb) = 0;
  // Clearing an expired or invalid timer is a no-op.
  virtual void ClearTimer(TimerID id) = 0;

  // Monotonic milliseconds since boot.
  virtual int64_t NowMs() const = 0;
};

}  // namespace blepoll
