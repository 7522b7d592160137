#pragma once

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "DeviceConfig.hpp"
#include "Poller.hpp"

#include "blepoll_timers.hpp"

namespace tpms {

// Schedules polls of all configured devices through a single Poller and
// keeps the last good data of each.
class Coordinator {
 public:
  static constexpr int kStationaryIntervalMs = 900 * 1000;
  static constexpr int kMovingIntervalMs = 15 * 1000;

  // If cfg_path is empty, changes are not persisted.
  Coordinator(const DeviceConfig &cfg, const std::string &cfg_path,
              Poller *poller, blepoll::Scheduler *sched);
  ~Coordinator();
  Coordinator(const Coordinator &other) = delete;

  // Queues an initial poll of every device.
  void Start();

  Status RequestPoll(Str id, bool learning);
  Status SetMoving(Str id, bool moving);
  Status AssignSensors(Str id, const PositionMap &sensors);
  Status Rotate(Str id, Str pattern);

  // Signal strength observed in advertisements, reported with the next poll.
  void UpdateRSSI(const blepoll::bt::Addr &addr, int rssi);

  StatusOr<std::vector<std::string>> GetPatterns(Str id) const;
  StatusOr<std::vector<std::string>> GetLearned(Str id) const;
  StatusOr<std::string> GetDataJSON(Str id) const;
  std::string ListJSON() const;

  StatusOr<bool> IsAvailable(Str id) const;
  StatusOr<int> GetIntervalMs(Str id) const;
  const DeviceConfig &config() const;

 private:
  struct Entry {
    bool available = false;
    int64_t last_poll_ms = -1;
    std::map<std::string, int> values;
    std::vector<std::string> learned;
    bool has_rssi = false;
    int rssi = 0;
    blepoll::Scheduler::TimerID timer_id = blepoll::Scheduler::kInvalidTimerID;
  };

  struct QueueItem {
    std::string id;
    bool learning;
  };

  Entry *FindEntry(Str id);
  const Entry *FindEntry(Str id) const;

  void Enqueue(const std::string &id, bool learning);
  void ScheduleNext(const std::string &id, int delay_ms);
  void RunNext();
  void PollDone(const std::string &id, bool learning,
                const Poller::Outcome &outcome);
  Status SaveConfig();

  DeviceConfig cfg_;
  const std::string cfg_path_;
  Poller *const poller_;
  blepoll::Scheduler *const sched_;

  std::map<std::string, Entry> entries_;
  std::deque<QueueItem> queue_;
};

}  // namespace tpms
