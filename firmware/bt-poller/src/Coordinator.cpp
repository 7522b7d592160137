#include "Coordinator.hpp"

#include "common/cs_dbg.h"

namespace tpms {

Coordinator::Coordinator(const DeviceConfig &cfg, const std::string &cfg_path,
                         Poller *poller, blepoll::Scheduler *sched)
    : cfg_(cfg), cfg_path_(cfg_path), poller_(poller), sched_(sched) {
  for (const auto &dev : cfg_.devices) {
    entries_[dev.id] = Entry();
  }
}

Coordinator::~Coordinator() {
  for (auto &it : entries_) {
    sched_->ClearTimer(it.second.timer_id);
  }
}

void Coordinator::Start() {
  for (const auto &dev : cfg_.devices) {
    Enqueue(dev.id, false /* learning */);
  }
  RunNext();
}

Coordinator::Entry *Coordinator::FindEntry(Str id) {
  auto it = entries_.find(id.ToString());
  return (it != entries_.end() ? &it->second : nullptr);
}

const Coordinator::Entry *Coordinator::FindEntry(Str id) const {
  auto it = entries_.find(id.ToString());
  return (it != entries_.end() ? &it->second : nullptr);
}

static Status UnknownDevice(Str id) {
  return Errorf(STATUS_NOT_FOUND, "unknown device '%.*s'", BLEPOLLSTRF(id));
}

Status Coordinator::RequestPoll(Str id, bool learning) {
  if (cfg_.Find(id) == nullptr) return UnknownDevice(id);
  Enqueue(id.ToString(), learning);
  RunNext();
  return Status::OK();
}

void Coordinator::Enqueue(const std::string &id, bool learning) {
  for (auto &qi : queue_) {
    if (qi.id == id) {
      qi.learning = (qi.learning || learning);
      return;
    }
  }
  QueueItem qi;
  qi.id = id;
  qi.learning = learning;
  queue_.push_back(qi);
  LOG(LL_DEBUG, ("%s: queued%s, %d in queue", id.c_str(),
                 (learning ? " (learning)" : ""), (int) queue_.size()));
}

void Coordinator::ScheduleNext(const std::string &id, int delay_ms) {
  Entry *e = FindEntry(id);
  if (e == nullptr) return;
  sched_->ClearTimer(e->timer_id);
  e->timer_id = sched_->SetTimer(delay_ms, [this, id]() {
    Entry *te = FindEntry(id);
    if (te == nullptr) return;
    te->timer_id = blepoll::Scheduler::kInvalidTimerID;
    Enqueue(id, false /* learning */);
    RunNext();
  });
}

void Coordinator::RunNext() {
  while (!poller_->busy() && !queue_.empty()) {
    const QueueItem qi = queue_.front();
    queue_.pop_front();
    const DeviceConfig::Device *dev = cfg_.Find(qi.id);
    Entry *e = FindEntry(qi.id);
    if (dev == nullptr || e == nullptr) continue;
    sched_->ClearTimer(e->timer_id);
    e->timer_id = blepoll::Scheduler::kInvalidTimerID;
    Poller::Request req;
    req.addr = dev->addr;
    req.profile = dev->profile;
    req.mapping = dev->sensors;
    req.learning = qi.learning;
    req.expected_data = dev->GetExpectedData();
    req.expected_config = dev->GetExpectedConfig();
    req.has_rssi = e->has_rssi;
    req.rssi = e->rssi;
    const std::string id = qi.id;
    const bool learning = qi.learning;
    Status st = poller_->Poll(req, [this, id, learning](
                                       const Poller::Outcome &outcome) {
      PollDone(id, learning, outcome);
    });
    if (st.ok()) return;
    LOG(LL_ERROR, ("%s: poll failed: %s", id.c_str(), st.ToString().c_str()));
    ScheduleNext(id, GetIntervalMs(id).ValueOrDie());
  }
}

void Coordinator::PollDone(const std::string &id, bool learning,
                           const Poller::Outcome &outcome) {
  Entry *e = FindEntry(id);
  if (e != nullptr) {
    const PollResult &res = outcome.result;
    e->last_poll_ms = sched_->NowMs();
    if (!res.status.ok()) {
      LOG(LL_WARN, ("%s: unavailable: %s", id.c_str(),
                    res.status.ToString().c_str()));
      e->available = false;
    } else {
      e->available = true;
      bool have_readings = false;
      for (const auto &it : res.values) {
        if (it.first != PollResult::kSignalStrengthKey) have_readings = true;
      }
      if (have_readings) {
        e->values = res.values;
      } else {
        // Nothing new, keep showing the last readings.
        for (const auto &it : res.values) e->values[it.first] = it.second;
        LOG(LL_INFO, ("%s: no readings, keeping %d values", id.c_str(),
                      (int) e->values.size()));
      }
    }
    if (learning) {
      e->learned = outcome.discovered;
      LOG(LL_INFO, ("%s: learned %d sensors", id.c_str(),
                    (int) e->learned.size()));
    }
    ScheduleNext(id, GetIntervalMs(id).ValueOrDie());
  }
  RunNext();
}

Status Coordinator::SetMoving(Str id, bool moving) {
  DeviceConfig::Device *dev = cfg_.Find(id);
  if (dev == nullptr) return UnknownDevice(id);
  if (dev->moving != moving) {
    dev->moving = moving;
    LOG(LL_INFO, ("%s: %s, interval %d s", dev->id.c_str(),
                  (moving ? "moving" : "stationary"),
                  GetIntervalMs(id).ValueOrDie() / 1000));
    Status st = SaveConfig();
    if (!st.ok()) return st;
  }
  // Refresh right away, the next one follows at the new interval.
  return RequestPoll(id, false /* learning */);
}

Status Coordinator::AssignSensors(Str id, const PositionMap &sensors) {
  DeviceConfig::Device *dev = cfg_.Find(id);
  if (dev == nullptr) return UnknownDevice(id);
  LOG(LL_INFO, ("%s: sensors %s -> %s", dev->id.c_str(),
                dev->sensors.ToString().c_str(), sensors.ToString().c_str()));
  dev->sensors = sensors;
  return SaveConfig();
}

Status Coordinator::Rotate(Str id, Str pattern) {
  DeviceConfig::Device *dev = cfg_.Find(id);
  if (dev == nullptr) return UnknownDevice(id);
  PositionMap sensors = dev->sensors;
  TireNames names = dev->names;
  Status st = TireRotation::Apply(pattern, &sensors, &names);
  if (!st.ok()) return st;
  dev->sensors = sensors;
  dev->names = names;
  return SaveConfig();
}

void Coordinator::UpdateRSSI(const blepoll::bt::Addr &addr, int rssi) {
  for (const auto &dev : cfg_.devices) {
    if (dev.addr != addr) continue;
    Entry *e = FindEntry(dev.id);
    if (e == nullptr) continue;
    e->has_rssi = true;
    e->rssi = rssi;
  }
}

StatusOr<std::vector<std::string>> Coordinator::GetPatterns(Str id) const {
  const DeviceConfig::Device *dev = cfg_.Find(id);
  if (dev == nullptr) return UnknownDevice(id);
  return TireRotation::Patterns(static_cast<int>(dev->sensors.size()));
}

StatusOr<std::vector<std::string>> Coordinator::GetLearned(Str id) const {
  const Entry *e = FindEntry(id);
  if (e == nullptr) return UnknownDevice(id);
  return e->learned;
}

StatusOr<std::string> Coordinator::GetDataJSON(Str id) const {
  const DeviceConfig::Device *dev = cfg_.Find(id);
  const Entry *e = FindEntry(id);
  if (dev == nullptr || e == nullptr) return UnknownDevice(id);
  std::string data("{");
  for (const auto &it : e->values) {
    if (data.size() > 1) data.append(", ");
    mgos::JSONAppendStringf(&data, "%Q: %d", it.first.c_str(), it.second);
  }
  data.append("}");
  return mgos::JSONPrintStringf(
      "{id: %Q, available: %B, moving: %B, last_poll: %.3f, data: %s}",
      dev->id.c_str(), e->available, dev->moving,
      (e->last_poll_ms >= 0 ? e->last_poll_ms / 1000.0 : -1.0), data.c_str());
}

std::string Coordinator::ListJSON() const {
  std::string res("[");
  for (const auto &dev : cfg_.devices) {
    const Entry *e = FindEntry(dev.id);
    if (res.size() > 1) res.append(", ");
    mgos::JSONAppendStringf(
        &res, "{id: %Q, family: %Q, addr: %Q, available: %B}",
        dev.id.c_str(), dev.profile->name, dev.addr.ToString().c_str(),
        (e != nullptr && e->available));
  }
  res.append("]");
  return res;
}

StatusOr<bool> Coordinator::IsAvailable(Str id) const {
  const Entry *e = FindEntry(id);
  if (e == nullptr) return UnknownDevice(id);
  return e->available;
}

StatusOr<int> Coordinator::GetIntervalMs(Str id) const {
  const DeviceConfig::Device *dev = cfg_.Find(id);
  if (dev == nullptr) return UnknownDevice(id);
  return (dev->moving ? kMovingIntervalMs : kStationaryIntervalMs);
}

const DeviceConfig &Coordinator::config() const {
  return cfg_;
}

Status Coordinator::SaveConfig() {
  if (cfg_path_.empty()) return Status::OK();
  Status st = cfg_.Save(cfg_path_);
  if (!st.ok()) {
    LOG(LL_ERROR, ("Failed to save config: %s", st.ToString().c_str()));
  }
  return st;
}

}  // namespace tpms
