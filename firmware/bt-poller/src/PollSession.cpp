#include "PollSession.hpp"

#include <algorithm>

#include "common/cs_dbg.h"

namespace tpms {

// static
std::string PollResult::PressureKey(int position) {
  return blepoll::SPrintf("tire%d_pressure", position);
}

// static
std::string PollResult::TemperatureKey(int position) {
  return blepoll::SPrintf("tire%d_temperature", position);
}

std::string PollResult::ToJSON() const {
  std::string res("{");
  for (const auto &it : values) {
    if (res.size() > 1) res.append(", ");
    res.append(mgos::JSONPrintStringf("%Q: %d", it.first.c_str(), it.second));
  }
  res.append("}");
  return res;
}

PollSession::PollSession(const Options &opts, CompleteCB complete_cb)
    : opts_(opts), complete_cb_(complete_cb) {
  // With nothing expected the session is complete from the start.
  CheckCompletion();
}

PollSession::Effect PollSession::Apply(const TPMSPacket &pkt) {
  if (pkt.type == TPMSPacket::Type::kConfig) {
    config_count_++;
    LOG(LL_DEBUG, ("Config %d: %s", config_count_, pkt.ToString().c_str()));
    return Effect::kNone;
  }
  auto ps = opts_.mapping.Lookup(pkt.sensor_id);
  if (ps.ok()) {
    const int pos = ps.ValueOrDie();
    result_.values[PollResult::PressureKey(pos)] = pkt.pressure;
    result_.values[PollResult::TemperatureKey(pos)] = pkt.temperature;
    data_count_++;
    LOG(LL_DEBUG, ("Tire %d: %s", pos, pkt.ToString().c_str()));
    return Effect::kUpdated;
  }
  const std::string ids = pkt.sensor_id.ToString();
  if (!opts_.learning) {
    LOG(LL_DEBUG, ("Unknown sensor %s, ignored", ids.c_str()));
    return Effect::kNone;
  }
  if (std::find(discovered_.begin(), discovered_.end(), ids) !=
      discovered_.end()) {
    return Effect::kNone;
  }
  if (discovered_.size() >= opts_.max_discovered) {
    LOG(LL_WARN, ("Too many sensors, %s dropped", ids.c_str()));
    return Effect::kNone;
  }
  discovered_.push_back(ids);
  LOG(LL_INFO, ("Discovered sensor %s", ids.c_str()));
  return Effect::kDiscovered;
}

PollSession::Effect PollSession::HandleNotification(Str raw) {
  LOG(LL_VERBOSE_DEBUG, ("Notification: %s", raw.ToHexString().c_str()));
  auto ps = TPMSPacket::Parse(raw);
  if (!ps.ok()) {
    LOG(LL_DEBUG, ("Dropped: %s", ps.status().ToString().c_str()));
    return Effect::kNone;
  }
  const Effect eff = Apply(ps.ValueOrDie());
  CheckCompletion();
  return eff;
}

void PollSession::CheckCompletion() {
  if (complete_ || opts_.learning) return;
  if (data_count_ < opts_.expected_data) return;
  complete_ = true;
  LOG(LL_DEBUG, ("Complete: %d data, %d config%s", data_count_, config_count_,
                 (config_complete() ? "" : " (config incomplete)")));
  if (complete_cb_) complete_cb_();
}

void PollSession::SetValue(const std::string &key, int value) {
  result_.values[key] = value;
}

void PollSession::SetStatus(const Status &st) {
  result_.status = st;
}

void PollSession::ClearValues() {
  result_.values.clear();
}

bool PollSession::learning() const {
  return opts_.learning;
}

bool PollSession::complete() const {
  return complete_;
}

bool PollSession::config_complete() const {
  return (config_count_ >= opts_.expected_config);
}

int PollSession::data_count() const {
  return data_count_;
}

int PollSession::config_count() const {
  return config_count_;
}

const PollResult &PollSession::result() const {
  return result_;
}

PollResult PollSession::TakeResult() {
  return std::move(result_);
}

const std::vector<std::string> &PollSession::discovered() const {
  return discovered_;
}

}  // namespace tpms
