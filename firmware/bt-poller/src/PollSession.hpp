#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "TPMSPacket.hpp"
#include "TPMSSensorID.hpp"

namespace tpms {

// Outcome of one poll. status is UNAVAILABLE if the device could not be
// reached; a timed out session is still OK, with whatever arrived.
struct PollResult {
  Status status;
  std::map<std::string, int> values;

  static std::string PressureKey(int position);
  static std::string TemperatureKey(int position);
  static constexpr const char *kSignalStrengthKey = "signal_strength";

  // {"tire1_pressure": 32, ...}
  std::string ToJSON() const;
};

// Accumulates notifications of a single poll and decides when enough
// have arrived.
class PollSession {
 public:
  enum class Effect {
    kNone,
    kUpdated,
    kDiscovered,
  };

  struct Options {
    PositionMap mapping;
    bool learning = false;
    int expected_data = 4;
    int expected_config = 4;
    size_t max_discovered = 16;
  };

  typedef std::function<void()> CompleteCB;

  explicit PollSession(const Options &opts, CompleteCB complete_cb = nullptr);
  PollSession(const PollSession &other) = delete;

  Effect Apply(const TPMSPacket &pkt);

  // Decodes and applies one raw notification, then checks for completion.
  // Rejected packets are logged and dropped.
  Effect HandleNotification(Str raw);

  void SetValue(const std::string &key, int value);
  void SetStatus(const Status &st);
  void ClearValues();

  bool learning() const;
  bool complete() const;
  bool config_complete() const;
  int data_count() const;
  int config_count() const;
  const PollResult &result() const;
  PollResult TakeResult();
  // Text form of unmapped identities seen in learning mode, arrival order.
  const std::vector<std::string> &discovered() const;

 private:
  void CheckCompletion();

  const Options opts_;
  CompleteCB complete_cb_;
  PollResult result_;
  int data_count_ = 0;
  int config_count_ = 0;
  bool complete_ = false;
  std::vector<std::string> discovered_;
};

}  // namespace tpms
