#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "blepoll_str.hpp"

namespace tpms {

using blepoll::Errorf;
using blepoll::Status;
using blepoll::StatusOr;
using blepoll::Str;

// Identity of a tire sensor as it appears in notifications, bytes 1-4.
struct SensorID {
  static constexpr size_t kLen = 4;

  uint8_t bytes[kLen] = {};

  SensorID() = default;
  explicit SensorID(const uint8_t *b);

  // Accepts "0E-B3-0B-02" (any case) and "0EB30B02".
  static StatusOr<SensorID> Parse(Str s);

  // Hyphen-separated uppercase hex, "0E-B3-0B-02".
  std::string ToString() const;

  bool operator==(const SensorID &other) const;
  bool operator!=(const SensorID &other) const { return !(*this == other); }
  bool operator<(const SensorID &other) const;
};

static constexpr int kMinPosition = 1;
static constexpr int kMaxPosition = 6;

// "tire_<n>"
std::string PositionLabel(int position);
StatusOr<int> ParsePositionLabel(Str label);

// Tire position -> sensor identity. Both sides are unique.
class PositionMap {
 public:
  PositionMap() = default;

  // Factory presets of the TireLinc head unit, positions 1-4.
  static PositionMap Defaults();

  Status Add(int position, const SensorID &id);

  // Returns NOT_FOUND for identities not in the map.
  StatusOr<int> Lookup(const SensorID &id) const;
  StatusOr<SensorID> Get(int position) const;

  const std::map<int, SensorID> &entries() const;
  size_t size() const;
  bool empty() const;

  std::string ToString() const;

  bool operator==(const PositionMap &other) const;
  bool operator!=(const PositionMap &other) const { return !(*this == other); }

 private:
  std::map<int, SensorID> by_pos_;
  std::map<SensorID, int> by_id_;
};

}  // namespace tpms
