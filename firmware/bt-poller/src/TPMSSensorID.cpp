#include "TPMSSensorID.hpp"

#include <cstring>

namespace tpms {

static const char *const kDefaultSensorIDs[] = {
    "0E-B3-0B-02",
    "0E-88-46-02",
    "0E-FF-47-02",
    "0E-61-3A-02",
};

SensorID::SensorID(const uint8_t *b) {
  std::memcpy(bytes, b, kLen);
}

// static
StatusOr<SensorID> SensorID::Parse(Str s) {
  std::string hex;
  s = s.Strip();
  if (s.len == kLen * 2) {
    hex = s.ToString();
  } else {
    auto parts = s.SplitOn('-');
    if (parts.size() != kLen) {
      return Errorf(STATUS_INVALID_ARGUMENT, "invalid sensor id '%.*s'",
                    BLEPOLLSTRF(s));
    }
    for (const auto &part : parts) {
      if (part.len != 2) {
        return Errorf(STATUS_INVALID_ARGUMENT, "invalid sensor id '%.*s'",
                      BLEPOLLSTRF(s));
      }
      hex.append(part.p, part.len);
    }
  }
  SensorID res;
  size_t size = sizeof(res.bytes);
  if (!Str(hex).HexDecode(res.bytes, size) || size != kLen) {
    return Errorf(STATUS_INVALID_ARGUMENT, "invalid sensor id '%.*s'",
                  BLEPOLLSTRF(s));
  }
  return res;
}

std::string SensorID::ToString() const {
  return blepoll::SPrintf("%02X-%02X-%02X-%02X", bytes[0], bytes[1], bytes[2],
                          bytes[3]);
}

bool SensorID::operator==(const SensorID &other) const {
  return (std::memcmp(bytes, other.bytes, kLen) == 0);
}

bool SensorID::operator<(const SensorID &other) const {
  return (std::memcmp(bytes, other.bytes, kLen) < 0);
}

std::string PositionLabel(int position) {
  return blepoll::SPrintf("tire_%d", position);
}

StatusOr<int> ParsePositionLabel(Str label) {
  Str num(label);
  if (!num.StartsWith("tire_")) {
    return Errorf(STATUS_INVALID_ARGUMENT, "invalid position '%.*s'",
                  BLEPOLLSTRF(label));
  }
  num.ChopLeft(5);
  auto ps = num.ToUInt8();
  if (!ps.ok() || ps.ValueOrDie() < kMinPosition ||
      ps.ValueOrDie() > kMaxPosition) {
    return Errorf(STATUS_INVALID_ARGUMENT, "invalid position '%.*s'",
                  BLEPOLLSTRF(label));
  }
  return static_cast<int>(ps.ValueOrDie());
}

// static
PositionMap PositionMap::Defaults() {
  PositionMap res;
  int pos = kMinPosition;
  for (const char *ids : kDefaultSensorIDs) {
    const SensorID id = SensorID::Parse(ids).ValueOrDie();
    res.by_pos_[pos] = id;
    res.by_id_[id] = pos;
    pos++;
  }
  return res;
}

Status PositionMap::Add(int position, const SensorID &id) {
  if (position < kMinPosition || position > kMaxPosition) {
    return Errorf(STATUS_INVALID_ARGUMENT, "invalid position %d", position);
  }
  if (by_pos_.count(position) != 0) {
    return Errorf(STATUS_ALREADY_EXISTS, "position %d is already assigned",
                  position);
  }
  auto it = by_id_.find(id);
  if (it != by_id_.end()) {
    return Errorf(STATUS_ALREADY_EXISTS, "sensor %s is already at position %d",
                  id.ToString().c_str(), it->second);
  }
  by_pos_[position] = id;
  by_id_[id] = position;
  return Status::OK();
}

StatusOr<int> PositionMap::Lookup(const SensorID &id) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return Status::NOT_FOUND();
  }
  return it->second;
}

StatusOr<SensorID> PositionMap::Get(int position) const {
  auto it = by_pos_.find(position);
  if (it == by_pos_.end()) {
    return Status::NOT_FOUND();
  }
  return it->second;
}

const std::map<int, SensorID> &PositionMap::entries() const {
  return by_pos_;
}

size_t PositionMap::size() const {
  return by_pos_.size();
}

bool PositionMap::empty() const {
  return by_pos_.empty();
}

std::string PositionMap::ToString() const {
  std::string res;
  for (const auto &it : by_pos_) {
    if (!res.empty()) res.append(" ");
    res.append(blepoll::SPrintf("%d=%s", it.first,
                                it.second.ToString().c_str()));
  }
  return res;
}

bool PositionMap::operator==(const PositionMap &other) const {
  return (by_pos_ == other.by_pos_);
}

}  // namespace tpms
