#include "TireRotation.hpp"

#include "common/cs_dbg.h"

namespace tpms {

// static
const std::vector<RotationPattern> &TireRotation::All() {
  // clang-format off
  static const std::vector<RotationPattern> s_patterns = {
      {"swap", 2, {{1, 2}, {2, 1}}},
      {"front_to_rear", 4, {{1, 3}, {2, 4}, {3, 1}, {4, 2}}},
      {"x_pattern", 4, {{1, 4}, {2, 3}, {3, 2}, {4, 1}}},
      {"rearward_cross", 4, {{1, 4}, {2, 3}, {3, 1}, {4, 2}}},
      {"forward_cross", 4, {{1, 3}, {2, 4}, {3, 2}, {4, 1}}},
      {"axle_rotation", 6, {{1, 5}, {2, 6}, {3, 1}, {4, 2}, {5, 3}, {6, 4}}},
      {"side_swap", 6, {{1, 2}, {2, 1}, {3, 4}, {4, 3}, {5, 6}, {6, 5}}},
  };
  // clang-format on
  return s_patterns;
}

// static
std::vector<std::string> TireRotation::Patterns(int num_tires) {
  std::vector<std::string> res;
  for (const auto &p : All()) {
    if (p.num_tires == num_tires) res.push_back(p.name);
  }
  return res;
}

// static
StatusOr<const RotationPattern *> TireRotation::Find(int num_tires, Str name) {
  for (const auto &p : All()) {
    if (p.num_tires == num_tires && name == p.name) return &p;
  }
  return Errorf(STATUS_NOT_FOUND, "no pattern '%.*s' for %d tires",
                BLEPOLLSTRF(name), num_tires);
}

// static
std::string TireRotation::DefaultName(int num_tires, int position) {
  static const char *const kFourTireNames[] = {
      "Front Left",
      "Front Right",
      "Rear Left",
      "Rear Right",
  };
  if (num_tires == 4 && position >= 1 && position <= 4) {
    return kFourTireNames[position - 1];
  }
  return blepoll::SPrintf("Tire %d", position);
}

// static
Status TireRotation::Apply(Str pattern, PositionMap *mapping,
                           TireNames *names) {
  const int num_tires = static_cast<int>(mapping->size());
  auto ps = Find(num_tires, pattern);
  if (!ps.ok()) return ps.status();
  const RotationPattern &p = *ps.ValueOrDie();

  std::map<int, SensorID> sensors = mapping->entries();
  TireNames new_names = *names;
  for (const auto &move : p.moves) {
    const int new_pos = move.first, old_pos = move.second;
    sensors.erase(new_pos);
    auto it = names->find(old_pos);
    if (it != names->end()) {
      new_names[new_pos] = it->second;
    } else {
      new_names[new_pos] = DefaultName(num_tires, new_pos);
    }
  }
  for (const auto &move : p.moves) {
    auto ids = mapping->Get(move.second);
    if (ids.ok()) sensors[move.first] = ids.ValueOrDie();
  }

  PositionMap new_mapping;
  for (const auto &it : sensors) {
    Status st = new_mapping.Add(it.first, it.second);
    if (!st.ok()) return st;
  }
  LOG(LL_INFO, ("Rotation %s: %s -> %s", p.name, mapping->ToString().c_str(),
                new_mapping.ToString().c_str()));
  *mapping = new_mapping;
  *names = new_names;
  return Status::OK();
}

}  // namespace tpms
