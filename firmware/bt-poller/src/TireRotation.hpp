#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "TPMSSensorID.hpp"

namespace tpms {

typedef std::map<int, std::string> TireNames;

struct RotationPattern {
  const char *name;
  int num_tires;
  // {new position, old position}
  std::vector<std::pair<int, int>> moves;
};

// Rotation moves the sensors along with the tires, so the mapping
// is relabeled and names follow their sensors.
class TireRotation {
 public:
  static std::vector<std::string> Patterns(int num_tires);
  static StatusOr<const RotationPattern *> Find(int num_tires, Str name);

  // "Front Left" etc. for 4 tires, "Tire <n>" otherwise.
  static std::string DefaultName(int num_tires, int position);

  // Tire count is the number of mapped positions.
  // Positions the pattern does not mention are left as they are.
  static Status Apply(Str pattern, PositionMap *mapping, TireNames *names);

 private:
  static const std::vector<RotationPattern> &All();
};

}  // namespace tpms
