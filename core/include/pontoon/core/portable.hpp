#pragma once

#include <string>
#include <vector>

#include "pontoon/core/entities.hpp"
#include "pontoon/core/grid.hpp"
#include "pontoon/core/id.hpp"
#include "pontoon/core/result.hpp"

namespace pontoon::core {

// Exchange form for persistence/export collaborators. Enumerations travel as
// their lower-case names ("double", "yellow") and rotation in degrees.
struct PortablePontoon {
  ObjectId id = kInvalidObjectId;
  GridPosition position{};
  std::string type{"single"};
  std::string color{"blue"};
  int rotation_deg = 0;
};

struct PortableGrid {
  GridDimensions dimensions{};
  std::vector<PortablePontoon> pontoons{};
  ObjectId next_id = kInvalidObjectId;  // kInvalidObjectId: derive from the largest id
};

[[nodiscard]] PortableGrid ToPortable(const Grid& grid);

// Rejects malformed or rule-breaking input as a whole; never returns a partial grid.
[[nodiscard]] EditResult<Grid> FromPortable(const PortableGrid& portable);

}  // namespace pontoon::core
