#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace pontoon::core {

using ObjectId = std::uint64_t;
constexpr ObjectId kInvalidObjectId = 0;

// Human-facing label such as "PN-000012" used in logs and panels.
inline std::string make_display_id(std::string_view prefix, ObjectId id, int pad_width = 6) {
  std::ostringstream oss;
  oss << prefix << "-" << std::setw(pad_width) << std::setfill('0') << id;
  return oss.str();
}

inline std::string pontoon_display_id(ObjectId id) { return make_display_id("PN", id); }

}  // namespace pontoon::core
