/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_TYPES_HPP
#define REGION_TYPES_HPP

#include "utils/UniqueID.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ostream>

namespace Strata {

using RegionId = int32_t;
using TileId = int32_t;
using EntityID = UniqueID::IDType;

constexpr RegionId INVALID_REGION_ID = -1;
constexpr TileId INVALID_TILE_ID = -1;

/**
 * @brief Integer cell coordinate inside a region grid. Row-major index is
 * z * width + x.
 */
struct CellPos {
  int32_t x{0};
  int32_t z{0};

  bool operator==(const CellPos &other) const {
    return x == other.x && z == other.z;
  }
  bool operator!=(const CellPos &other) const { return !(*this == other); }

  float distanceTo(const CellPos &other) const {
    const float dx = static_cast<float>(x - other.x);
    const float dz = static_cast<float>(z - other.z);
    return std::sqrt(dx * dx + dz * dz);
  }

  // Ring index used by the neighbourhood searches
  int chebyshevDistance(const CellPos &other) const {
    return std::max(std::abs(x - other.x), std::abs(z - other.z));
  }
};

enum class Rotation : uint8_t { North = 0, East = 1, South = 2, West = 3 };

inline std::ostream &operator<<(std::ostream &os, const CellPos &pos) {
  return os << "(" << pos.x << ", " << pos.z << ")";
}

inline std::ostream &operator<<(std::ostream &os, Rotation rotation) {
  return os << static_cast<int>(rotation);
}

} // namespace Strata

#endif // REGION_TYPES_HPP
