/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_CODEC_HPP
#define GRID_CODEC_HPP

#include "world/RegionTypes.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace Strata {

class Region;

/**
 * @brief Flattens one per-cell scalar layer of a region into bytes and back.
 *
 * Cells are visited row-major (z outer, x inner). 16-bit layers are stored
 * little-endian, two bytes per cell; 8-bit layers one byte per cell.
 * Deserializing a buffer whose size does not match the region throws
 * ArchiveFormatError before any cell is applied.
 */
class GridCodec {
public:
    using CellU16 = std::function<uint16_t(const CellPos&)>;
    using CellU8 = std::function<uint8_t(const CellPos&)>;
    using ApplyU16 = std::function<void(const CellPos&, uint16_t)>;
    using ApplyU8 = std::function<void(const CellPos&, uint8_t)>;

    static std::vector<uint8_t> serializeU16(const Region& region, const CellU16& cellFn);
    static std::vector<uint8_t> serializeU8(const Region& region, const CellU8& cellFn);

    static void deserializeU16(const std::vector<uint8_t>& bytes, const Region& region, const ApplyU16& applyFn);
    static void deserializeU8(const std::vector<uint8_t>& bytes, const Region& region, const ApplyU8& applyFn);

private:
    GridCodec() = delete;
};

} // namespace Strata

#endif // GRID_CODEC_HPP
