/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "persistence/GridCodec.hpp"
#include "core/PersistenceError.hpp"
#include "world/Region.hpp"

namespace Strata {

namespace {

void checkSize(const std::vector<uint8_t>& bytes, size_t expected, const char* layer)
{
    if (bytes.size() != expected) {
        throw ArchiveFormatError(std::string(layer) + " grid holds " + std::to_string(bytes.size()) +
                                 " bytes, region needs " + std::to_string(expected));
    }
}

} // namespace

std::vector<uint8_t> GridCodec::serializeU16(const Region& region, const CellU16& cellFn)
{
    std::vector<uint8_t> bytes;
    bytes.reserve(region.getCellCount() * 2);
    for (int z = 0; z < region.getHeight(); ++z) {
        for (int x = 0; x < region.getWidth(); ++x) {
            const uint16_t value = cellFn(CellPos{x, z});
            bytes.push_back(static_cast<uint8_t>(value & 0xFF));
            bytes.push_back(static_cast<uint8_t>(value >> 8));
        }
    }
    return bytes;
}

std::vector<uint8_t> GridCodec::serializeU8(const Region& region, const CellU8& cellFn)
{
    std::vector<uint8_t> bytes;
    bytes.reserve(region.getCellCount());
    for (int z = 0; z < region.getHeight(); ++z) {
        for (int x = 0; x < region.getWidth(); ++x) {
            bytes.push_back(cellFn(CellPos{x, z}));
        }
    }
    return bytes;
}

void GridCodec::deserializeU16(const std::vector<uint8_t>& bytes, const Region& region, const ApplyU16& applyFn)
{
    checkSize(bytes, region.getCellCount() * 2, "16-bit");
    size_t offset = 0;
    for (int z = 0; z < region.getHeight(); ++z) {
        for (int x = 0; x < region.getWidth(); ++x) {
            const uint16_t value = static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
            offset += 2;
            applyFn(CellPos{x, z}, value);
        }
    }
}

void GridCodec::deserializeU8(const std::vector<uint8_t>& bytes, const Region& region, const ApplyU8& applyFn)
{
    checkSize(bytes, region.getCellCount(), "8-bit");
    size_t offset = 0;
    for (int z = 0; z < region.getHeight(); ++z) {
        for (int x = 0; x < region.getWidth(); ++x) {
            applyFn(CellPos{x, z}, bytes[offset++]);
        }
    }
}

} // namespace Strata
