/**
 * @file world.h
 * @brief Chunk coordinate keys and the block query surface shared by physics,
 *        pathfinding and spawn placement
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include "terrain_constants.h"

/**
 * @brief Horizontal chunk coordinate key (chunks span the full world height)
 */
struct ChunkCoord {
    int x = 0;
    int z = 0;

    bool operator==(const ChunkCoord& other) const {
        return x == other.x && z == other.z;
    }
    bool operator!=(const ChunkCoord& other) const { return !(*this == other); }
};

namespace std {
    template<>
    struct hash<ChunkCoord> {
        size_t operator()(const ChunkCoord& coord) const {
            size_t h1 = hash<int>()(coord.x);
            size_t h2 = hash<int>()(coord.z);
            return h1 ^ (h2 * 0x9E3779B97F4A7C15ULL + (h1 << 6) + (h1 >> 2));
        }
    };
}

namespace WorldCoords {
    /**
     * @brief Floor division of a world block coordinate by the chunk edge
     */
    inline int toChunk(int world) {
        const int size = TerrainGeneration::CHUNK_SIZE;
        return (world >= 0) ? world / size : -((-world + size - 1) / size);
    }

    /**
     * @brief Euclidean (always non-negative) local coordinate inside a chunk
     */
    inline int toLocal(int world) {
        const int size = TerrainGeneration::CHUNK_SIZE;
        return ((world % size) + size) % size;
    }

    inline int toBlock(float world) {
        return static_cast<int>(std::floor(world));
    }

    inline ChunkCoord chunkOf(float worldX, float worldZ) {
        return {toChunk(toBlock(worldX)), toChunk(toBlock(worldZ))};
    }
}

/**
 * @brief Read-only block lookup in world space
 *
 * Implemented by the client chunk scheduler, the server overworld terrain
 * and dungeon instances. Unknown or unloaded space reads as air.
 */
class BlockSource {
public:
    virtual ~BlockSource() = default;

    virtual uint8_t getBlock(int x, int y, int z) const = 0;

    /**
     * @brief Block containing a floating-point world position
     */
    uint8_t getBlockAt(float x, float y, float z) const {
        return getBlock(WorldCoords::toBlock(x), WorldCoords::toBlock(y), WorldCoords::toBlock(z));
    }

    bool isSolidAt(float x, float y, float z) const {
        return getBlockAt(x, y, z) != 0;
    }

    /**
     * @brief Highest Y this source can hold a block at (exclusive)
     */
    virtual int columnHeight() const { return TerrainGeneration::CHUNK_SIZE; }
};

/**
 * @brief Y just above the highest solid block of a column
 *
 * Scans downward from the top of the source and returns `y + 1` of the
 * first solid block, or DEFAULT_GROUND_HEIGHT for an empty column.
 */
int findGroundHeight(const BlockSource& world, float worldX, float worldZ);
