/**
 * @file overworld_terrain.h
 * @brief Server-side block queries over the procedural overworld
 */

#pragma once

#include <deque>
#include <unordered_map>
#include "terrain_generator.h"
#include "voxel_grid.h"
#include "world.h"

/**
 * @brief BlockSource that generates LOD 0 chunks on demand
 *
 * Uses the same generator and seed as the client scheduler, so collision,
 * pathfinding and spawn placement on the server see the terrain players see.
 * Generated chunks are cached; the oldest is dropped once the cache is full.
 * Not thread-safe: owned by the room thread.
 */
class OverworldTerrain : public BlockSource {
public:
    OverworldTerrain(const TerrainGenerator& generator, size_t maxCachedChunks = 256);

    uint8_t getBlock(int x, int y, int z) const override;

    size_t cachedChunks() const { return m_chunks.size(); }
    void clear();

private:
    const VoxelGrid& chunk(const ChunkCoord& coord) const;

    const TerrainGenerator& m_generator;
    size_t m_maxCachedChunks;

    mutable std::unordered_map<ChunkCoord, VoxelGrid> m_chunks;
    mutable std::deque<ChunkCoord> m_order;
};
