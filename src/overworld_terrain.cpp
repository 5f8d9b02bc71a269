/**
 * @file overworld_terrain.cpp
 * @brief Server-side cache of generated overworld chunks for block queries
 */

#include "overworld_terrain.h"
#include "block_system.h"
#include "logger.h"

OverworldTerrain::OverworldTerrain(const TerrainGenerator& generator, size_t maxCachedChunks)
    : m_generator(generator), m_maxCachedChunks(maxCachedChunks > 0 ? maxCachedChunks : 1) {
}

uint8_t OverworldTerrain::getBlock(int x, int y, int z) const {
    if (y < 0 || y >= TerrainGeneration::CHUNK_SIZE) {
        return BlockID::AIR;
    }

    ChunkCoord coord{WorldCoords::toChunk(x), WorldCoords::toChunk(z)};
    return chunk(coord).get(WorldCoords::toLocal(x), y, WorldCoords::toLocal(z));
}

const VoxelGrid& OverworldTerrain::chunk(const ChunkCoord& coord) const {
    auto it = m_chunks.find(coord);
    if (it != m_chunks.end()) {
        return it->second;
    }

    while (m_chunks.size() >= m_maxCachedChunks && !m_order.empty()) {
        m_chunks.erase(m_order.front());
        m_order.pop_front();
    }

    GeneratedChunk generated = m_generator.generate(coord.x, coord.z, 0);
    m_order.push_back(coord);
    auto inserted = m_chunks.emplace(coord, std::move(generated.blocks));

    Logger::debug() << "Overworld chunk (" << coord.x << ", " << coord.z << ") generated, "
                    << m_chunks.size() << " cached";
    return inserted.first->second;
}

void OverworldTerrain::clear() {
    m_chunks.clear();
    m_order.clear();
}
