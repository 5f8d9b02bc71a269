/**
 * @file terrain_generator.h
 * @brief Deterministic chunk generation: biome terrain, town blueprint and the test portal
 *
 * generate() is a pure function of (chunk coordinate, seed, LOD). A single
 * generator is shared read-only by every scheduler worker.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "town_blueprint.h"
#include "voxel_grid.h"
#include "world.h"

class FastNoiseLite;

enum class Biome : uint8_t {
    Plains,
    Forest,
    Desert
};

/**
 * @brief Surface blocks of a biome
 */
struct BiomePalette {
    uint8_t top;
    uint8_t under;
    uint8_t stone;
};

const BiomePalette& paletteFor(Biome biome);
const char* biomeName(Biome biome);

/**
 * @brief Portal emitted alongside a chunk for the caller to register
 */
struct PortalSpawn {
    std::string id;
    std::string rank;
    glm::ivec3 position{0};
};

/**
 * @brief Output of one generation job
 */
struct GeneratedChunk {
    ChunkCoord coord;
    int lod = 0;
    Biome biome = Biome::Plains;
    VoxelGrid blocks;
    std::vector<PortalSpawn> portals;
};

class TerrainGenerator {
public:
    explicit TerrainGenerator(int seed, TownBlueprint blueprint = TownBlueprint::createDefault());
    ~TerrainGenerator();

    TerrainGenerator(const TerrainGenerator&) = delete;
    TerrainGenerator& operator=(const TerrainGenerator&) = delete;

    /**
     * @brief Generates the voxel grid of one chunk
     *
     * LOD 0 stamps the whole town blueprint; coarser LODs keep only roads.
     * Every write is bounds-checked against the chunk grid.
     */
    GeneratedChunk generate(int chunkX, int chunkZ, int lod = 0) const;

    Biome biomeAt(int chunkX, int chunkZ) const;

    /**
     * @brief Top solid Y of the natural terrain column (town chunks are flat)
     */
    int terrainHeight(int worldX, int worldZ) const;

    static bool isTownChunk(int chunkX, int chunkZ);

    /**
     * @brief Writes the obsidian portal arch with its base corner at (x, y, z)
     */
    static void stampPortalArch(VoxelGrid& grid, int x, int y, int z);

    int seed() const { return m_seed; }
    const TownBlueprint& blueprint() const { return m_blueprint; }

private:
    void fillNaturalTerrain(GeneratedChunk& chunk) const;
    void fillTownGround(GeneratedChunk& chunk) const;

    int m_seed;
    TownBlueprint m_blueprint;
    std::unique_ptr<FastNoiseLite> m_heightNoise;
    std::unique_ptr<FastNoiseLite> m_biomeNoise;
};
