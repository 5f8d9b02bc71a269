/**
 * @file terrain_generator.cpp
 * @brief Chunk terrain, town stamping and portal arch
 */

#include "terrain_generator.h"
#include "block_system.h"
#include "dungeon_generator.h"
#include "terrain_constants.h"
#include "FastNoiseLite.h"
#include <algorithm>
#include <cmath>

using namespace TerrainGeneration;

namespace {

const BiomePalette PLAINS_PALETTE{BlockID::GRASS, BlockID::DIRT, BlockID::STONE};
const BiomePalette FOREST_PALETTE{BlockID::GRASS, BlockID::DIRT, BlockID::STONE};
const BiomePalette DESERT_PALETTE{BlockID::SAND, BlockID::SANDSTONE, BlockID::STONE};

} // namespace

const BiomePalette& paletteFor(Biome biome) {
    switch (biome) {
        case Biome::Forest: return FOREST_PALETTE;
        case Biome::Desert: return DESERT_PALETTE;
        case Biome::Plains:
        default:            return PLAINS_PALETTE;
    }
}

const char* biomeName(Biome biome) {
    switch (biome) {
        case Biome::Forest: return "forest";
        case Biome::Desert: return "desert";
        case Biome::Plains:
        default:            return "plains";
    }
}

TerrainGenerator::TerrainGenerator(int seed, TownBlueprint blueprint)
    : m_seed(seed), m_blueprint(std::move(blueprint)) {
    m_heightNoise = std::make_unique<FastNoiseLite>(seed);
    m_heightNoise->SetNoiseType(FastNoiseLite::NoiseType_OpenSimplex2);
    m_heightNoise->SetFractalType(FastNoiseLite::FractalType_FBm);
    m_heightNoise->SetFractalOctaves(3);
    m_heightNoise->SetFrequency(TERRAIN_FREQUENCY);

    m_biomeNoise = std::make_unique<FastNoiseLite>(seed + 1);
    m_biomeNoise->SetNoiseType(FastNoiseLite::NoiseType_OpenSimplex2);
    m_biomeNoise->SetFrequency(BIOME_FREQUENCY);
}

TerrainGenerator::~TerrainGenerator() = default;

bool TerrainGenerator::isTownChunk(int chunkX, int chunkZ) {
    return chunkX >= TOWN_MIN_CHUNK && chunkX <= TOWN_MAX_CHUNK &&
           chunkZ >= TOWN_MIN_CHUNK && chunkZ <= TOWN_MAX_CHUNK;
}

Biome TerrainGenerator::biomeAt(int chunkX, int chunkZ) const {
    if (isTownChunk(chunkX, chunkZ)) {
        return Biome::Plains;
    }

    float value = m_biomeNoise->GetNoise(static_cast<float>(chunkX), static_cast<float>(chunkZ));
    if (value < -0.33f) return Biome::Desert;
    if (value > 0.33f) return Biome::Forest;
    return Biome::Plains;
}

int TerrainGenerator::terrainHeight(int worldX, int worldZ) const {
    if (isTownChunk(WorldCoords::toChunk(worldX), WorldCoords::toChunk(worldZ))) {
        return TOWN_GROUND_Y;
    }

    float noise = m_heightNoise->GetNoise(static_cast<float>(worldX), static_cast<float>(worldZ));
    int height = GROUND_LEVEL + static_cast<int>(std::lround(noise * HEIGHT_VARIATION));
    return std::clamp(height, 1, CHUNK_SIZE - 2);
}

GeneratedChunk TerrainGenerator::generate(int chunkX, int chunkZ, int lod) const {
    GeneratedChunk chunk;
    chunk.coord = {chunkX, chunkZ};
    chunk.lod = lod;
    chunk.biome = biomeAt(chunkX, chunkZ);
    chunk.blocks = VoxelGrid::chunk();

    if (isTownChunk(chunkX, chunkZ)) {
        fillTownGround(chunk);
        m_blueprint.stamp(chunk.blocks, chunkX, chunkZ, TOWN_GROUND_Y, lod > 0);
    } else {
        fillNaturalTerrain(chunk);
    }

    if (chunkX == 0 && chunkZ == 0) {
        stampPortalArch(chunk.blocks, PORTAL_LOCAL_X, PORTAL_LOCAL_Y, PORTAL_LOCAL_Z);

        PortalSpawn portal;
        portal.id = "portal_iron_1";
        portal.rank = DungeonRanks::IRON.name;
        portal.position = glm::ivec3(PORTAL_LOCAL_X, PORTAL_LOCAL_Y, PORTAL_LOCAL_Z);
        chunk.portals.push_back(portal);
    }

    return chunk;
}

void TerrainGenerator::fillTownGround(GeneratedChunk& chunk) const {
    // Flat plaza: dirt under a single grass layer, air above
    for (int z = 0; z < CHUNK_SIZE; z++) {
        for (int x = 0; x < CHUNK_SIZE; x++) {
            chunk.blocks.set(x, TOWN_GROUND_Y - 1, z, BlockID::DIRT);
            chunk.blocks.set(x, TOWN_GROUND_Y, z, BlockID::GRASS);
        }
    }
}

void TerrainGenerator::fillNaturalTerrain(GeneratedChunk& chunk) const {
    const BiomePalette& palette = paletteFor(chunk.biome);
    const int baseX = chunk.coord.x * CHUNK_SIZE;
    const int baseZ = chunk.coord.z * CHUNK_SIZE;

    for (int z = 0; z < CHUNK_SIZE; z++) {
        for (int x = 0; x < CHUNK_SIZE; x++) {
            int height = terrainHeight(baseX + x, baseZ + z);
            for (int y = 0; y <= height; y++) {
                uint8_t block = palette.stone;
                if (y == height) {
                    block = palette.top;
                } else if (y >= height - TOPSOIL_DEPTH) {
                    block = palette.under;
                }
                chunk.blocks.set(x, y, z, block);
            }
        }
    }
}

void TerrainGenerator::stampPortalArch(VoxelGrid& grid, int x, int y, int z) {
    for (int i = 0; i < 5; i++) {
        grid.set(x + i, y, z, BlockID::OBSIDIAN);       // threshold
        grid.set(x + i, y + 5, z, BlockID::OBSIDIAN);   // lintel
    }
    for (int j = 1; j < 5; j++) {
        grid.set(x, y + j, z, BlockID::OBSIDIAN);       // left post
        grid.set(x + 4, y + j, z, BlockID::OBSIDIAN);   // right post
    }
}
