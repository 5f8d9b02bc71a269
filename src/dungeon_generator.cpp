/**
 * @file dungeon_generator.cpp
 * @brief Dungeon themes, ranks and instance generation
 */

#include "dungeon_generator.h"
#include "block_system.h"
#include "logger.h"
#include "terrain_constants.h"
#include "FastNoiseLite.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace DungeonThemes {
    const DungeonTheme CAVE{"Cave", BlockID::STONE, BlockID::COBBLESTONE, BlockID::DIRT, false};
    const DungeonTheme HELL{"Hell", BlockID::OBSIDIAN, BlockID::OBSIDIAN, BlockID::STONE, true};
}

namespace DungeonRanks {
    const DungeonRank IRON{"Iron", "#8d8d8d", 40.0f};
    const DungeonRank BRONZE{"Bronze", "#cd7f32", 30.0f};
    const DungeonRank SILVER{"Silver", "#c0c0c0", 15.0f};
    const DungeonRank GOLD{"Gold", "#ffd700", 10.0f};
    const DungeonRank DIAMOND{"Diamond", "#b9f2ff", 4.0f};
    const DungeonRank TRANSCENDENT{"Transcendent", "#9932cc", 0.9f};
    const DungeonRank ASCENDED{"Ascended", "#ffffff", 0.1f};

    const std::array<const DungeonRank*, 7>& all() {
        static const std::array<const DungeonRank*, 7> ranks = {
            &IRON, &BRONZE, &SILVER, &GOLD, &DIAMOND, &TRANSCENDENT, &ASCENDED
        };
        return ranks;
    }

    const DungeonRank& pickWeighted(float roll) {
        float total = 0.0f;
        for (const DungeonRank* rank : all()) {
            total += rank->weight;
        }

        float remaining = std::clamp(roll, 0.0f, 1.0f) * total;
        for (const DungeonRank* rank : all()) {
            if (remaining < rank->weight) {
                return *rank;
            }
            remaining -= rank->weight;
        }
        return IRON;
    }

    const DungeonRank* find(const std::string& name) {
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        std::string wanted = lower(name);
        for (const DungeonRank* rank : all()) {
            if (lower(rank->name) == wanted) {
                return rank;
            }
        }
        return nullptr;
    }
}

DungeonInstance::DungeonInstance(VoxelGrid blocks, glm::vec3 spawnPoint, const DungeonTheme& theme, int seed)
    : m_blocks(std::move(blocks)), m_spawnPoint(spawnPoint), m_theme(&theme), m_seed(seed) {
}

namespace DungeonGenerator {

DungeonInstance generate(const DungeonTheme& theme, int seed) {
    using namespace DungeonGeneration;

    VoxelGrid blocks(WIDTH, HEIGHT, DEPTH, BlockID::AIR);

    FastNoiseLite noise(seed);
    noise.SetNoiseType(FastNoiseLite::NoiseType_OpenSimplex2);
    noise.SetFrequency(1.0f);

    for (int x = 0; x < WIDTH; x++) {
        for (int z = 0; z < DEPTH; z++) {
            float n = noise.GetNoise(x * NOISE_SCALE, z * NOISE_SCALE);
            float normalized = (n + 1.0f) / 2.0f;
            int floorHeight = FLOOR_BASE_HEIGHT + static_cast<int>(std::floor(normalized * FLOOR_AMPLITUDE));
            for (int y = 0; y <= floorHeight; y++) {
                blocks.set(x, y, z, theme.wall);
            }
            blocks.set(x, CEILING_Y, z, theme.wall);
        }
    }

    if (theme.lavaLayer) {
        for (int x = 0; x < WIDTH; x++) {
            for (int z = 0; z < DEPTH; z++) {
                if (blocks.get(x, LAVA_LAYER_Y, z) != BlockID::AIR) {
                    blocks.set(x, LAVA_LAYER_Y, z, BlockID::LAVA);
                }
            }
        }
    }

    glm::vec3 spawn = findSpawnPoint(blocks);
    Logger::debug() << "Generated " << theme.name << " dungeon (seed " << seed << "), spawn at "
                    << spawn.x << ", " << spawn.y << ", " << spawn.z;

    return DungeonInstance(std::move(blocks), spawn, theme, seed);
}

glm::vec3 findSpawnPoint(const VoxelGrid& blocks) {
    using namespace DungeonGeneration;

    glm::vec3 spawn(SPAWN_X, DEFAULT_SPAWN_Y, SPAWN_Z);
    int x = static_cast<int>(std::floor(SPAWN_X));
    int z = static_cast<int>(std::floor(SPAWN_Z));

    // Start below the ceiling so the scan lands on the cave floor
    int startY = std::min(CEILING_Y - 1, blocks.height() - 1);
    for (int y = startY; y >= 0; y--) {
        if (blocks.get(x, y, z) != BlockID::AIR) {
            spawn.y = static_cast<float>(y) + SPAWN_CLEARANCE;
            break;
        }
    }
    return spawn;
}

} // namespace DungeonGenerator
