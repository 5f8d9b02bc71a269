/**
 * @file dungeon_generator.h
 * @brief Ephemeral dungeon instances: themed noise caverns behind portals
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <glm/glm.hpp>
#include "voxel_grid.h"
#include "world.h"

/**
 * @brief Block palette and name of a dungeon theme
 */
struct DungeonTheme {
    std::string name;
    uint8_t wall;
    uint8_t floor;
    uint8_t detail;
    bool lavaLayer;   ///< Converts the lava layer's solid cells to lava
};

namespace DungeonThemes {
    extern const DungeonTheme CAVE;
    extern const DungeonTheme HELL;
}

/**
 * @brief Portal/dungeon rank with its spawn weight and display colour
 */
struct DungeonRank {
    const char* name;
    const char* color;
    float weight;
};

namespace DungeonRanks {
    extern const DungeonRank IRON;
    extern const DungeonRank BRONZE;
    extern const DungeonRank SILVER;
    extern const DungeonRank GOLD;
    extern const DungeonRank DIAMOND;
    extern const DungeonRank TRANSCENDENT;
    extern const DungeonRank ASCENDED;

    const std::array<const DungeonRank*, 7>& all();

    /**
     * @brief Rank for a uniform roll in [0, 1) by cumulative weight
     */
    const DungeonRank& pickWeighted(float roll);

    /**
     * @brief Rank by name (case-insensitive); nullptr if unknown
     */
    const DungeonRank* find(const std::string& name);
}

/**
 * @brief A generated dungeon grid owned by the room while a player is inside
 */
class DungeonInstance : public BlockSource {
public:
    DungeonInstance(VoxelGrid blocks, glm::vec3 spawnPoint, const DungeonTheme& theme, int seed);

    uint8_t getBlock(int x, int y, int z) const override { return m_blocks.get(x, y, z); }
    int columnHeight() const override { return m_blocks.height(); }

    const VoxelGrid& blocks() const { return m_blocks; }
    const glm::vec3& spawnPoint() const { return m_spawnPoint; }
    const DungeonTheme& theme() const { return *m_theme; }
    int seed() const { return m_seed; }

private:
    VoxelGrid m_blocks;
    glm::vec3 m_spawnPoint;
    const DungeonTheme* m_theme;
    int m_seed;
};

namespace DungeonGenerator {
    /**
     * @brief Generates the 128x32x128 grid for a theme and seed
     *
     * Floor height per column is `4 + floor(((n + 1) / 2) * 8)` for seeded noise
     * n; a wall-block ceiling sits at y = 20. The spawn point is found by
     * scanning down the centre column from just below the ceiling.
     */
    DungeonInstance generate(const DungeonTheme& theme, int seed);

    /**
     * @brief First-solid-block scan of the centre column; default height if none
     */
    glm::vec3 findSpawnPoint(const VoxelGrid& blocks);
}
