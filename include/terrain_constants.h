/**
 * @file terrain_constants.h
 * @brief Named constants for terrain generation, dungeons and physics
 */

#pragma once

namespace TerrainGeneration {
    // Chunk dimensions
    constexpr int CHUNK_SIZE = 32;               ///< Edge length of a cubic chunk (blocks)
    constexpr int CHUNK_VOLUME = CHUNK_SIZE * CHUNK_SIZE * CHUNK_SIZE;

    // Overworld terrain
    constexpr int GROUND_LEVEL = 10;             ///< Top solid layer of flat ground (Y)
    constexpr float HEIGHT_VARIATION = 3.0f;     ///< Max height variation outside the town (blocks)
    constexpr int TOPSOIL_DEPTH = 3;             ///< Under-block layers below the top block
    constexpr float TERRAIN_FREQUENCY = 0.02f;   ///< Height noise frequency
    constexpr float BIOME_FREQUENCY = 0.15f;     ///< Biome noise frequency (sampled per chunk)
    constexpr int DEFAULT_GROUND_HEIGHT = 10;    ///< findGroundHeight result when a column is empty

    // Town region (chunk coordinates, inclusive)
    constexpr int TOWN_MIN_CHUNK = -2;
    constexpr int TOWN_MAX_CHUNK = 2;
    constexpr int TOWN_GROUND_Y = 10;            ///< Grass layer inside the town
    constexpr int TOWN_STRUCTURE_Y = 11;         ///< Base Y of buildings standing on the grass

    // Test portal arch in the origin chunk
    constexpr int PORTAL_LOCAL_X = 18;
    constexpr int PORTAL_LOCAL_Y = 11;
    constexpr int PORTAL_LOCAL_Z = 18;
}

namespace DungeonGeneration {
    constexpr int WIDTH = 128;                   ///< X extent
    constexpr int HEIGHT = 32;                   ///< Y extent
    constexpr int DEPTH = 128;                   ///< Z extent

    constexpr float NOISE_SCALE = 0.05f;
    constexpr int FLOOR_BASE_HEIGHT = 4;
    constexpr int FLOOR_AMPLITUDE = 8;
    constexpr int CEILING_Y = 20;
    constexpr int LAVA_LAYER_Y = 4;              ///< Layer converted to lava in hell dungeons

    constexpr float SPAWN_X = 64.5f;
    constexpr float SPAWN_Z = 64.5f;
    constexpr float DEFAULT_SPAWN_Y = 15.0f;
    constexpr float SPAWN_CLEARANCE = 1.1f;      ///< Added above the first solid block found
}

namespace PhysicsConstants {
    constexpr float GROUND_CHECK_DISTANCE = 0.1f; ///< Distance below the feet probed for ground
    constexpr float COLLISION_SAMPLE_INSET = 0.1f; ///< Inset of the lowest/highest horizontal collision samples
}
