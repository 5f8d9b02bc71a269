/**
 * @file game_settings.h
 * @brief Typed settings read from the INI configuration
 *
 * Every tunable the simulation uses lives here with its default, so a missing
 * config file still yields a fully working server.
 */

#pragma once

#include <string>

class Config;

struct StreamingSettings {
    int viewDistance = 8;        ///< Radius (chunks) of the square requested around the viewer
    int retentionDistance = 8;   ///< Loaded chunks farther than this (chunks) are evicted
    int workerThreads = 0;       ///< 0 = hardware_concurrency - 1
    int lod1Distance = 4;        ///< Chunk distance at which LOD 1 starts
    int lod2Distance = 6;        ///< Chunk distance at which LOD 2 starts
};

struct PathfinderSettings {
    float maxSearchDistance = 60.0f;  ///< Straight-line start/end distance beyond which no search runs
    int maxExpansions = 500;          ///< Node expansion budget per search
};

struct PhysicsSettings {
    float gravity = -30.0f;
    float moveSpeed = 5.0f;
    float jumpStrength = 10.0f;
    float playerWidth = 0.6f;
    float playerHeight = 1.8f;
};

struct RoomSettings {
    int tickRate = 60;
    int maxEnemies = 50;
    float spawnInterval = 1.0f;
    float spawnMinRadius = 40.0f;
    float spawnMaxRadius = 80.0f;
    float safeZone = 40.0f;              ///< Half-extent of the no-spawn box around the origin
    float eliteChance = 0.1f;
    float repathInterval = 2.0f;         ///< Seconds between enemy retarget/path requests
    float waypointTolerance = 0.5f;
    float meleeBaseDamage = 5.0f;
    float meleeRange = 2.5f;
    float interactRadius = 3.0f;
    float portalRadius = 3.0f;
    float collectRadius = 3.0f;
    float manaRegen = 1.0f;              ///< Mana per second
    int chatMaxLength = 200;
    int maxEssences = 4;
    int maxCachedChunks = 256;           ///< Overworld terrain cache bound
    float spawnX = 0.0f;
    float spawnY = 30.0f;
    float spawnZ = 0.0f;
    std::string dataDirectory = "assets/data";
};

struct GameSettings {
    int seed = 1337;
    StreamingSettings streaming;
    PathfinderSettings pathfinding;
    PhysicsSettings physics;
    RoomSettings room;
};

/**
 * @brief Reads every known key, falling back to the defaults above
 */
GameSettings loadGameSettings(const Config& config);

/**
 * @brief Resolves a configured worker count (0 or less = hardware_concurrency - 1, at least 1)
 */
int resolveWorkerCount(int configured);
