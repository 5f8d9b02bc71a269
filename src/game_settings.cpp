/**
 * @file game_settings.cpp
 * @brief Maps config.ini sections onto GameSettings
 */

#include "game_settings.h"
#include "config.h"
#include <algorithm>
#include <thread>

GameSettings loadGameSettings(const Config& config) {
    GameSettings settings;

    settings.seed = config.getInt("World", "seed", settings.seed);

    StreamingSettings& streaming = settings.streaming;
    streaming.viewDistance = config.getInt("Streaming", "view_distance", streaming.viewDistance);
    streaming.retentionDistance = config.getInt("Streaming", "retention_distance", streaming.viewDistance);
    streaming.workerThreads = config.getInt("Streaming", "worker_threads", streaming.workerThreads);
    streaming.lod1Distance = config.getInt("Streaming", "lod1_distance", streaming.lod1Distance);
    streaming.lod2Distance = config.getInt("Streaming", "lod2_distance", streaming.lod2Distance);
    streaming.retentionDistance = std::max(streaming.retentionDistance, streaming.viewDistance);

    PathfinderSettings& path = settings.pathfinding;
    path.maxSearchDistance = config.getFloat("Pathfinding", "max_search_distance", path.maxSearchDistance);
    path.maxExpansions = config.getInt("Pathfinding", "max_expansions", path.maxExpansions);

    PhysicsSettings& physics = settings.physics;
    physics.gravity = config.getFloat("Physics", "gravity", physics.gravity);
    physics.moveSpeed = config.getFloat("Physics", "move_speed", physics.moveSpeed);
    physics.jumpStrength = config.getFloat("Physics", "jump_strength", physics.jumpStrength);
    physics.playerWidth = config.getFloat("Physics", "player_width", physics.playerWidth);
    physics.playerHeight = config.getFloat("Physics", "player_height", physics.playerHeight);

    RoomSettings& room = settings.room;
    room.tickRate = std::max(1, config.getInt("Room", "tick_rate", room.tickRate));
    room.maxEnemies = config.getInt("Room", "max_enemies", room.maxEnemies);
    room.spawnInterval = config.getFloat("Room", "spawn_interval", room.spawnInterval);
    room.spawnMinRadius = config.getFloat("Room", "spawn_min_radius", room.spawnMinRadius);
    room.spawnMaxRadius = config.getFloat("Room", "spawn_max_radius", room.spawnMaxRadius);
    room.safeZone = config.getFloat("Room", "safe_zone", room.safeZone);
    room.eliteChance = config.getFloat("Room", "elite_chance", room.eliteChance);
    room.repathInterval = config.getFloat("Room", "aggro_repath_interval", room.repathInterval);
    room.waypointTolerance = config.getFloat("Room", "waypoint_tolerance", room.waypointTolerance);
    room.meleeBaseDamage = config.getFloat("Room", "melee_base_damage", room.meleeBaseDamage);
    room.meleeRange = config.getFloat("Room", "melee_range", room.meleeRange);
    room.interactRadius = config.getFloat("Room", "interact_radius", room.interactRadius);
    room.portalRadius = config.getFloat("Room", "portal_radius", room.portalRadius);
    room.collectRadius = config.getFloat("Room", "collect_radius", room.collectRadius);
    room.manaRegen = config.getFloat("Room", "mana_regen", room.manaRegen);
    room.chatMaxLength = config.getInt("Room", "chat_max_length", room.chatMaxLength);
    room.maxEssences = config.getInt("Room", "max_essences", room.maxEssences);
    room.maxCachedChunks = config.getInt("Room", "max_cached_chunks", room.maxCachedChunks);
    room.spawnX = config.getFloat("Room", "spawn_x", room.spawnX);
    room.spawnY = config.getFloat("Room", "spawn_y", room.spawnY);
    room.spawnZ = config.getFloat("Room", "spawn_z", room.spawnZ);
    room.dataDirectory = config.getString("Room", "data_dir", room.dataDirectory);

    if (room.spawnMaxRadius < room.spawnMinRadius) {
        std::swap(room.spawnMinRadius, room.spawnMaxRadius);
    }

    return settings;
}

int resolveWorkerCount(int configured) {
    if (configured > 0) {
        return configured;
    }
    int hardware = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, hardware - 1);
}
