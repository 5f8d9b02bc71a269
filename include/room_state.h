/**
 * @file room_state.h
 * @brief Replicated entity values: the read-only mirror clients receive
 *
 * These hold projections only (ids, names, numbers). The full item, essence
 * and AI state lives in the server-side PlayerSession / EnemyController.
 */

#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "replicated_map.h"

/**
 * @brief id + display name projection of an item definition
 */
struct SyncedItem {
    std::string id;
    std::string name;

    bool operator==(const SyncedItem& o) const { return id == o.id && name == o.name; }
    bool operator!=(const SyncedItem& o) const { return !(*this == o); }
};

struct QuestObjectiveState {
    std::string description;
    int progress = 0;
    int amount = 1;

    bool operator==(const QuestObjectiveState& o) const {
        return description == o.description && progress == o.progress && amount == o.amount;
    }
};

struct ActiveQuest {
    std::string id;
    std::string title;
    bool readyForTurnIn = false;
    std::vector<QuestObjectiveState> objectives;

    bool operator==(const ActiveQuest& o) const {
        return id == o.id && title == o.title && readyForTurnIn == o.readyForTurnIn &&
               objectives == o.objectives;
    }
};

enum class LocationType {
    Overworld,
    Dungeon
};

struct PlayerState {
    std::string username = "New Player";
    glm::vec3 position{0.0f, 30.0f, 0.0f};
    float currentHealth = 100.0f;
    float maxHealth = 100.0f;
    float currentMana = 50.0f;
    float maxMana = 50.0f;
    std::map<std::string, SyncedItem> equipment;     ///< slot name -> item
    std::vector<SyncedItem> inventory;
    std::vector<SyncedItem> essences;
    std::string mainStoryState = "NOT_STARTED";
    std::map<std::string, ActiveQuest> activeQuests;
    std::vector<std::string> completedQuests;
    LocationType location = LocationType::Overworld;

    // Every resource write goes through these so [0, max] always holds
    void setHealth(float value) { currentHealth = std::clamp(value, 0.0f, maxHealth); }
    void setMana(float value) { currentMana = std::clamp(value, 0.0f, maxMana); }

    bool operator==(const PlayerState& o) const {
        return username == o.username && position == o.position &&
               currentHealth == o.currentHealth && maxHealth == o.maxHealth &&
               currentMana == o.currentMana && maxMana == o.maxMana &&
               equipment == o.equipment && inventory == o.inventory && essences == o.essences &&
               mainStoryState == o.mainStoryState && activeQuests == o.activeQuests &&
               completedQuests == o.completedQuests && location == o.location;
    }
};

enum class EnemyClass {
    Minion,
    Elite
};

inline const char* enemyClassName(EnemyClass cls) {
    return cls == EnemyClass::Elite ? "elite" : "minion";
}

struct EnemyState {
    std::string id;
    std::string type;        ///< Quest-facing type, e.g. "Slime"
    std::string name;
    EnemyClass classType = EnemyClass::Minion;
    glm::vec3 position{0.0f};
    float health = 0.0f;
    float maxHealth = 0.0f;

    void setHealth(float value) { health = std::clamp(value, 0.0f, maxHealth); }

    bool operator==(const EnemyState& o) const {
        return id == o.id && type == o.type && name == o.name && classType == o.classType &&
               position == o.position && health == o.health && maxHealth == o.maxHealth;
    }
};

struct NpcState {
    std::string id;
    std::string name;
    glm::vec3 position{0.0f};

    bool operator==(const NpcState& o) const {
        return id == o.id && name == o.name && position == o.position;
    }
};

struct PortalState {
    std::string id;
    std::string name;
    glm::vec3 position{0.0f};
    std::string color;

    bool operator==(const PortalState& o) const {
        return id == o.id && name == o.name && position == o.position && color == o.color;
    }
};

enum class CollectibleKind {
    Essence,
    Stone
};

struct CollectibleState {
    std::string id;
    CollectibleKind kind = CollectibleKind::Essence;
    std::string definitionId;
    std::string name;
    std::string color;
    glm::vec3 position{0.0f};

    bool operator==(const CollectibleState& o) const {
        return id == o.id && kind == o.kind && definitionId == o.definitionId && name == o.name &&
               color == o.color && position == o.position;
    }
};

/**
 * @brief The replicated tree of one room
 */
struct RoomState {
    ReplicatedMap<PlayerState> players;
    ReplicatedMap<EnemyState> enemies;
    ReplicatedMap<NpcState> npcs;
    ReplicatedMap<PortalState> portals;
    ReplicatedMap<CollectibleState> collectibles;
};
