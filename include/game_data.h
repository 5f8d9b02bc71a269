/**
 * @file game_data.h
 * @brief Static data tables: items, essences, awakening stones, enemy types and world objects
 *
 * All tables are loaded from YAML files in the configured data directory:
 *   items.yaml, essences.yaml, awakening_stones.yaml, enemies.yaml, world.yaml
 *
 * A file that is missing or malformed is logged and leaves its table empty;
 * a single malformed entry is skipped. Nothing here throws to the caller.
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include "room_state.h"

namespace YAML { class Node; }

// ============================================================
// Stats
// ============================================================

enum class Stat {
    Might,
    Speed,
    Endurance,
    Recovery,
    Spirit
};

constexpr int STAT_COUNT = 5;

const char* statName(Stat stat);
std::optional<Stat> parseStat(const std::string& name);

/**
 * @brief One value per Stat
 */
struct StatBlock {
    std::array<float, STAT_COUNT> values{};

    float get(Stat stat) const { return values[static_cast<int>(stat)]; }
    void add(Stat stat, float amount) { values[static_cast<int>(stat)] += amount; }

    StatBlock& operator+=(const StatBlock& other) {
        for (int i = 0; i < STAT_COUNT; i++) {
            values[i] += other.values[i];
        }
        return *this;
    }

    static StatBlock uniform(float value) {
        StatBlock block;
        block.values.fill(value);
        return block;
    }
};

// ============================================================
// Items
// ============================================================

enum class ItemType {
    Consumable,
    Weapon,
    Armor,
    Essence,
    AwakeningStone
};

enum class EquipSlot {
    MainHand,
    Head,
    Chest,
    Legs,
    Feet
};

const char* equipSlotName(EquipSlot slot);
std::optional<EquipSlot> parseEquipSlot(const std::string& name);
std::optional<ItemType> parseItemType(const std::string& name);

struct ItemDefinition {
    std::string id;
    std::string name;
    std::string description;
    ItemType type = ItemType::Consumable;
    std::optional<EquipSlot> slot;   ///< Weapons and armor only
    float damage = 0.0f;
    float meleeBonus = 0.0f;         ///< Added to melee strikes while in the main hand
    float defense = 0.0f;
    float healAmount = 0.0f;         ///< Consumable heal effect
    StatBlock stats;

    SyncedItem synced() const { return {id, name}; }
};

// ============================================================
// Essences and abilities
// ============================================================

enum class AbilityEffect {
    AreaDamage,      ///< AOE_DAMAGE: every enemy within range
    None
};

struct AbilityDefinition {
    std::string id;
    std::string name;
    std::string description;
    bool unlocked = true;
    float cost = 0.0f;
    float cooldown = 0.0f;
    AbilityEffect effect = AbilityEffect::AreaDamage;
    float baseDamage = 0.0f;
    std::optional<Stat> scalingStat;
    float scalingRatio = 1.0f;
    float range = 0.0f;
    std::string vfx;
};

struct EssenceDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string color = "#ffffff";
    std::vector<AbilityDefinition> abilities;
};

// ============================================================
// Awakening stones
// ============================================================

/// ADD_FLAT_DAMAGE (stacks onto the essence ability) or DAMAGE (the stone's own strike)
struct FlatDamageMod {
    float value = 0.0f;
    bool appliesToEssence = true;
};

/// ADD_EFFECT: status applied to enemies hit
struct StatusEffectMod {
    std::string effect;          ///< STUN, BLEED, LEECH, VULNERABLE, ...
    float chance = 1.0f;
    float duration = 0.0f;
    float amount = 0.0f;
    float damage = 0.0f;
    float healPerSecond = 0.0f;
};

/// COOLDOWN
struct CooldownOverrideMod {
    float seconds = 0.0f;
};

/// KNOCKBACK
struct KnockbackMod {
    float force = 0.0f;
    float range = 0.0f;
};

/// APPLY_BUFF: timed buff on the caster
struct BuffMod {
    std::string name;
    float duration = 0.0f;
    float damageReduction = 0.0f;
};

using StoneMod = std::variant<FlatDamageMod, StatusEffectMod, CooldownOverrideMod, KnockbackMod, BuffMod>;

enum class StoneAbilityType {
    None,        ///< Passive modifier only
    Instant,
    Charge
};

struct AwakeningStoneDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string color = "#ffffff";
    std::string vfx;
    StoneAbilityType abilityType = StoneAbilityType::None;
    std::vector<std::string> requiredEssenceIds;   ///< Empty = fits any essence
    std::vector<StoneMod> mods;

    bool isCompatibleWith(const std::string& essenceId) const;
    bool grantsAbility() const { return abilityType != StoneAbilityType::None; }

    std::optional<float> cooldownOverride() const;

    /**
     * @brief Sum of flat damage mods
     * @param essenceOnly Only ADD_FLAT_DAMAGE (what stacks onto the essence ability)
     */
    float flatDamage(bool essenceOnly) const;

    const KnockbackMod* knockback() const;

    SyncedItem synced() const { return {id, name}; }
};

// ============================================================
// Enemies and world objects
// ============================================================

enum class EnemyAttackKind {
    Melee,
    Ranged
};

struct EnemyAttackDefinition {
    EnemyAttackKind kind = EnemyAttackKind::Melee;
    float damage = 0.0f;
    float range = 1.5f;
    float cooldown = 2.0f;
};

struct EnemyType {
    std::string key;        ///< Table key, e.g. SLIME
    std::string type;       ///< Quest target name, e.g. Slime
    std::string name;
    float width = 1.0f;
    float height = 1.0f;
    float health = 10.0f;
    float speed = 1.0f;
    float aggroRange = 10.0f;
    int xpValue = 0;
    std::vector<EnemyAttackDefinition> attacks;
};

struct NpcDefinition {
    std::string id;
    std::string name;
    glm::vec3 position{0.0f};
    std::string questId;
    std::vector<std::string> dialogue;
};

struct PortalDefinition {
    std::string id;
    std::string name;
    glm::vec3 position{0.0f};
    std::string color;
};

struct CollectibleDefinition {
    std::string id;
    CollectibleKind kind = CollectibleKind::Essence;
    std::string definitionId;
    glm::vec3 position{0.0f};
};

/**
 * @brief What every new player starts with
 */
struct StartingLoadout {
    struct Essence {
        std::string id;
        std::vector<std::string> stones;   ///< Socket slot i holds stones[i] ("" = empty)
    };

    std::vector<std::string> items;
    std::vector<Essence> essences;
};

enum class DataTable {
    Items,
    Essences,
    AwakeningStones,
    Enemies,
    World
};

const char* dataTableFile(DataTable table);

// ============================================================
// GameData
// ============================================================

class GameData {
public:
    GameData() = default;

    /**
     * @brief Loads every table file from a directory
     * @return True if all five tables loaded
     */
    bool loadFromDirectory(const std::string& directory);

    /**
     * @brief Loads (replaces) one table from a YAML file
     */
    bool loadFile(DataTable table, const std::string& filepath);

    /**
     * @brief Loads (replaces) one table from YAML text
     */
    bool loadString(DataTable table, const std::string& yamlText);

    const ItemDefinition* findItem(const std::string& id) const;
    const EssenceDefinition* findEssence(const std::string& id) const;
    const AwakeningStoneDefinition* findStone(const std::string& id) const;
    const EnemyType* findEnemyType(const std::string& key) const;
    const NpcDefinition* findNpc(const std::string& id) const;
    const PortalDefinition* findPortal(const std::string& id) const;

    /// Enemy types in file order (uniform spawn selection indexes this)
    const std::vector<EnemyType>& enemyTypes() const { return m_enemyTypes; }
    const std::vector<AwakeningStoneDefinition>& stones() const { return m_stones; }
    const std::vector<NpcDefinition>& npcs() const { return m_npcs; }
    const std::vector<PortalDefinition>& portals() const { return m_portals; }
    const std::vector<CollectibleDefinition>& collectibles() const { return m_collectibles; }
    const StartingLoadout& startingLoadout() const { return m_loadout; }

    size_t itemCount() const { return m_items.size(); }
    size_t essenceCount() const { return m_essences.size(); }

private:
    bool apply(DataTable table, const YAML::Node& root, const std::string& source);
    int parseItems(const YAML::Node& root, const std::string& source);
    int parseEssences(const YAML::Node& root, const std::string& source);
    int parseStones(const YAML::Node& root, const std::string& source);
    int parseEnemies(const YAML::Node& root, const std::string& source);
    int parseWorld(const YAML::Node& root, const std::string& source);

    std::unordered_map<std::string, ItemDefinition> m_items;
    std::unordered_map<std::string, EssenceDefinition> m_essences;
    std::vector<AwakeningStoneDefinition> m_stones;
    std::vector<EnemyType> m_enemyTypes;
    std::vector<NpcDefinition> m_npcs;
    std::vector<PortalDefinition> m_portals;
    std::vector<CollectibleDefinition> m_collectibles;
    StartingLoadout m_loadout;
};
