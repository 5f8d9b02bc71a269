/**
 * @file player_session.h
 * @brief Server-side companion of a connected player
 *
 * Holds what the replicated PlayerState only projects: full item and essence
 * definitions, socketed stones, cooldowns, buffs, physics body, latest input
 * and the private dungeon instance. The session is the only writer of its
 * PlayerState; the room copies it into the replicated map after each change.
 */

#pragma once

#include <array>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "body_physics.h"
#include "dungeon_generator.h"
#include "game_data.h"
#include "room_state.h"

constexpr int ESSENCE_SOCKET_COUNT = 5;

/**
 * @brief An inventory slot: either a regular item or an awakening stone
 */
struct InventoryEntry {
    const ItemDefinition* item = nullptr;
    const AwakeningStoneDefinition* stone = nullptr;

    SyncedItem synced() const { return item ? item->synced() : stone->synced(); }
    std::string id() const { return item ? item->id : stone->id; }
};

struct EquippedEssence {
    const EssenceDefinition* definition = nullptr;
    std::array<const AwakeningStoneDefinition*, ESSENCE_SOCKET_COUNT> stones{};
};

/**
 * @brief An ability with stats, mods and stone contributions folded in
 */
struct ResolvedAbility {
    std::string id;
    std::string name;
    std::string vfx;
    AbilityEffect effect = AbilityEffect::AreaDamage;
    float cost = 0.0f;
    float cooldown = 0.0f;
    float damage = 0.0f;
    float range = 0.0f;
    bool chargeable = false;
    std::vector<StatusEffectMod> statusEffects;
    std::vector<BuffMod> buffs;
    KnockbackMod knockback;          ///< force 0 = none
};

struct ActiveBuff {
    std::string name;
    float remaining = 0.0f;
    float damageReduction = 0.0f;
};

class PlayerSession {
public:
    static constexpr float BASE_STAT_VALUE = 10.0f;
    static constexpr float DEFENSE_FACTOR = 0.5f;       ///< Incoming damage removed per point of armor defense
    static constexpr float MAX_DAMAGE_REDUCTION = 0.9f;

    PlayerSession(std::string sessionId, const std::string& username, const GameData& data,
                  const PhysicsSettings& physics, const glm::vec3& spawnPoint);

    /**
     * @brief Grants the configured starting items, essences and socketed stones
     */
    void applyStartingLoadout();

    const std::string& id() const { return m_id; }
    const PlayerState& state() const { return m_state; }
    PlayerState& state() { return m_state; }

    PhysicsBody& body() { return m_body; }
    const PhysicsBody& body() const { return m_body; }
    const glm::vec3& position() const { return m_body.position; }
    void teleport(const glm::vec3& position);

    void setInput(const KeyState& keys) { m_keys = keys; }
    const KeyState& input() const { return m_keys; }

    // ===== Stats and combat =====

    /// Base stats plus equipment bonuses
    StatBlock stats() const;
    float meleeDamage(float baseDamage) const;
    float totalDefense() const;
    float damageReduction() const;

    /**
     * @brief Applies enemy damage after armor and buffs (minimum 1)
     * @return Damage actually applied
     */
    float takeDamage(float rawDamage);
    void heal(float amount);
    bool isDead() const { return m_state.currentHealth <= 0.0f; }
    bool spendMana(float cost);

    void addBuff(const BuffMod& buff);
    const std::vector<ActiveBuff>& buffs() const { return m_buffs; }

    /// Heal-over-time from a LEECH status landing on an enemy
    void addLeech(float duration, float healPerSecond);

    /**
     * @brief Ticks buffs, leech and mana regeneration
     */
    void update(float dt, float manaRegenPerSecond);

    /**
     * @brief Full health/mana at a new position, back in the overworld
     */
    void respawn(const glm::vec3& spawnPoint);

    // ===== Abilities =====

    /**
     * @brief Ability list by slot index: per equipped essence, its unlocked
     *        abilities followed by socketed stones that grant an ability
     */
    std::vector<ResolvedAbility> abilities() const;

    ResolvedAbility computeEssenceAbility(const EquippedEssence& essence, const AbilityDefinition& ability) const;
    ResolvedAbility computeStoneAbility(const AwakeningStoneDefinition& stone) const;

    bool isOnCooldown(const std::string& abilityId, double now);
    void startCooldown(const std::string& abilityId, float duration, double now);

    // ===== Inventory, equipment, essences =====

    void addItem(const ItemDefinition& item);
    void addStone(const AwakeningStoneDefinition& stone);

    /**
     * @brief Uses an inventory entry: consumables are drunk, weapons/armor equipped
     * @return False for an invalid index or an entry that cannot be used
     */
    bool useItem(int inventoryIndex);

    /**
     * @brief Moves an item into its slot, returning the previous occupant to the inventory
     */
    bool equipItem(int inventoryIndex);

    /**
     * @brief Adds an essence unless already owned or at the limit
     */
    bool addEssence(const EssenceDefinition& essence, int maxEssences);

    /**
     * @brief Sockets a compatible stone from the inventory into an empty essence socket
     */
    bool socketStone(const std::string& essenceId, int socketIndex, int stoneInventoryIndex);

    const std::vector<InventoryEntry>& inventory() const { return m_inventory; }
    const std::vector<EquippedEssence>& essences() const { return m_essences; }
    const ItemDefinition* equipped(EquipSlot slot) const;

    // ===== Location =====

    bool inDungeon() const { return m_dungeon != nullptr; }
    const DungeonInstance* dungeon() const { return m_dungeon.get(); }
    void enterDungeon(std::unique_ptr<DungeonInstance> dungeon, const std::string& portalId);
    std::string exitDungeon();

private:
    void syncInventory();
    void syncEquipment();
    void syncEssences();

    struct Cooldown {
        double startedAt;
        float duration;
    };

    struct Leech {
        float remaining;
        float healPerSecond;
    };

    std::string m_id;
    const GameData& m_data;
    PlayerState m_state;
    PhysicsBody m_body;
    KeyState m_keys;

    std::vector<InventoryEntry> m_inventory;
    std::map<EquipSlot, const ItemDefinition*> m_equipment;
    std::vector<EquippedEssence> m_essences;
    std::unordered_map<std::string, Cooldown> m_cooldowns;
    std::vector<ActiveBuff> m_buffs;
    std::vector<Leech> m_leeches;

    std::unique_ptr<DungeonInstance> m_dungeon;
    std::string m_dungeonPortalId;
};
