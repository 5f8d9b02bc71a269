/**
 * @file player_session.cpp
 * @brief Player inventory, loadout, ability resolution and resource accounting
 */

#include "player_session.h"
#include "logger.h"
#include <algorithm>
#include <type_traits>
#include <variant>

namespace {
constexpr float DEFAULT_STONE_RANGE = 4.0f;
}

PlayerSession::PlayerSession(std::string sessionId, const std::string& username, const GameData& data,
                             const PhysicsSettings& physics, const glm::vec3& spawnPoint)
    : m_id(std::move(sessionId)), m_data(data) {
    m_state.username = username.empty() ? "New Player" : username;
    m_body.width = physics.playerWidth;
    m_body.height = physics.playerHeight;
    teleport(spawnPoint);
}

void PlayerSession::applyStartingLoadout() {
    const StartingLoadout& loadout = m_data.startingLoadout();

    for (const std::string& id : loadout.items) {
        if (const ItemDefinition* item = m_data.findItem(id)) {
            addItem(*item);
        } else if (const AwakeningStoneDefinition* stone = m_data.findStone(id)) {
            addStone(*stone);
        } else {
            Logger::warning() << "Starting loadout references unknown item '" << id << "'";
        }
    }

    for (const StartingLoadout::Essence& entry : loadout.essences) {
        const EssenceDefinition* essence = m_data.findEssence(entry.id);
        if (!essence) {
            Logger::warning() << "Starting loadout references unknown essence '" << entry.id << "'";
            continue;
        }

        EquippedEssence equipped;
        equipped.definition = essence;
        for (size_t i = 0; i < entry.stones.size() && i < equipped.stones.size(); i++) {
            if (entry.stones[i].empty()) continue;
            const AwakeningStoneDefinition* stone = m_data.findStone(entry.stones[i]);
            if (stone && stone->isCompatibleWith(essence->id)) {
                equipped.stones[i] = stone;
            } else {
                Logger::warning() << "Starting stone '" << entry.stones[i] << "' does not fit " << essence->id;
            }
        }
        m_essences.push_back(equipped);
    }

    syncEssences();
}

void PlayerSession::teleport(const glm::vec3& position) {
    m_body.position = position;
    m_body.velocity = glm::vec3(0.0f);
    m_body.grounded = false;
    m_state.position = position;
}

// ============================================================
// Stats and combat
// ============================================================

StatBlock PlayerSession::stats() const {
    StatBlock total = StatBlock::uniform(BASE_STAT_VALUE);
    for (const auto& entry : m_equipment) {
        total += entry.second->stats;
    }
    return total;
}

float PlayerSession::meleeDamage(float baseDamage) const {
    const ItemDefinition* weapon = equipped(EquipSlot::MainHand);
    return baseDamage + (weapon ? weapon->meleeBonus : 0.0f);
}

float PlayerSession::totalDefense() const {
    float defense = 0.0f;
    for (const auto& entry : m_equipment) {
        defense += entry.second->defense;
    }
    return defense;
}

float PlayerSession::damageReduction() const {
    float reduction = 0.0f;
    for (const ActiveBuff& buff : m_buffs) {
        reduction += buff.damageReduction;
    }
    return std::min(reduction, MAX_DAMAGE_REDUCTION);
}

float PlayerSession::takeDamage(float rawDamage) {
    float damage = rawDamage * (1.0f - damageReduction()) - totalDefense() * DEFENSE_FACTOR;
    damage = std::max(damage, 1.0f);
    m_state.setHealth(m_state.currentHealth - damage);
    return damage;
}

void PlayerSession::heal(float amount) {
    m_state.setHealth(m_state.currentHealth + amount);
}

bool PlayerSession::spendMana(float cost) {
    if (m_state.currentMana < cost) {
        return false;
    }
    m_state.setMana(m_state.currentMana - cost);
    return true;
}

void PlayerSession::addBuff(const BuffMod& buff) {
    for (ActiveBuff& active : m_buffs) {
        if (active.name == buff.name) {
            active.remaining = std::max(active.remaining, buff.duration);
            active.damageReduction = buff.damageReduction;
            return;
        }
    }
    m_buffs.push_back({buff.name, buff.duration, buff.damageReduction});
}

void PlayerSession::addLeech(float duration, float healPerSecond) {
    m_leeches.push_back({duration, healPerSecond});
}

void PlayerSession::update(float dt, float manaRegenPerSecond) {
    for (ActiveBuff& buff : m_buffs) {
        buff.remaining -= dt;
    }
    m_buffs.erase(std::remove_if(m_buffs.begin(), m_buffs.end(),
                                 [](const ActiveBuff& b) { return b.remaining <= 0.0f; }),
                  m_buffs.end());

    for (Leech& leech : m_leeches) {
        float step = std::min(dt, leech.remaining);
        heal(leech.healPerSecond * step);
        leech.remaining -= dt;
    }
    m_leeches.erase(std::remove_if(m_leeches.begin(), m_leeches.end(),
                                   [](const Leech& l) { return l.remaining <= 0.0f; }),
                    m_leeches.end());

    if (!isDead()) {
        m_state.setMana(m_state.currentMana + manaRegenPerSecond * dt);
    }
}

void PlayerSession::respawn(const glm::vec3& spawnPoint) {
    m_dungeon.reset();
    m_dungeonPortalId.clear();
    m_state.location = LocationType::Overworld;
    m_buffs.clear();
    m_leeches.clear();
    m_state.currentHealth = m_state.maxHealth;
    m_state.currentMana = m_state.maxMana;
    teleport(spawnPoint);
}

// ============================================================
// Abilities
// ============================================================

std::vector<ResolvedAbility> PlayerSession::abilities() const {
    std::vector<ResolvedAbility> list;
    for (const EquippedEssence& essence : m_essences) {
        for (const AbilityDefinition& ability : essence.definition->abilities) {
            if (ability.unlocked) {
                list.push_back(computeEssenceAbility(essence, ability));
            }
        }
        for (const AwakeningStoneDefinition* stone : essence.stones) {
            if (stone && stone->grantsAbility() && stone->isCompatibleWith(essence.definition->id)) {
                list.push_back(computeStoneAbility(*stone));
            }
        }
    }
    return list;
}

ResolvedAbility PlayerSession::computeEssenceAbility(const EquippedEssence& essence,
                                                     const AbilityDefinition& ability) const {
    ResolvedAbility resolved;
    resolved.id = ability.id;
    resolved.name = ability.name;
    resolved.vfx = ability.vfx;
    resolved.effect = ability.effect;
    resolved.cost = ability.cost;
    resolved.cooldown = ability.cooldown;
    resolved.range = ability.range;

    resolved.damage = ability.baseDamage;
    if (ability.scalingStat) {
        resolved.damage += stats().get(*ability.scalingStat) * ability.scalingRatio;
    }

    for (const AwakeningStoneDefinition* stone : essence.stones) {
        if (!stone) continue;
        resolved.damage += stone->flatDamage(true);
        for (const StoneMod& mod : stone->mods) {
            if (const auto* status = std::get_if<StatusEffectMod>(&mod)) {
                resolved.statusEffects.push_back(*status);
            }
        }
    }
    return resolved;
}

ResolvedAbility PlayerSession::computeStoneAbility(const AwakeningStoneDefinition& stone) const {
    ResolvedAbility resolved;
    resolved.id = stone.id;
    resolved.name = stone.name;
    resolved.vfx = stone.vfx;
    resolved.effect = AbilityEffect::AreaDamage;
    resolved.chargeable = stone.abilityType == StoneAbilityType::Charge;
    resolved.damage = stone.flatDamage(false);
    resolved.cooldown = stone.cooldownOverride().value_or(0.0f);

    const KnockbackMod* knockback = stone.knockback();
    resolved.range = knockback ? knockback->range : DEFAULT_STONE_RANGE;

    for (const StoneMod& mod : stone.mods) {
        std::visit([&resolved](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, StatusEffectMod>) {
                resolved.statusEffects.push_back(m);
            } else if constexpr (std::is_same_v<T, KnockbackMod>) {
                resolved.knockback = m;
            } else if constexpr (std::is_same_v<T, BuffMod>) {
                resolved.buffs.push_back(m);
            }
        }, mod);
    }
    return resolved;
}

bool PlayerSession::isOnCooldown(const std::string& abilityId, double now) {
    auto it = m_cooldowns.find(abilityId);
    if (it == m_cooldowns.end()) {
        return false;
    }
    if (now - it->second.startedAt >= it->second.duration) {
        m_cooldowns.erase(it);
        return false;
    }
    return true;
}

void PlayerSession::startCooldown(const std::string& abilityId, float duration, double now) {
    m_cooldowns[abilityId] = {now, duration};
}

// ============================================================
// Inventory, equipment, essences
// ============================================================

void PlayerSession::addItem(const ItemDefinition& item) {
    InventoryEntry entry;
    entry.item = &item;
    m_inventory.push_back(entry);
    syncInventory();
}

void PlayerSession::addStone(const AwakeningStoneDefinition& stone) {
    InventoryEntry entry;
    entry.stone = &stone;
    m_inventory.push_back(entry);
    syncInventory();
}

bool PlayerSession::useItem(int inventoryIndex) {
    if (inventoryIndex < 0 || inventoryIndex >= static_cast<int>(m_inventory.size())) {
        return false;
    }

    const ItemDefinition* item = m_inventory[inventoryIndex].item;
    if (!item) {
        return false;  // stones are socketed, not used
    }

    switch (item->type) {
        case ItemType::Consumable:
            if (item->healAmount > 0.0f) {
                heal(item->healAmount);
            }
            m_inventory.erase(m_inventory.begin() + inventoryIndex);
            syncInventory();
            return true;
        case ItemType::Weapon:
        case ItemType::Armor:
            return equipItem(inventoryIndex);
        default:
            return false;
    }
}

bool PlayerSession::equipItem(int inventoryIndex) {
    if (inventoryIndex < 0 || inventoryIndex >= static_cast<int>(m_inventory.size())) {
        return false;
    }
    const ItemDefinition* item = m_inventory[inventoryIndex].item;
    if (!item || !item->slot) {
        return false;
    }

    m_inventory.erase(m_inventory.begin() + inventoryIndex);

    auto it = m_equipment.find(*item->slot);
    if (it != m_equipment.end()) {
        InventoryEntry previous;
        previous.item = it->second;
        m_inventory.push_back(previous);
    }
    m_equipment[*item->slot] = item;

    syncInventory();
    syncEquipment();
    return true;
}

bool PlayerSession::addEssence(const EssenceDefinition& essence, int maxEssences) {
    if (static_cast<int>(m_essences.size()) >= maxEssences) {
        return false;
    }
    for (const EquippedEssence& owned : m_essences) {
        if (owned.definition->id == essence.id) {
            return false;
        }
    }

    EquippedEssence equipped;
    equipped.definition = &essence;
    m_essences.push_back(equipped);
    syncEssences();
    return true;
}

bool PlayerSession::socketStone(const std::string& essenceId, int socketIndex, int stoneInventoryIndex) {
    if (socketIndex < 0 || socketIndex >= ESSENCE_SOCKET_COUNT) {
        return false;
    }
    if (stoneInventoryIndex < 0 || stoneInventoryIndex >= static_cast<int>(m_inventory.size())) {
        return false;
    }

    auto essence = std::find_if(m_essences.begin(), m_essences.end(),
                                [&](const EquippedEssence& e) { return e.definition->id == essenceId; });
    if (essence == m_essences.end() || essence->stones[socketIndex] != nullptr) {
        return false;
    }

    const AwakeningStoneDefinition* stone = m_inventory[stoneInventoryIndex].stone;
    if (!stone || !stone->isCompatibleWith(essenceId)) {
        return false;
    }

    essence->stones[socketIndex] = stone;
    m_inventory.erase(m_inventory.begin() + stoneInventoryIndex);
    syncInventory();

    Logger::info() << m_state.username << " socketed " << stone->name << " into "
                   << essence->definition->name << " slot " << socketIndex;
    return true;
}

const ItemDefinition* PlayerSession::equipped(EquipSlot slot) const {
    auto it = m_equipment.find(slot);
    return it != m_equipment.end() ? it->second : nullptr;
}

// ============================================================
// Location
// ============================================================

void PlayerSession::enterDungeon(std::unique_ptr<DungeonInstance> dungeon, const std::string& portalId) {
    teleport(dungeon->spawnPoint());
    m_dungeon = std::move(dungeon);
    m_dungeonPortalId = portalId;
    m_state.location = LocationType::Dungeon;
}

std::string PlayerSession::exitDungeon() {
    std::string portalId = m_dungeonPortalId;
    m_dungeon.reset();
    m_dungeonPortalId.clear();
    m_state.location = LocationType::Overworld;
    return portalId;
}

// ============================================================
// Replicated projections
// ============================================================

void PlayerSession::syncInventory() {
    m_state.inventory.clear();
    for (const InventoryEntry& entry : m_inventory) {
        m_state.inventory.push_back(entry.synced());
    }
}

void PlayerSession::syncEquipment() {
    m_state.equipment.clear();
    for (const auto& entry : m_equipment) {
        m_state.equipment[equipSlotName(entry.first)] = entry.second->synced();
    }
}

void PlayerSession::syncEssences() {
    m_state.essences.clear();
    for (const EquippedEssence& essence : m_essences) {
        m_state.essences.push_back({essence.definition->id, essence.definition->name});
    }
}
