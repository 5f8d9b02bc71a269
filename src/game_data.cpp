/**
 * @file game_data.cpp
 * @brief YAML loaders for the static game tables
 */

#include "game_data.h"
#include "logger.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template<typename T>
T read(const YAML::Node& node, const char* key, T fallback) {
    return node[key] ? node[key].as<T>() : fallback;
}

glm::vec3 readPosition(const YAML::Node& node) {
    YAML::Node pos = node["position"];
    if (pos && pos.IsSequence() && pos.size() == 3) {
        return glm::vec3(pos[0].as<float>(), pos[1].as<float>(), pos[2].as<float>());
    }
    return glm::vec3(read<float>(node, "x", 0.0f), read<float>(node, "y", 0.0f), read<float>(node, "z", 0.0f));
}

YAML::Node listNode(const YAML::Node& root, const char* key) {
    return root[key] ? root[key] : root;
}

StatBlock readStats(const YAML::Node& node, const std::string& owner) {
    StatBlock stats;
    if (!node || !node.IsMap()) {
        return stats;
    }
    for (const auto& entry : node) {
        std::string name = entry.first.as<std::string>();
        std::optional<Stat> stat = parseStat(name);
        if (!stat) {
            Logger::warning() << "GameData: unknown stat '" << name << "' on " << owner;
            continue;
        }
        stats.add(*stat, entry.second.as<float>());
    }
    return stats;
}

std::optional<StoneMod> parseMod(const YAML::Node& node) {
    std::string type = node["type"].as<std::string>();

    if (type == "ADD_FLAT_DAMAGE") {
        return StoneMod(FlatDamageMod{read<float>(node, "value", 0.0f), true});
    }
    if (type == "DAMAGE") {
        return StoneMod(FlatDamageMod{read<float>(node, "amount", read<float>(node, "value", 0.0f)), false});
    }
    if (type == "ADD_EFFECT") {
        StatusEffectMod mod;
        mod.effect = node["value"].as<std::string>();
        mod.chance = read<float>(node, "chance", 1.0f);
        mod.duration = read<float>(node, "duration", 0.0f);
        mod.amount = read<float>(node, "amount", 0.0f);
        mod.damage = read<float>(node, "damage", 0.0f);
        mod.healPerSecond = read<float>(node, "heal_per_second", 0.0f);
        return StoneMod(mod);
    }
    if (type == "COOLDOWN") {
        return StoneMod(CooldownOverrideMod{node["seconds"].as<float>()});
    }
    if (type == "KNOCKBACK") {
        return StoneMod(KnockbackMod{read<float>(node, "force", 0.0f), read<float>(node, "range", 0.0f)});
    }
    if (type == "APPLY_BUFF") {
        BuffMod mod;
        mod.name = node["name"].as<std::string>();
        mod.duration = read<float>(node, "duration", 0.0f);
        mod.damageReduction = read<float>(node, "damage_reduction", 0.0f);
        return StoneMod(mod);
    }
    return std::nullopt;
}

} // namespace

// ============================================================
// Enum names
// ============================================================

const char* statName(Stat stat) {
    switch (stat) {
        case Stat::Might: return "might";
        case Stat::Speed: return "speed";
        case Stat::Endurance: return "endurance";
        case Stat::Recovery: return "recovery";
        case Stat::Spirit: return "spirit";
    }
    return "unknown";
}

std::optional<Stat> parseStat(const std::string& name) {
    std::string lower = toLower(name);
    for (int i = 0; i < STAT_COUNT; i++) {
        Stat stat = static_cast<Stat>(i);
        if (lower == statName(stat)) {
            return stat;
        }
    }
    return std::nullopt;
}

const char* equipSlotName(EquipSlot slot) {
    switch (slot) {
        case EquipSlot::MainHand: return "mainHand";
        case EquipSlot::Head: return "head";
        case EquipSlot::Chest: return "chest";
        case EquipSlot::Legs: return "legs";
        case EquipSlot::Feet: return "feet";
    }
    return "unknown";
}

std::optional<EquipSlot> parseEquipSlot(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "mainhand" || lower == "main_hand") return EquipSlot::MainHand;
    if (lower == "head") return EquipSlot::Head;
    if (lower == "chest") return EquipSlot::Chest;
    if (lower == "legs") return EquipSlot::Legs;
    if (lower == "feet") return EquipSlot::Feet;
    return std::nullopt;
}

std::optional<ItemType> parseItemType(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "consumable") return ItemType::Consumable;
    if (lower == "weapon") return ItemType::Weapon;
    if (lower == "armor") return ItemType::Armor;
    if (lower == "essence") return ItemType::Essence;
    if (lower == "awakening stone" || lower == "awakening_stone") return ItemType::AwakeningStone;
    return std::nullopt;
}

const char* dataTableFile(DataTable table) {
    switch (table) {
        case DataTable::Items: return "items.yaml";
        case DataTable::Essences: return "essences.yaml";
        case DataTable::AwakeningStones: return "awakening_stones.yaml";
        case DataTable::Enemies: return "enemies.yaml";
        case DataTable::World: return "world.yaml";
    }
    return "";
}

// ============================================================
// AwakeningStoneDefinition
// ============================================================

bool AwakeningStoneDefinition::isCompatibleWith(const std::string& essenceId) const {
    if (requiredEssenceIds.empty()) {
        return true;
    }
    return std::find(requiredEssenceIds.begin(), requiredEssenceIds.end(), essenceId) != requiredEssenceIds.end();
}

std::optional<float> AwakeningStoneDefinition::cooldownOverride() const {
    for (const StoneMod& mod : mods) {
        if (const auto* cooldown = std::get_if<CooldownOverrideMod>(&mod)) {
            return cooldown->seconds;
        }
    }
    return std::nullopt;
}

float AwakeningStoneDefinition::flatDamage(bool essenceOnly) const {
    float total = 0.0f;
    for (const StoneMod& mod : mods) {
        if (const auto* flat = std::get_if<FlatDamageMod>(&mod)) {
            if (!essenceOnly || flat->appliesToEssence) {
                total += flat->value;
            }
        }
    }
    return total;
}

const KnockbackMod* AwakeningStoneDefinition::knockback() const {
    for (const StoneMod& mod : mods) {
        if (const auto* knock = std::get_if<KnockbackMod>(&mod)) {
            return knock;
        }
    }
    return nullptr;
}

// ============================================================
// GameData
// ============================================================

bool GameData::loadFromDirectory(const std::string& directory) {
    const DataTable tables[] = {DataTable::Items, DataTable::Essences, DataTable::AwakeningStones,
                                DataTable::Enemies, DataTable::World};

    bool allLoaded = true;
    for (DataTable table : tables) {
        if (!loadFile(table, directory + "/" + dataTableFile(table))) {
            allLoaded = false;
        }
    }
    return allLoaded;
}

bool GameData::loadFile(DataTable table, const std::string& filepath) {
    try {
        YAML::Node root = YAML::LoadFile(filepath);
        return apply(table, root, filepath);
    } catch (const std::exception& e) {
        Logger::error() << "GameData: failed to load " << filepath << ": " << e.what();
        apply(table, YAML::Node(), filepath);
        return false;
    }
}

bool GameData::loadString(DataTable table, const std::string& yamlText) {
    try {
        return apply(table, YAML::Load(yamlText), "<string>");
    } catch (const std::exception& e) {
        Logger::error() << "GameData: failed to parse " << dataTableFile(table) << " text: " << e.what();
        apply(table, YAML::Node(), "<string>");
        return false;
    }
}

bool GameData::apply(DataTable table, const YAML::Node& root, const std::string& source) {
    int count = 0;
    switch (table) {
        case DataTable::Items: count = parseItems(root, source); break;
        case DataTable::Essences: count = parseEssences(root, source); break;
        case DataTable::AwakeningStones: count = parseStones(root, source); break;
        case DataTable::Enemies: count = parseEnemies(root, source); break;
        case DataTable::World: count = parseWorld(root, source); break;
    }
    if (count < 0) {
        Logger::error() << "GameData: unexpected layout in " << source << ", table left empty";
        return false;
    }
    if (root.IsDefined() && !root.IsNull()) {
        Logger::info() << "GameData: loaded " << count << " entries from " << source;
    }
    return true;
}

int GameData::parseItems(const YAML::Node& root, const std::string& source) {
    m_items.clear();
    YAML::Node list = listNode(root, "items");
    if (!list.IsSequence()) {
        return root.IsDefined() && !root.IsNull() ? -1 : 0;
    }

    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node& entry = list[i];
        try {
            ItemDefinition item;
            item.id = entry["id"].as<std::string>();
            item.name = entry["name"].as<std::string>();
            item.description = read<std::string>(entry, "description", "");

            std::optional<ItemType> type = parseItemType(entry["type"].as<std::string>());
            if (!type) {
                Logger::error() << "GameData: item '" << item.id << "' has unknown type in " << source;
                continue;
            }
            item.type = *type;

            if (entry["slot"]) {
                item.slot = parseEquipSlot(entry["slot"].as<std::string>());
            }
            item.damage = read<float>(entry, "damage", 0.0f);
            item.meleeBonus = read<float>(entry, "melee_bonus", 0.0f);
            item.defense = read<float>(entry, "defense", 0.0f);
            if (entry["effect"] && read<std::string>(entry["effect"], "type", "") == "heal") {
                item.healAmount = read<float>(entry["effect"], "amount", 0.0f);
            }
            item.stats = readStats(entry["stats"], item.id);

            m_items[item.id] = item;
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping item " << i << " in " << source << ": " << e.what();
        }
    }
    return static_cast<int>(m_items.size());
}

int GameData::parseEssences(const YAML::Node& root, const std::string& source) {
    m_essences.clear();
    YAML::Node list = listNode(root, "essences");
    if (!list.IsSequence()) {
        return root.IsDefined() && !root.IsNull() ? -1 : 0;
    }

    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node& entry = list[i];
        try {
            EssenceDefinition essence;
            essence.id = entry["id"].as<std::string>();
            essence.name = entry["name"].as<std::string>();
            essence.description = read<std::string>(entry, "description", "");
            essence.color = read<std::string>(entry, "color", "#ffffff");

            for (const auto& node : entry["abilities"]) {
                AbilityDefinition ability;
                ability.id = node["id"].as<std::string>();
                ability.name = node["name"].as<std::string>();
                ability.description = read<std::string>(node, "description", "");
                ability.unlocked = read<bool>(node, "unlocked", true);
                ability.cost = read<float>(node, "cost", 0.0f);
                ability.cooldown = read<float>(node, "cooldown", 0.0f);
                ability.effect = read<std::string>(node, "type", "AOE_DAMAGE") == "AOE_DAMAGE"
                    ? AbilityEffect::AreaDamage : AbilityEffect::None;
                ability.baseDamage = read<float>(node, "base_damage", 0.0f);
                if (node["scaling_stat"]) {
                    ability.scalingStat = parseStat(node["scaling_stat"].as<std::string>());
                }
                ability.scalingRatio = read<float>(node, "scaling_ratio", 1.0f);
                ability.range = read<float>(node, "range", 0.0f);
                ability.vfx = read<std::string>(node, "vfx", "");
                essence.abilities.push_back(ability);
            }

            m_essences[essence.id] = essence;
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping essence " << i << " in " << source << ": " << e.what();
        }
    }
    return static_cast<int>(m_essences.size());
}

int GameData::parseStones(const YAML::Node& root, const std::string& source) {
    m_stones.clear();
    YAML::Node list = listNode(root, "stones");
    if (!list.IsSequence()) {
        return root.IsDefined() && !root.IsNull() ? -1 : 0;
    }

    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node& entry = list[i];
        try {
            AwakeningStoneDefinition stone;
            stone.id = entry["id"].as<std::string>();
            stone.name = entry["name"].as<std::string>();
            stone.description = read<std::string>(entry, "description", "");
            stone.color = read<std::string>(entry, "color", "#ffffff");
            stone.vfx = read<std::string>(entry, "vfx", "");

            std::string abilityType = toLower(read<std::string>(entry, "ability_type", ""));
            if (abilityType == "instant") {
                stone.abilityType = StoneAbilityType::Instant;
            } else if (abilityType == "charge") {
                stone.abilityType = StoneAbilityType::Charge;
            }

            YAML::Node required = entry["required_essence"];
            if (required && required.IsSequence()) {
                for (const auto& id : required) {
                    stone.requiredEssenceIds.push_back(id.as<std::string>());
                }
            } else if (required && required.IsScalar()) {
                stone.requiredEssenceIds.push_back(required.as<std::string>());
            }

            for (const auto& node : entry["mods"]) {
                std::optional<StoneMod> mod = parseMod(node);
                if (!mod) {
                    Logger::warning() << "GameData: stone '" << stone.id << "' has unknown mod type '"
                                      << node["type"].as<std::string>() << "'";
                    continue;
                }
                stone.mods.push_back(*mod);
            }

            m_stones.push_back(stone);
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping stone " << i << " in " << source << ": " << e.what();
        }
    }
    return static_cast<int>(m_stones.size());
}

int GameData::parseEnemies(const YAML::Node& root, const std::string& source) {
    m_enemyTypes.clear();
    YAML::Node list = listNode(root, "enemies");
    if (!list.IsSequence()) {
        return root.IsDefined() && !root.IsNull() ? -1 : 0;
    }

    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node& entry = list[i];
        try {
            EnemyType enemy;
            enemy.key = entry["key"].as<std::string>();
            enemy.type = read<std::string>(entry, "type", enemy.key);
            enemy.name = read<std::string>(entry, "name", enemy.type);
            enemy.width = read<float>(entry, "width", 1.0f);
            enemy.height = read<float>(entry, "height", 1.0f);

            YAML::Node stats = entry["stats"];
            if (stats) {
                enemy.health = read<float>(stats, "health", enemy.health);
                enemy.speed = read<float>(stats, "speed", enemy.speed);
                enemy.aggroRange = read<float>(stats, "aggro_range", enemy.aggroRange);
                enemy.xpValue = read<int>(stats, "xp_value", 0);
            }

            for (const auto& node : entry["abilities"]) {
                EnemyAttackDefinition attack;
                attack.kind = toLower(read<std::string>(node, "type", "melee")) == "ranged"
                    ? EnemyAttackKind::Ranged : EnemyAttackKind::Melee;
                attack.damage = read<float>(node, "damage", 0.0f);
                attack.range = read<float>(node, "range", attack.range);
                attack.cooldown = read<float>(node, "cooldown", attack.cooldown);
                enemy.attacks.push_back(attack);
            }

            m_enemyTypes.push_back(enemy);
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping enemy type " << i << " in " << source << ": " << e.what();
        }
    }
    return static_cast<int>(m_enemyTypes.size());
}

int GameData::parseWorld(const YAML::Node& root, const std::string& source) {
    m_npcs.clear();
    m_portals.clear();
    m_collectibles.clear();
    m_loadout = StartingLoadout();
    if (!root.IsDefined() || root.IsNull()) {
        return 0;
    }
    if (!root.IsMap()) {
        return -1;
    }

    int count = 0;

    for (const auto& node : root["npcs"]) {
        try {
            NpcDefinition npc;
            npc.id = node["id"].as<std::string>();
            npc.name = node["name"].as<std::string>();
            npc.position = readPosition(node);
            npc.questId = read<std::string>(node, "quest", "");
            for (const auto& line : node["dialogue"]) {
                npc.dialogue.push_back(line.as<std::string>());
            }
            m_npcs.push_back(npc);
            count++;
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping NPC in " << source << ": " << e.what();
        }
    }

    for (const auto& node : root["portals"]) {
        try {
            PortalDefinition portal;
            portal.id = node["id"].as<std::string>();
            portal.name = node["name"].as<std::string>();
            portal.position = readPosition(node);
            portal.color = read<std::string>(node, "color", "#ffffff");
            m_portals.push_back(portal);
            count++;
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping portal in " << source << ": " << e.what();
        }
    }

    for (const auto& node : root["collectibles"]) {
        try {
            CollectibleDefinition collectible;
            collectible.id = node["id"].as<std::string>();
            collectible.kind = toLower(node["kind"].as<std::string>()) == "stone"
                ? CollectibleKind::Stone : CollectibleKind::Essence;
            collectible.definitionId = node["definition"].as<std::string>();
            collectible.position = readPosition(node);
            m_collectibles.push_back(collectible);
            count++;
        } catch (const std::exception& e) {
            Logger::error() << "GameData: skipping collectible in " << source << ": " << e.what();
        }
    }

    YAML::Node loadout = root["starting_loadout"];
    if (loadout) {
        try {
            for (const auto& id : loadout["items"]) {
                m_loadout.items.push_back(id.as<std::string>());
            }
            for (const auto& node : loadout["essences"]) {
                StartingLoadout::Essence essence;
                essence.id = node["id"].as<std::string>();
                for (const auto& stone : node["stones"]) {
                    essence.stones.push_back(stone.IsNull() ? "" : stone.as<std::string>());
                }
                m_loadout.essences.push_back(essence);
            }
        } catch (const std::exception& e) {
            Logger::error() << "GameData: malformed starting_loadout in " << source << ": " << e.what();
        }
    }

    return count;
}

// ============================================================
// Lookups
// ============================================================

const ItemDefinition* GameData::findItem(const std::string& id) const {
    auto it = m_items.find(id);
    return it != m_items.end() ? &it->second : nullptr;
}

const EssenceDefinition* GameData::findEssence(const std::string& id) const {
    auto it = m_essences.find(id);
    return it != m_essences.end() ? &it->second : nullptr;
}

const AwakeningStoneDefinition* GameData::findStone(const std::string& id) const {
    for (const auto& stone : m_stones) {
        if (stone.id == id) {
            return &stone;
        }
    }
    return nullptr;
}

const EnemyType* GameData::findEnemyType(const std::string& key) const {
    for (const auto& enemy : m_enemyTypes) {
        if (enemy.key == key) {
            return &enemy;
        }
    }
    return nullptr;
}

const NpcDefinition* GameData::findNpc(const std::string& id) const {
    for (const auto& npc : m_npcs) {
        if (npc.id == id) {
            return &npc;
        }
    }
    return nullptr;
}

const PortalDefinition* GameData::findPortal(const std::string& id) const {
    for (const auto& portal : m_portals) {
        if (portal.id == id) {
            return &portal;
        }
    }
    return nullptr;
}
