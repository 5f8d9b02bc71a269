/**
 * @file game_room.cpp
 * @brief Room message validation, fixed-step simulation and combat resolution
 */

#include "game_room.h"
#include "block_system.h"
#include "dungeon_generator.h"
#include "logger.h"
#include "terrain_generator.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace {

constexpr float TWO_PI = 6.28318530718f;
constexpr float COLLECTIBLE_HOVER = 0.7f;        ///< Collectibles float this far above the ground
const glm::vec3 PORTAL_ENTRY_OFFSET(2.0f, 2.0f, 0.0f);   ///< Centre of the arch opening
const glm::vec3 PORTAL_EXIT_OFFSET(2.0f, 0.0f, 2.0f);    ///< Standing spot in front of the arch

float distanceSq(const glm::vec3& a, const glm::vec3& b) {
    glm::vec3 d = a - b;
    return glm::dot(d, d);
}

std::string trimmed(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(start, end - start);
}

} // namespace

GameRoom::GameRoom(const GameSettings& settings, const GameData& data, const QuestDatabase& quests,
                   const TerrainGenerator& generator, MessageSink& sink)
    : m_settings(settings),
      m_data(data),
      m_quests(quests),
      m_sink(sink),
      m_overworld(generator, static_cast<size_t>(std::max(1, settings.room.maxCachedChunks))),
      m_physics(settings.physics),
      m_pathfinder(settings.pathfinding),
      m_rng(std::random_device{}()) {
    registerWorldObjects();
}

void GameRoom::registerWorldObjects() {
    for (const NpcDefinition& npc : m_data.npcs()) {
        m_state.npcs.set(npc.id, {npc.id, npc.name, npc.position});
    }
    for (const PortalDefinition& portal : m_data.portals()) {
        m_state.portals.set(portal.id, {portal.id, portal.name, portal.position, portal.color});
    }
    for (const CollectibleDefinition& collectible : m_data.collectibles()) {
        spawnCollectible(collectible.kind, collectible.definitionId, collectible.position, collectible.id);
    }

    Logger::info() << "Room created: " << m_state.npcs.size() << " NPCs, " << m_state.portals.size()
                   << " portals, " << m_state.collectibles.size() << " collectibles";
}

glm::vec3 GameRoom::spawnPoint() const {
    return glm::vec3(m_settings.room.spawnX, m_settings.room.spawnY, m_settings.room.spawnZ);
}

// ============================================================
// Sessions
// ============================================================

bool GameRoom::join(const std::string& sessionId, const std::string& username) {
    if (m_sessions.count(sessionId)) {
        Logger::warning() << "Session " << sessionId << " joined twice";
        return false;
    }

    auto session = std::make_unique<PlayerSession>(sessionId, username, m_data, m_settings.physics, spawnPoint());
    session->applyStartingLoadout();

    PlayerSession& ref = *session;
    m_sessions.emplace(sessionId, std::move(session));
    syncPlayer(ref);

    Logger::info() << ref.state().username << " (" << sessionId << ") joined, " << m_sessions.size()
                   << " player(s) in room";
    return true;
}

void GameRoom::leave(const std::string& sessionId) {
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return;
    }

    Logger::info() << it->second->state().username << " (" << sessionId << ") left";
    m_sessions.erase(it);
    m_state.players.remove(sessionId);
}

PlayerSession* GameRoom::session(const std::string& sessionId) {
    auto it = m_sessions.find(sessionId);
    return it != m_sessions.end() ? it->second.get() : nullptr;
}

EnemyController* GameRoom::enemy(const std::string& enemyId) {
    auto it = m_enemies.find(enemyId);
    return it != m_enemies.end() ? it->second.get() : nullptr;
}

const BlockSource& GameRoom::worldFor(const PlayerSession& session) const {
    if (const DungeonInstance* dungeon = session.dungeon()) {
        return *dungeon;
    }
    return m_overworld;
}

// ============================================================
// Messages
// ============================================================

bool GameRoom::handleMessage(const std::string& sessionId, const ClientMessage& message) {
    PlayerSession* player = session(sessionId);
    if (!player) {
        Logger::debug() << "Ignoring " << messageName(message) << " from unknown session " << sessionId;
        return false;
    }

    bool applied = std::visit([this, player](const auto& msg) { return handle(*player, msg); }, message);
    if (!applied) {
        Logger::debug() << "Ignored " << messageName(message) << " from " << sessionId;
    }

    syncPlayer(*player);
    return applied;
}

bool GameRoom::handle(PlayerSession& session, const InputMessage& message) {
    session.setInput(message.keys);
    return true;
}

bool GameRoom::handle(PlayerSession& session, const MeleeAttackMessage&) {
    float damage = session.meleeDamage(m_settings.room.meleeBaseDamage);

    for (EnemyController* target : enemiesWithin(session, m_settings.room.meleeRange)) {
        damageEnemy(*target, damage, session.id());
    }

    m_sink.broadcast(PlayVfxEvent{"createMeleeSlash", session.position() + glm::vec3(0.0f, 1.0f, 0.0f)});
    return true;
}

bool GameRoom::handle(PlayerSession& session, const UseAbilityMessage& message) {
    std::vector<ResolvedAbility> abilities = session.abilities();
    if (message.slotIndex < 0 || message.slotIndex >= static_cast<int>(abilities.size())) {
        return false;
    }

    const ResolvedAbility& ability = abilities[message.slotIndex];
    if (session.isOnCooldown(ability.id, m_time) || !session.spendMana(ability.cost)) {
        return false;
    }
    if (ability.cooldown > 0.0f) {
        session.startCooldown(ability.id, ability.cooldown, m_time);
    }

    float damage = ability.damage;
    if (ability.chargeable) {
        damage *= 1.0f + std::clamp(message.chargeTime, 0.0f, 1.0f);
    }

    Logger::debug() << session.state().username << " used " << ability.name << " (" << damage << " damage)";
    m_sink.broadcast(PlayVfxEvent{ability.vfx, session.position()});

    for (const BuffMod& buff : ability.buffs) {
        session.addBuff(buff);
    }

    if (ability.effect != AbilityEffect::AreaDamage) {
        return true;
    }

    bool leeched = false;
    for (EnemyController* target : enemiesWithin(session, ability.range)) {
        for (const StatusEffectMod& status : ability.statusEffects) {
            if (roll() >= status.chance) continue;

            if (status.effect == "LEECH") {
                if (!leeched) {
                    session.addLeech(status.duration, status.healPerSecond);
                    leeched = true;
                }
            } else {
                target->applyStatus(status, session.id());
            }
        }
        if (ability.knockback.force > 0.0f) {
            target->applyKnockback(session.position(), ability.knockback.force);
        }
        damageEnemy(*target, damage, session.id());
    }
    return true;
}

bool GameRoom::handle(PlayerSession& session, const UseItemMessage& message) {
    return session.useItem(message.inventoryIndex);
}

bool GameRoom::handle(PlayerSession& session, const SocketStoneMessage& message) {
    return session.socketStone(message.essenceId, message.essenceSocketIndex, message.stoneInventoryIndex);
}

const NpcDefinition* GameRoom::npcInRange(const PlayerSession& session, const std::string& npcId) const {
    const NpcDefinition* npc = m_data.findNpc(npcId);
    if (!npc || session.inDungeon()) {
        return nullptr;
    }
    float radius = m_settings.room.interactRadius;
    return distanceSq(session.position(), npc->position) <= radius * radius ? npc : nullptr;
}

bool GameRoom::handle(PlayerSession& session, const StartQuestMessage& message) {
    for (const NpcDefinition& npc : m_data.npcs()) {
        if (npc.questId != message.questId || !npcInRange(session, npc.id)) continue;

        if (m_quests.startQuest(session.state(), message.questId)) {
            sendQuestUpdate(session);
            return true;
        }
        return false;
    }
    return false;
}

bool GameRoom::handle(PlayerSession& session, const InteractNpcMessage& message) {
    const NpcDefinition* npc = npcInRange(session, message.npcId);
    if (!npc) {
        return false;
    }

    m_sink.send(session.id(), NpcDialogueEvent{npc->name, npc->dialogue, npc->questId});
    if (!npc->questId.empty()) {
        m_quests.startQuest(session.state(), npc->questId);
        sendQuestUpdate(session);
    }
    return true;
}

bool GameRoom::handle(PlayerSession& session, const EnterPortalMessage& message) {
    const PortalDefinition* portal = m_data.findPortal(message.portalId);
    if (!portal || session.inDungeon()) {
        return false;
    }

    float radius = m_settings.room.portalRadius;
    if (glm::length(session.position() - (portal->position + PORTAL_ENTRY_OFFSET)) >= radius) {
        return false;
    }

    const DungeonTheme& theme = roll() < 0.5f ? DungeonThemes::CAVE : DungeonThemes::HELL;
    int seed = static_cast<int>(roll() * 100000.0f);
    const DungeonRank* rank = DungeonRanks::find(portal->name);

    auto dungeon = std::make_unique<DungeonInstance>(DungeonGenerator::generate(theme, seed));

    LoadDungeonEvent load;
    load.blocks = dungeon->blocks().data();
    load.width = dungeon->blocks().width();
    load.height = dungeon->blocks().height();
    load.depth = dungeon->blocks().depth();
    load.spawnPoint = dungeon->spawnPoint();
    load.theme = theme.name;
    load.rank = rank ? rank->name : DungeonRanks::IRON.name;

    session.enterDungeon(std::move(dungeon), portal->id);
    m_sink.send(session.id(), load);
    clearEnemies();

    Logger::info() << session.state().username << " entered " << load.rank << " dungeon (" << theme.name
                   << ", seed " << seed << ")";
    return true;
}

bool GameRoom::handle(PlayerSession& session, const ExitDungeonMessage&) {
    if (!session.inDungeon()) {
        return false;
    }

    std::string portalId = session.exitDungeon();
    glm::vec3 exit = spawnPoint();
    if (const PortalDefinition* portal = m_data.findPortal(portalId)) {
        exit = portal->position + PORTAL_EXIT_OFFSET;
    }
    session.teleport(exit);
    m_sink.send(session.id(), UnloadDungeonEvent{});

    Logger::info() << session.state().username << " left the dungeon";
    return true;
}

bool GameRoom::collect(PlayerSession& session, const std::string& collectibleId, CollectibleKind kind) {
    const CollectibleState* collectible = m_state.collectibles.get(collectibleId);
    if (!collectible || collectible->kind != kind || session.inDungeon()) {
        return false;
    }

    float radius = m_settings.room.collectRadius;
    if (distanceSq(session.position(), collectible->position) > radius * radius) {
        return false;
    }

    if (kind == CollectibleKind::Essence) {
        const EssenceDefinition* essence = m_data.findEssence(collectible->definitionId);
        if (!essence || !session.addEssence(*essence, m_settings.room.maxEssences)) {
            return false;
        }
    } else {
        const AwakeningStoneDefinition* stone = m_data.findStone(collectible->definitionId);
        if (!stone) {
            return false;
        }
        session.addStone(*stone);
    }

    Logger::info() << session.state().username << " collected " << collectible->name;
    m_state.collectibles.remove(collectibleId);
    return true;
}

bool GameRoom::handle(PlayerSession& session, const CollectEssenceMessage& message) {
    return collect(session, message.id, CollectibleKind::Essence);
}

bool GameRoom::handle(PlayerSession& session, const CollectStoneMessage& message) {
    return collect(session, message.id, CollectibleKind::Stone);
}

bool GameRoom::handle(PlayerSession& session, const ChatMessage& message) {
    std::string content = trimmed(message.content);
    if (content.empty()) {
        return false;
    }

    size_t maxLength = static_cast<size_t>(std::max(1, m_settings.room.chatMaxLength));
    if (content.size() > maxLength) {
        content.resize(maxLength);
    }

    m_sink.broadcast(ChatEvent{session.state().username, content});
    return true;
}

void GameRoom::sendQuestUpdate(PlayerSession& session) {
    QuestUpdateEvent update;
    for (const auto& entry : session.state().activeQuests) {
        update.quests.push_back(entry.second);
    }
    m_sink.send(session.id(), update);
}

// ============================================================
// Tick
// ============================================================

void GameRoom::tick(float dt) {
    if (dt <= 0.0f) {
        return;
    }

    m_time += dt;
    updatePlayers(dt);
    updateEnemies(dt);
    updateSpawning(dt);
}

void GameRoom::updatePlayers(float dt) {
    for (auto& entry : m_sessions) {
        PlayerSession& player = *entry.second;
        m_physics.stepPlayer(player.body(), player.input(), worldFor(player), dt);
        player.update(dt, m_settings.room.manaRegen);
        syncPlayer(player);
    }
}

void GameRoom::updateEnemies(float dt) {
    std::vector<EnemyTarget> targets;
    for (const auto& entry : m_sessions) {
        if (!entry.second->inDungeon()) {
            targets.push_back({entry.first, entry.second->position()});
        }
    }

    std::vector<EnemyAttackIntent> attacks;
    std::vector<std::pair<std::string, std::string>> bled;   // enemy, killer

    for (auto& entry : m_enemies) {
        EnemyController& enemy = *entry.second;
        enemy.update(dt, m_overworld, m_physics, m_pathfinder, targets, m_settings.room, attacks);

        std::string sourceId;
        float damage = enemy.tickStatuses(dt, sourceId);
        if (damage > 0.0f && enemy.takeDamage(damage, sourceId)) {
            bled.emplace_back(enemy.id(), sourceId);
        }
    }

    for (const auto& death : bled) {
        killEnemy(death.first, death.second);
    }
    for (auto& entry : m_enemies) {
        syncEnemy(*entry.second);
    }
    for (const EnemyAttackIntent& attack : attacks) {
        resolveEnemyAttack(attack);
    }
}

void GameRoom::updateSpawning(float dt) {
    m_spawnTimer += dt;
    if (m_spawnTimer <= m_settings.room.spawnInterval) {
        return;
    }
    if (static_cast<int>(m_enemies.size()) >= m_settings.room.maxEnemies || m_data.enemyTypes().empty()) {
        return;
    }

    std::vector<const PlayerSession*> overworldPlayers;
    for (const auto& entry : m_sessions) {
        if (!entry.second->inDungeon()) {
            overworldPlayers.push_back(entry.second.get());
        }
    }
    if (overworldPlayers.empty()) {
        return;
    }

    m_spawnTimer = 0.0f;
    std::uniform_int_distribution<size_t> pick(0, overworldPlayers.size() - 1);
    trySpawnEnemyNear(overworldPlayers[pick(m_rng)]->position());
}

bool GameRoom::trySpawnEnemyNear(const glm::vec3& playerPosition) {
    const RoomSettings& room = m_settings.room;
    float angle = roll() * TWO_PI;
    float radius = room.spawnMinRadius + roll() * (room.spawnMaxRadius - room.spawnMinRadius);
    int x = static_cast<int>(std::round(playerPosition.x + std::cos(angle) * radius));
    int z = static_cast<int>(std::round(playerPosition.z + std::sin(angle) * radius));

    if (std::abs(static_cast<float>(x)) < room.safeZone && std::abs(static_cast<float>(z)) < room.safeZone) {
        return false;
    }

    int ground = findGroundHeight(m_overworld, static_cast<float>(x), static_cast<float>(z));
    if (m_overworld.getBlock(x, ground - 1, z) == BlockID::AIR) {
        return false;
    }

    const std::vector<EnemyType>& types = m_data.enemyTypes();
    std::uniform_int_distribution<size_t> pick(0, types.size() - 1);
    const EnemyType& type = types[pick(m_rng)];
    EnemyClass classType = roll() < room.eliteChance ? EnemyClass::Elite : EnemyClass::Minion;

    return !spawnEnemy(type.key, glm::vec3(x, ground, z), classType).empty();
}

// ============================================================
// Combat
// ============================================================

std::string GameRoom::spawnEnemy(const std::string& typeKey, const glm::vec3& position, EnemyClass classType) {
    const EnemyType* type = m_data.findEnemyType(typeKey);
    if (!type) {
        Logger::warning() << "Cannot spawn unknown enemy type '" << typeKey << "'";
        return "";
    }

    EnemyState state;
    state.id = nextEntityId("enemy");
    state.type = type->type;
    state.name = type->name;
    state.classType = classType;
    state.position = position;
    state.maxHealth = type->health * (classType == EnemyClass::Elite ? 2.0f : 1.0f);
    state.health = state.maxHealth;

    auto controller = std::make_unique<EnemyController>(state, *type);
    m_state.enemies.set(state.id, controller->state());
    m_enemies.emplace(state.id, std::move(controller));

    Logger::debug() << "Spawned " << enemyClassName(classType) << " " << type->name << " " << state.id << " at ("
                    << position.x << ", " << position.y << ", " << position.z << ")";
    return state.id;
}

std::vector<EnemyController*> GameRoom::enemiesWithin(const PlayerSession& session, float radius) {
    std::vector<EnemyController*> hits;
    // Enemies only live in the overworld
    if (session.inDungeon()) {
        return hits;
    }

    float radiusSq = radius * radius;
    for (auto& entry : m_enemies) {
        if (distanceSq(session.position(), entry.second->body().position) < radiusSq) {
            hits.push_back(entry.second.get());
        }
    }
    return hits;
}

void GameRoom::damageEnemy(EnemyController& enemy, float amount, const std::string& attackerId) {
    if (enemy.takeDamage(amount, attackerId)) {
        killEnemy(enemy.id(), attackerId);
    } else {
        syncEnemy(enemy);
    }
}

void GameRoom::killEnemy(const std::string& enemyId, const std::string& killerId) {
    auto it = m_enemies.find(enemyId);
    if (it == m_enemies.end()) {
        return;
    }

    std::unique_ptr<EnemyController> enemy = std::move(it->second);
    m_enemies.erase(it);
    m_state.enemies.remove(enemyId);

    Logger::info() << enemy->state().name << " " << enemyId << " was killed by " << killerId;

    if (PlayerSession* killer = session(killerId)) {
        QuestEvent event;
        event.type = QuestEvent::Type::EnemyKilled;
        event.target = enemy->state().type;
        if (m_quests.notify(killer->state(), event)) {
            sendQuestUpdate(*killer);
        }
        syncPlayer(*killer);
    }

    if (enemy->state().classType == EnemyClass::Elite && !m_data.stones().empty()) {
        const std::vector<AwakeningStoneDefinition>& stones = m_data.stones();
        std::uniform_int_distribution<size_t> pick(0, stones.size() - 1);
        spawnCollectible(CollectibleKind::Stone, stones[pick(m_rng)].id, enemy->body().position);
    }
}

void GameRoom::resolveEnemyAttack(const EnemyAttackIntent& attack) {
    PlayerSession* target = session(attack.targetId);
    if (!target || target->inDungeon() || !m_enemies.count(attack.enemyId)) {
        return;
    }

    float applied = target->takeDamage(attack.damage);
    Logger::debug() << attack.enemyId << " hit " << target->state().username << " for " << applied;

    if (target->isDead()) {
        Logger::info() << target->state().username << " died and respawns at the spawn point";
        target->respawn(spawnPoint());
    }
    syncPlayer(*target);
}

void GameRoom::clearEnemies() {
    m_enemies.clear();
    m_state.enemies.clear();
}

// ============================================================
// World objects
// ============================================================

std::string GameRoom::spawnCollectible(CollectibleKind kind, const std::string& definitionId,
                                       const glm::vec3& position, const std::string& id) {
    CollectibleState collectible;
    collectible.kind = kind;
    collectible.definitionId = definitionId;

    if (kind == CollectibleKind::Essence) {
        const EssenceDefinition* essence = m_data.findEssence(definitionId);
        if (!essence) {
            Logger::warning() << "Collectible references unknown essence '" << definitionId << "'";
            return "";
        }
        collectible.name = essence->name;
        collectible.color = essence->color;
    } else {
        const AwakeningStoneDefinition* stone = m_data.findStone(definitionId);
        if (!stone) {
            Logger::warning() << "Collectible references unknown stone '" << definitionId << "'";
            return "";
        }
        collectible.name = stone->name;
        collectible.color = stone->color;
    }

    collectible.id = id.empty() ? nextEntityId("collectible") : id;
    int ground = findGroundHeight(m_overworld, position.x, position.z);
    collectible.position = glm::vec3(position.x, ground + COLLECTIBLE_HOVER, position.z);

    m_state.collectibles.set(collectible.id, collectible);
    return collectible.id;
}

void GameRoom::syncPlayer(const PlayerSession& session) {
    PlayerState state = session.state();
    state.position = session.position();
    m_state.players.set(session.id(), std::move(state));
}

void GameRoom::syncEnemy(const EnemyController& enemy) {
    m_state.enemies.set(enemy.id(), enemy.state());
}

std::string GameRoom::nextEntityId(const char* prefix) {
    std::ostringstream id;
    id << prefix << "_" << m_nextEntity++;
    return id.str();
}

float GameRoom::roll() {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(m_rng);
}
