/**
 * @file game_room.h
 * @brief Authoritative room: the only writer of replicated gameplay state
 *
 * ARCHITECTURE:
 * - RoomState holds the replicated collections; observers receive add/change/remove
 * - PlayerSession / EnemyController hold the non-replicated companion state
 * - handleMessage() validates one client intent; invalid requests are no-ops
 * - tick() runs player physics, enemy AI and attacks, status effects and spawning
 *
 * THREAD SAFETY:
 * - Not thread-safe. A room is driven by a single thread (see RoomHost);
 *   every mutation happens inside handleMessage(), join(), leave() or tick().
 *
 * Usage:
 * @code
 *   GameRoom room(settings, gameData, quests, generator, sink);
 *   room.join("session-1", "Aria");
 *   room.handleMessage("session-1", InputMessage{{{"w", true}}});
 *   room.tick(1.0f / 60.0f);
 * @endcode
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "body_physics.h"
#include "enemy_controller.h"
#include "game_data.h"
#include "game_settings.h"
#include "overworld_terrain.h"
#include "pathfinder.h"
#include "player_session.h"
#include "protocol.h"
#include "quest_database.h"
#include "room_state.h"

class TerrainGenerator;

class GameRoom {
public:
    /**
     * @brief Creates a room and registers the NPCs, portals and collectibles of the world data
     *
     * data, quests, generator and sink must outlive the room.
     */
    GameRoom(const GameSettings& settings, const GameData& data, const QuestDatabase& quests,
             const TerrainGenerator& generator, MessageSink& sink);

    GameRoom(const GameRoom&) = delete;
    GameRoom& operator=(const GameRoom&) = delete;

    /**
     * @brief Adds a player with the starting loadout at the spawn point
     * @return False if the session is already in the room
     */
    bool join(const std::string& sessionId, const std::string& username);

    /**
     * @brief Removes the player and its private dungeon; other sessions are untouched
     */
    void leave(const std::string& sessionId);

    /**
     * @brief Validates and applies one client message
     * @return True if the message changed anything; false for an ignored request
     */
    bool handleMessage(const std::string& sessionId, const ClientMessage& message);

    /**
     * @brief Advances the simulation by dt seconds
     */
    void tick(float dt);

    RoomState& state() { return m_state; }
    const RoomState& state() const { return m_state; }

    PlayerSession* session(const std::string& sessionId);
    EnemyController* enemy(const std::string& enemyId);
    size_t playerCount() const { return m_sessions.size(); }
    size_t enemyCount() const { return m_enemies.size(); }

    /**
     * @brief Places an enemy of a type from the enemy table
     * @return The new enemy ID, or an empty string for an unknown type
     */
    std::string spawnEnemy(const std::string& typeKey, const glm::vec3& position, EnemyClass classType);

    /**
     * @brief Places a collectible for an essence or stone definition
     * @return The collectible ID, or an empty string for an unknown definition
     */
    std::string spawnCollectible(CollectibleKind kind, const std::string& definitionId, const glm::vec3& position,
                                 const std::string& id = "");

    /**
     * @brief Block source a session currently stands in (its dungeon or the overworld)
     */
    const BlockSource& worldFor(const PlayerSession& session) const;

    const OverworldTerrain& overworld() const { return m_overworld; }
    const RoomSettings& settings() const { return m_settings.room; }
    glm::vec3 spawnPoint() const;
    double time() const { return m_time; }
    void setRandomSeed(uint32_t seed) { m_rng.seed(seed); }

private:
    // Message handlers, selected by std::visit
    bool handle(PlayerSession& session, const InputMessage& message);
    bool handle(PlayerSession& session, const MeleeAttackMessage& message);
    bool handle(PlayerSession& session, const UseAbilityMessage& message);
    bool handle(PlayerSession& session, const UseItemMessage& message);
    bool handle(PlayerSession& session, const SocketStoneMessage& message);
    bool handle(PlayerSession& session, const StartQuestMessage& message);
    bool handle(PlayerSession& session, const InteractNpcMessage& message);
    bool handle(PlayerSession& session, const EnterPortalMessage& message);
    bool handle(PlayerSession& session, const ExitDungeonMessage& message);
    bool handle(PlayerSession& session, const CollectEssenceMessage& message);
    bool handle(PlayerSession& session, const CollectStoneMessage& message);
    bool handle(PlayerSession& session, const ChatMessage& message);

    // Tick phases
    void updatePlayers(float dt);
    void updateEnemies(float dt);
    void updateSpawning(float dt);
    bool trySpawnEnemyNear(const glm::vec3& playerPosition);

    // Combat
    std::vector<EnemyController*> enemiesWithin(const PlayerSession& session, float radius);
    void damageEnemy(EnemyController& enemy, float amount, const std::string& attackerId);
    void killEnemy(const std::string& enemyId, const std::string& killerId);
    void resolveEnemyAttack(const EnemyAttackIntent& attack);
    void clearEnemies();
    void sendQuestUpdate(PlayerSession& session);

    // World objects
    void registerWorldObjects();
    const NpcDefinition* npcInRange(const PlayerSession& session, const std::string& npcId) const;
    bool collect(PlayerSession& session, const std::string& collectibleId, CollectibleKind kind);

    void syncPlayer(const PlayerSession& session);
    void syncEnemy(const EnemyController& enemy);
    std::string nextEntityId(const char* prefix);
    float roll();

    GameSettings m_settings;
    const GameData& m_data;
    QuestTracker m_quests;
    MessageSink& m_sink;

    OverworldTerrain m_overworld;
    BodyPhysics m_physics;
    Pathfinder m_pathfinder;

    RoomState m_state;
    std::map<std::string, std::unique_ptr<PlayerSession>> m_sessions;
    std::map<std::string, std::unique_ptr<EnemyController>> m_enemies;

    std::mt19937 m_rng;
    double m_time = 0.0;
    float m_spawnTimer = 0.0f;
    uint64_t m_nextEntity = 1;
};
