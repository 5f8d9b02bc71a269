/**
 * @file client_prediction.h
 * @brief Client-side movement prediction, reconciliation and replicated-state mirror
 *
 * The local player moves every frame with the same BodyPhysics the room uses,
 * against the client's own streamed terrain. Authoritative snapshots never
 * snap the prediction; each frame pulls it a fixed fraction of the way back.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <glm/glm.hpp>
#include "body_physics.h"
#include "room_state.h"

class BlockSource;
class ChunkScheduler;

class ClientPrediction {
public:
    static constexpr float RECONCILE_LERP = 0.2f;        ///< Fraction of the error corrected per frame
    static constexpr float RECONCILE_THRESHOLD = 0.1f;   ///< Errors at or below this are left alone

    explicit ClientPrediction(PhysicsSettings settings = PhysicsSettings());

    void setInput(const KeyState& keys) { m_keys = keys; }

    /**
     * @brief Integrates the local input for one frame
     */
    void predict(const BlockSource& world, float dt);

    /**
     * @brief Stores the latest authoritative state of the local player
     */
    void onServerSnapshot(const PlayerState& state);

    /**
     * @brief Moves the prediction toward the server position
     * @return True if a correction was applied
     */
    bool reconcile();

    /**
     * @brief predict() then reconcile(): the per-frame entry point
     */
    void update(const BlockSource& world, float dt);

    /**
     * @brief Hard reset to a position (dungeon load/unload)
     */
    void teleport(const glm::vec3& position);

    const glm::vec3& predictedPosition() const { return m_body.position; }
    const std::optional<glm::vec3>& serverPosition() const { return m_serverPosition; }
    const PhysicsBody& body() const { return m_body; }
    const PlayerState& serverState() const { return m_serverState; }

    /**
     * @brief Distance between prediction and the last snapshot (0 before any snapshot)
     */
    float error() const;

private:
    BodyPhysics m_physics;
    PhysicsBody m_body;
    KeyState m_keys;

    PlayerState m_serverState;
    std::optional<glm::vec3> m_serverPosition;
};

/**
 * @brief Local copy of a room's replicated collections
 *
 * Subscribes to every map of a RoomState and applies add/change/remove events.
 * Changes to the local player feed the prediction's snapshot; collectibles are
 * re-seated on the client's own ground once their chunk is loaded.
 */
class ClientMirror {
public:
    /**
     * @param scheduler Optional; without it collectibles keep the server height
     */
    ClientMirror(RoomState& room, std::string localSessionId, ClientPrediction& prediction,
                 ChunkScheduler* scheduler = nullptr);
    ~ClientMirror();

    ClientMirror(const ClientMirror&) = delete;
    ClientMirror& operator=(const ClientMirror&) = delete;

    const std::unordered_map<std::string, PlayerState>& players() const { return m_players; }
    const std::unordered_map<std::string, EnemyState>& enemies() const { return m_enemies; }
    const std::unordered_map<std::string, NpcState>& npcs() const { return m_npcs; }
    const std::unordered_map<std::string, PortalState>& portals() const { return m_portals; }
    const std::unordered_map<std::string, CollectibleState>& collectibles() const { return m_collectibles; }

    size_t eventCount() const { return m_eventCount; }

private:
    template<typename Value>
    ListenerHandle mirror(ReplicatedMap<Value>& source, std::unordered_map<std::string, Value>& target,
                          std::function<void(const std::string&, const Value&)> onUpsert = nullptr);

    void placeCollectible(const std::string& id);

    RoomState& m_room;
    std::string m_localId;
    ClientPrediction& m_prediction;
    ChunkScheduler* m_scheduler;

    std::unordered_map<std::string, PlayerState> m_players;
    std::unordered_map<std::string, EnemyState> m_enemies;
    std::unordered_map<std::string, NpcState> m_npcs;
    std::unordered_map<std::string, PortalState> m_portals;
    std::unordered_map<std::string, CollectibleState> m_collectibles;

    ListenerHandle m_playersHandle = 0;
    ListenerHandle m_enemiesHandle = 0;
    ListenerHandle m_npcsHandle = 0;
    ListenerHandle m_portalsHandle = 0;
    ListenerHandle m_collectiblesHandle = 0;
    size_t m_eventCount = 0;

    // Expires with the mirror so late chunk callbacks become no-ops
    std::shared_ptr<bool> m_alive;
};
