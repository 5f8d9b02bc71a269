/**
 * @file client_prediction.cpp
 * @brief Prediction/reconciliation loop and the replicated-state mirror
 */

#include "client_prediction.h"
#include "chunk_scheduler.h"
#include "logger.h"
#include "world.h"

namespace {
constexpr float COLLECTIBLE_HOVER = 0.7f;
}

// ============================================================
// ClientPrediction
// ============================================================

ClientPrediction::ClientPrediction(PhysicsSettings settings)
    : m_physics(settings) {
    m_body.width = settings.playerWidth;
    m_body.height = settings.playerHeight;
    m_body.position = m_serverState.position;
}

void ClientPrediction::predict(const BlockSource& world, float dt) {
    m_physics.stepPlayer(m_body, m_keys, world, dt);
}

void ClientPrediction::onServerSnapshot(const PlayerState& state) {
    bool first = !m_serverPosition.has_value();
    m_serverState = state;
    m_serverPosition = state.position;

    if (first) {
        // Nothing predicted yet: start where the server placed us
        teleport(state.position);
    }
}

bool ClientPrediction::reconcile() {
    if (!m_serverPosition) {
        return false;
    }
    if (glm::length(*m_serverPosition - m_body.position) <= RECONCILE_THRESHOLD) {
        return false;
    }

    m_body.position = glm::mix(m_body.position, *m_serverPosition, RECONCILE_LERP);
    return true;
}

void ClientPrediction::update(const BlockSource& world, float dt) {
    predict(world, dt);
    reconcile();
}

void ClientPrediction::teleport(const glm::vec3& position) {
    m_body.position = position;
    m_body.velocity = glm::vec3(0.0f);
    m_body.grounded = false;
}

float ClientPrediction::error() const {
    return m_serverPosition ? glm::length(*m_serverPosition - m_body.position) : 0.0f;
}

// ============================================================
// ClientMirror
// ============================================================

ClientMirror::ClientMirror(RoomState& room, std::string localSessionId, ClientPrediction& prediction,
                           ChunkScheduler* scheduler)
    : m_room(room),
      m_localId(std::move(localSessionId)),
      m_prediction(prediction),
      m_scheduler(scheduler),
      m_alive(std::make_shared<bool>(true)) {
    m_playersHandle = mirror<PlayerState>(m_room.players, m_players,
        [this](const std::string& id, const PlayerState& state) {
            if (id == m_localId) {
                m_prediction.onServerSnapshot(state);
            }
        });
    m_enemiesHandle = mirror<EnemyState>(m_room.enemies, m_enemies);
    m_npcsHandle = mirror<NpcState>(m_room.npcs, m_npcs);
    m_portalsHandle = mirror<PortalState>(m_room.portals, m_portals);
    m_collectiblesHandle = mirror<CollectibleState>(m_room.collectibles, m_collectibles,
        [this](const std::string& id, const CollectibleState&) { placeCollectible(id); });
}

ClientMirror::~ClientMirror() {
    m_room.players.unsubscribe(m_playersHandle);
    m_room.enemies.unsubscribe(m_enemiesHandle);
    m_room.npcs.unsubscribe(m_npcsHandle);
    m_room.portals.unsubscribe(m_portalsHandle);
    m_room.collectibles.unsubscribe(m_collectiblesHandle);
}

template<typename Value>
ListenerHandle ClientMirror::mirror(ReplicatedMap<Value>& source, std::unordered_map<std::string, Value>& target,
                                    std::function<void(const std::string&, const Value&)> onUpsert) {
    // Entities that existed before we subscribed arrive as adds
    source.forEach([&](const std::string& id, const Value& value) {
        target[id] = value;
        if (onUpsert) onUpsert(id, value);
    });

    return source.subscribe([this, &target, onUpsert](ReplicationOp op, const std::string& id, const Value* value) {
        m_eventCount++;
        if (op == ReplicationOp::Remove || !value) {
            target.erase(id);
            return;
        }
        target[id] = *value;
        if (onUpsert) onUpsert(id, *value);
    });
}

void ClientMirror::placeCollectible(const std::string& id) {
    if (!m_scheduler) {
        return;
    }

    auto it = m_collectibles.find(id);
    if (it == m_collectibles.end()) {
        return;
    }

    glm::vec3 position = it->second.position;
    ChunkCoord coord = WorldCoords::chunkOf(position.x, position.z);
    std::weak_ptr<bool> alive = m_alive;

    m_scheduler->loadChunkAndCallback(coord.x, coord.z, [this, alive, id](const LoadedChunk&) {
        if (alive.expired()) {
            return;
        }
        auto entry = m_collectibles.find(id);
        if (entry == m_collectibles.end()) {
            return;  // collected before its chunk arrived
        }
        glm::vec3& pos = entry->second.position;
        pos.y = static_cast<float>(m_scheduler->findGroundHeight(pos.x, pos.z)) + COLLECTIBLE_HOVER;
        Logger::debug() << "Placed collectible " << id << " at y=" << pos.y;
    });
}
