/**
 * @file enemy_controller.h
 * @brief Server-side enemy brain: retargeting, path following, attacks and status effects
 */

#pragma once

#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "body_physics.h"
#include "game_data.h"
#include "game_settings.h"
#include "room_state.h"

class BlockSource;
class Pathfinder;

/**
 * @brief A player the enemy may chase this tick
 */
struct EnemyTarget {
    std::string sessionId;
    glm::vec3 position;
};

/**
 * @brief Attack the room resolves against a player after the AI pass
 */
struct EnemyAttackIntent {
    std::string enemyId;
    std::string targetId;
    float damage = 0.0f;
    EnemyAttackKind kind = EnemyAttackKind::Melee;
};

struct EnemyStatus {
    std::string effect;
    float remaining = 0.0f;
    float amount = 0.0f;             ///< VULNERABLE damage multiplier bonus
    float damagePerSecond = 0.0f;    ///< BLEED
    std::string sourceId;            ///< Player credited for damage over time
};

class EnemyController {
public:
    static constexpr float KNOCKBACK_DAMPING = 8.0f;   ///< Per-second decay of knockback velocity
    static constexpr float DEFAULT_STUN_DURATION = 1.0f;

    EnemyController(EnemyState state, const EnemyType& type);

    const std::string& id() const { return m_state.id; }
    const EnemyState& state() const { return m_state; }
    const EnemyType& type() const { return *m_type; }
    PhysicsBody& body() { return m_body; }
    const PhysicsBody& body() const { return m_body; }

    /**
     * @brief One AI + physics step
     *
     * Every repathInterval seconds the enemy retargets the nearest target within
     * aggro range and asks the pathfinder for a route (a failed search leaves it
     * idle). Each step it walks toward the current waypoint and appends an
     * attack intent when its target is in range and the attack is ready.
     */
    void update(float dt, const BlockSource& world, const BodyPhysics& physics, const Pathfinder& pathfinder,
                const std::vector<EnemyTarget>& targets, const RoomSettings& settings,
                std::vector<EnemyAttackIntent>& attacks);

    /**
     * @brief Applies damage (amplified by VULNERABLE), clamped at zero
     * @return True if this hit killed the enemy
     */
    bool takeDamage(float amount, const std::string& attackerId);

    void applyStatus(const StatusEffectMod& mod, const std::string& sourceId);
    void applyKnockback(const glm::vec3& origin, float force);

    /**
     * @brief Damage over time accumulated this step (BLEED), credited to its source
     */
    float tickStatuses(float dt, std::string& sourceId);

    bool isDead() const { return m_state.health <= 0.0f; }
    bool isStunned() const;
    const std::string& lastAttacker() const { return m_lastAttacker; }
    const std::string& targetId() const { return m_targetId; }
    const std::vector<glm::vec3>& path() const { return m_path; }
    size_t pathIndex() const { return m_pathIndex; }

    void syncState() { m_state.position = m_body.position; }

private:
    void retarget(const BlockSource& world, const Pathfinder& pathfinder, const std::vector<EnemyTarget>& targets);
    const EnemyTarget* findTarget(const std::vector<EnemyTarget>& targets) const;

    EnemyState m_state;
    const EnemyType* m_type;
    PhysicsBody m_body;

    std::vector<glm::vec3> m_path;
    size_t m_pathIndex = 0;
    float m_repathTimer;
    float m_attackTimer = 0.0f;
    std::string m_targetId;
    std::string m_lastAttacker;

    glm::vec3 m_knockback{0.0f};
    std::vector<EnemyStatus> m_statuses;
};
