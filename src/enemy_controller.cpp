/**
 * @file enemy_controller.cpp
 * @brief Enemy AI step, damage intake and status effects
 */

#include "enemy_controller.h"
#include "logger.h"
#include "pathfinder.h"
#include "world.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

float horizontalDistance(const glm::vec3& a, const glm::vec3& b) {
    return std::hypot(a.x - b.x, a.z - b.z);
}

} // namespace

EnemyController::EnemyController(EnemyState state, const EnemyType& type)
    : m_state(std::move(state)), m_type(&type), m_repathTimer(std::numeric_limits<float>::max()) {
    m_body.width = type.width;
    m_body.height = type.height;
    m_body.position = m_state.position;
}

const EnemyTarget* EnemyController::findTarget(const std::vector<EnemyTarget>& targets) const {
    const EnemyTarget* best = nullptr;
    float bestDistance = m_type->aggroRange;

    for (const EnemyTarget& target : targets) {
        float distance = horizontalDistance(target.position, m_body.position);
        if (distance <= bestDistance) {
            bestDistance = distance;
            best = &target;
        }
    }
    return best;
}

void EnemyController::retarget(const BlockSource& world, const Pathfinder& pathfinder,
                               const std::vector<EnemyTarget>& targets) {
    const EnemyTarget* target = findTarget(targets);
    if (!target) {
        m_targetId.clear();
        m_path.clear();
        m_pathIndex = 0;
        return;
    }

    m_targetId = target->sessionId;
    auto path = pathfinder.findPath(world, m_body.position, target->position);
    if (!path) {
        // No route (too far, blocked or budget exhausted): idle until the next retarget
        m_path.clear();
        m_pathIndex = 0;
        return;
    }

    m_path = std::move(*path);
    // The first waypoint is the cell the enemy already stands in
    m_pathIndex = m_path.empty() ? 0 : 1;
}

void EnemyController::update(float dt, const BlockSource& world, const BodyPhysics& physics,
                             const Pathfinder& pathfinder, const std::vector<EnemyTarget>& targets,
                             const RoomSettings& settings, std::vector<EnemyAttackIntent>& attacks) {
    m_repathTimer += dt;
    if (m_repathTimer >= settings.repathInterval) {
        m_repathTimer = 0.0f;
        retarget(world, pathfinder, targets);
    }

    glm::vec3 chase(0.0f);
    if (!isStunned() && m_pathIndex < m_path.size()) {
        const glm::vec3& waypoint = m_path[m_pathIndex];
        float dx = waypoint.x - m_body.position.x;
        float dz = waypoint.z - m_body.position.z;

        if (std::abs(dx) < settings.waypointTolerance && std::abs(dz) < settings.waypointTolerance) {
            m_pathIndex++;
        } else {
            float length = std::hypot(dx, dz);
            chase = glm::vec3(dx / length, 0.0f, dz / length) * m_type->speed;

            // Step up onto the next cell
            if (waypoint.y > m_body.position.y + 0.5f && m_body.grounded) {
                m_body.velocity.y = physics.settings().jumpStrength;
            }
        }
    }

    m_body.velocity.x = chase.x + m_knockback.x;
    m_body.velocity.z = chase.z + m_knockback.z;
    m_knockback *= std::max(0.0f, 1.0f - KNOCKBACK_DAMPING * dt);

    physics.stepBody(m_body, world, dt);
    syncState();

    m_attackTimer = std::max(0.0f, m_attackTimer - dt);
    if (m_targetId.empty() || m_type->attacks.empty() || isStunned() || m_attackTimer > 0.0f) {
        return;
    }

    for (const EnemyTarget& target : targets) {
        if (target.sessionId != m_targetId) continue;

        const EnemyAttackDefinition& attack = m_type->attacks.front();
        if (glm::length(target.position - m_body.position) <= attack.range) {
            attacks.push_back({m_state.id, target.sessionId, attack.damage, attack.kind});
            m_attackTimer = attack.cooldown;
        }
        break;
    }
}

bool EnemyController::takeDamage(float amount, const std::string& attackerId) {
    if (isDead()) {
        return false;
    }

    float multiplier = 1.0f;
    for (const EnemyStatus& status : m_statuses) {
        if (status.effect == "VULNERABLE") {
            multiplier += status.amount;
        }
    }

    m_lastAttacker = attackerId;
    m_state.setHealth(m_state.health - amount * multiplier);
    Logger::debug() << "Enemy " << m_state.id << " took " << amount * multiplier << " damage, health "
                    << m_state.health;
    return isDead();
}

void EnemyController::applyStatus(const StatusEffectMod& mod, const std::string& sourceId) {
    EnemyStatus status;
    status.effect = mod.effect;
    status.remaining = mod.duration > 0.0f ? mod.duration : DEFAULT_STUN_DURATION;
    status.amount = mod.amount;
    status.damagePerSecond = mod.effect == "BLEED" && mod.duration > 0.0f ? mod.damage / mod.duration : 0.0f;
    status.sourceId = sourceId;

    for (EnemyStatus& existing : m_statuses) {
        if (existing.effect == status.effect) {
            existing = status;
            return;
        }
    }
    m_statuses.push_back(status);
}

void EnemyController::applyKnockback(const glm::vec3& origin, float force) {
    glm::vec3 away = m_body.position - origin;
    away.y = 0.0f;
    if (glm::dot(away, away) < 1e-6f) {
        away = glm::vec3(1.0f, 0.0f, 0.0f);
    }
    m_knockback = glm::normalize(away) * force;
}

float EnemyController::tickStatuses(float dt, std::string& sourceId) {
    float damage = 0.0f;
    for (EnemyStatus& status : m_statuses) {
        float step = std::min(dt, status.remaining);
        if (status.damagePerSecond > 0.0f && step > 0.0f) {
            damage += status.damagePerSecond * step;
            sourceId = status.sourceId;
        }
        status.remaining -= dt;
    }
    m_statuses.erase(std::remove_if(m_statuses.begin(), m_statuses.end(),
                                    [](const EnemyStatus& s) { return s.remaining <= 0.0f; }),
                     m_statuses.end());
    return damage;
}

bool EnemyController::isStunned() const {
    for (const EnemyStatus& status : m_statuses) {
        if (status.effect == "STUN") {
            return true;
        }
    }
    return false;
}
