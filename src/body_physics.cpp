/**
 * @file body_physics.cpp
 * @brief Axis-separated voxel collision for box bodies
 */

#include "body_physics.h"
#include "terrain_constants.h"
#include "world.h"
#include <cmath>

namespace {
constexpr int AXIS_X = 0;
constexpr int AXIS_Y = 1;
constexpr int AXIS_Z = 2;
}

BodyPhysics::BodyPhysics(PhysicsSettings settings)
    : m_settings(settings) {
}

bool BodyPhysics::isPressed(const KeyState& keys, const char* key) {
    auto it = keys.find(key);
    return it != keys.end() && it->second;
}

glm::vec3 BodyPhysics::moveDirection(const KeyState& keys) {
    glm::vec3 direction(0.0f);
    if (isPressed(keys, "w")) direction.z -= 1.0f;
    if (isPressed(keys, "s")) direction.z += 1.0f;
    if (isPressed(keys, "a")) direction.x -= 1.0f;
    if (isPressed(keys, "d")) direction.x += 1.0f;

    if (glm::dot(direction, direction) > 0.0f) {
        direction = glm::normalize(direction);
    }
    return direction;
}

void BodyPhysics::stepPlayer(PhysicsBody& body, const KeyState& keys, const BlockSource& world, float dt) const {
    glm::vec3 direction = moveDirection(keys);
    body.velocity.x = direction.x * m_settings.moveSpeed;
    body.velocity.z = direction.z * m_settings.moveSpeed;
    body.velocity.y += m_settings.gravity * dt;

    // Jump impulse only from the ground
    if (isPressed(keys, " ") && body.grounded) {
        body.velocity.y = m_settings.jumpStrength;
    }

    resolveCollisions(body, world, dt);
    body.grounded = checkGrounded(body, world);
}

void BodyPhysics::stepBody(PhysicsBody& body, const BlockSource& world, float dt) const {
    body.velocity.y += m_settings.gravity * dt;
    resolveCollisions(body, world, dt);
    body.grounded = checkGrounded(body, world);
}

void BodyPhysics::resolveCollisions(PhysicsBody& body, const BlockSource& world, float dt) const {
    const float halfWidth = body.width / 2.0f;
    const float height = body.height;

    // Y first: settle onto the floor (or under the ceiling) before sliding
    body.position.y += body.velocity.y * dt;
    if (isCollidingOnAxis(body, AXIS_Y, world)) {
        body.position.y = (body.velocity.y < 0.0f)
            ? std::floor(body.position.y) + 1.0f
            : std::floor(body.position.y + height) - height;
        body.velocity.y = 0.0f;
    }

    body.position.x += body.velocity.x * dt;
    if (isCollidingOnAxis(body, AXIS_X, world)) {
        body.position.x = (body.velocity.x > 0.0f)
            ? std::floor(body.position.x + halfWidth) - halfWidth
            : std::floor(body.position.x - halfWidth) + 1.0f + halfWidth;
        body.velocity.x = 0.0f;
    }

    body.position.z += body.velocity.z * dt;
    if (isCollidingOnAxis(body, AXIS_Z, world)) {
        body.position.z = (body.velocity.z > 0.0f)
            ? std::floor(body.position.z + halfWidth) - halfWidth
            : std::floor(body.position.z - halfWidth) + 1.0f + halfWidth;
        body.velocity.z = 0.0f;
    }
}

bool BodyPhysics::isCollidingOnAxis(const PhysicsBody& body, int axis, const BlockSource& world) {
    const glm::vec3& p = body.position;
    const float halfWidth = body.width / 2.0f;
    const float inset = PhysicsConstants::COLLISION_SAMPLE_INSET;

    if (axis == AXIS_Y) {
        // Feet and head columns
        return world.isSolidAt(p.x, p.y, p.z) || world.isSolidAt(p.x, p.y + body.height, p.z);
    }

    const float sampleHeights[3] = {inset, body.height / 2.0f, body.height - inset};
    for (float h : sampleHeights) {
        float y = p.y + h;
        if (axis == AXIS_X) {
            if (world.isSolidAt(p.x - halfWidth, y, p.z) || world.isSolidAt(p.x + halfWidth, y, p.z)) {
                return true;
            }
        } else {
            if (world.isSolidAt(p.x, y, p.z - halfWidth) || world.isSolidAt(p.x, y, p.z + halfWidth)) {
                return true;
            }
        }
    }
    return false;
}

bool BodyPhysics::checkGrounded(const PhysicsBody& body, const BlockSource& world) {
    return world.isSolidAt(body.position.x, body.position.y - PhysicsConstants::GROUND_CHECK_DISTANCE,
                           body.position.z);
}
