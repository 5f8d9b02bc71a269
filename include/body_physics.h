/**
 * @file body_physics.h
 * @brief Deterministic box-body integration against a voxel BlockSource
 *
 * Shared by the authoritative room (players and enemies) and the client
 * predictor, so both sides resolve the same input against the same terrain
 * identically.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <glm/glm.hpp>
#include "game_settings.h"

class BlockSource;

/**
 * @brief Held-key snapshot from an input message ("w", "a", "s", "d", " ")
 */
using KeyState = std::unordered_map<std::string, bool>;

/**
 * @brief Axis-aligned body: position is the centre of the feet
 */
struct PhysicsBody {
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    float width = 0.6f;
    float height = 1.8f;
    bool grounded = false;
};

class BodyPhysics {
public:
    explicit BodyPhysics(PhysicsSettings settings = PhysicsSettings());

    /**
     * @brief Unit horizontal direction from WASD (w = -Z, s = +Z, a = -X, d = +X)
     */
    static glm::vec3 moveDirection(const KeyState& keys);

    static bool isPressed(const KeyState& keys, const char* key);

    /**
     * @brief Player step: input velocity, gravity, jump, collision, grounded probe
     */
    void stepPlayer(PhysicsBody& body, const KeyState& keys, const BlockSource& world, float dt) const;

    /**
     * @brief Generic step for a body whose horizontal velocity was set by its owner
     */
    void stepBody(PhysicsBody& body, const BlockSource& world, float dt) const;

    /**
     * @brief Moves the body by velocity * dt, resolving Y then X then Z
     *
     * On contact the body snaps to the voxel boundary and the velocity
     * component of that axis is zeroed.
     */
    void resolveCollisions(PhysicsBody& body, const BlockSource& world, float dt) const;

    static bool isCollidingOnAxis(const PhysicsBody& body, int axis, const BlockSource& world);

    /**
     * @brief True if the block just below the feet is solid
     */
    static bool checkGrounded(const PhysicsBody& body, const BlockSource& world);

    const PhysicsSettings& settings() const { return m_settings; }

private:
    PhysicsSettings m_settings;
};
