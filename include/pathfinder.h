/**
 * @file pathfinder.h
 * @brief Bounded A* over the 26-connected voxel grid for ground enemies
 */

#pragma once

#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include "game_settings.h"

class BlockSource;

/**
 * @brief Grid A* with a standing-room walkability predicate
 *
 * A cell is walkable when it and the cell above are air and the cell below is
 * solid. Searches farther than maxSearchDistance are refused outright and a
 * search stops after maxExpansions node pops; both outcomes are std::nullopt,
 * not errors.
 *
 * Stateless between calls; one instance can serve every enemy of a room.
 */
class Pathfinder {
public:
    explicit Pathfinder(PathfinderSettings settings = PathfinderSettings());

    /**
     * @brief Finds a path from start to end (both floored to cells)
     * @return Waypoints at cell centres `(x + 0.5, y, z + 0.5)`, start cell first
     */
    std::optional<std::vector<glm::vec3>> findPath(const BlockSource& world,
                                                   const glm::vec3& start,
                                                   const glm::vec3& end) const;

    static bool isWalkable(const BlockSource& world, const glm::ivec3& cell);

    /**
     * @brief Octile-style cost estimate between two cells
     *
     * `10 * (dx + dy + dz) + (14 - 30) * min(dx, dy, dz)`; also the step cost.
     */
    static int estimateCost(const glm::ivec3& a, const glm::ivec3& b);

    const PathfinderSettings& settings() const { return m_settings; }

private:
    PathfinderSettings m_settings;
};
