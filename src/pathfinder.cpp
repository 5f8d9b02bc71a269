/**
 * @file pathfinder.cpp
 * @brief A* search with a binary-heap open set and lazy deletion
 */

#include "pathfinder.h"
#include "world.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace {

constexpr int STRAIGHT_COST = 10;
constexpr int DIAGONAL_COST = 14;

// Packs a cell into one key; world cells fit comfortably in 21 bits per axis
int64_t cellKey(const glm::ivec3& cell) {
    const int64_t mask = (1 << 21) - 1;
    return ((static_cast<int64_t>(cell.x) & mask) << 42) |
           ((static_cast<int64_t>(cell.y) & mask) << 21) |
           (static_cast<int64_t>(cell.z) & mask);
}

struct OpenEntry {
    glm::ivec3 cell;
    int g;
    int f;

    // Inverted so the priority_queue pops the lowest f cost
    bool operator<(const OpenEntry& other) const {
        return f > other.f;
    }
};

struct NodeRecord {
    int g;
    glm::ivec3 parent;
    bool hasParent;
};

} // namespace

Pathfinder::Pathfinder(PathfinderSettings settings)
    : m_settings(settings) {
}

bool Pathfinder::isWalkable(const BlockSource& world, const glm::ivec3& cell) {
    return world.getBlock(cell.x, cell.y, cell.z) == 0 &&
           world.getBlock(cell.x, cell.y + 1, cell.z) == 0 &&
           world.getBlock(cell.x, cell.y - 1, cell.z) != 0;
}

int Pathfinder::estimateCost(const glm::ivec3& a, const glm::ivec3& b) {
    int dx = std::abs(a.x - b.x);
    int dy = std::abs(a.y - b.y);
    int dz = std::abs(a.z - b.z);
    return STRAIGHT_COST * (dx + dy + dz) + (DIAGONAL_COST - 3 * STRAIGHT_COST) * std::min({dx, dy, dz});
}

std::optional<std::vector<glm::vec3>> Pathfinder::findPath(const BlockSource& world,
                                                           const glm::vec3& start,
                                                           const glm::vec3& end) const {
    if (glm::length(end - start) > m_settings.maxSearchDistance) {
        return std::nullopt;
    }

    const glm::ivec3 startCell(static_cast<int>(std::floor(start.x)),
                               static_cast<int>(std::floor(start.y)),
                               static_cast<int>(std::floor(start.z)));
    const glm::ivec3 endCell(static_cast<int>(std::floor(end.x)),
                             static_cast<int>(std::floor(end.y)),
                             static_cast<int>(std::floor(end.z)));

    if (!isWalkable(world, startCell)) {
        return std::nullopt;
    }

    std::priority_queue<OpenEntry> open;
    std::unordered_map<int64_t, NodeRecord> records;
    std::unordered_set<int64_t> closed;

    records[cellKey(startCell)] = {0, startCell, false};
    open.push({startCell, 0, estimateCost(startCell, endCell)});

    int budget = m_settings.maxExpansions;
    while (!open.empty() && budget > 0) {
        OpenEntry current = open.top();
        open.pop();

        int64_t currentKey = cellKey(current.cell);
        if (closed.count(currentKey)) {
            continue;  // stale heap entry
        }
        budget--;
        closed.insert(currentKey);

        if (current.cell == endCell) {
            std::vector<glm::vec3> path;
            glm::ivec3 cell = current.cell;
            while (true) {
                path.emplace_back(cell.x + 0.5f, static_cast<float>(cell.y), cell.z + 0.5f);
                const NodeRecord& record = records[cellKey(cell)];
                if (!record.hasParent) {
                    break;
                }
                cell = record.parent;
            }
            std::reverse(path.begin(), path.end());
            return path;
        }

        for (int dx = -1; dx <= 1; dx++) {
            for (int dy = -1; dy <= 1; dy++) {
                for (int dz = -1; dz <= 1; dz++) {
                    if (dx == 0 && dy == 0 && dz == 0) continue;

                    glm::ivec3 neighbor = current.cell + glm::ivec3(dx, dy, dz);
                    int64_t neighborKey = cellKey(neighbor);
                    if (closed.count(neighborKey)) continue;

                    if (!isWalkable(world, neighbor)) {
                        closed.insert(neighborKey);
                        continue;
                    }

                    int g = current.g + estimateCost(current.cell, neighbor);
                    auto it = records.find(neighborKey);
                    if (it != records.end() && it->second.g <= g) {
                        continue;
                    }

                    records[neighborKey] = {g, current.cell, true};
                    open.push({neighbor, g, g + estimateCost(neighbor, endCell)});
                }
            }
        }
    }

    return std::nullopt;
}
