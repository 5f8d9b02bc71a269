/**
 * @file test_pathfinder.cpp
 * @brief A* search over small hand-built voxel worlds
 */

#include "test_utils.h"
#include "block_system.h"
#include "pathfinder.h"
#include "voxel_grid.h"
#include "world.h"

namespace {

class GridSource : public BlockSource {
public:
    explicit GridSource(VoxelGrid grid) : m_grid(std::move(grid)) {}
    uint8_t getBlock(int x, int y, int z) const override { return m_grid.get(x, y, z); }
    int columnHeight() const override { return m_grid.height(); }
    VoxelGrid& grid() { return m_grid; }

private:
    VoxelGrid m_grid;
};

/**
 * @brief 16x8x16 world with a stone floor at y = 0
 */
GridSource flatWorld() {
    VoxelGrid grid(16, 8, 16);
    grid.fillBox(0, 0, 0, 15, 0, 15, BlockID::STONE);
    return GridSource(std::move(grid));
}

void assertContiguous(const std::vector<glm::vec3>& path) {
    for (size_t i = 1; i < path.size(); i++) {
        ASSERT_LE(std::abs(path[i].x - path[i - 1].x), 1.0f);
        ASSERT_LE(std::abs(path[i].y - path[i - 1].y), 1.0f);
        ASSERT_LE(std::abs(path[i].z - path[i - 1].z), 1.0f);
    }
}

} // namespace

TEST(WalkablePredicate) {
    GridSource world = flatWorld();
    ASSERT_TRUE(Pathfinder::isWalkable(world, glm::ivec3(3, 1, 3)));
    ASSERT_FALSE(Pathfinder::isWalkable(world, glm::ivec3(3, 0, 3)));   // inside the floor
    ASSERT_FALSE(Pathfinder::isWalkable(world, glm::ivec3(3, 2, 3)));   // nothing underneath

    world.grid().set(3, 2, 3, BlockID::STONE);
    ASSERT_FALSE(Pathfinder::isWalkable(world, glm::ivec3(3, 1, 3)));   // no headroom
}

TEST(CostEstimate) {
    glm::ivec3 origin(0);
    ASSERT_EQ(Pathfinder::estimateCost(origin, glm::ivec3(1, 0, 0)), 10);
    ASSERT_EQ(Pathfinder::estimateCost(origin, glm::ivec3(1, 1, 1)), 14);
    ASSERT_EQ(Pathfinder::estimateCost(origin, glm::ivec3(3, 0, 0)), 30);
    ASSERT_EQ(Pathfinder::estimateCost(origin, glm::ivec3(-2, 2, 2)), 28);
}

TEST(StraightLinePath) {
    GridSource world = flatWorld();
    Pathfinder pathfinder;

    auto path = pathfinder.findPath(world, glm::vec3(2.2f, 1.0f, 2.7f), glm::vec3(9.9f, 1.0f, 2.1f));
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->size(), 8u);

    ASSERT_NEAR(path->front().x, 2.5f, 0.0001f);
    ASSERT_NEAR(path->front().z, 2.5f, 0.0001f);
    ASSERT_NEAR(path->back().x, 9.5f, 0.0001f);
    ASSERT_NEAR(path->back().y, 1.0f, 0.0001f);
    assertContiguous(*path);
}

TEST(PathAroundWall) {
    GridSource world = flatWorld();
    // Wall along x = 6 with a single gap at z = 12
    for (int z = 0; z < 16; z++) {
        if (z != 12) {
            world.grid().fillBox(6, 1, z, 6, 3, z, BlockID::BRICK);
        }
    }

    Pathfinder pathfinder;
    auto path = pathfinder.findPath(world, glm::vec3(2.5f, 1.0f, 2.5f), glm::vec3(10.5f, 1.0f, 2.5f));
    ASSERT_TRUE(path.has_value());
    assertContiguous(*path);

    bool throughGap = false;
    for (const glm::vec3& point : *path) {
        ASSERT_TRUE(Pathfinder::isWalkable(world, glm::ivec3(static_cast<int>(std::floor(point.x)),
                                                             static_cast<int>(point.y),
                                                             static_cast<int>(std::floor(point.z)))));
        if (static_cast<int>(std::floor(point.x)) == 6) {
            ASSERT_EQ(static_cast<int>(std::floor(point.z)), 12);
            throughGap = true;
        }
    }
    ASSERT_TRUE(throughGap);
}

TEST(ClimbsSingleStep) {
    GridSource world = flatWorld();
    world.grid().fillBox(8, 1, 0, 15, 1, 15, BlockID::DIRT);

    Pathfinder pathfinder;
    auto path = pathfinder.findPath(world, glm::vec3(3.5f, 1.0f, 5.5f), glm::vec3(12.5f, 2.0f, 5.5f));
    ASSERT_TRUE(path.has_value());
    ASSERT_NEAR(path->back().y, 2.0f, 0.0001f);
    assertContiguous(*path);
}

TEST(EnclosedTargetUnreachable) {
    GridSource world = flatWorld();
    // Ring of walls around (12, 1, 12)
    world.grid().fillBox(10, 1, 10, 14, 3, 14, BlockID::COBBLESTONE);
    world.grid().fillBox(11, 1, 11, 13, 3, 13, BlockID::AIR);

    Pathfinder pathfinder;
    auto path = pathfinder.findPath(world, glm::vec3(2.5f, 1.0f, 2.5f), glm::vec3(12.5f, 1.0f, 12.5f));
    ASSERT_FALSE(path.has_value());
}

TEST(SearchLimits) {
    GridSource world = flatWorld();

    PathfinderSettings tight;
    tight.maxSearchDistance = 5.0f;
    Pathfinder shortRange(tight);
    ASSERT_FALSE(shortRange.findPath(world, glm::vec3(1.5f, 1.0f, 1.5f), glm::vec3(12.5f, 1.0f, 1.5f)).has_value());
    ASSERT_TRUE(shortRange.findPath(world, glm::vec3(1.5f, 1.0f, 1.5f), glm::vec3(4.5f, 1.0f, 1.5f)).has_value());

    PathfinderSettings starved;
    starved.maxExpansions = 3;
    Pathfinder lowBudget(starved);
    ASSERT_FALSE(lowBudget.findPath(world, glm::vec3(1.5f, 1.0f, 1.5f), glm::vec3(12.5f, 1.0f, 1.5f)).has_value());
}

TEST(UnwalkableStartRefused) {
    GridSource world = flatWorld();
    Pathfinder pathfinder;
    // Start floating two blocks above the floor
    ASSERT_FALSE(pathfinder.findPath(world, glm::vec3(2.5f, 3.0f, 2.5f), glm::vec3(6.5f, 1.0f, 2.5f)).has_value());
}

TEST(StartEqualsEnd) {
    GridSource world = flatWorld();
    Pathfinder pathfinder;
    auto path = pathfinder.findPath(world, glm::vec3(4.5f, 1.0f, 4.5f), glm::vec3(4.9f, 1.2f, 4.1f));
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->size(), 1u);
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
