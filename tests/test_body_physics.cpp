/**
 * @file test_body_physics.cpp
 * @brief Gravity, input movement and axis-separated voxel collision
 */

#include "test_utils.h"
#include "block_system.h"
#include "body_physics.h"
#include "voxel_grid.h"
#include "world.h"
#include <algorithm>

namespace {

constexpr float DT = 1.0f / 60.0f;

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
 * @brief 32x32x32 world whose ground surface is y = 10
 */
GridSource groundWorld() {
    VoxelGrid grid = VoxelGrid::chunk();
    grid.fillBox(0, 0, 0, 31, 9, 31, BlockID::STONE);
    return GridSource(std::move(grid));
}

PhysicsBody standingBody(float x, float z) {
    PhysicsBody body;
    body.position = glm::vec3(x, 10.0f, z);
    body.grounded = true;
    return body;
}

} // namespace

TEST(MoveDirectionNormalized) {
    KeyState keys{{"w", true}, {"d", true}};
    glm::vec3 direction = BodyPhysics::moveDirection(keys);
    ASSERT_NEAR(glm::length(direction), 1.0f, 0.0001f);
    ASSERT_LT(direction.z, 0.0f);
    ASSERT_GT(direction.x, 0.0f);

    // Opposing keys cancel; released keys count as up
    KeyState cancel{{"a", true}, {"d", true}, {"w", false}};
    ASSERT_NEAR(glm::length(BodyPhysics::moveDirection(cancel)), 0.0f, 0.0001f);
    ASSERT_NEAR(glm::length(BodyPhysics::moveDirection(KeyState())), 0.0f, 0.0001f);
}

TEST(FallsOntoGround) {
    GridSource world = groundWorld();
    BodyPhysics physics;

    PhysicsBody body;
    body.position = glm::vec3(8.5f, 15.0f, 8.5f);
    for (int i = 0; i < 120; i++) {
        physics.stepPlayer(body, KeyState(), world, DT);
    }

    ASSERT_NEAR(body.position.y, 10.0f, 0.0001f);
    ASSERT_NEAR(body.velocity.y, 0.0f, 0.0001f);
    ASSERT_TRUE(body.grounded);
    ASSERT_TRUE(BodyPhysics::checkGrounded(body, world));
}

TEST(WalksAtMoveSpeed) {
    GridSource world = groundWorld();
    BodyPhysics physics;

    PhysicsBody body = standingBody(3.5f, 8.5f);
    KeyState keys{{"d", true}};
    for (int i = 0; i < 60; i++) {
        physics.stepPlayer(body, keys, world, DT);
    }

    ASSERT_NEAR(body.position.x, 3.5f + physics.settings().moveSpeed, 0.01f);
    ASSERT_NEAR(body.position.z, 8.5f, 0.0001f);
    ASSERT_NEAR(body.position.y, 10.0f, 0.0001f);
}

TEST(WallStopsMovement) {
    GridSource world = groundWorld();
    world.grid().fillBox(10, 10, 0, 10, 13, 31, BlockID::BRICK);
    BodyPhysics physics;

    PhysicsBody body = standingBody(5.5f, 8.5f);
    KeyState keys{{"d", true}};
    for (int i = 0; i < 120; i++) {
        physics.stepPlayer(body, keys, world, DT);
    }

    ASSERT_NEAR(body.position.x, 10.0f - body.width / 2.0f, 0.0001f);
    ASSERT_NEAR(body.velocity.x, 0.0f, 0.0001f);

    // Same wall from the other side along Z
    world.grid().fillBox(0, 10, 20, 9, 13, 20, BlockID::BRICK);
    PhysicsBody walker = standingBody(4.5f, 15.5f);
    KeyState south{{"s", true}};
    for (int i = 0; i < 120; i++) {
        physics.stepPlayer(walker, south, world, DT);
    }
    ASSERT_NEAR(walker.position.z, 20.0f - walker.width / 2.0f, 0.0001f);
}

TEST(JumpOnlyFromGround) {
    GridSource world = groundWorld();
    BodyPhysics physics;

    PhysicsBody body = standingBody(8.5f, 8.5f);
    KeyState jump{{" ", true}};
    physics.stepPlayer(body, jump, world, DT);
    ASSERT_GT(body.position.y, 10.0f);
    ASSERT_FALSE(body.grounded);

    // Holding jump mid-air never adds a second impulse
    float peak = body.position.y;
    for (int i = 0; i < 240; i++) {
        physics.stepPlayer(body, jump, world, DT);
        if (!body.grounded) {
            peak = std::max(peak, body.position.y);
        } else {
            break;
        }
    }
    float expectedPeak = 10.0f + (physics.settings().jumpStrength * physics.settings().jumpStrength) /
                                 (2.0f * -physics.settings().gravity);
    ASSERT_LT(peak, expectedPeak + 0.3f);
    ASSERT_TRUE(body.grounded);
}

TEST(CeilingBlocksJump) {
    GridSource world = groundWorld();
    world.grid().fillBox(0, 12, 0, 31, 12, 31, BlockID::STONE);
    BodyPhysics physics;

    PhysicsBody body = standingBody(8.5f, 8.5f);
    KeyState jump{{" ", true}};
    float highest = body.position.y;
    for (int i = 0; i < 30; i++) {
        physics.stepPlayer(body, jump, world, DT);
        highest = std::max(highest, body.position.y);
    }

    ASSERT_LE(highest + body.height, 12.0f + 0.2f);
    ASSERT_NEAR(body.position.y, 10.0f, 0.3f);
}

TEST(StepBodyKeepsOwnerVelocity) {
    GridSource world = groundWorld();
    BodyPhysics physics;

    PhysicsBody body = standingBody(4.5f, 4.5f);
    body.velocity = glm::vec3(0.0f, 0.0f, 2.0f);
    for (int i = 0; i < 30; i++) {
        physics.stepBody(body, world, DT);
    }
    ASSERT_NEAR(body.position.z, 5.5f, 0.01f);
    ASSERT_NEAR(body.velocity.z, 2.0f, 0.0001f);
    ASSERT_TRUE(body.grounded);
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
