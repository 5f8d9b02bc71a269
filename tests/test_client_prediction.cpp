/**
 * @file test_client_prediction.cpp
 * @brief Local prediction, snapshot reconciliation and the client-side state mirror
 */

#include "test_utils.h"
#include "block_system.h"
#include "chunk_scheduler.h"
#include "client_prediction.h"
#include "voxel_grid.h"
#include "world.h"

namespace {

constexpr float DT = 1.0f / 60.0f;

class GridSource : public BlockSource {
public:
    explicit GridSource(VoxelGrid grid) : m_grid(std::move(grid)) {}
    uint8_t getBlock(int x, int y, int z) const override { return m_grid.get(x, y, z); }
    int columnHeight() const override { return m_grid.height(); }

private:
    VoxelGrid m_grid;
};

GridSource groundWorld() {
    VoxelGrid grid = VoxelGrid::chunk();
    grid.fillBox(0, 0, 0, 31, 9, 31, BlockID::STONE);
    return GridSource(std::move(grid));
}

PlayerState playerAt(const glm::vec3& position) {
    PlayerState state;
    state.username = "Aria";
    state.position = position;
    return state;
}

} // namespace

// ============================================================================
// Prediction and reconciliation
// ============================================================================

TEST(FirstSnapshotPlacesPrediction) {
    ClientPrediction prediction;
    ASSERT_FALSE(prediction.serverPosition().has_value());
    ASSERT_FALSE(prediction.reconcile());
    ASSERT_EQ(prediction.error(), 0.0f);

    prediction.onServerSnapshot(playerAt(glm::vec3(8.5f, 10.0f, 8.5f)));
    ASSERT_TRUE(prediction.predictedPosition() == glm::vec3(8.5f, 10.0f, 8.5f));
    ASSERT_EQ(prediction.error(), 0.0f);

    // Later snapshots never snap the prediction
    prediction.onServerSnapshot(playerAt(glm::vec3(12.5f, 10.0f, 8.5f)));
    ASSERT_TRUE(prediction.predictedPosition() == glm::vec3(8.5f, 10.0f, 8.5f));
    ASSERT_NEAR(prediction.error(), 4.0f, 1e-5f);
    ASSERT_EQ(prediction.serverState().username, "Aria");
}

TEST(ReconcileMovesFractionOfError) {
    ClientPrediction prediction;
    prediction.onServerSnapshot(playerAt(glm::vec3(0.0f)));
    prediction.teleport(glm::vec3(10.0f, 0.0f, 0.0f));

    ASSERT_TRUE(prediction.reconcile());
    ASSERT_NEAR(prediction.predictedPosition().x, 8.0f, 1e-5f);
    ASSERT_TRUE(prediction.reconcile());
    ASSERT_NEAR(prediction.predictedPosition().x, 6.4f, 1e-5f);

    // Converges and then stops correcting
    int corrections = 0;
    while (prediction.reconcile()) {
        corrections++;
        ASSERT_LT(corrections, 100);
    }
    ASSERT_LE(prediction.error(), ClientPrediction::RECONCILE_THRESHOLD);
    ASSERT_GT(prediction.error(), 0.0f);
}

TEST(SmallErrorLeftAlone) {
    ClientPrediction prediction;
    prediction.onServerSnapshot(playerAt(glm::vec3(0.0f)));
    prediction.teleport(glm::vec3(0.05f, 0.0f, 0.05f));

    ASSERT_FALSE(prediction.reconcile());
    ASSERT_NEAR(prediction.predictedPosition().x, 0.05f, 1e-6f);
}

TEST(PredictionMovesWithInput) {
    GridSource world = groundWorld();
    ClientPrediction prediction;
    prediction.onServerSnapshot(playerAt(glm::vec3(8.5f, 10.0f, 8.5f)));

    KeyState keys;
    keys["d"] = true;
    prediction.setInput(keys);
    for (int i = 0; i < 30; i++) {
        prediction.predict(world, DT);
    }

    // Half a second at 5 blocks/s, resting on the ground
    ASSERT_NEAR(prediction.predictedPosition().x, 11.0f, 0.01f);
    ASSERT_NEAR(prediction.predictedPosition().y, 10.0f, 1e-4f);
    ASSERT_TRUE(prediction.body().grounded);

    // A server that agrees leaves nothing to correct
    prediction.onServerSnapshot(playerAt(prediction.predictedPosition()));
    ASSERT_FALSE(prediction.reconcile());
    ASSERT_EQ(prediction.error(), 0.0f);
}

TEST(UpdatePredictsThenReconciles) {
    GridSource world = groundWorld();
    ClientPrediction prediction;
    prediction.onServerSnapshot(playerAt(glm::vec3(8.5f, 10.0f, 8.5f)));
    prediction.onServerSnapshot(playerAt(glm::vec3(13.5f, 10.0f, 8.5f)));

    float before = prediction.error();
    prediction.update(world, DT);
    ASSERT_LT(prediction.error(), before);
}

// ============================================================================
// Mirror
// ============================================================================

TEST(MirrorCopiesExistingAndTracksChanges) {
    RoomState room;
    room.players.set("me", playerAt(glm::vec3(1.0f, 11.0f, 1.0f)));
    room.players.set("other", playerAt(glm::vec3(4.0f, 11.0f, 4.0f)));
    room.npcs.set("npc_gideon", {"npc_gideon", "Elder Gideon", glm::vec3(5.0f, 11.0f, 5.0f)});

    ClientPrediction prediction;
    ClientMirror mirror(room, "me", prediction);

    ASSERT_EQ(mirror.players().size(), 2u);
    ASSERT_EQ(mirror.npcs().size(), 1u);
    ASSERT_EQ(mirror.eventCount(), 0u);
    // The local entry seeds the prediction
    ASSERT_TRUE(prediction.predictedPosition() == glm::vec3(1.0f, 11.0f, 1.0f));

    EnemyState slime;
    slime.id = "enemy_1";
    slime.type = "Slime";
    slime.maxHealth = 20.0f;
    slime.health = 20.0f;
    room.enemies.set(slime.id, slime);
    room.enemies.update(slime.id, [](EnemyState& e) { e.setHealth(12.0f); });
    ASSERT_EQ(mirror.enemies().at("enemy_1").health, 12.0f);

    room.players.set("me", playerAt(glm::vec3(3.0f, 11.0f, 1.0f)));
    ASSERT_TRUE(prediction.serverPosition().has_value());
    ASSERT_TRUE(*prediction.serverPosition() == glm::vec3(3.0f, 11.0f, 1.0f));
    ASSERT_TRUE(prediction.predictedPosition() == glm::vec3(1.0f, 11.0f, 1.0f));

    // Other players never touch the prediction
    room.players.set("other", playerAt(glm::vec3(40.0f, 11.0f, 4.0f)));
    ASSERT_TRUE(*prediction.serverPosition() == glm::vec3(3.0f, 11.0f, 1.0f));
    ASSERT_EQ(mirror.players().at("other").position.x, 40.0f);

    room.players.remove("other");
    room.enemies.remove("enemy_1");
    ASSERT_EQ(mirror.players().size(), 1u);
    ASSERT_TRUE(mirror.enemies().empty());
    ASSERT_EQ(mirror.eventCount(), 6u);
}

TEST(MirrorDetachesOnDestruction) {
    RoomState room;
    ClientPrediction prediction;
    {
        ClientMirror mirror(room, "me", prediction);
        room.portals.set("portal_iron_1", {"portal_iron_1", "Iron", glm::vec3(18.0f, 11.0f, 18.0f), "#8d8d8d"});
        ASSERT_EQ(mirror.portals().size(), 1u);
    }

    // No listener left pointing at the destroyed mirror
    room.portals.remove("portal_iron_1");
    room.players.set("me", playerAt(glm::vec3(0.0f)));
    ASSERT_FALSE(prediction.serverPosition().has_value());
}

TEST(CollectiblesSeatedOnLoadedGround) {
    // Every chunk is solid stone up to y = 4
    ChunkScheduler scheduler([](const ChunkJob& job) {
        LoadedChunk chunk;
        chunk.coord = job.coord;
        chunk.lod = job.lod;
        chunk.blocks = VoxelGrid::chunk();
        chunk.blocks.fillBox(0, 0, 0, 31, 4, 31, BlockID::STONE);
        return chunk;
    }, StreamingSettings());

    RoomState room;
    CollectibleState shard;
    shard.id = "collectible_dark_01";
    shard.kind = CollectibleKind::Essence;
    shard.definitionId = "essence_dark_01";
    shard.position = glm::vec3(5.0f, 99.0f, 3.0f);
    room.collectibles.set(shard.id, shard);

    ClientPrediction prediction;
    ClientMirror mirror(room, "me", prediction, &scheduler);
    ASSERT_EQ(mirror.collectibles().at(shard.id).position.y, 99.0f);

    scheduler.start(1);
    ASSERT_TRUE(scheduler.waitUntilIdle(std::chrono::seconds(20)));
    ASSERT_NEAR(mirror.collectibles().at(shard.id).position.y, 5.7f, 1e-4f);

    // Collected before its chunk arrives: the late callback finds nothing to move
    CollectibleState far = shard;
    far.id = "collectible_far";
    far.position = glm::vec3(500.0f, 99.0f, 500.0f);
    room.collectibles.set(far.id, far);
    room.collectibles.remove(far.id);
    ASSERT_TRUE(scheduler.waitUntilIdle(std::chrono::seconds(20)));
    ASSERT_EQ(mirror.collectibles().count(far.id), 0u);

    scheduler.stop();
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
