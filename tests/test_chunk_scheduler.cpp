/**
 * @file test_chunk_scheduler.cpp
 * @brief Job deduplication, LOD upgrades, eviction and callbacks of the chunk scheduler
 */

#include "test_utils.h"
#include "block_system.h"
#include "chunk_scheduler.h"
#include "terrain_generator.h"
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace {

const auto IDLE_TIMEOUT = std::chrono::seconds(20);

/**
 * @brief Job runner that records every job it runs and returns a flat slab
 */
class CountingRunner {
public:
    LoadedChunk operator()(const ChunkJob& job) {
        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_runs[{job.coord.x, job.coord.z}]++;
            fail = job.coord.x == m_failX && job.coord.z == m_failZ && (m_failLod < 0 || job.lod == m_failLod);
        }
        if (fail) {
            throw std::runtime_error("generator exploded");
        }

        LoadedChunk chunk;
        chunk.coord = job.coord;
        chunk.lod = job.lod;
        chunk.blocks = VoxelGrid::chunk();
        chunk.blocks.fillBox(0, 0, 0, 31, 4, 31, BlockID::STONE);
        return chunk;
    }

    int runs(int x, int z) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_runs.find({x, z});
        return it != m_runs.end() ? it->second : 0;
    }

    int totalRuns() {
        std::lock_guard<std::mutex> lock(m_mutex);
        int total = 0;
        for (const auto& entry : m_runs) {
            total += entry.second;
        }
        return total;
    }

    /// lod < 0 fails every job for the chunk
    void failAt(int x, int z, int lod = -1) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failX = x;
        m_failZ = z;
        m_failLod = lod;
    }

private:
    std::mutex m_mutex;
    std::map<std::pair<int, int>, int> m_runs;
    int m_failX = 1 << 20;
    int m_failZ = 1 << 20;
    int m_failLod = -1;
};

ChunkJobRunner wrap(CountingRunner& runner) {
    return [&runner](const ChunkJob& job) { return runner(job); };
}

StreamingSettings smallSettings(int viewDistance) {
    StreamingSettings settings;
    settings.viewDistance = viewDistance;
    settings.retentionDistance = viewDistance;
    settings.workerThreads = 3;
    settings.lod1Distance = 1;
    settings.lod2Distance = 2;
    return settings;
}

} // namespace

TEST(EveryChunkGeneratedOnce) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(2));
    scheduler.start();

    scheduler.onViewerMoved({0, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(scheduler.loadedCount(), 25u);
    ASSERT_EQ(runner.totalRuns(), 25);
    for (int x = -2; x <= 2; x++) {
        for (int z = -2; z <= 2; z++) {
            ASSERT_EQ(runner.runs(x, z), 1);
            ASSERT_TRUE(scheduler.getState(x, z) == ChunkState::Ready);
        }
    }

    // Same viewer chunk again: nothing new
    scheduler.onViewerMoved({0, 0});
    scheduler.requestChunk(1, 1, 1.5f);
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(runner.totalRuns(), 25);

    SchedulerStats stats = scheduler.stats();
    ASSERT_EQ(stats.completed, 25u);
    ASSERT_EQ(stats.failed, 0u);
    scheduler.stop();
}

TEST(LodFollowsDistance) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(2));

    ASSERT_EQ(scheduler.requiredLod(0.0f), 0);
    ASSERT_EQ(scheduler.requiredLod(1.0f), 1);
    ASSERT_EQ(scheduler.requiredLod(1.9f), 1);
    ASSERT_EQ(scheduler.requiredLod(2.0f), 2);

    scheduler.start(2);
    scheduler.onViewerMoved({0, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(scheduler.getLoadedChunk(0, 0)->lod, 0);
    ASSERT_EQ(scheduler.getLoadedChunk(1, 0)->lod, 1);
    ASSERT_EQ(scheduler.getLoadedChunk(1, -1)->lod, 1);
    ASSERT_EQ(scheduler.getLoadedChunk(-2, 0)->lod, 2);
    ASSERT_EQ(scheduler.getLoadedChunk(2, 2)->lod, 2);
}

TEST(StricterLodRegenerates) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(2));
    scheduler.start(1);

    ASSERT_TRUE(scheduler.requestChunk(5, 5, 4.0f, 2));
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(scheduler.getLoadedChunk(5, 5)->lod, 2);

    // Coarser or equal detail is already satisfied
    ASSERT_FALSE(scheduler.requestChunk(5, 5, 4.0f, 2));

    ASSERT_TRUE(scheduler.requestChunk(5, 5, 0.0f, 0));
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(scheduler.getLoadedChunk(5, 5)->lod, 0);
    ASSERT_EQ(runner.runs(5, 5), 2);

    ASSERT_FALSE(scheduler.requestChunk(5, 5, 3.0f, 1));
}

TEST(RepeatedRequestsCoalesce) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(2));

    // Not started: requests stay queued
    ASSERT_TRUE(scheduler.requestChunk(7, 7, 3.0f, 1));
    ASSERT_FALSE(scheduler.requestChunk(7, 7, 3.0f, 1));
    ASSERT_TRUE(scheduler.requestChunk(7, 7, 1.0f, 0));
    ASSERT_TRUE(scheduler.getState(7, 7) == ChunkState::Queued);
    ASSERT_EQ(scheduler.stats().queued, 1u);

    scheduler.start(2);
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(runner.runs(7, 7), 1);
    ASSERT_EQ(scheduler.getLoadedChunk(7, 7)->lod, 0);
}

TEST(ViewerMoveEvictsOutOfRange) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));

    size_t evicted = 0;
    scheduler.setChunkEvictedCallback([&evicted](const ChunkCoord&) { evicted++; });

    scheduler.start();
    scheduler.onViewerMoved({0, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(scheduler.loadedCount(), 9u);

    scheduler.onViewerMoved({10, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(evicted, 9u);
    ASSERT_EQ(scheduler.loadedCount(), 9u);
    ASSERT_NULL(scheduler.getLoadedChunk(0, 0));
    ASSERT_NOT_NULL(scheduler.getLoadedChunk(10, 1));
    ASSERT_TRUE(scheduler.getState(0, 0) == ChunkState::Unrequested);
}

TEST(CallbackWhenChunkReady) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(2);

    int fired = 0;
    int lodSeen = -1;
    scheduler.loadChunkAndCallback(3, -4, [&](const LoadedChunk& chunk) {
        fired++;
        lodSeen = chunk.lod;
    });
    ASSERT_EQ(fired, 0);
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(fired, 1);
    ASSERT_EQ(lodSeen, 0);

    // Already loaded: synchronous
    scheduler.loadChunkAndCallback(3, -4, [&](const LoadedChunk&) { fired++; });
    ASSERT_EQ(fired, 2);
    ASSERT_EQ(runner.runs(3, -4), 1);
}

TEST(PendingCallbackPinsChunk) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.onViewerMoved({0, 0});

    bool fired = false;
    scheduler.loadChunkAndCallback(20, 20, [&](const LoadedChunk&) { fired = true; });

    scheduler.start(2);
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_TRUE(fired);
}

TEST(FailedJobReported) {
    CountingRunner runner;
    runner.failAt(1, 1);
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(2);

    scheduler.onViewerMoved({0, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    SchedulerStats stats = scheduler.stats();
    ASSERT_EQ(stats.failed, 1u);
    ASSERT_EQ(stats.loaded, 8u);
    ASSERT_NULL(scheduler.getLoadedChunk(1, 1));
    ASSERT_TRUE(scheduler.getState(1, 1) == ChunkState::Unrequested);
    ASSERT_TRUE(scheduler.isRunning());
}

TEST(FailedJobReleasesWaitingCallbacks) {
    CountingRunner runner;
    runner.failAt(1, 1);
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(1);

    int fired = 0;
    scheduler.loadChunkAndCallback(1, 1, [&](const LoadedChunk&) { fired++; });
    ASSERT_EQ(scheduler.stats().waiting, 1u);
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(fired, 0);
    ASSERT_EQ(scheduler.stats().failed, 1u);
    ASSERT_EQ(scheduler.stats().waiting, 0u);

    // Asking again runs a fresh job; callbacks do not pile up on the failed key
    scheduler.loadChunkAndCallback(1, 1, [&](const LoadedChunk&) { fired++; });
    scheduler.loadChunkAndCallback(1, 1, [&](const LoadedChunk&) { fired++; });
    ASSERT_EQ(scheduler.stats().waiting, 1u);
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(fired, 0);
    ASSERT_EQ(runner.runs(1, 1), 2);
    ASSERT_EQ(scheduler.stats().failed, 2u);
    ASSERT_EQ(scheduler.stats().waiting, 0u);

    // No longer pinned: a viewer far away leaves nothing behind for it
    scheduler.onViewerMoved({10, 0});
    ASSERT_TRUE(scheduler.getState(1, 1) == ChunkState::Unrequested);
}

TEST(FailedUpgradeOutOfRangeIsEvicted) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(1);
    scheduler.onViewerMoved({0, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(scheduler.getLoadedChunk(1, 0)->lod, 1);

    runner.failAt(1, 0, 0);
    ASSERT_TRUE(scheduler.requestChunk(1, 0, 0.0f, 0));
    ASSERT_TRUE(scheduler.getState(1, 0) == ChunkState::InFlight);

    scheduler.onViewerMoved({10, 0});
    ASSERT_NOT_NULL(scheduler.getLoadedChunk(1, 0));
    ASSERT_EQ(scheduler.stats().evicted, 8u);

    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_NULL(scheduler.getLoadedChunk(1, 0));
    ASSERT_EQ(scheduler.stats().failed, 1u);
    ASSERT_EQ(scheduler.stats().evicted, 9u);
    ASSERT_EQ(scheduler.loadedCount(), 9u);
}

TEST(InFlightChunkEvictedWhenJobCompletes) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(1);

    ASSERT_TRUE(scheduler.requestChunk(1, 0, 4.0f, 2));
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(scheduler.getLoadedChunk(1, 0)->lod, 2);

    // Upgrade dispatched; its result is only applied by the next pump
    ASSERT_TRUE(scheduler.requestChunk(1, 0, 0.0f, 0));
    ASSERT_TRUE(scheduler.getState(1, 0) == ChunkState::InFlight);

    scheduler.onViewerMoved({10, 0});
    const LoadedChunk* kept = scheduler.getLoadedChunk(1, 0);
    ASSERT_NOT_NULL(kept);
    ASSERT_EQ(kept->lod, 2);
    ASSERT_EQ(scheduler.stats().evicted, 0u);
    ASSERT_EQ(scheduler.stats().inFlight, 1u);

    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_NULL(scheduler.getLoadedChunk(1, 0));
    ASSERT_TRUE(scheduler.getState(1, 0) == ChunkState::Unrequested);
    ASSERT_EQ(runner.runs(1, 0), 2);

    SchedulerStats stats = scheduler.stats();
    ASSERT_EQ(stats.discarded, 1u);
    ASSERT_EQ(stats.evicted, 1u);
    ASSERT_EQ(stats.loaded, 9u);
}

TEST(FinerRequestWaitsForCoarseJob) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(1);

    ASSERT_TRUE(scheduler.requestChunk(4, 4, 4.0f, 2));
    ASSERT_TRUE(scheduler.getState(4, 4) == ChunkState::InFlight);

    // One job per key: the finer request queues behind the running one
    ASSERT_TRUE(scheduler.requestChunk(4, 4, 0.0f, 0));
    ASSERT_EQ(scheduler.stats().queued, 1u);
    ASSERT_EQ(scheduler.stats().inFlight, 1u);

    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(scheduler.getLoadedChunk(4, 4)->lod, 0);
    ASSERT_EQ(runner.runs(4, 4), 2);

    SchedulerStats stats = scheduler.stats();
    ASSERT_EQ(stats.completed, 2u);
    ASSERT_EQ(stats.discarded, 0u);

    // The finer chunk is never replaced by a coarser one
    ASSERT_FALSE(scheduler.requestChunk(4, 4, 4.0f, 2));
}

TEST(BlockQueriesOverTerrain) {
    TerrainGenerator generator(11);
    BlockRegistry registry = BlockRegistry::createDefault();
    ChunkScheduler scheduler(generator, registry, smallSettings(1));
    scheduler.start(2);

    bool portalSeen = false;
    scheduler.loadChunkAndCallback(0, 0, [&](const LoadedChunk& chunk) {
        portalSeen = !chunk.portals.empty();
        ASSERT_FALSE(chunk.mesh.empty());
    });
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_TRUE(portalSeen);

    // Spawn plaza road: top solid block at y = 10
    ASSERT_EQ(scheduler.findGroundHeight(5.5f, 3.5f), TerrainGeneration::TOWN_GROUND_Y + 1);
    ASSERT_EQ(scheduler.getBlock(5, TerrainGeneration::TOWN_GROUND_Y, 3), BlockID::COBBLESTONE);

    // Unloaded space and out-of-range heights read as air
    ASSERT_EQ(scheduler.getBlock(3200, 5, 0), BlockID::AIR);
    ASSERT_EQ(scheduler.getBlock(5, -1, 3), BlockID::AIR);
    ASSERT_EQ(scheduler.getBlock(5, 40, 3), BlockID::AIR);
}

TEST(StopKeepsLoadedChunks) {
    CountingRunner runner;
    ChunkScheduler scheduler(wrap(runner), smallSettings(1));
    scheduler.start(2);
    scheduler.onViewerMoved({0, 0});
    ASSERT_TRUE(scheduler.waitUntilIdle(IDLE_TIMEOUT));

    scheduler.stop();
    ASSERT_FALSE(scheduler.isRunning());
    ASSERT_EQ(scheduler.loadedCount(), 9u);

    // Nothing is left pending after a stop
    ASSERT_EQ(scheduler.stats().queued, 0u);
    ASSERT_EQ(scheduler.stats().inFlight, 0u);
    ASSERT_TRUE(scheduler.waitUntilIdle(std::chrono::milliseconds(0)));
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
