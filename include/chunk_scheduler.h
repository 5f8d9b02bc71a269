/**
 * @file chunk_scheduler.h
 * @brief Distance-prioritized chunk generation across a fixed worker pool
 *
 * ARCHITECTURE:
 * - Min-priority queue of jobs ordered by chunk distance from the viewer
 * - Owner-side assignment table: worker -> current job | idle
 * - Workers run generate + mesh (pure, no shared mutable state)
 * - processCompleted() on the owner thread applies results and fires callbacks
 *
 * Per key the lifecycle is unrequested -> queued -> in-flight -> ready; a ready
 * chunk goes back through queued/in-flight when a stricter LOD is required.
 *
 * THREAD SAFETY:
 * - Every public method must be called from the owning thread
 * - Worker threads only touch the WorkerPool inbox/completion queues
 *
 * Usage:
 * @code
 *   ChunkScheduler scheduler(generator, registry, settings.streaming);
 *   scheduler.start();
 *
 *   // Each frame:
 *   scheduler.updateViewerPosition(playerPos);
 *   scheduler.processCompleted();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>
#include "chunk_mesher.h"
#include "game_settings.h"
#include "terrain_generator.h"
#include "voxel_grid.h"
#include "world.h"
#include "worker_pool.h"

class BlockRegistry;

enum class ChunkState : uint8_t {
    Unrequested,
    Queued,
    InFlight,
    Ready
};

/**
 * @brief Job message sent to a worker
 */
struct ChunkJob {
    ChunkCoord coord;
    int lod = 0;
    float distance = 0.0f;       ///< Priority (chunk distance from the viewer)
    uint64_t generation = 0;     ///< Request generation, increases with every (re)request
};

/**
 * @brief Result message: a renderable chunk plus its raw grid
 */
struct LoadedChunk {
    ChunkCoord coord;
    int lod = 0;
    uint64_t generation = 0;
    Biome biome = Biome::Plains;
    VoxelGrid blocks;
    ChunkMesh mesh;
    std::vector<PortalSpawn> portals;
};

using ChunkJobRunner = std::function<LoadedChunk(const ChunkJob&)>;
using ChunkWorkerPool = WorkerPool<ChunkJob, LoadedChunk>;
using ChunkReadyCallback = std::function<void(const LoadedChunk&)>;
using ChunkEvictedCallback = std::function<void(const ChunkCoord&)>;

struct SchedulerStats {
    size_t queued = 0;
    size_t inFlight = 0;
    size_t loaded = 0;
    size_t completed = 0;        ///< Results applied since start
    size_t discarded = 0;        ///< Stale or out-of-range results dropped
    size_t failed = 0;           ///< Jobs that raised an error
    size_t evicted = 0;
    size_t waiting = 0;          ///< Keys pinned by pending loadChunkAndCallback() calls
};

class ChunkScheduler : public BlockSource {
public:
    /**
     * @brief Scheduler running the terrain generator and mesher in its workers
     *
     * generator and registry must outlive the scheduler.
     */
    ChunkScheduler(const TerrainGenerator& generator, const BlockRegistry& registry,
                   StreamingSettings settings);

    /**
     * @brief Scheduler with a custom job runner
     */
    ChunkScheduler(ChunkJobRunner runner, StreamingSettings settings);

    ~ChunkScheduler() override;

    ChunkScheduler(const ChunkScheduler&) = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    /**
     * @brief Job runner that generates a chunk and meshes it in world space
     */
    static ChunkJobRunner makeTerrainRunner(const TerrainGenerator& generator, const BlockRegistry& registry);

    /**
     * @brief Starts the worker pool
     * @param numWorkers Worker count (0 = settings value, itself 0 = hardware_concurrency - 1)
     */
    void start(int numWorkers = 0);

    /**
     * @brief Joins the workers and drops queued/in-flight work; loaded chunks stay
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Queues a chunk at the LOD its distance requires
     * @return True if a job was queued or an existing entry was tightened
     */
    bool requestChunk(int chunkX, int chunkZ, float priorityDistance);

    /**
     * @brief Queues a chunk at an explicit LOD
     *
     * No-op when the chunk is already loaded, in flight or queued at an equal
     * or better LOD (and no farther distance).
     */
    bool requestChunk(int chunkX, int chunkZ, float priorityDistance, int lod);

    /**
     * @brief Recomputes the required set around the viewer chunk, queues what
     *        is missing or under-detailed and evicts what left retention
     *
     * No-op when the viewer chunk did not change.
     */
    void onViewerMoved(const ChunkCoord& viewerChunk);

    void updateViewerPosition(const glm::vec3& position) {
        onViewerMoved(WorldCoords::chunkOf(position.x, position.z));
    }

    /**
     * @brief Requests a chunk at distance 0 and calls back once it is ready
     *
     * Fires synchronously if the chunk is already loaded. A pending key is
     * pinned against eviction until its callbacks have run; if the job
     * fails the pin is released and the callbacks are dropped.
     */
    void loadChunkAndCallback(int chunkX, int chunkZ, ChunkReadyCallback callback);

    /**
     * @brief Applies finished jobs, fires callbacks and hands out more work
     *
     * Never blocks. Call once per frame/tick.
     */
    void processCompleted();

    /**
     * @brief Pumps until nothing is queued or in flight, or the timeout expires
     *
     * For warm-up and tests; the frame loop uses processCompleted().
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    const LoadedChunk* getLoadedChunk(int chunkX, int chunkZ) const;
    ChunkState getState(int chunkX, int chunkZ) const;

    /**
     * @brief LOD step function of chunk distance
     */
    int requiredLod(float distance) const;

    void setChunkReadyCallback(ChunkReadyCallback callback) { m_onReady = std::move(callback); }
    void setChunkEvictedCallback(ChunkEvictedCallback callback) { m_onEvicted = std::move(callback); }

    uint8_t getBlock(int x, int y, int z) const override;
    int findGroundHeight(float worldX, float worldZ) const { return ::findGroundHeight(*this, worldX, worldZ); }

    SchedulerStats stats() const;
    size_t loadedCount() const { return m_loaded.size(); }
    const StreamingSettings& settings() const { return m_settings; }

private:
    struct QueueEntry {
        ChunkCoord coord;
        int lod;
        float distance;
        uint64_t generation;

        // Inverted: priority_queue is a max-heap, nearest chunk must come first
        bool operator<(const QueueEntry& other) const {
            return distance > other.distance;
        }
    };

    struct PendingRequest {
        int lod;
        float distance;
        uint64_t generation;
    };

    bool enqueue(const ChunkCoord& coord, float distance, int lod);
    void dispatch();
    void applyCompletion(ChunkWorkerPool::Completion& completion);
    void evict(const ChunkCoord& coord);
    bool isRetained(const ChunkCoord& coord) const;
    void clearPending();

    ChunkJobRunner m_runner;
    StreamingSettings m_settings;
    std::unique_ptr<ChunkWorkerPool> m_pool;

    // Owner-side bookkeeping
    std::vector<std::optional<ChunkJob>> m_assignments;           ///< worker -> job | idle
    std::priority_queue<QueueEntry> m_queue;                      ///< May hold superseded entries
    std::unordered_map<ChunkCoord, PendingRequest> m_queued;      ///< Live queue entry per key
    std::unordered_map<ChunkCoord, ChunkJob> m_inFlight;          ///< At most one job per key
    std::unordered_map<ChunkCoord, std::unique_ptr<LoadedChunk>> m_loaded;
    std::unordered_map<ChunkCoord, std::vector<ChunkReadyCallback>> m_waiting;

    std::optional<ChunkCoord> m_viewer;
    uint64_t m_nextGeneration = 1;

    ChunkReadyCallback m_onReady;
    ChunkEvictedCallback m_onEvicted;

    size_t m_completedCount = 0;
    size_t m_discardedCount = 0;
    size_t m_failedCount = 0;
    size_t m_evictedCount = 0;
};
