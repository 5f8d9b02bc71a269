/**
 * @file chunk_scheduler.cpp
 * @brief Owner-side chunk job bookkeeping, dispatch and result application
 */

#include "chunk_scheduler.h"
#include "block_system.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

using namespace TerrainGeneration;

ChunkScheduler::ChunkScheduler(const TerrainGenerator& generator, const BlockRegistry& registry,
                               StreamingSettings settings)
    : ChunkScheduler(makeTerrainRunner(generator, registry), settings) {
}

ChunkScheduler::ChunkScheduler(ChunkJobRunner runner, StreamingSettings settings)
    : m_runner(std::move(runner)), m_settings(settings) {
}

ChunkScheduler::~ChunkScheduler() {
    stop();
}

ChunkJobRunner ChunkScheduler::makeTerrainRunner(const TerrainGenerator& generator, const BlockRegistry& registry) {
    return [&generator, &registry](const ChunkJob& job) {
        GeneratedChunk generated = generator.generate(job.coord.x, job.coord.z, job.lod);

        LoadedChunk chunk;
        chunk.coord = job.coord;
        chunk.lod = job.lod;
        chunk.generation = job.generation;
        chunk.biome = generated.biome;
        chunk.portals = std::move(generated.portals);

        ChunkMesher mesher(registry);
        chunk.mesh = mesher.mesh(generated.blocks,
                                 glm::ivec3(job.coord.x * CHUNK_SIZE, 0, job.coord.z * CHUNK_SIZE));
        chunk.blocks = std::move(generated.blocks);
        return chunk;
    };
}

void ChunkScheduler::start(int numWorkers) {
    if (m_pool && m_pool->isRunning()) {
        Logger::warning() << "ChunkScheduler already running";
        return;
    }

    int workers = resolveWorkerCount(numWorkers > 0 ? numWorkers : m_settings.workerThreads);
    Logger::info() << "Starting ChunkScheduler with " << workers << " worker threads";

    m_pool = std::make_unique<ChunkWorkerPool>(m_runner);
    m_assignments.assign(workers, std::nullopt);
    m_pool->start(workers);

    dispatch();
}

void ChunkScheduler::stop() {
    if (!m_pool) {
        return;
    }

    Logger::info() << "Stopping ChunkScheduler...";
    m_pool->stop();

    // Results that finished during shutdown are dropped with the rest of the pending work
    size_t dropped = m_pool->takeCompleted().size();
    m_pool.reset();
    m_assignments.clear();
    clearPending();

    Logger::info() << "ChunkScheduler stopped (" << dropped << " late results dropped, "
                   << m_loaded.size() << " chunks kept)";
}

bool ChunkScheduler::isRunning() const {
    return m_pool && m_pool->isRunning();
}

void ChunkScheduler::clearPending() {
    std::priority_queue<QueueEntry> empty;
    m_queue.swap(empty);
    m_queued.clear();
    m_inFlight.clear();
}

int ChunkScheduler::requiredLod(float distance) const {
    if (distance >= static_cast<float>(m_settings.lod2Distance)) return 2;
    if (distance >= static_cast<float>(m_settings.lod1Distance)) return 1;
    return 0;
}

bool ChunkScheduler::requestChunk(int chunkX, int chunkZ, float priorityDistance) {
    return requestChunk(chunkX, chunkZ, priorityDistance, requiredLod(priorityDistance));
}

bool ChunkScheduler::requestChunk(int chunkX, int chunkZ, float priorityDistance, int lod) {
    bool queued = enqueue({chunkX, chunkZ}, priorityDistance, lod);
    if (queued) {
        dispatch();
    }
    return queued;
}

bool ChunkScheduler::enqueue(const ChunkCoord& coord, float distance, int lod) {
    auto loadedIt = m_loaded.find(coord);
    if (loadedIt != m_loaded.end() && loadedIt->second->lod <= lod) {
        return false;
    }

    auto flightIt = m_inFlight.find(coord);
    if (flightIt != m_inFlight.end() && flightIt->second.lod <= lod) {
        return false;
    }

    auto queuedIt = m_queued.find(coord);
    if (queuedIt != m_queued.end()) {
        PendingRequest& pending = queuedIt->second;
        if (pending.lod <= lod && pending.distance <= distance) {
            return false;
        }

        // Tighten the existing request; the older heap entry becomes stale
        pending.lod = std::min(pending.lod, lod);
        pending.distance = std::min(pending.distance, distance);
        pending.generation = m_nextGeneration++;
        m_queue.push({coord, pending.lod, pending.distance, pending.generation});
        return true;
    }

    PendingRequest pending{lod, distance, m_nextGeneration++};
    m_queued[coord] = pending;
    m_queue.push({coord, pending.lod, pending.distance, pending.generation});
    return true;
}

void ChunkScheduler::dispatch() {
    if (!isRunning()) {
        return;
    }

    std::vector<QueueEntry> heldBack;

    for (size_t worker = 0; worker < m_assignments.size() && !m_queue.empty(); ) {
        if (m_assignments[worker].has_value()) {
            worker++;
            continue;
        }

        QueueEntry entry = m_queue.top();
        m_queue.pop();

        auto queuedIt = m_queued.find(entry.coord);
        if (queuedIt == m_queued.end() || queuedIt->second.generation != entry.generation) {
            continue;  // superseded or cancelled
        }

        if (m_inFlight.count(entry.coord)) {
            // One job per key: wait for the running one to finish
            heldBack.push_back(entry);
            continue;
        }

        ChunkJob job{entry.coord, entry.lod, entry.distance, entry.generation};
        if (!m_pool->assign(static_cast<int>(worker), job)) {
            Logger::warning() << "ChunkScheduler: worker " << worker << " refused a job";
            heldBack.push_back(entry);
            break;
        }

        m_queued.erase(queuedIt);
        m_inFlight[job.coord] = job;
        m_assignments[worker] = job;
        worker++;
    }

    for (const QueueEntry& entry : heldBack) {
        m_queue.push(entry);
    }
}

void ChunkScheduler::processCompleted() {
    if (!m_pool) {
        return;
    }

    std::vector<ChunkWorkerPool::Completion> completions = m_pool->takeCompleted();
    for (ChunkWorkerPool::Completion& completion : completions) {
        applyCompletion(completion);
    }

    dispatch();
}

void ChunkScheduler::applyCompletion(ChunkWorkerPool::Completion& completion) {
    const ChunkJob& job = completion.job;

    if (completion.workerId >= 0 && completion.workerId < static_cast<int>(m_assignments.size())) {
        m_assignments[completion.workerId].reset();
    }
    m_inFlight.erase(job.coord);

    if (!completion.result.has_value()) {
        m_failedCount++;
        Logger::error() << "Chunk job (" << job.coord.x << ", " << job.coord.z << ") lod " << job.lod
                        << " failed on worker " << completion.workerId << ": " << completion.error;

        // A failed key is no longer pinned; its callbacks are dropped
        auto waitingIt = m_waiting.find(job.coord);
        if (waitingIt != m_waiting.end()) {
            Logger::warning() << "Dropped " << waitingIt->second.size() << " callback(s) waiting on chunk ("
                              << job.coord.x << ", " << job.coord.z << ")";
            m_waiting.erase(waitingIt);
        }
        if (!isRetained(job.coord)) {
            evict(job.coord);
        }
        return;
    }

    // Deferred eviction: the key left retention while this job was running
    if (!isRetained(job.coord)) {
        m_discardedCount++;
        if (m_loaded.count(job.coord)) {
            evict(job.coord);
        }
        Logger::debug() << "Discarded out-of-range chunk (" << job.coord.x << ", " << job.coord.z << ")";
        return;
    }

    auto loadedIt = m_loaded.find(job.coord);
    if (loadedIt != m_loaded.end()) {
        const LoadedChunk& live = *loadedIt->second;
        if (live.lod <= job.lod) {
            m_discardedCount++;
            return;
        }
    }

    auto chunk = std::make_unique<LoadedChunk>(std::move(*completion.result));
    chunk->generation = job.generation;
    const LoadedChunk& applied = *chunk;
    m_loaded[job.coord] = std::move(chunk);
    m_completedCount++;

    if (m_onReady) {
        m_onReady(applied);
    }

    auto waitingIt = m_waiting.find(job.coord);
    if (waitingIt != m_waiting.end()) {
        std::vector<ChunkReadyCallback> callbacks = std::move(waitingIt->second);
        m_waiting.erase(waitingIt);
        for (auto& callback : callbacks) {
            callback(applied);
        }
    }
}

void ChunkScheduler::onViewerMoved(const ChunkCoord& viewerChunk) {
    if (m_viewer.has_value() && *m_viewer == viewerChunk) {
        return;
    }
    m_viewer = viewerChunk;

    const int radius = m_settings.viewDistance;
    for (int dx = -radius; dx <= radius; dx++) {
        for (int dz = -radius; dz <= radius; dz++) {
            float distance = std::hypot(static_cast<float>(dx), static_cast<float>(dz));
            enqueue({viewerChunk.x + dx, viewerChunk.z + dz}, distance, requiredLod(distance));
        }
    }

    std::vector<ChunkCoord> toEvict;
    for (const auto& entry : m_loaded) {
        const ChunkCoord& coord = entry.first;
        // Chunks with a job in flight are dropped when that job completes
        if (!isRetained(coord) && !m_inFlight.count(coord)) {
            toEvict.push_back(coord);
        }
    }
    for (const ChunkCoord& coord : toEvict) {
        evict(coord);
    }

    for (auto it = m_queued.begin(); it != m_queued.end(); ) {
        if (!isRetained(it->first)) {
            it = m_queued.erase(it);
        } else {
            ++it;
        }
    }

    Logger::debug() << "Viewer entered chunk (" << viewerChunk.x << ", " << viewerChunk.z << "): "
                    << m_queued.size() << " queued, " << m_inFlight.size() << " in flight, "
                    << toEvict.size() << " evicted";

    dispatch();
}

bool ChunkScheduler::isRetained(const ChunkCoord& coord) const {
    if (!m_viewer.has_value() || m_waiting.count(coord)) {
        return true;
    }
    int dx = std::abs(coord.x - m_viewer->x);
    int dz = std::abs(coord.z - m_viewer->z);
    return std::max(dx, dz) <= m_settings.retentionDistance;
}

void ChunkScheduler::evict(const ChunkCoord& coord) {
    if (m_loaded.erase(coord) == 0) {
        return;
    }
    m_evictedCount++;
    if (m_onEvicted) {
        m_onEvicted(coord);
    }
}

void ChunkScheduler::loadChunkAndCallback(int chunkX, int chunkZ, ChunkReadyCallback callback) {
    ChunkCoord coord{chunkX, chunkZ};

    auto loadedIt = m_loaded.find(coord);
    if (loadedIt != m_loaded.end()) {
        callback(*loadedIt->second);
        return;
    }

    m_waiting[coord].push_back(std::move(callback));
    // A job already in flight will satisfy the callback at any LOD
    if (!m_inFlight.count(coord)) {
        requestChunk(chunkX, chunkZ, 0.0f, 0);
    }
}

bool ChunkScheduler::waitUntilIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        processCompleted();
        if (m_queued.empty() && m_inFlight.empty()) {
            return true;
        }
        if (!isRunning()) {
            return false;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        m_pool->waitForCompletion(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
}

const LoadedChunk* ChunkScheduler::getLoadedChunk(int chunkX, int chunkZ) const {
    auto it = m_loaded.find({chunkX, chunkZ});
    return it != m_loaded.end() ? it->second.get() : nullptr;
}

ChunkState ChunkScheduler::getState(int chunkX, int chunkZ) const {
    ChunkCoord coord{chunkX, chunkZ};
    if (m_inFlight.count(coord)) return ChunkState::InFlight;
    if (m_queued.count(coord)) return ChunkState::Queued;
    if (m_loaded.count(coord)) return ChunkState::Ready;
    return ChunkState::Unrequested;
}

uint8_t ChunkScheduler::getBlock(int x, int y, int z) const {
    if (y < 0 || y >= CHUNK_SIZE) {
        return BlockID::AIR;
    }
    const LoadedChunk* chunk = getLoadedChunk(WorldCoords::toChunk(x), WorldCoords::toChunk(z));
    if (!chunk) {
        return BlockID::AIR;
    }
    return chunk->blocks.get(WorldCoords::toLocal(x), y, WorldCoords::toLocal(z));
}

SchedulerStats ChunkScheduler::stats() const {
    SchedulerStats s;
    s.queued = m_queued.size();
    s.inFlight = m_inFlight.size();
    s.loaded = m_loaded.size();
    s.completed = m_completedCount;
    s.discarded = m_discardedCount;
    s.failed = m_failedCount;
    s.evicted = m_evictedCount;
    s.waiting = m_waiting.size();
    return s;
}
