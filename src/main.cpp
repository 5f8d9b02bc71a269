/**
 * @file main.cpp
 * @brief Entry point of the authoritative room server
 *
 * Startup order:
 * - config.ini (or the path given as the first argument) and log level
 * - Game data tables and the quest database from the data directory
 * - Town blueprint and block registry
 * - Spawn-area terrain warm-up through the chunk scheduler
 * - RoomHost ticking until SIGINT / SIGTERM
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <string>
#include <thread>
#include "block_system.h"
#include "chunk_scheduler.h"
#include "config.h"
#include "game_data.h"
#include "game_room.h"
#include "game_settings.h"
#include "logger.h"
#include "quest_database.h"
#include "room_host.h"
#include "terrain_generator.h"
#include "town_blueprint.h"

namespace {

std::atomic<bool> g_shutdownRequested{false};

void handleSignal(int) {
    g_shutdownRequested.store(true);
}

/**
 * @brief Stand-in transport: logs what would be sent to clients
 */
class LoggingSink : public MessageSink {
public:
    void send(const std::string& sessionId, const ServerMessage& message) override {
        Logger::debug() << "-> " << sessionId << ": " << messageName(message);
    }

    void broadcast(const ServerMessage& message) override {
        if (const ChatEvent* chat = std::get_if<ChatEvent>(&message)) {
            Logger::info() << "[chat] " << chat->sender << ": " << chat->content;
            return;
        }
        Logger::debug() << "-> all: " << messageName(message);
    }
};

void warmSpawnArea(const TerrainGenerator& generator, const BlockRegistry& registry,
                   const GameSettings& settings) {
    StreamingSettings streaming = settings.streaming;
    streaming.viewDistance = std::min(streaming.viewDistance, 3);
    streaming.retentionDistance = std::max(streaming.retentionDistance, streaming.viewDistance);

    ChunkScheduler scheduler(generator, registry, streaming);
    size_t portals = 0;
    scheduler.setChunkReadyCallback([&portals](const LoadedChunk& chunk) {
        portals += chunk.portals.size();
    });

    auto start = std::chrono::steady_clock::now();
    scheduler.start();
    scheduler.updateViewerPosition(glm::vec3(settings.room.spawnX, settings.room.spawnY, settings.room.spawnZ));

    if (!scheduler.waitUntilIdle(std::chrono::seconds(30))) {
        Logger::warning() << "Spawn area warm-up timed out";
    }
    scheduler.stop();

    size_t triangles = 0;
    for (int x = -streaming.viewDistance; x <= streaming.viewDistance; x++) {
        for (int z = -streaming.viewDistance; z <= streaming.viewDistance; z++) {
            if (const LoadedChunk* chunk = scheduler.getLoadedChunk(x, z)) {
                triangles += chunk->mesh.triangleCount();
            }
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    SchedulerStats stats = scheduler.stats();
    Logger::info() << "Warmed " << stats.loaded << " chunks (" << triangles << " triangles, " << portals
                   << " portal(s), " << stats.failed << " failed) in " << elapsed.count() << " ms";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "config.ini";

    try {
        Config config;
        if (!config.loadFromFile(configPath)) {
            Logger::warning() << "Failed to load " << configPath << ", using default values";
        }

        Logger::setMinLevel(Logger::parseLevel(config.getString("Logging", "level", "info"), LogLevel::INFO));
        Logger::setUseColors(config.getBool("Logging", "colors", true));

        GameSettings settings = loadGameSettings(config);
        const std::string& dataDir = settings.room.dataDirectory;

        GameData gameData;
        if (!gameData.loadFromDirectory(dataDir)) {
            Logger::error() << "Some game data tables failed to load from " << dataDir
                            << "; the room runs with what loaded";
        }

        QuestDatabase quests;
        if (!quests.loadFromFile(dataDir + "/quests.yaml")) {
            Logger::error() << "Quest database unavailable; quests cannot be started";
        }

        TownBlueprint blueprint = TownBlueprint::createDefault();
        std::string blueprintPath = config.getString("World", "blueprint", "assets/town/blueprint.yaml");
        if (!blueprint.loadFromFile(blueprintPath)) {
            Logger::warning() << "Using the built-in town blueprint";
        }

        BlockRegistry registry = BlockRegistry::createDefault();
        std::string blocksPath = config.getString("World", "blocks", "");
        if (!blocksPath.empty()) {
            registry.loadFromFile(blocksPath);
        }

        TerrainGenerator generator(settings.seed, blueprint);
        Logger::info() << "World seed " << settings.seed;
        warmSpawnArea(generator, registry, settings);

        LoggingSink sink;
        GameRoom room(settings, gameData, quests, generator, sink);
        RoomHost host(room, settings.room.tickRate);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        host.start();
        Logger::info() << "Server running, press Ctrl+C to stop";

        while (!g_shutdownRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        Logger::info() << "Shutting down...";
        host.stop();
        return 0;

    } catch (const std::exception& e) {
        Logger::error() << "Fatal error: " << e.what();
        return 1;
    }
}
