/**
 * @file room_host.cpp
 * @brief Command queue and fixed-rate tick loop of a room
 */

#include "room_host.h"
#include "game_room.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <exception>

RoomHost::RoomHost(GameRoom& room, int tickRate)
    : m_room(room), m_tickInterval(1.0f / static_cast<float>(std::max(1, tickRate))) {
}

RoomHost::~RoomHost() {
    if (m_running.load()) {
        stop();
    }
}

void RoomHost::start() {
    if (m_running.load()) {
        Logger::warning() << "RoomHost already running";
        return;
    }

    m_running.store(true);
    m_thread = std::thread(&RoomHost::tickThread, this);
    Logger::info() << "Room ticking at " << static_cast<int>(1.0f / m_tickInterval + 0.5f) << " Hz";
}

void RoomHost::stop() {
    if (!m_running.load()) {
        return;
    }

    m_running.store(false);
    if (m_thread.joinable()) {
        m_thread.join();
    }

    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_commands.clear();
    Logger::info() << "Room stopped after " << m_tickCount.load() << " ticks";
}

void RoomHost::postJoin(const std::string& sessionId, const std::string& username) {
    enqueue([sessionId, username](GameRoom& room) { room.join(sessionId, username); });
}

void RoomHost::postLeave(const std::string& sessionId) {
    enqueue([sessionId](GameRoom& room) { room.leave(sessionId); });
}

void RoomHost::post(const std::string& sessionId, ClientMessage message) {
    enqueue([sessionId, message = std::move(message)](GameRoom& room) {
        room.handleMessage(sessionId, message);
    });
}

void RoomHost::enqueue(Command command) {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_commands.push_back(std::move(command));
}

size_t RoomHost::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_commands.size();
}

void RoomHost::step() {
    // Swap under lock to keep transport threads unblocked while the room works
    std::vector<Command> commands;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        commands.swap(m_commands);
    }

    for (Command& command : commands) {
        command(m_room);
    }

    m_room.tick(m_tickInterval);
    m_tickCount.fetch_add(1);
}

void RoomHost::tickThread() {
    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<float>(m_tickInterval));
    auto nextTick = Clock::now();

    while (m_running.load()) {
        try {
            step();
        } catch (const std::exception& e) {
            Logger::error() << "Room tick " << m_tickCount.load() << " failed: " << e.what();
        }

        nextTick += interval;
        auto now = Clock::now();
        if (nextTick < now) {
            // Fell behind: run the next tick immediately instead of bursting to catch up
            nextTick = now;
        }
        std::this_thread::sleep_until(nextTick);
    }
}
