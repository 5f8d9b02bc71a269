/**
 * @file room_host.h
 * @brief Fixed-rate driver thread for a GameRoom
 *
 * Transport threads post joins, leaves and messages; they are queued and
 * applied at the start of the next tick on the room thread, so all mutation
 * of one room stays serialized. Several hosts may run side by side.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "protocol.h"

class GameRoom;

class RoomHost {
public:
    /**
     * @param tickRate Ticks per second (clamped to at least 1)
     */
    RoomHost(GameRoom& room, int tickRate);
    ~RoomHost();

    RoomHost(const RoomHost&) = delete;
    RoomHost& operator=(const RoomHost&) = delete;

    /**
     * @brief Starts the tick thread
     */
    void start();

    /**
     * @brief Stops and joins the tick thread; commands still queued are dropped
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    void postJoin(const std::string& sessionId, const std::string& username);
    void postLeave(const std::string& sessionId);
    void post(const std::string& sessionId, ClientMessage message);

    /**
     * @brief Applies queued commands then advances the room by one tick
     *
     * Called by the tick thread; tests call it directly without start().
     */
    void step();

    uint64_t tickCount() const { return m_tickCount.load(); }
    size_t pendingCount() const;
    float tickInterval() const { return m_tickInterval; }

private:
    using Command = std::function<void(GameRoom&)>;

    void enqueue(Command command);
    void tickThread();

    GameRoom& m_room;
    float m_tickInterval;

    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_tickCount{0};
    std::thread m_thread;

    mutable std::mutex m_queueMutex;
    std::vector<Command> m_commands;
};
