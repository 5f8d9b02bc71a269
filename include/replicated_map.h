/**
 * @file replicated_map.h
 * @brief Insertion-ordered entity map that reports add/change/remove to observers
 *
 * The room is the only writer of its replicated collections. Observers (the
 * transport, tests, client mirrors) subscribe and receive one event per
 * effective mutation; writing a value equal to the stored one emits nothing.
 *
 * Usage:
 *   ReplicatedMap<EnemyState> enemies;
 *   auto handle = enemies.subscribe([](ReplicationOp op, const std::string& id, const EnemyState* value) {
 *       // value is nullptr for Remove
 *   });
 *   enemies.set(enemy.id, enemy);
 *   enemies.unsubscribe(handle);
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using ListenerHandle = uint64_t;

enum class ReplicationOp {
    Add,
    Change,
    Remove
};

inline const char* replicationOpName(ReplicationOp op) {
    switch (op) {
        case ReplicationOp::Add: return "add";
        case ReplicationOp::Change: return "change";
        case ReplicationOp::Remove: return "remove";
    }
    return "unknown";
}

template<typename Value>
class ReplicatedMap {
public:
    using Listener = std::function<void(ReplicationOp, const std::string&, const Value*)>;

    /**
     * @brief Inserts or replaces an entry
     * @return True if an event was emitted (new key or different value)
     */
    bool set(const std::string& id, Value value) {
        auto it = m_index.find(id);
        if (it == m_index.end()) {
            m_index[id] = m_entries.size();
            m_entries.emplace_back(id, std::move(value));
            notify(ReplicationOp::Add, id, &m_entries.back().second);
            return true;
        }

        Value& stored = m_entries[it->second].second;
        if (stored == value) {
            return false;
        }
        stored = std::move(value);
        notify(ReplicationOp::Change, id, &stored);
        return true;
    }

    /**
     * @brief Mutates an entry in place; emits Change only if it actually changed
     * @return False if the key does not exist
     */
    template<typename Fn>
    bool update(const std::string& id, Fn&& mutate) {
        auto it = m_index.find(id);
        if (it == m_index.end()) {
            return false;
        }
        Value copy = m_entries[it->second].second;
        mutate(copy);
        set(id, std::move(copy));
        return true;
    }

    bool remove(const std::string& id) {
        auto it = m_index.find(id);
        if (it == m_index.end()) {
            return false;
        }

        size_t slot = it->second;
        m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(slot));
        m_index.erase(it);
        for (auto& entry : m_index) {
            if (entry.second > slot) {
                entry.second--;
            }
        }
        notify(ReplicationOp::Remove, id, nullptr);
        return true;
    }

    /**
     * @brief Removes every entry, emitting one Remove per key in order
     */
    void clear() {
        while (!m_entries.empty()) {
            remove(m_entries.front().first);
        }
    }

    const Value* get(const std::string& id) const {
        auto it = m_index.find(id);
        return it != m_index.end() ? &m_entries[it->second].second : nullptr;
    }

    bool contains(const std::string& id) const { return m_index.count(id) > 0; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /**
     * @brief Visits entries in insertion order
     */
    template<typename Fn>
    void forEach(Fn&& visit) const {
        for (const auto& entry : m_entries) {
            visit(entry.first, entry.second);
        }
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(m_entries.size());
        for (const auto& entry : m_entries) {
            out.push_back(entry.first);
        }
        return out;
    }

    ListenerHandle subscribe(Listener listener) {
        ListenerHandle handle = m_nextHandle++;
        m_listeners.emplace_back(handle, std::move(listener));
        return handle;
    }

    /**
     * @brief Removes a listener
     *
     * Safe to call from inside a listener: during a notification the entry is
     * only blanked (and skipped) and erased once the notification is over.
     */
    void unsubscribe(ListenerHandle handle) {
        if (m_notifyDepth > 0) {
            for (auto& entry : m_listeners) {
                if (entry.first == handle) {
                    entry.second = nullptr;
                    m_hasRemoved = true;
                }
            }
            return;
        }
        m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                         [handle](const auto& entry) { return entry.first == handle; }),
                          m_listeners.end());
    }

    size_t listenerCount() const {
        return static_cast<size_t>(std::count_if(m_listeners.begin(), m_listeners.end(),
                                                 [](const auto& entry) { return static_cast<bool>(entry.second); }));
    }

private:
    struct NotifyScope {
        explicit NotifyScope(ReplicatedMap& map) : m_map(map) { m_map.m_notifyDepth++; }
        ~NotifyScope() {
            if (--m_map.m_notifyDepth == 0 && m_map.m_hasRemoved) {
                m_map.compactListeners();
            }
        }
        ReplicatedMap& m_map;
    };

    // Listeners added during a notification first hear the next event
    void notify(ReplicationOp op, const std::string& id, const Value* value) {
        NotifyScope scope(*this);
        const size_t count = m_listeners.size();
        for (size_t i = 0; i < count; i++) {
            if (!m_listeners[i].second) {
                continue;
            }
            // Copy: the listener may subscribe and reallocate m_listeners
            Listener listener = m_listeners[i].second;
            listener(op, id, value);
        }
    }

    void compactListeners() {
        m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                         [](const auto& entry) { return !entry.second; }),
                          m_listeners.end());
        m_hasRemoved = false;
    }

    std::vector<std::pair<std::string, Value>> m_entries;
    std::unordered_map<std::string, size_t> m_index;
    std::vector<std::pair<ListenerHandle, Listener>> m_listeners;
    ListenerHandle m_nextHandle = 1;
    int m_notifyDepth = 0;
    bool m_hasRemoved = false;
};
