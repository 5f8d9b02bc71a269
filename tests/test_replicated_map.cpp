/**
 * @file test_replicated_map.cpp
 * @brief Change notification and ordering of replicated entity maps
 */

#include "test_utils.h"
#include "room_state.h"
#include <string>
#include <vector>

namespace {

struct Event {
    ReplicationOp op;
    std::string id;
    float health;   ///< -1 for Remove
};

EnemyState enemy(const std::string& id, float health) {
    EnemyState state;
    state.id = id;
    state.type = "Slime";
    state.name = "Slime";
    state.maxHealth = 20.0f;
    state.health = health;
    return state;
}

} // namespace

// ============================================================================
// Mutations
// ============================================================================

TEST(SetEmitsAddThenChange) {
    ReplicatedMap<EnemyState> enemies;
    std::vector<Event> events;
    enemies.subscribe([&](ReplicationOp op, const std::string& id, const EnemyState* value) {
        events.push_back({op, id, value ? value->health : -1.0f});
    });

    ASSERT_TRUE(enemies.set("enemy_1", enemy("enemy_1", 20.0f)));
    ASSERT_TRUE(enemies.set("enemy_1", enemy("enemy_1", 15.0f)));
    // Equal value: nothing to report
    ASSERT_FALSE(enemies.set("enemy_1", enemy("enemy_1", 15.0f)));

    ASSERT_EQ(events.size(), 2u);
    ASSERT_TRUE(events[0].op == ReplicationOp::Add);
    ASSERT_TRUE(events[1].op == ReplicationOp::Change);
    ASSERT_EQ(events[1].health, 15.0f);
    ASSERT_EQ(enemies.get("enemy_1")->health, 15.0f);
    ASSERT_EQ(enemies.size(), 1u);
}

TEST(UpdateMutatesInPlace) {
    ReplicatedMap<EnemyState> enemies;
    int changes = 0;
    enemies.set("enemy_1", enemy("enemy_1", 20.0f));
    enemies.subscribe([&](ReplicationOp op, const std::string&, const EnemyState*) {
        if (op == ReplicationOp::Change) changes++;
    });

    ASSERT_TRUE(enemies.update("enemy_1", [](EnemyState& e) { e.setHealth(-5.0f); }));
    ASSERT_EQ(enemies.get("enemy_1")->health, 0.0f);
    ASSERT_EQ(changes, 1);

    // No-op mutation emits nothing
    ASSERT_TRUE(enemies.update("enemy_1", [](EnemyState&) {}));
    ASSERT_EQ(changes, 1);

    ASSERT_FALSE(enemies.update("enemy_9", [](EnemyState& e) { e.health = 1.0f; }));
    ASSERT_FALSE(enemies.contains("enemy_9"));
}

TEST(RemoveKeepsInsertionOrder) {
    ReplicatedMap<EnemyState> enemies;
    enemies.set("a", enemy("a", 1.0f));
    enemies.set("b", enemy("b", 2.0f));
    enemies.set("c", enemy("c", 3.0f));
    enemies.set("d", enemy("d", 4.0f));

    ASSERT_TRUE(enemies.remove("b"));
    ASSERT_FALSE(enemies.remove("b"));

    std::vector<std::string> keys = enemies.keys();
    ASSERT_EQ(keys.size(), 3u);
    ASSERT_EQ(keys[0], "a");
    ASSERT_EQ(keys[1], "c");
    ASSERT_EQ(keys[2], "d");

    // Lookups past the removed slot still resolve to the right entry
    ASSERT_EQ(enemies.get("c")->health, 3.0f);
    ASSERT_EQ(enemies.get("d")->health, 4.0f);
    ASSERT_NULL(enemies.get("b"));

    enemies.set("b", enemy("b", 5.0f));
    ASSERT_EQ(enemies.keys().back(), "b");
}

TEST(ClearEmitsOneRemovePerKey) {
    ReplicatedMap<EnemyState> enemies;
    enemies.set("a", enemy("a", 1.0f));
    enemies.set("b", enemy("b", 2.0f));

    std::vector<std::string> removed;
    enemies.subscribe([&](ReplicationOp op, const std::string& id, const EnemyState* value) {
        ASSERT_TRUE(op == ReplicationOp::Remove);
        ASSERT_NULL(value);
        removed.push_back(id);
    });

    enemies.clear();
    ASSERT_TRUE(enemies.empty());
    ASSERT_EQ(removed.size(), 2u);
    ASSERT_EQ(removed[0], "a");
    ASSERT_EQ(removed[1], "b");
}

// ============================================================================
// Observers
// ============================================================================

TEST(UnsubscribeStopsEvents) {
    ReplicatedMap<EnemyState> enemies;
    int first = 0;
    int second = 0;
    ListenerHandle a = enemies.subscribe([&](ReplicationOp, const std::string&, const EnemyState*) { first++; });
    ListenerHandle b = enemies.subscribe([&](ReplicationOp, const std::string&, const EnemyState*) { second++; });
    ASSERT_NE(a, b);

    enemies.set("a", enemy("a", 1.0f));
    enemies.unsubscribe(a);
    enemies.set("a", enemy("a", 2.0f));
    enemies.unsubscribe(999);
    enemies.remove("a");

    ASSERT_EQ(first, 1);
    ASSERT_EQ(second, 3);
}

TEST(UnsubscribeFromInsideListener) {
    ReplicatedMap<EnemyState> enemies;
    int selfCalls = 0;
    int victimCalls = 0;
    int lateCalls = 0;
    ListenerHandle self = 0;
    ListenerHandle victim = 0;

    self = enemies.subscribe([&](ReplicationOp, const std::string&, const EnemyState*) {
        selfCalls++;
        enemies.unsubscribe(self);
        enemies.unsubscribe(victim);
        enemies.subscribe([&](ReplicationOp, const std::string&, const EnemyState*) { lateCalls++; });
    });
    victim = enemies.subscribe([&](ReplicationOp, const std::string&, const EnemyState*) { victimCalls++; });
    ASSERT_EQ(enemies.listenerCount(), 2u);

    enemies.set("a", enemy("a", 1.0f));
    ASSERT_EQ(selfCalls, 1);
    // Removed before its turn in the same event
    ASSERT_EQ(victimCalls, 0);
    // Added during the event: hears only later ones
    ASSERT_EQ(lateCalls, 0);
    ASSERT_EQ(enemies.listenerCount(), 1u);

    enemies.set("a", enemy("a", 2.0f));
    enemies.remove("a");
    ASSERT_EQ(selfCalls, 1);
    ASSERT_EQ(victimCalls, 0);
    ASSERT_EQ(lateCalls, 2);
}

TEST(ForEachVisitsInOrder) {
    ReplicatedMap<EnemyState> enemies;
    enemies.set("z", enemy("z", 1.0f));
    enemies.set("m", enemy("m", 2.0f));
    enemies.set("a", enemy("a", 3.0f));

    std::string order;
    float total = 0.0f;
    enemies.forEach([&](const std::string& id, const EnemyState& e) {
        order += id;
        total += e.health;
    });
    ASSERT_EQ(order, "zma");
    ASSERT_EQ(total, 6.0f);
}

TEST(OpNames) {
    ASSERT_EQ(std::string(replicationOpName(ReplicationOp::Add)), "add");
    ASSERT_EQ(std::string(replicationOpName(ReplicationOp::Change)), "change");
    ASSERT_EQ(std::string(replicationOpName(ReplicationOp::Remove)), "remove");
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
