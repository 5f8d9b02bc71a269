/**
 * @file quest_database.h
 * @brief Quest definitions loaded once at boot, and per-player quest progress
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

struct PlayerState;

namespace YAML { class Node; }

struct QuestObjectiveDefinition {
    std::string description;
    std::string type;        ///< "kill" is the only type that records progress
    std::string target;      ///< Enemy type for kill objectives
    int amount = 1;
};

struct QuestDefinition {
    std::string id;
    std::string title;
    std::string type;        ///< "main_story" drives PlayerState::mainStoryState
    std::vector<QuestObjectiveDefinition> objectives;
};

/**
 * @brief Read-only quest table
 *
 * Example quests.yaml:
 * @code
 * MSQ_01:
 *   title: A Slimy Situation
 *   type: main_story
 *   objectives:
 *     - {description: Defeat 3 Slimes, type: kill, target: Slime, amount: 3}
 * @endcode
 *
 * If loading fails the table stays empty and every lookup misses, which makes
 * quest start a no-op for all IDs.
 */
class QuestDatabase {
public:
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& yamlText);

    const QuestDefinition* find(const std::string& questId) const;
    size_t size() const { return m_quests.size(); }
    bool empty() const { return m_quests.empty(); }

private:
    int parse(const YAML::Node& root, const std::string& source);

    std::unordered_map<std::string, QuestDefinition> m_quests;
};

/**
 * @brief Gameplay event a quest can react to
 */
struct QuestEvent {
    enum class Type {
        EnemyKilled
    };

    Type type = Type::EnemyKilled;
    std::string target;      ///< Enemy type for EnemyKilled
    int amount = 1;
};

/**
 * @brief Applies quest rules to a player's replicated quest state
 */
class QuestTracker {
public:
    explicit QuestTracker(const QuestDatabase& database) : m_database(database) {}

    /**
     * @brief Starts a quest; ignored if unknown, active or already completed
     * @return True if the quest was added
     */
    bool startQuest(PlayerState& player, const std::string& questId) const;

    /**
     * @brief Records an event against every active quest that is not yet ready
     * @return True if any objective progressed
     */
    bool notify(PlayerState& player, const QuestEvent& event) const;

private:
    void checkCompletion(PlayerState& player, const std::string& questId) const;

    const QuestDatabase& m_database;
};
