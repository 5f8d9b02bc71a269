/**
 * @file quest_database.cpp
 * @brief Quest table loading and progress tracking
 */

#include "quest_database.h"
#include "logger.h"
#include "room_state.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>

bool QuestDatabase::loadFromFile(const std::string& filepath) {
    m_quests.clear();
    try {
        YAML::Node root = YAML::LoadFile(filepath);
        int count = parse(root, filepath);
        Logger::info() << "QuestDatabase: loaded " << count << " quests from " << filepath;
        return count > 0;
    } catch (const std::exception& e) {
        Logger::error() << "QuestDatabase: failed to load " << filepath << ": " << e.what()
                        << " (quests disabled)";
        m_quests.clear();
        return false;
    }
}

bool QuestDatabase::loadFromString(const std::string& yamlText) {
    m_quests.clear();
    try {
        return parse(YAML::Load(yamlText), "<string>") > 0;
    } catch (const std::exception& e) {
        Logger::error() << "QuestDatabase: failed to parse quest YAML: " << e.what();
        m_quests.clear();
        return false;
    }
}

int QuestDatabase::parse(const YAML::Node& root, const std::string& source) {
    if (!root.IsMap()) {
        Logger::error() << "QuestDatabase: expected a map of quest id -> quest in " << source;
        return 0;
    }

    for (const auto& entry : root) {
        std::string id = entry.first.as<std::string>();
        const YAML::Node& node = entry.second;
        try {
            QuestDefinition quest;
            quest.id = id;
            quest.title = node["title"].as<std::string>();
            quest.type = node["type"] ? node["type"].as<std::string>() : "side";

            for (const auto& obj : node["objectives"]) {
                QuestObjectiveDefinition objective;
                objective.description = obj["description"].as<std::string>();
                objective.type = obj["type"].as<std::string>();
                objective.target = obj["target"] ? obj["target"].as<std::string>() : "";
                objective.amount = obj["amount"] ? obj["amount"].as<int>() : 1;
                quest.objectives.push_back(objective);
            }

            m_quests[id] = quest;
        } catch (const std::exception& e) {
            Logger::error() << "QuestDatabase: skipping quest '" << id << "' in " << source << ": " << e.what();
        }
    }
    return static_cast<int>(m_quests.size());
}

const QuestDefinition* QuestDatabase::find(const std::string& questId) const {
    auto it = m_quests.find(questId);
    return it != m_quests.end() ? &it->second : nullptr;
}

bool QuestTracker::startQuest(PlayerState& player, const std::string& questId) const {
    if (player.activeQuests.count(questId)) {
        return false;
    }
    if (std::find(player.completedQuests.begin(), player.completedQuests.end(), questId) != player.completedQuests.end()) {
        return false;
    }

    const QuestDefinition* quest = m_database.find(questId);
    if (!quest) {
        return false;
    }

    if (quest->type == "main_story") {
        player.mainStoryState = questId + "_IN_PROGRESS";
    }

    ActiveQuest active;
    active.id = questId;
    active.title = quest->title;
    for (const auto& def : quest->objectives) {
        QuestObjectiveState objective;
        objective.description = def.description;
        objective.amount = def.amount;
        active.objectives.push_back(objective);
    }
    player.activeQuests[questId] = active;

    Logger::info() << player.username << " started quest " << questId << " (" << quest->title << ")";
    return true;
}

bool QuestTracker::notify(PlayerState& player, const QuestEvent& event) const {
    bool anyProgress = false;

    for (auto& entry : player.activeQuests) {
        ActiveQuest& active = entry.second;
        if (active.readyForTurnIn) {
            continue;
        }

        const QuestDefinition* quest = m_database.find(active.id);
        if (!quest) {
            continue;
        }

        bool progressed = false;
        size_t count = std::min(quest->objectives.size(), active.objectives.size());
        for (size_t i = 0; i < count; i++) {
            const QuestObjectiveDefinition& def = quest->objectives[i];
            QuestObjectiveState& objective = active.objectives[i];

            if (event.type == QuestEvent::Type::EnemyKilled && def.type == "kill" && def.target == event.target &&
                objective.progress < objective.amount) {
                objective.progress = std::min(objective.amount, objective.progress + event.amount);
                progressed = true;
            }
        }

        if (progressed) {
            anyProgress = true;
            checkCompletion(player, active.id);
        }
    }
    return anyProgress;
}

void QuestTracker::checkCompletion(PlayerState& player, const std::string& questId) const {
    auto it = player.activeQuests.find(questId);
    if (it == player.activeQuests.end() || it->second.readyForTurnIn) {
        return;
    }

    const auto& objectives = it->second.objectives;
    bool allMet = std::all_of(objectives.begin(), objectives.end(),
                              [](const QuestObjectiveState& o) { return o.progress >= o.amount; });
    if (allMet) {
        it->second.readyForTurnIn = true;
        Logger::info() << player.username << " can turn in quest " << questId;
    }
}
