/**
 * @file protocol.h
 * @brief Typed room messages: client intents in, fire-and-forget events out
 *
 * Replicated-state diffs travel separately through the ReplicatedMap
 * observers; these are the one-shot messages around them.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include "body_physics.h"
#include "room_state.h"

// ============================================================
// Client -> server
// ============================================================

struct InputMessage {
    KeyState keys;
};

struct MeleeAttackMessage {};

struct UseAbilityMessage {
    int slotIndex = 0;
    float chargeTime = 0.0f;
};

struct UseItemMessage {
    int inventoryIndex = 0;
};

struct SocketStoneMessage {
    std::string essenceId;
    int essenceSocketIndex = 0;
    int stoneInventoryIndex = 0;
};

struct StartQuestMessage {
    std::string questId;
};

struct InteractNpcMessage {
    std::string npcId;
};

struct EnterPortalMessage {
    std::string portalId;
};

struct ExitDungeonMessage {};

struct CollectEssenceMessage {
    std::string id;
};

struct CollectStoneMessage {
    std::string id;
};

struct ChatMessage {
    std::string content;
};

using ClientMessage = std::variant<InputMessage, MeleeAttackMessage, UseAbilityMessage, UseItemMessage,
                                   SocketStoneMessage, StartQuestMessage, InteractNpcMessage,
                                   EnterPortalMessage, ExitDungeonMessage, CollectEssenceMessage,
                                   CollectStoneMessage, ChatMessage>;

// ============================================================
// Server -> client
// ============================================================

struct LoadDungeonEvent {
    std::vector<uint8_t> blocks;     ///< VoxelGrid buffer, (y * depth + z) * width + x
    int width = 0;
    int height = 0;
    int depth = 0;
    glm::vec3 spawnPoint{0.0f};
    std::string theme;
    std::string rank;
};

struct UnloadDungeonEvent {};

struct PlayVfxEvent {
    std::string type;
    glm::vec3 position{0.0f};
};

struct NpcDialogueEvent {
    std::string name;
    std::vector<std::string> dialogue;
    std::string questId;
};

struct QuestUpdateEvent {
    std::vector<ActiveQuest> quests;
};

struct ChatEvent {
    std::string sender;
    std::string content;
};

using ServerMessage = std::variant<LoadDungeonEvent, UnloadDungeonEvent, PlayVfxEvent, NpcDialogueEvent,
                                   QuestUpdateEvent, ChatEvent>;

inline const char* messageName(const ServerMessage& message) {
    static const char* const names[] = {
        "load_dungeon", "unload_dungeon", "play_vfx", "npc_dialogue", "quest_update", "chat"
    };
    return names[message.index()];
}

inline const char* messageName(const ClientMessage& message) {
    static const char* const names[] = {
        "input", "melee_attack", "use_ability", "use_item", "socket_stone", "start_quest",
        "interact_npc", "enter_portal", "exit_dungeon", "collect_essence", "collect_stone", "chat"
    };
    return names[message.index()];
}

/**
 * @brief Outbound transport of a room
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    virtual void send(const std::string& sessionId, const ServerMessage& message) = 0;
    virtual void broadcast(const ServerMessage& message) = 0;
};
