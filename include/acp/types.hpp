// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Constants
// =============================================================================

/// ACP protocol version advertised by initialize
inline constexpr const char* kProtocolVersion = "2024-11-05";

/// The one session id handed out for the lifetime of the process
inline constexpr const char* kDefaultSessionId = "glm-session-001";

/// The only conversation mode the agent offers
inline constexpr const char* kChatModeId = "chat";

/// Stop reason reported when a prompt turn finishes normally
inline constexpr const char* kStopReasonCompleted = "completed";

// =============================================================================
// Conversation Types
// =============================================================================

/// Speaker of a conversation turn
enum class Role
{
    User,
    Assistant
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    Role,
    {
        {Role::User, "user"},
        {Role::Assistant, "assistant"},
    }
)

/// One message in the conversation history
struct Turn
{
    Role role = Role::User;
    std::string content;

    bool operator==(const Turn& other) const = default;
};

inline void to_json(json& j, const Turn& t)
{
    j = json{{"role", t.role}, {"content", t.content}};
}

inline void from_json(const json& j, Turn& t)
{
    j.at("role").get_to(t.role);
    j.at("content").get_to(t.content);
}

// =============================================================================
// initialize
// =============================================================================

/// Which content kinds a prompt may embed
struct PromptCapabilities
{
    bool audio = false;
    bool embedded_content = false;
    bool image = false;
};

inline void to_json(json& j, const PromptCapabilities& c)
{
    j = json{{"audio", c.audio}, {"embeddedContent", c.embedded_content}, {"image", c.image}};
}

struct AgentCapabilities
{
    bool load_session = false;
    PromptCapabilities prompt_capabilities;
};

inline void to_json(json& j, const AgentCapabilities& c)
{
    j = json{{"loadSession", c.load_session}, {"promptCapabilities", c.prompt_capabilities}};
}

/// Result of the initialize handshake
struct InitializeResult
{
    std::string protocol_version = kProtocolVersion;
    AgentCapabilities agent_capabilities;
    std::vector<json> auth_methods;
};

inline void to_json(json& j, const InitializeResult& r)
{
    j = json{
        {"protocolVersion", r.protocol_version},
        {"agentCapabilities", r.agent_capabilities},
        {"authMethods", json::array()}
    };
    for (const auto& method : r.auth_methods)
        j["authMethods"].push_back(method);
}

// =============================================================================
// session/new
// =============================================================================

struct NewSessionParams
{
    std::optional<std::string> project_path;
};

inline void from_json(const json& j, NewSessionParams& p)
{
    if (j.contains("projectPath") && !j.at("projectPath").is_null())
        p.project_path = j.at("projectPath").get<std::string>();
}

/// A conversation mode offered to the client
struct SessionMode
{
    std::string id;
    std::string name;
    std::string description;
};

inline void to_json(json& j, const SessionMode& m)
{
    j = json{{"id", m.id}, {"name", m.name}, {"description", m.description}};
}

struct SessionModeState
{
    std::string current_mode_id;
    std::vector<SessionMode> available_modes;
};

inline void to_json(json& j, const SessionModeState& s)
{
    j = json{{"currentModeId", s.current_mode_id}, {"availableModes", s.available_modes}};
}

struct NewSessionResult
{
    std::string session_id;
    SessionModeState modes;
};

inline void to_json(json& j, const NewSessionResult& r)
{
    j = json{{"sessionId", r.session_id}, {"modes", r.modes}};
}

// =============================================================================
// session/prompt
// =============================================================================

/// A block of prompt content; only text blocks carry meaning here
struct ContentBlock
{
    std::string type;
    std::optional<std::string> text;
};

inline void to_json(json& j, const ContentBlock& b)
{
    j = json{{"type", b.type}};
    if (b.text)
        j["text"] = *b.text;
}

inline void from_json(const json& j, ContentBlock& b)
{
    b.type = j.value("type", std::string{});
    if (j.contains("text") && !j.at("text").is_null())
        b.text = j.at("text").get<std::string>();
}

struct PromptParams
{
    std::optional<std::string> session_id;
    std::vector<ContentBlock> content;
};

inline void from_json(const json& j, PromptParams& p)
{
    if (j.contains("sessionId") && j.at("sessionId").is_string())
        p.session_id = j.at("sessionId").get<std::string>();
    if (j.contains("content") && !j.at("content").is_null())
        p.content = j.at("content").get<std::vector<ContentBlock>>();
}

/// Concatenate the text of every text block, skipping all other block types
inline std::string collect_prompt_text(const std::vector<ContentBlock>& blocks)
{
    std::string text;
    for (const auto& block : blocks)
        if (block.type == "text" && block.text)
            text += *block.text;
    return text;
}

struct PromptResult
{
    std::string stop_reason = kStopReasonCompleted;
};

inline void to_json(json& j, const PromptResult& r)
{
    j = json{{"stopReason", r.stop_reason}};
}

// =============================================================================
// session/set_mode
// =============================================================================

struct SetModeParams
{
    std::string mode_id = kChatModeId;
};

inline void from_json(const json& j, SetModeParams& p)
{
    if (j.contains("modeId") && j.at("modeId").is_string())
        p.mode_id = j.at("modeId").get<std::string>();
}

// =============================================================================
// fs/read_text_file and fs/write_text_file
// =============================================================================

struct ReadTextFileParams
{
    std::string path;
    std::optional<int64_t> line; // 1-based
    std::optional<int64_t> limit;
};

/// Read a line number or count, saturating unsigned values above INT64_MAX
inline int64_t line_index_from_json(const json& j)
{
    if (j.is_number_unsigned())
    {
        auto value = j.get<uint64_t>();
        constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        return value > max ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(value);
    }
    return j.get<int64_t>();
}

inline void from_json(const json& j, ReadTextFileParams& p)
{
    p.path = j.value("path", std::string{});
    if (j.contains("line") && !j.at("line").is_null())
        p.line = line_index_from_json(j.at("line"));
    if (j.contains("limit") && !j.at("limit").is_null())
        p.limit = line_index_from_json(j.at("limit"));
}

struct ReadTextFileResult
{
    std::string content;
};

inline void to_json(json& j, const ReadTextFileResult& r)
{
    j = json{{"content", r.content}};
}

struct WriteTextFileParams
{
    std::string path;
    std::string content;
};

inline void from_json(const json& j, WriteTextFileParams& p)
{
    p.path = j.value("path", std::string{});
    p.content = j.value("content", std::string{});
}

// =============================================================================
// session/update notification
// =============================================================================

/// Payload of an agent_message_chunk session update
struct AgentMessageChunk
{
    std::string session_id;
    std::string text;
};

inline void to_json(json& j, const AgentMessageChunk& c)
{
    j = json{
        {"sessionId", c.session_id},
        {"sessionUpdate", "agent_message_chunk"},
        {"content", {{"type", "text"}, {"text", c.text}}}
    };
}

} // namespace acp
