#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mnemo::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;
using Duration = std::chrono::milliseconds;

// Persisted timestamps carry millisecond precision, so every in-memory
// timestamp is truncated to match.
inline TimePoint now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

inline int64_t to_millis(TimePoint tp) {
    return tp.time_since_epoch().count();
}

inline TimePoint from_millis(int64_t ms) {
    return TimePoint{std::chrono::milliseconds{ms}};
}

using MessageId = uint64_t;

// Message roles
enum class Role {
    System,
    User,
    Assistant
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

inline std::optional<Role> role_from_string(std::string_view str) {
    if (str == "system") return Role::System;
    if (str == "user") return Role::User;
    if (str == "assistant") return Role::Assistant;
    return std::nullopt;
}

// One conversational turn
struct Message {
    MessageId id = 0;
    Role role = Role::User;
    std::string content;
    TimePoint timestamp;
    int token_estimate = 0;
    double importance = 0.0;
    bool compressed = false;

    Json to_json() const {
        return Json{
            {"type", "message"},
            {"id", id},
            {"role", std::string(role_to_string(role))},
            {"content", content},
            {"timestamp", to_millis(timestamp)},
            {"tokens", token_estimate},
            {"importance", importance},
            {"compressed", compressed}
        };
    }

    // Throws on missing or mistyped fields and on an unknown role
    static Message from_json(const Json& j) {
        Message m;
        m.id = j.at("id").get<MessageId>();
        auto role = role_from_string(j.at("role").get<std::string>());
        if (!role) {
            throw std::invalid_argument("unknown role: " + j.at("role").get<std::string>());
        }
        m.role = *role;
        m.content = j.at("content").get<std::string>();
        m.timestamp = from_millis(j.at("timestamp").get<int64_t>());
        m.token_estimate = j.at("tokens").get<int>();
        m.importance = j.at("importance").get<double>();
        m.compressed = j.value("compressed", false);
        return m;
    }

    bool operator==(const Message&) const = default;
};

// Compressed stand-in for the messages first_id..last_id (inclusive)
struct Summary {
    std::string text;
    MessageId first_id = 0;
    MessageId last_id = 0;
    int token_estimate = 0;
    TimePoint created_at;

    Json to_json() const {
        return Json{
            {"type", "summary"},
            {"text", text},
            {"first_id", first_id},
            {"last_id", last_id},
            {"tokens", token_estimate},
            {"created_at", to_millis(created_at)}
        };
    }

    static Summary from_json(const Json& j) {
        Summary s;
        s.text = j.at("text").get<std::string>();
        s.first_id = j.at("first_id").get<MessageId>();
        s.last_id = j.at("last_id").get<MessageId>();
        s.token_estimate = j.at("tokens").get<int>();
        s.created_at = from_millis(j.value("created_at", int64_t{0}));
        if (s.first_id == 0 || s.last_id < s.first_id) {
            throw std::invalid_argument("invalid summary span");
        }
        return s;
    }

    bool operator==(const Summary&) const = default;
};

// A session timeline entry
using Entity = std::variant<Message, Summary>;

inline bool is_message(const Entity& e) { return std::holds_alternative<Message>(e); }
inline bool is_summary(const Entity& e) { return std::holds_alternative<Summary>(e); }

// Active entities are summaries and messages that are not folded into one
inline bool is_active(const Entity& e) {
    if (const auto* m = std::get_if<Message>(&e)) {
        return !m->compressed;
    }
    return true;
}

inline int entity_tokens(const Entity& e) {
    return std::visit([](const auto& v) { return v.token_estimate; }, e);
}

// Inclusive range of message ids offered for compression
struct Span {
    MessageId first_id = 0;
    MessageId last_id = 0;

    size_t size() const { return first_id == 0 ? 0 : static_cast<size_t>(last_id - first_id + 1); }
    bool operator==(const Span&) const = default;
};

}  // namespace mnemo::core
