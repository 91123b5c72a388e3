#include "mnemo/context/context_builder.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace mnemo::context {

Json ContextPayload::to_json() const {
    Json messages = Json::array();

    if (!recalled.empty()) {
        messages.push_back(Json{
            {"role", "system"},
            {"content", ContextBuilder::render_recalled(recalled)}
        });
    }

    for (const auto& entity : entities) {
        if (const auto* m = std::get_if<Message>(&entity)) {
            messages.push_back(Json{
                {"role", std::string(role_to_string(m->role))},
                {"content", m->content}
            });
        } else {
            messages.push_back(Json{
                {"role", "system"},
                {"content", ContextBuilder::render_summary(std::get<Summary>(entity))}
            });
        }
    }

    return messages;
}

ContextBuilder::ContextBuilder(const ContextConfig& config)
    : config_(config)
{
}

ContextBuilder& ContextBuilder::with_entities(const std::vector<const Entity*>& active) {
    entities_.clear();
    entities_.reserve(active.size());
    for (const Entity* entity : active) {
        entities_.push_back(*entity);
    }
    return *this;
}

ContextBuilder& ContextBuilder::with_recalled(std::vector<RecallChunk> chunks) {
    recalled_ = std::move(chunks);
    return *this;
}

ContextBuilder& ContextBuilder::with_protected_tail(size_t count) {
    protected_tail_ = count;
    return *this;
}

std::string ContextBuilder::render_summary(const Summary& summary) {
    std::ostringstream ss;
    ss << "Summary of earlier conversation (messages "
       << summary.first_id << "-" << summary.last_id << "):\n"
       << summary.text;
    return ss.str();
}

std::string ContextBuilder::render_recalled(const std::vector<RecallChunk>& chunks) {
    std::ostringstream ss;
    ss << "Relevant earlier context:";
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) ss << "\n---";
        ss << "\n[" << role_to_string(chunks[i].role) << "] " << chunks[i].content;
    }
    return ss.str();
}

int ContextBuilder::estimated_tokens() const {
    int tokens = 0;
    for (const auto& entity : entities_) {
        tokens += entity_tokens(entity);
    }
    for (const auto& chunk : recalled_) {
        tokens += chunk.tokens;
    }
    return tokens;
}

Result<ContextPayload, Error> ContextBuilder::build() {
    ContextPayload payload;
    payload.recalled = recalled_;
    int tokens = estimated_tokens();

    while (tokens > config_.max_tokens && !payload.recalled.empty()) {
        tokens -= payload.recalled.back().tokens;
        payload.recalled.pop_back();
        payload.was_trimmed = true;
    }

    size_t unprotected = entities_.size() > protected_tail_ ? entities_.size() - protected_tail_ : 0;
    std::vector<bool> dropped(entities_.size(), false);

    // Summaries go before messages
    for (bool summaries : {true, false}) {
        for (size_t i = 0; i < unprotected && tokens > config_.max_tokens; ++i) {
            if (is_summary(entities_[i]) != summaries) continue;
            tokens -= entity_tokens(entities_[i]);
            dropped[i] = true;
            payload.was_trimmed = true;
        }
    }

    if (tokens > config_.max_tokens) {
        return Result<ContextPayload, Error>::err(
            ErrorCode::ContextTooLarge,
            "Context exceeds maximum tokens: " +
                std::to_string(tokens) + " > " +
                std::to_string(config_.max_tokens)
        );
    }

    for (size_t i = 0; i < entities_.size(); ++i) {
        if (!dropped[i]) {
            payload.entities.push_back(entities_[i]);
        }
    }
    payload.estimated_tokens = tokens;

    if (payload.was_trimmed) {
        spdlog::warn("Context trimmed to {} tokens (ceiling {})", tokens, config_.max_tokens);
    }

    return Result<ContextPayload, Error>::ok(std::move(payload));
}

}  // namespace mnemo::context
