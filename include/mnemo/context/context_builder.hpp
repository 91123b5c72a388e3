#pragma once

#include "recall_engine.hpp"
#include "mnemo/core/config.hpp"
#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"

#include <string>
#include <vector>

namespace mnemo::context {

using namespace mnemo::core;

// What the chat loop receives for one request
struct ContextPayload {
    std::vector<Entity> entities;        // active view, in order
    std::vector<RecallChunk> recalled;   // score order
    int estimated_tokens = 0;
    bool was_trimmed = false;

    // Chat messages: recalled context first as one system message, then the
    // active entities with summaries rendered as system messages in place
    Json to_json() const;
};

// Context builder - assembles the payload and enforces the payload ceiling
class ContextBuilder {
public:
    explicit ContextBuilder(const ContextConfig& config);

    ContextBuilder& with_entities(const std::vector<const Entity*>& active);
    ContextBuilder& with_recalled(std::vector<RecallChunk> chunks);

    // The last count entities are never dropped when trimming
    ContextBuilder& with_protected_tail(size_t count);

    // Over max_tokens, drops recalled chunks (lowest score first), then
    // summaries oldest first, then unprotected messages oldest first.
    // Fails if the protected tail alone is over the ceiling.
    Result<ContextPayload, Error> build();

    int estimated_tokens() const;

    static std::string render_summary(const Summary& summary);
    static std::string render_recalled(const std::vector<RecallChunk>& chunks);

private:
    ContextConfig config_;
    std::vector<Entity> entities_;
    std::vector<RecallChunk> recalled_;
    size_t protected_tail_ = 0;
};

}  // namespace mnemo::context
