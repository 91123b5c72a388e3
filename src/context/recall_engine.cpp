#include "mnemo/context/recall_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace mnemo::context {

Json RecallChunk::to_json() const {
    return Json{
        {"id", id},
        {"role", std::string(role_to_string(role))},
        {"content", content},
        {"timestamp", to_millis(timestamp)},
        {"score", score},
        {"tokens", tokens}
    };
}

RecallEngine::RecallEngine(const RecallConfig& config)
    : config_(config)
{
}

std::vector<RecallChunk> RecallEngine::recall(const memory::Session& session,
                                              std::string_view query) const {
    return recall(session, query, static_cast<size_t>(std::max(config_.top_k, 0)));
}

std::vector<RecallChunk> RecallEngine::recall(const memory::Session& session,
                                              std::string_view query, size_t k) const {
    std::vector<RecallChunk> chunks;
    if (k == 0) {
        return chunks;
    }

    std::unordered_set<MessageId> active_ids;
    for (const Entity* entity : session.active()) {
        if (const auto* m = std::get_if<Message>(entity)) {
            active_ids.insert(m->id);
        }
    }

    // Over-fetch so that filtering out the active window still leaves k
    auto hits = session.index().query(query, k + active_ids.size());

    std::unordered_set<MessageId> seen;
    int used = 0;

    for (const auto& hit : hits) {
        if (hit.score < config_.min_score) break;
        if (active_ids.count(hit.id) > 0) continue;
        if (!seen.insert(hit.id).second) continue;

        const Message* msg = session.find_message(hit.id);
        if (!msg) continue;

        if (used + msg->token_estimate > config_.token_budget) {
            break;
        }

        RecallChunk chunk;
        chunk.id = msg->id;
        chunk.role = msg->role;
        chunk.content = msg->content;
        chunk.timestamp = msg->timestamp;
        chunk.score = hit.score;
        chunk.tokens = msg->token_estimate;

        used += chunk.tokens;
        chunks.push_back(std::move(chunk));
        if (chunks.size() >= k) break;
    }

    if (!chunks.empty()) {
        spdlog::debug("Recalled {} messages ({} tokens)", chunks.size(), used);
    }

    return chunks;
}

}  // namespace mnemo::context
