#pragma once

#include "mnemo/core/config.hpp"
#include "mnemo/core/types.hpp"
#include "mnemo/memory/session.hpp"

#include <string_view>
#include <vector>

namespace mnemo::context {

using namespace mnemo::core;

// A past message brought back into context
struct RecallChunk {
    MessageId id = 0;
    Role role = Role::User;
    std::string content;
    TimePoint timestamp;
    double score = 0.0;
    int tokens = 0;

    Json to_json() const;
};

// Recall engine - surfaces indexed messages that are no longer in the
// active window
class RecallEngine {
public:
    explicit RecallEngine(const RecallConfig& config);

    // At most k chunks in score order, none of them active, none below
    // min_score, stopping at the first chunk over the token sub-budget
    std::vector<RecallChunk> recall(const memory::Session& session,
                                    std::string_view query, size_t k) const;

    // Same, with k = top_k
    std::vector<RecallChunk> recall(const memory::Session& session,
                                    std::string_view query) const;

private:
    RecallConfig config_;
};

}  // namespace mnemo::context
