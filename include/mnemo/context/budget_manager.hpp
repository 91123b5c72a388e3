#pragma once

#include "compressor.hpp"
#include "mnemo/core/config.hpp"
#include "mnemo/core/types.hpp"
#include "mnemo/memory/session.hpp"

#include <optional>

namespace mnemo::context {

using namespace mnemo::core;

// Outcome of one budget check
struct CompressionReport {
    int tokens_before = 0;
    int tokens_after = 0;
    size_t summaries_created = 0;

    bool compressed() const { return summaries_created > 0; }
};

// Budget manager - keeps the active window within the token budget by
// compressing the oldest eligible spans first
class BudgetManager {
public:
    BudgetManager(const MemoryConfig& config, Compressor& compressor);

    // Compress until the active total fits the budget or nothing is eligible.
    // Never increases the active total.
    CompressionReport check_and_compress(memory::Session& session);

    int active_tokens(const memory::Session& session) const;
    bool needs_compression(const memory::Session& session) const;

    // Oldest maximal run of active, non-exempt messages outside the recent
    // window, capped at summarize_batch messages
    std::optional<Span> next_eligible_span(const memory::Session& session) const;

private:
    MemoryConfig config_;
    Compressor& compressor_;
};

}  // namespace mnemo::context
