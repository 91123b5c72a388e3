#include "mnemo/context/budget_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mnemo::context {

BudgetManager::BudgetManager(const MemoryConfig& config, Compressor& compressor)
    : config_(config)
    , compressor_(compressor)
{
}

int BudgetManager::active_tokens(const memory::Session& session) const {
    return session.active_tokens();
}

bool BudgetManager::needs_compression(const memory::Session& session) const {
    return active_tokens(session) > config_.token_budget;
}

std::optional<Span> BudgetManager::next_eligible_span(const memory::Session& session) const {
    auto active = session.active();
    size_t recent = static_cast<size_t>(std::max(config_.keep_recent, 0));
    if (active.size() <= recent) {
        return std::nullopt;
    }

    size_t limit = active.size() - recent;
    size_t batch = static_cast<size_t>(std::max(config_.summarize_batch, 1));
    const auto& scorer = compressor_.scorer();

    auto eligible = [&](size_t i) -> const Message* {
        const auto* m = std::get_if<Message>(active[i]);
        return (m && !scorer.is_exempt(*m)) ? m : nullptr;
    };

    for (size_t i = 0; i < limit; ++i) {
        const Message* first = eligible(i);
        if (!first) continue;

        Span span{first->id, first->id};
        for (size_t j = i + 1; j < limit && span.size() < batch; ++j) {
            const Message* next = eligible(j);
            if (!next || next->id != span.last_id + 1) break;
            span.last_id = next->id;
        }
        return span;
    }

    return std::nullopt;
}

CompressionReport BudgetManager::check_and_compress(memory::Session& session) {
    CompressionReport report;
    report.tokens_before = active_tokens(session);
    report.tokens_after = report.tokens_before;

    while (report.tokens_after > config_.token_budget) {
        auto span = next_eligible_span(session);
        if (!span) {
            spdlog::debug("Active window at {} tokens, budget {}, nothing eligible",
                          report.tokens_after, config_.token_budget);
            break;
        }

        if (!compressor_.compress(session, *span)) {
            break;
        }

        ++report.summaries_created;
        report.tokens_after = active_tokens(session);
    }

    if (report.compressed()) {
        spdlog::info("Compression pass: {} -> {} tokens ({} summaries, budget {})",
                     report.tokens_before, report.tokens_after,
                     report.summaries_created, config_.token_budget);
    }

    return report;
}

}  // namespace mnemo::context
