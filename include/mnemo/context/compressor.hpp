#pragma once

#include "mnemo/core/config.hpp"
#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"
#include "mnemo/llm/summarizer.hpp"
#include "mnemo/memory/importance.hpp"
#include "mnemo/memory/session.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mnemo::context {

using namespace mnemo::core;

// Compressor - replaces an eligible span of active messages with a summary.
//
// A span is eligible when it is a contiguous run of active messages that
// lies entirely before the most recent keep_recent active entities and
// contains no exempt message. Anything else is a no-op.
class Compressor {
public:
    Compressor(const MemoryConfig& config, llm::Summarizer* summarizer = nullptr);

    // Fold the span into a summary; nullopt if the span was rejected.
    // Summarizer failures fall back to the extractive summary.
    std::optional<Summary> compress(memory::Session& session, const Span& span);

    // Messages of the span if it is eligible
    Result<std::vector<Message>, Error> collect_span(const memory::Session& session,
                                                     const Span& span) const;

    // Longest summary allowed for a span of span_chars characters
    size_t summary_cap(size_t span_chars) const;

    const memory::ImportanceScorer& scorer() const { return scorer_; }

private:
    MemoryConfig config_;
    llm::Summarizer* summarizer_;
    llm::ExtractiveSummarizer fallback_;
    memory::ImportanceScorer scorer_;

    std::string summarize(const std::vector<Message>& messages, size_t cap);
};

}  // namespace mnemo::context
