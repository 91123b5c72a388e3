#include "mnemo/context/compressor.hpp"
#include "mnemo/memory/token_estimator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mnemo::context {

Compressor::Compressor(const MemoryConfig& config, llm::Summarizer* summarizer)
    : config_(config)
    , summarizer_(summarizer)
    , scorer_(config.importance_threshold)
{
}

size_t Compressor::summary_cap(size_t span_chars) const {
    auto by_ratio = static_cast<size_t>(static_cast<double>(span_chars) * config_.summary_ratio);
    return std::min(static_cast<size_t>(std::max(config_.max_summary_chars, 0)), by_ratio);
}

Result<std::vector<Message>, Error> Compressor::collect_span(const memory::Session& session,
                                                             const Span& span) const {
    using R = Result<std::vector<Message>, Error>;

    if (span.first_id == 0 || span.last_id < span.first_id) {
        return R::err(ErrorCode::InvalidArgument, "Empty span");
    }

    auto active = session.active();
    size_t recent = static_cast<size_t>(std::max(config_.keep_recent, 0));
    size_t limit = active.size() > recent ? active.size() - recent : 0;

    auto it = std::find_if(active.begin(), active.end(), [&](const Entity* e) {
        const auto* m = std::get_if<Message>(e);
        return m && m->id == span.first_id;
    });
    if (it == active.end()) {
        return R::err(ErrorCode::SpanNotEligible, "Span start is not active",
                      std::to_string(span.first_id));
    }

    size_t start = static_cast<size_t>(it - active.begin());
    size_t count = span.size();
    if (start + count > limit) {
        return R::err(ErrorCode::SpanNotEligible, "Span reaches into the recent window");
    }

    std::vector<Message> messages;
    messages.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto* m = std::get_if<Message>(active[start + i]);
        if (!m) {
            return R::err(ErrorCode::SpanNotEligible, "Span contains a summary");
        }
        if (m->id != span.first_id + i) {
            return R::err(ErrorCode::SpanNotEligible, "Span is not contiguous");
        }
        if (scorer_.is_exempt(*m)) {
            return R::err(ErrorCode::SpanNotEligible, "Span contains an exempt message",
                          std::to_string(m->id));
        }
        messages.push_back(*m);
    }

    return R::ok(std::move(messages));
}

std::string Compressor::summarize(const std::vector<Message>& messages, size_t cap) {
    if (summarizer_ && summarizer_->is_available()) {
        try {
            auto result = summarizer_->summarize(messages, cap);
            if (result.is_ok() && !result.value().empty()) {
                return llm::ExtractiveSummarizer::truncate_middle(result.value(), cap);
            }
            if (result.is_err()) {
                spdlog::warn("Summarizer {} failed, using extractive summary: {}",
                             summarizer_->name(), result.error().full_message());
            } else {
                spdlog::warn("Summarizer {} returned nothing, using extractive summary",
                             summarizer_->name());
            }
        } catch (const std::exception& e) {
            spdlog::warn("Summarizer {} threw, using extractive summary: {}",
                         summarizer_->name(), e.what());
        }
    }

    return fallback_.extract(messages, cap);
}

std::optional<Summary> Compressor::compress(memory::Session& session, const Span& span) {
    auto collected = collect_span(session, span);
    if (collected.is_err()) {
        spdlog::debug("Span {}-{} not compressed: {}",
                      span.first_id, span.last_id, collected.error().full_message());
        return std::nullopt;
    }

    const auto& messages = collected.value();

    size_t span_chars = 0;
    int span_tokens = 0;
    for (const auto& m : messages) {
        span_chars += m.content.size();
        span_tokens += m.token_estimate;
    }

    Summary summary;
    summary.text = summarize(messages, summary_cap(span_chars));
    summary.first_id = span.first_id;
    summary.last_id = span.last_id;
    summary.token_estimate = memory::TokenEstimator::estimate(summary.text);
    summary.created_at = now();

    if (summary.token_estimate > span_tokens) {
        spdlog::debug("Span {}-{} not compressed: summary would cost {} > {} tokens",
                      span.first_id, span.last_id, summary.token_estimate, span_tokens);
        return std::nullopt;
    }

    auto folded = session.fold(span, summary);
    if (folded.is_err()) {
        spdlog::warn("Failed to fold span {}-{}: {}",
                     span.first_id, span.last_id, folded.error().full_message());
        return std::nullopt;
    }

    spdlog::info("Compressed messages {}-{}: {} -> {} tokens",
                 span.first_id, span.last_id, span_tokens, summary.token_estimate);
    return summary;
}

}  // namespace mnemo::context
