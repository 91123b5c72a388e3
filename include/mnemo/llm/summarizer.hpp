#pragma once

#include "mnemo/core/config.hpp"
#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"
#include "provider.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mnemo::llm {

using namespace mnemo::core;

// Summarization capability used by compression. May fail; callers must
// have a local fallback.
class Summarizer {
public:
    virtual ~Summarizer() = default;

    virtual std::string name() const = 0;
    virtual bool is_available() const = 0;

    // Summarize a contiguous run of messages in at most max_chars
    virtual Result<std::string, Error> summarize(const std::vector<Message>& span,
                                                 size_t max_chars) = 0;
};

// Delegates to an LLM provider. One attempt, no retries.
class LLMSummarizer : public Summarizer {
public:
    LLMSummarizer(std::unique_ptr<LLMProvider> provider, const SummarizerConfig& config);

    std::string name() const override;
    bool is_available() const override;
    Result<std::string, Error> summarize(const std::vector<Message>& span,
                                         size_t max_chars) override;

    static std::string summarization_prompt(size_t max_chars);

private:
    std::unique_ptr<LLMProvider> provider_;
    SummarizerConfig config_;
};

// Deterministic local summary: keeps questions, code blocks and decision
// lines; with nothing to keep, falls back to head + tail of the transcript.
// Never fails.
class ExtractiveSummarizer : public Summarizer {
public:
    static constexpr const char* kElision = " [...] ";

    std::string name() const override { return "extractive"; }
    bool is_available() const override { return true; }
    Result<std::string, Error> summarize(const std::vector<Message>& span,
                                         size_t max_chars) override;

    // Same as summarize, without the Result wrapper
    static std::string extract(const std::vector<Message>& span, size_t max_chars);

    static std::vector<std::string> distill_facts(const std::vector<Message>& span);
    static std::string transcript(const std::vector<Message>& span);

    // Keep the first and last portions of text within max_chars
    static std::string truncate_middle(const std::string& text, size_t max_chars);
};

// Summarizer selected by summarizer.provider
std::unique_ptr<Summarizer> make_summarizer(const Config& config);

}  // namespace mnemo::llm
