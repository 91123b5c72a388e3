#include "mnemo/llm/summarizer.hpp"
#include "mnemo/llm/providers/claude.hpp"
#include "mnemo/memory/importance.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace mnemo::llm {

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

// Lowercased with whitespace runs collapsed, for near-duplicate detection
std::string fingerprint(const std::string& s) {
    std::string out;
    bool space = false;
    for (unsigned char c : trim(s)) {
        if (std::isspace(c)) {
            space = true;
            continue;
        }
        if (space) out.push_back(' ');
        space = false;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool is_continuation(const std::string& s, size_t pos) {
    return pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80;
}

// Cut positions that never split a UTF-8 sequence
size_t utf8_floor(const std::string& s, size_t pos) {
    while (pos > 0 && is_continuation(s, pos)) --pos;
    return pos;
}

size_t utf8_ceil(const std::string& s, size_t pos) {
    while (is_continuation(s, pos)) ++pos;
    return pos;
}

std::string tagged(const Message& msg, const std::string& line) {
    return "[" + std::string(role_to_string(msg.role)) + "]: " + line;
}

}  // namespace

// LLMSummarizer
LLMSummarizer::LLMSummarizer(std::unique_ptr<LLMProvider> provider, const SummarizerConfig& config)
    : provider_(std::move(provider))
    , config_(config)
{
}

std::string LLMSummarizer::name() const {
    return provider_ ? provider_->name() : "none";
}

bool LLMSummarizer::is_available() const {
    return provider_ && provider_->is_available();
}

std::string LLMSummarizer::summarization_prompt(size_t max_chars) {
    return "You are a conversation summarizer. Summarize the following conversation excerpt "
           "concisely, focusing on:\n"
           "1. Key decisions made\n"
           "2. Important information learned\n"
           "3. Actions taken and their outcomes\n"
           "4. Any pending items or context needed for future turns\n\n"
           "Use at most " + std::to_string(max_chars) + " characters. "
           "Output only the summary, no preamble.";
}

Result<std::string, Error> LLMSummarizer::summarize(const std::vector<Message>& span,
                                                    size_t max_chars) {
    if (!is_available()) {
        return Result<std::string, Error>::err(
            ErrorCode::LLMProviderUnavailable,
            "No summarization provider available"
        );
    }

    LLMRequest request;
    request.system_prompt = summarization_prompt(max_chars);
    request.messages = {ChatMessage{Role::User, ExtractiveSummarizer::transcript(span)}};
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;

    auto result = provider_->complete(request);
    if (result.is_err()) {
        return Result<std::string, Error>::err(std::move(result).error());
    }

    std::string text = trim(result.value().content);
    if (text.empty()) {
        return Result<std::string, Error>::err(
            ErrorCode::SummarizationFailed,
            "Provider returned an empty summary",
            provider_->name()
        );
    }

    spdlog::debug("Summarized {} messages via {} in {}ms",
                  span.size(), provider_->name(), result.value().latency.count());
    return Result<std::string, Error>::ok(std::move(text));
}

// ExtractiveSummarizer
std::string ExtractiveSummarizer::transcript(const std::vector<Message>& span) {
    std::ostringstream ss;
    for (size_t i = 0; i < span.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << tagged(span[i], span[i].content);
    }
    return ss.str();
}

std::vector<std::string> ExtractiveSummarizer::distill_facts(const std::vector<Message>& span) {
    std::vector<std::string> facts;

    for (const auto& msg : span) {
        const std::string& content = msg.content;

        // Short pleasantries carry nothing worth keeping
        if (content.size() < 20 && !memory::ImportanceScorer::has_code_block(content)) {
            continue;
        }

        std::istringstream lines(content);
        std::string line;
        bool in_code = false;
        std::string code;

        while (std::getline(lines, line)) {
            std::string stripped = trim(line);

            if (stripped.rfind("```", 0) == 0) {
                if (in_code) {
                    code += line;
                    facts.push_back(code);
                    code.clear();
                    in_code = false;
                } else {
                    in_code = true;
                    code = line + "\n";
                }
                continue;
            }

            if (in_code) {
                code += line + "\n";
                continue;
            }

            if (!stripped.empty() && stripped.back() == '?') {
                facts.push_back(tagged(msg, stripped));
            } else if (memory::ImportanceScorer::has_decision_language(stripped)) {
                facts.push_back(tagged(msg, stripped));
            }
        }

        // Unclosed fence: keep the partial code, closed
        if (in_code && !code.empty()) {
            facts.push_back(code + "```");
        }
    }

    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    for (auto& fact : facts) {
        if (seen.insert(fingerprint(fact)).second) {
            unique.push_back(std::move(fact));
        }
    }
    return unique;
}

std::string ExtractiveSummarizer::truncate_middle(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }

    const std::string elision = kElision;
    if (max_chars <= elision.size() + 2) {
        return text.substr(0, utf8_floor(text, max_chars));
    }

    size_t keep = max_chars - elision.size();
    size_t head = utf8_floor(text, keep - keep / 2);
    size_t tail = utf8_ceil(text, text.size() - keep / 2);
    return text.substr(0, head) + elision + text.substr(tail);
}

std::string ExtractiveSummarizer::extract(const std::vector<Message>& span, size_t max_chars) {
    auto facts = distill_facts(span);

    std::string text;
    if (facts.empty()) {
        text = transcript(span);
    } else {
        std::ostringstream ss;
        for (size_t i = 0; i < facts.size(); ++i) {
            if (i > 0) ss << "\n";
            ss << facts[i];
        }
        text = ss.str();
    }

    return truncate_middle(text, max_chars);
}

Result<std::string, Error> ExtractiveSummarizer::summarize(const std::vector<Message>& span,
                                                           size_t max_chars) {
    return Result<std::string, Error>::ok(extract(span, max_chars));
}

std::unique_ptr<Summarizer> make_summarizer(const Config& config) {
    if (config.summarizer.provider == "extractive") {
        return std::make_unique<ExtractiveSummarizer>();
    }

    auto provider = std::make_unique<ClaudeProvider>(
        config.api_keys.anthropic, config.summarizer.model, config.summarizer.timeout_ms);
    if (!provider->is_available()) {
        spdlog::info("No Anthropic API key; summaries will be extractive");
    }
    return std::make_unique<LLMSummarizer>(std::move(provider), config.summarizer);
}

}  // namespace mnemo::llm
