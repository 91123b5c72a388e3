#include "mnemo/context/conversation_memory.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

namespace mnemo::context {

Json MemoryStats::to_json() const {
    return Json{
        {"session", session_name},
        {"active_messages", active_messages},
        {"total_messages", total_messages},
        {"summaries", summaries},
        {"indexed_documents", indexed_documents},
        {"active_tokens", active_tokens},
        {"token_budget", token_budget}
    };
}

ConversationMemory::ConversationMemory(const Config& config,
                                       std::unique_ptr<llm::Summarizer> summarizer)
    : config_(config)
    , summarizer_(summarizer ? std::move(summarizer) : llm::make_summarizer(config))
    , scorer_(config.memory.importance_threshold)
    , compressor_(config.memory, summarizer_.get())
    , budget_(config.memory, compressor_)
    , recall_(config.recall)
    , store_(config.memory.storage_path)
    , session_("", config.summarizer.model)
{
    spdlog::debug("Conversation memory ready: budget {} tokens, keep {} recent, summarizer {}",
                  config_.memory.token_budget, config_.memory.keep_recent, summarizer_->name());
}

std::string ConversationMemory::default_session_name() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

Message ConversationMemory::add(Role role, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);

    double importance = scorer_.score(role, content);
    Message stored = session_.append(role, std::move(content), importance);

    budget_.check_and_compress(session_);
    return stored;
}

Result<ContextPayload, Error> ConversationMemory::build_context(const std::string& user_input) {
    std::lock_guard<std::mutex> lock(mutex_);

    budget_.check_and_compress(session_);

    std::vector<RecallChunk> recalled;
    if (!user_input.empty()) {
        recalled = recall_.recall(session_, user_input);
    }

    return ContextBuilder(config_.context)
        .with_entities(session_.active())
        .with_recalled(std::move(recalled))
        .with_protected_tail(static_cast<size_t>(config_.memory.keep_recent))
        .build();
}

std::vector<RecallChunk> ConversationMemory::recall(const std::string& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recall_.recall(session_, query);
}

Result<fs::path, Error> ConversationMemory::save_session(const std::optional<std::string>& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string previous = session_.name();
    if (name && !name->empty()) {
        session_.set_name(*name);
    } else if (previous.empty()) {
        session_.set_name(default_session_name());
    }

    auto result = store_.save(session_);
    if (result.is_err()) {
        session_.set_name(previous);
        spdlog::error("Failed to save session: {}", result.error().full_message());
        return result;
    }

    spdlog::info("Saved session '{}' to {}", session_.name(), result.value().string());
    return result;
}

Result<void, Error> ConversationMemory::load_session(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto loaded = store_.load(name);
    if (loaded.is_err()) {
        spdlog::warn("Failed to load session '{}': {}", name, loaded.error().full_message());
        return Result<void, Error>::err(std::move(loaded).error());
    }

    session_ = std::move(loaded).value();
    return Result<void, Error>::ok();
}

std::vector<std::string> ConversationMemory::list_sessions() const {
    return store_.list();
}

void ConversationMemory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = memory::Session("", config_.summarizer.model);
}

MemoryStats ConversationMemory::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MemoryStats stats;
    stats.session_name = session_.name();
    stats.total_messages = session_.message_count();
    stats.summaries = session_.summary_count();
    stats.indexed_documents = session_.index().document_count();
    stats.active_tokens = session_.active_tokens();
    stats.token_budget = config_.memory.token_budget;

    for (const Entity* entity : session_.active()) {
        if (is_message(*entity)) {
            ++stats.active_messages;
        }
    }

    return stats;
}

std::string ConversationMemory::session_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.name();
}

}  // namespace mnemo::context
