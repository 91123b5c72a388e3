#pragma once

#include "budget_manager.hpp"
#include "compressor.hpp"
#include "context_builder.hpp"
#include "recall_engine.hpp"
#include "mnemo/core/config.hpp"
#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"
#include "mnemo/llm/summarizer.hpp"
#include "mnemo/memory/importance.hpp"
#include "mnemo/memory/session.hpp"
#include "mnemo/memory/session_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mnemo::context {

using namespace mnemo::core;
namespace fs = std::filesystem;

// Memory statistics
struct MemoryStats {
    std::string session_name;
    size_t active_messages = 0;
    size_t total_messages = 0;
    size_t summaries = 0;
    size_t indexed_documents = 0;
    int active_tokens = 0;
    int token_budget = 0;

    Json to_json() const;
};

// Conversation memory - per-turn interface over one session.
// All operations hold the session lock for their whole duration.
class ConversationMemory {
public:
    // A null summarizer selects one from the configuration
    explicit ConversationMemory(const Config& config,
                                std::unique_ptr<llm::Summarizer> summarizer = nullptr);

    // Append, index and compress if over budget. Returns a copy of the
    // stored message.
    Message add(Role role, std::string content);

    // Budget check, recall for user_input, payload within context.max_tokens.
    // user_input is only the recall query; record it with add().
    Result<ContextPayload, Error> build_context(const std::string& user_input);

    // Recall without building a payload
    std::vector<RecallChunk> recall(const std::string& query);

    // Persist under name, or the current name, or a UTC timestamp
    Result<fs::path, Error> save_session(const std::optional<std::string>& name = std::nullopt);

    // Replace the current session; on failure the current one is kept
    Result<void, Error> load_session(const std::string& name);

    std::vector<std::string> list_sessions() const;

    // Start a fresh, unnamed session
    void clear();

    MemoryStats stats() const;
    std::string session_name() const;

    // Unsynchronized view for inspection
    const memory::Session& session() const { return session_; }

    static std::string default_session_name();

private:
    Config config_;
    std::unique_ptr<llm::Summarizer> summarizer_;
    memory::ImportanceScorer scorer_;
    Compressor compressor_;
    BudgetManager budget_;
    RecallEngine recall_;
    memory::SessionStore store_;
    memory::Session session_;
    mutable std::mutex mutex_;
};

}  // namespace mnemo::context
