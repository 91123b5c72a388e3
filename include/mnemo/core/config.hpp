#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace mnemo::core {

namespace fs = std::filesystem;

// Conversation memory configuration
struct MemoryConfig {
    int token_budget = 6000;       // ceiling on active window tokens
    int keep_recent = 10;          // always-uncompressed tail
    fs::path storage_path = "~/.mnemo/sessions";
    double importance_threshold = 0.7;
    int summarize_batch = 21;      // max messages folded into one summary
    int max_summary_chars = 2000;
    double summary_ratio = 0.5;    // summary length relative to its span
};

// Recall configuration
struct RecallConfig {
    int top_k = 3;
    int token_budget = 1500;
    double min_score = 0.1;
};

// Context payload configuration
struct ContextConfig {
    int max_tokens = 12000;
};

// Delegated summarization
struct SummarizerConfig {
    std::string provider = "claude";  // claude | extractive
    std::string model = "claude-3-5-haiku-20241022";
    int timeout_ms = 10000;
    int max_tokens = 1000;
    double temperature = 0.3;
};

// API keys configuration
struct ApiKeysConfig {
    std::string anthropic;  // From env: ANTHROPIC_API_KEY
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_path;               // empty: console only
};

// Main configuration
struct Config {
    MemoryConfig memory;
    RecallConfig recall;
    ContextConfig context;
    SummarizerConfig summarizer;
    ApiKeysConfig api_keys;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand ~ and environment variables in paths
    void expand_paths();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

}  // namespace mnemo::core
