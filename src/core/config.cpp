#include "mnemo/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace mnemo::core {

namespace {

fs::path expand_path_fs(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

void apply_env_overrides(Config& config) {
    if (const char* key = std::getenv("ANTHROPIC_API_KEY")) {
        config.api_keys.anthropic = key;
    }
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.mnemo/config.yaml")));
}

void Config::expand_paths() {
    memory.storage_path = expand_path_fs(memory.storage_path);
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path_fs(observability.log_path);
    }
}

Result<void, Error> Config::validate() const {
    if (memory.token_budget <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.token_budget must be positive"
        );
    }

    if (memory.keep_recent < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.keep_recent must be at least 1"
        );
    }

    if (memory.importance_threshold < 0.0 || memory.importance_threshold > 1.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.importance_threshold must be within [0, 1]"
        );
    }

    if (memory.summarize_batch < 1 || memory.max_summary_chars < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.summarize_batch and memory.max_summary_chars must be positive"
        );
    }

    if (memory.summary_ratio <= 0.0 || memory.summary_ratio > 1.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.summary_ratio must be within (0, 1]"
        );
    }

    if (recall.top_k < 0 || recall.token_budget < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "recall.top_k and recall.token_budget must not be negative"
        );
    }

    if (context.max_tokens <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "context.max_tokens must be positive"
        );
    }

    if (summarizer.provider != "claude" && summarizer.provider != "extractive") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "summarizer.provider must be 'claude' or 'extractive'",
            summarizer.provider
        );
    }

    if (summarizer.timeout_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "summarizer.timeout_ms must be positive"
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path_fs(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto mem_node = root["memory"]) {
            config.memory.token_budget = mem_node["token_budget"].as<int>(config.memory.token_budget);
            config.memory.keep_recent = mem_node["keep_recent"].as<int>(config.memory.keep_recent);
            config.memory.storage_path = mem_node["storage_path"].as<std::string>(config.memory.storage_path.string());
            config.memory.importance_threshold = mem_node["importance_threshold"].as<double>(config.memory.importance_threshold);
            config.memory.summarize_batch = mem_node["summarize_batch"].as<int>(config.memory.summarize_batch);
            config.memory.max_summary_chars = mem_node["max_summary_chars"].as<int>(config.memory.max_summary_chars);
            config.memory.summary_ratio = mem_node["summary_ratio"].as<double>(config.memory.summary_ratio);
        }

        if (auto recall_node = root["recall"]) {
            config.recall.top_k = recall_node["top_k"].as<int>(config.recall.top_k);
            config.recall.token_budget = recall_node["token_budget"].as<int>(config.recall.token_budget);
            config.recall.min_score = recall_node["min_score"].as<double>(config.recall.min_score);
        }

        if (auto ctx_node = root["context"]) {
            config.context.max_tokens = ctx_node["max_tokens"].as<int>(config.context.max_tokens);
        }

        if (auto sum_node = root["summarizer"]) {
            config.summarizer.provider = sum_node["provider"].as<std::string>(config.summarizer.provider);
            config.summarizer.model = sum_node["model"].as<std::string>(config.summarizer.model);
            config.summarizer.timeout_ms = sum_node["timeout_ms"].as<int>(config.summarizer.timeout_ms);
            config.summarizer.max_tokens = sum_node["max_tokens"].as<int>(config.summarizer.max_tokens);
            config.summarizer.temperature = sum_node["temperature"].as<double>(config.summarizer.temperature);
        }

        // API keys (environment variables win)
        if (auto keys_node = root["api_keys"]) {
            config.api_keys.anthropic = expand_path(keys_node["anthropic"].as<std::string>(""));
        }
        apply_env_overrides(config);

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs_node["log_path"].as<std::string>(config.observability.log_path.string());
        }

        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    apply_env_overrides(config);
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path_fs(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "memory" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "token_budget" << YAML::Value << memory.token_budget;
        out << YAML::Key << "keep_recent" << YAML::Value << memory.keep_recent;
        out << YAML::Key << "storage_path" << YAML::Value << memory.storage_path.string();
        out << YAML::Key << "importance_threshold" << YAML::Value << memory.importance_threshold;
        out << YAML::Key << "summarize_batch" << YAML::Value << memory.summarize_batch;
        out << YAML::Key << "max_summary_chars" << YAML::Value << memory.max_summary_chars;
        out << YAML::Key << "summary_ratio" << YAML::Value << memory.summary_ratio;
        out << YAML::EndMap;

        out << YAML::Key << "recall" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "top_k" << YAML::Value << recall.top_k;
        out << YAML::Key << "token_budget" << YAML::Value << recall.token_budget;
        out << YAML::Key << "min_score" << YAML::Value << recall.min_score;
        out << YAML::EndMap;

        out << YAML::Key << "context" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_tokens" << YAML::Value << context.max_tokens;
        out << YAML::EndMap;

        out << YAML::Key << "summarizer" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "provider" << YAML::Value << summarizer.provider;
        out << YAML::Key << "model" << YAML::Value << summarizer.model;
        out << YAML::Key << "timeout_ms" << YAML::Value << summarizer.timeout_ms;
        out << YAML::Key << "max_tokens" << YAML::Value << summarizer.max_tokens;
        out << YAML::Key << "temperature" << YAML::Value << summarizer.temperature;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace mnemo::core
