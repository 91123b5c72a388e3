#pragma once

#include "mnemo/core/config.hpp"
#include "mnemo/llm/summarizer.hpp"

#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>

namespace mnemo::test {

namespace fs = std::filesystem;

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("mnemo_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Always reports an error
class FailingSummarizer : public llm::Summarizer {
public:
    int calls = 0;

    std::string name() const override { return "failing"; }
    bool is_available() const override { return true; }

    core::Result<std::string, core::Error> summarize(const std::vector<core::Message>&, size_t) override {
        ++calls;
        return core::Result<std::string, core::Error>::err(
            core::ErrorCode::LLMConnectionFailed, "connection refused");
    }
};

// Throws instead of returning
class ThrowingSummarizer : public llm::Summarizer {
public:
    std::string name() const override { return "throwing"; }
    bool is_available() const override { return true; }

    core::Result<std::string, core::Error> summarize(const std::vector<core::Message>&, size_t) override {
        throw std::runtime_error("summarizer exploded");
    }
};

// Returns a fixed text
class FixedSummarizer : public llm::Summarizer {
public:
    explicit FixedSummarizer(std::string text) : text_(std::move(text)) {}

    std::string name() const override { return "fixed"; }
    bool is_available() const override { return true; }

    core::Result<std::string, core::Error> summarize(const std::vector<core::Message>&, size_t) override {
        return core::Result<std::string, core::Error>::ok(text_);
    }

private:
    std::string text_;
};

// Configuration that never touches the network or the home directory
inline core::Config offline_config(const fs::path& storage) {
    core::Config config;
    config.memory.storage_path = storage;
    config.summarizer.provider = "extractive";
    config.api_keys.anthropic.clear();
    return config;
}

}  // namespace mnemo::test
