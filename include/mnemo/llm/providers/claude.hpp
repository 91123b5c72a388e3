#pragma once

#include "mnemo/llm/provider.hpp"

#include <string>

namespace mnemo::llm {

class ClaudeProvider : public LLMProvider {
public:
    ClaudeProvider(const std::string& api_key, const std::string& model, int timeout_ms = 10000);

    std::string name() const override { return "claude"; }
    bool is_available() const override;

    // Single attempt, bounded by the connection and read timeouts
    Result<LLMResponse, Error> complete(const LLMRequest& request) override;

    Json format_messages(const std::vector<ChatMessage>& messages) const;
    Json build_body(const LLMRequest& request) const;

    // Parse a Messages API response body
    Result<LLMResponse, Error> parse_response(const std::string& body) const;

private:
    std::string api_key_;
    std::string model_;
    int timeout_ms_;
    std::string base_url_ = "https://api.anthropic.com";
    std::string api_version_ = "2023-06-01";
};

}  // namespace mnemo::llm
