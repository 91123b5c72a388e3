#pragma once

#include "mnemo/core/result.hpp"
#include "mnemo/core/types.hpp"

#include <string>
#include <vector>

namespace mnemo::llm {

using namespace mnemo::core;

// Chat message as sent to a provider
struct ChatMessage {
    Role role;
    std::string content;
};

// LLM request
struct LLMRequest {
    std::vector<ChatMessage> messages;
    std::string system_prompt;
    int max_tokens = 1000;
    double temperature = 0.3;
};

// Token usage
struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;

    int total() const { return input_tokens + output_tokens; }
};

// LLM response
struct LLMResponse {
    std::string content;
    std::string model;
    TokenUsage usage;
    Duration latency{0};
};

// Base LLM provider interface
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    // Get provider name
    virtual std::string name() const = 0;

    // Check if provider is available (API key set, etc.)
    virtual bool is_available() const = 0;

    // Send a request and get response
    virtual Result<LLMResponse, Error> complete(const LLMRequest& request) = 0;
};

}  // namespace mnemo::llm
