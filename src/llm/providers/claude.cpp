#include "mnemo/llm/providers/claude.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace mnemo::llm {

ClaudeProvider::ClaudeProvider(const std::string& api_key, const std::string& model, int timeout_ms)
    : api_key_(api_key)
    , model_(model)
    , timeout_ms_(timeout_ms)
{
}

bool ClaudeProvider::is_available() const {
    return !api_key_.empty();
}

Json ClaudeProvider::format_messages(const std::vector<ChatMessage>& messages) const {
    Json formatted = Json::array();

    for (const auto& msg : messages) {
        // The Messages API takes system text out of band
        if (msg.role == Role::System) continue;

        formatted.push_back(Json{
            {"role", std::string(role_to_string(msg.role))},
            {"content", msg.content}
        });
    }

    return formatted;
}

Json ClaudeProvider::build_body(const LLMRequest& request) const {
    Json body;
    body["model"] = model_;
    body["max_tokens"] = request.max_tokens;
    body["messages"] = format_messages(request.messages);

    std::string system = request.system_prompt;
    for (const auto& msg : request.messages) {
        if (msg.role != Role::System) continue;
        if (!system.empty()) system += "\n\n";
        system += msg.content;
    }
    if (!system.empty()) {
        body["system"] = system;
    }

    if (request.temperature > 0) {
        body["temperature"] = request.temperature;
    }

    return body;
}

Result<LLMResponse, Error> ClaudeProvider::parse_response(const std::string& body) const {
    try {
        Json j = Json::parse(body);

        if (j.contains("error")) {
            std::string error_type = j["error"].value("type", "unknown");
            std::string error_msg = j["error"].value("message", "Unknown error");

            if (error_type == "rate_limit_error") {
                return Result<LLMResponse, Error>::err(ErrorCode::LLMRateLimited, error_msg);
            } else if (error_type == "overloaded_error") {
                return Result<LLMResponse, Error>::err(ErrorCode::LLMProviderUnavailable, error_msg);
            } else if (error_type == "invalid_request_error") {
                return Result<LLMResponse, Error>::err(ErrorCode::InvalidArgument, error_msg);
            }

            return Result<LLMResponse, Error>::err(ErrorCode::LLMInvalidResponse, error_msg);
        }

        LLMResponse response;
        response.model = j.value("model", model_);

        if (j.contains("content")) {
            for (const auto& block : j["content"]) {
                if (block.value("type", "") == "text") {
                    response.content += block.value("text", "");
                }
            }
        }

        if (j.contains("usage")) {
            response.usage.input_tokens = j["usage"].value("input_tokens", 0);
            response.usage.output_tokens = j["usage"].value("output_tokens", 0);
        }

        return Result<LLMResponse, Error>::ok(std::move(response));

    } catch (const Json::exception& e) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMInvalidResponse,
            std::string("JSON parse error: ") + e.what()
        );
    }
}

Result<LLMResponse, Error> ClaudeProvider::complete(const LLMRequest& request) {
    if (!is_available()) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMApiKeyMissing,
            "Anthropic API key not set"
        );
    }

    auto start = std::chrono::steady_clock::now();

    httplib::Client client(base_url_);
    auto timeout = std::chrono::milliseconds(timeout_ms_);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    httplib::Headers headers = {
        {"X-API-Key", api_key_},
        {"anthropic-version", api_version_}
    };

    auto res = client.Post("/v1/messages", headers, build_body(request).dump(), "application/json");

    auto latency = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

    if (!res) {
        spdlog::debug("Anthropic request failed: {}", httplib::to_string(res.error()));
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMConnectionFailed,
            "Failed to connect to Anthropic API",
            httplib::to_string(res.error())
        );
    }

    if (res->status == 429) {
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMRateLimited,
            "Rate limited by Anthropic API"
        );
    }

    auto result = parse_response(res->body);
    if (res->status != 200) {
        if (result.is_err()) {
            return result;
        }
        return Result<LLMResponse, Error>::err(
            ErrorCode::LLMInvalidResponse,
            "Unexpected status code: " + std::to_string(res->status)
        );
    }

    if (result.is_ok()) {
        result.value().latency = latency;
    }
    return result;
}

}  // namespace mnemo::llm
