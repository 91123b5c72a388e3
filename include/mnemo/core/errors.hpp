#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mnemo::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,

    // Session errors (100-199)
    SessionNotFound = 106,

    // Summarizer errors (200-299)
    LLMConnectionFailed = 200,
    LLMRateLimited = 201,
    LLMInvalidResponse = 203,
    LLMApiKeyMissing = 204,
    LLMProviderUnavailable = 205,
    SummarizationFailed = 210,

    // Context errors (500-599)
    ContextTooLarge = 502,
    SpanNotEligible = 503,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::SessionNotFound: return "Session not found";

        case ErrorCode::LLMConnectionFailed: return "Failed to connect to LLM provider";
        case ErrorCode::LLMRateLimited: return "LLM rate limit exceeded";
        case ErrorCode::LLMInvalidResponse: return "Invalid response from LLM";
        case ErrorCode::LLMApiKeyMissing: return "API key not configured";
        case ErrorCode::LLMProviderUnavailable: return "LLM provider unavailable";
        case ErrorCode::SummarizationFailed: return "Summarization failed";
        case ErrorCode::ContextTooLarge: return "Context too large";
        case ErrorCode::SpanNotEligible: return "Span not eligible for compression";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // File path, session name, etc.

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        return result;
    }
};

}  // namespace mnemo::core
