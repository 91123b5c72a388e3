#include <catch2/catch_test_macros.hpp>
#include "mnemo/llm/providers/claude.hpp"
#include "mnemo/llm/summarizer.hpp"

using namespace mnemo::core;
using namespace mnemo::llm;

namespace {

Message msg(MessageId id, Role role, std::string content) {
    Message m;
    m.id = id;
    m.role = role;
    m.content = std::move(content);
    return m;
}

}  // namespace

TEST_CASE("Extractive summary keeps questions, code and decisions", "[summarizer]") {
    std::vector<Message> span{
        msg(1, Role::User, "Which queue should we use for the ingestion jobs?"),
        msg(2, Role::Assistant, "Some background chatter that is not interesting at all.\n"
                                "We decided to use Redis streams for ingestion."),
        msg(3, Role::Assistant, "Config:\n```yaml\nstream: ingest\n```"),
        msg(4, Role::User, "ok")
    };

    auto facts = ExtractiveSummarizer::distill_facts(span);
    REQUIRE(facts.size() == 3);
    REQUIRE(facts[0] == "[user]: Which queue should we use for the ingestion jobs?");
    REQUIRE(facts[1] == "[assistant]: We decided to use Redis streams for ingestion.");
    REQUIRE(facts[2] == "```yaml\nstream: ingest\n```");

    auto text = ExtractiveSummarizer::extract(span, 2000);
    REQUIRE(text.find("background chatter") == std::string::npos);
    REQUIRE(text.find("Redis streams") != std::string::npos);
}

TEST_CASE("Extractive summary removes near duplicates", "[summarizer]") {
    std::vector<Message> span{
        msg(1, Role::User, "Is the cache warm after deploy?"),
        msg(2, Role::User, "is the  cache warm after DEPLOY?")
    };

    // Same role tag, same words once case and spacing are folded
    auto facts = ExtractiveSummarizer::distill_facts(span);
    REQUIRE(facts.size() == 1);
}

TEST_CASE("Extractive summary falls back to head and tail", "[summarizer]") {
    std::vector<Message> span{msg(1, Role::User, std::string(160, 'a'))};

    auto text = ExtractiveSummarizer::extract(span, 80);
    REQUIRE(text.size() == 80);
    REQUIRE(text.rfind("[user]: ", 0) == 0);
    REQUIRE(text.find(ExtractiveSummarizer::kElision) != std::string::npos);
}

TEST_CASE("Truncation respects the cap", "[summarizer]") {
    REQUIRE(ExtractiveSummarizer::truncate_middle("short", 10) == "short");
    REQUIRE(ExtractiveSummarizer::truncate_middle("abcdefghij", 4) == "abcd");
    REQUIRE(ExtractiveSummarizer::truncate_middle(std::string(100, 'x'), 0).empty());

    auto cut = ExtractiveSummarizer::truncate_middle("0123456789abcdefghijklmnopqrstuvwxyz", 21);
    REQUIRE(cut.size() == 21);
    REQUIRE(cut == "0123456 [...] tuvwxyz");
}

TEST_CASE("Truncation keeps multi-byte characters whole", "[summarizer]") {
    std::string lambdas;
    for (int i = 0; i < 101; ++i) lambdas += "\xce\xbb";
    const std::string text = lambdas + " " + lambdas;

    const size_t caps[] = {3, 50, 51, 100};
    for (size_t cap : caps) {
        auto cut = ExtractiveSummarizer::truncate_middle(text, cap);
        REQUIRE(cut.size() <= cap);
        REQUIRE_NOTHROW(Json(cut).dump());
    }
}

TEST_CASE("Extractive summarizer never fails", "[summarizer]") {
    ExtractiveSummarizer summarizer;
    REQUIRE(summarizer.is_available());

    auto result = summarizer.summarize({msg(1, Role::User, "anything")}, 50);
    REQUIRE(result.is_ok());
}

TEST_CASE("LLM summarizer without a key is unavailable", "[summarizer]") {
    SummarizerConfig config;
    LLMSummarizer summarizer(std::make_unique<ClaudeProvider>("", config.model), config);

    REQUIRE_FALSE(summarizer.is_available());
    REQUIRE(summarizer.name() == "claude");

    auto result = summarizer.summarize({msg(1, Role::User, "anything")}, 50);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::LLMProviderUnavailable);

    REQUIRE(LLMSummarizer::summarization_prompt(120).find("120 characters") != std::string::npos);
}

TEST_CASE("Summarizer factory follows the config", "[summarizer]") {
    Config config;
    config.api_keys.anthropic.clear();

    config.summarizer.provider = "extractive";
    REQUIRE(make_summarizer(config)->name() == "extractive");

    config.summarizer.provider = "claude";
    auto claude = make_summarizer(config);
    REQUIRE(claude->name() == "claude");
    REQUIRE_FALSE(claude->is_available());
}

TEST_CASE("Claude request body and response parsing", "[summarizer][claude]") {
    ClaudeProvider provider("test-key", "claude-test");
    REQUIRE(provider.is_available());

    LLMRequest request;
    request.system_prompt = "Summarize.";
    request.messages = {
        ChatMessage{Role::System, "Be brief."},
        ChatMessage{Role::User, "transcript"}
    };

    auto body = provider.build_body(request);
    REQUIRE(body["model"] == "claude-test");
    REQUIRE(body["system"] == "Summarize.\n\nBe brief.");
    REQUIRE(body["messages"].size() == 1);
    REQUIRE(body["messages"][0]["role"] == "user");

    auto ok = provider.parse_response(
        R"({"model":"claude-test","content":[{"type":"text","text":"Short "},{"type":"text","text":"summary"}],)"
        R"("usage":{"input_tokens":12,"output_tokens":3}})");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().content == "Short summary");
    REQUIRE(ok.value().usage.total() == 15);

    auto limited = provider.parse_response(R"({"error":{"type":"rate_limit_error","message":"slow down"}})");
    REQUIRE(limited.is_err());
    REQUIRE(limited.error().code == ErrorCode::LLMRateLimited);

    auto garbage = provider.parse_response("<html>");
    REQUIRE(garbage.is_err());
    REQUIRE(garbage.error().code == ErrorCode::LLMInvalidResponse);
}
