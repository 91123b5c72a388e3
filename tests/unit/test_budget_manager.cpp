#include <catch2/catch_test_macros.hpp>
#include "mnemo/context/budget_manager.hpp"

#include <algorithm>

using namespace mnemo::core;
using mnemo::context::BudgetManager;
using mnemo::context::Compressor;
using mnemo::memory::ImportanceScorer;
using mnemo::memory::Session;

namespace {

MemoryConfig scenario_config() {
    MemoryConfig config;
    config.token_budget = 100;
    config.keep_recent = 2;
    return config;
}

const Message& add(Session& session, Role role, const std::string& text) {
    static const ImportanceScorer scorer;
    return session.append(role, text, scorer.score(role, text));
}

}  // namespace

TEST_CASE("Oldest message is summarized once over budget", "[budget]") {
    auto config = scenario_config();
    Compressor compressor(config);
    BudgetManager budget(config, compressor);

    Session session("scenario");
    const std::string text(160, 'a');

    for (int i = 0; i < 2; ++i) {
        REQUIRE(add(session, Role::User, text).token_estimate == 40);
        auto report = budget.check_and_compress(session);
        REQUIRE_FALSE(report.compressed());
    }

    add(session, Role::User, text);
    REQUIRE(budget.needs_compression(session));

    auto report = budget.check_and_compress(session);
    REQUIRE(report.tokens_before == 120);
    REQUIRE(report.summaries_created == 1);
    REQUIRE(report.tokens_after <= 100);
    REQUIRE(budget.active_tokens(session) <= 100);
    REQUIRE_FALSE(budget.needs_compression(session));

    REQUIRE(session.find_message(1)->compressed);
    REQUIRE_FALSE(session.find_message(2)->compressed);
    REQUIRE_FALSE(session.find_message(3)->compressed);

    auto active = session.active();
    REQUIRE(std::get<Summary>(*active[0]).first_id == 1);
}

TEST_CASE("Compression never increases the active total", "[budget]") {
    auto config = scenario_config();
    Compressor compressor(config);
    BudgetManager budget(config, compressor);

    Session session("monotonic");
    for (int i = 0; i < 30; ++i) {
        add(session, i % 2 ? Role::Assistant : Role::User,
            "turn " + std::to_string(i) + " " + std::string(40 + (i * 37) % 300, 'x'));

        auto report = budget.check_and_compress(session);
        REQUIRE(report.tokens_after <= report.tokens_before);
        REQUIRE(report.tokens_after == session.active_tokens());
    }
}

TEST_CASE("Recent window survives every pass", "[budget]") {
    auto config = scenario_config();
    config.token_budget = 10;
    Compressor compressor(config);
    BudgetManager budget(config, compressor);

    Session session("recent");
    for (int i = 0; i < 12; ++i) {
        add(session, Role::User, "status update number " + std::to_string(i) + " " + std::string(100, 's'));
        budget.check_and_compress(session);

        auto active = session.active();
        size_t tail = std::min<size_t>(2, active.size());
        for (size_t j = active.size() - tail; j < active.size(); ++j) {
            REQUIRE(is_message(*active[j]));
        }
        REQUIRE_FALSE(session.find_message(session.next_id() - 1)->compressed);
    }
}

TEST_CASE("Code block message survives twenty later messages", "[budget]") {
    auto config = scenario_config();
    Compressor compressor(config);
    BudgetManager budget(config, compressor);

    Session session("code");
    const auto& code = add(session, Role::Assistant,
                           "Here is the fix:\n```cpp\nstd::lock_guard<std::mutex> lock(mutex_);\n```");
    MessageId code_id = code.id;

    for (int i = 0; i < 20; ++i) {
        add(session, i % 2 ? Role::Assistant : Role::User,
            "follow-up discussion " + std::to_string(i) + " " + std::string(120, 'f'));
        budget.check_and_compress(session);
    }

    REQUIRE(session.summary_count() > 0);

    const Message* kept = session.find_message(code_id);
    REQUIRE(kept != nullptr);
    REQUIRE_FALSE(kept->compressed);

    bool in_active = false;
    for (const Entity* e : session.active()) {
        const auto* m = std::get_if<Message>(e);
        if (m && m->id == code_id) in_active = true;
    }
    REQUIRE(in_active);
}

TEST_CASE("Eligible spans are oldest first and batched", "[budget]") {
    auto config = scenario_config();
    config.summarize_batch = 3;
    Compressor compressor(config);
    BudgetManager budget(config, compressor);

    Session session("spans");

    SECTION("plain run is capped at the batch size") {
        for (int i = 0; i < 10; ++i) add(session, Role::User, "ordinary message " + std::to_string(i) + " with some words");
        REQUIRE(budget.next_eligible_span(session) == Span{1, 3});
    }

    SECTION("exempt messages break runs") {
        add(session, Role::User, "ordinary message one with some words");
        add(session, Role::User, "```\nexempt code\n```");
        for (int i = 0; i < 6; ++i) add(session, Role::User, "ordinary message " + std::to_string(i) + " with some words");

        REQUIRE(budget.next_eligible_span(session) == Span{1, 1});
        REQUIRE(compressor.compress(session, Span{1, 1}).has_value());
        REQUIRE(budget.next_eligible_span(session) == Span{3, 5});
    }

    SECTION("nothing outside the recent window") {
        add(session, Role::User, "ordinary message one with some words");
        add(session, Role::User, "ordinary message two with some words");
        REQUIRE_FALSE(budget.next_eligible_span(session).has_value());
    }
}
