#include <catch2/catch_test_macros.hpp>
#include "mnemo/context/compressor.hpp"
#include "mnemo/context/recall_engine.hpp"

#include <set>

using namespace mnemo::core;
using mnemo::context::Compressor;
using mnemo::context::RecallEngine;
using mnemo::memory::Session;

namespace {

MemoryConfig memory_config() {
    MemoryConfig config;
    config.token_budget = 100;
    config.keep_recent = 2;
    return config;
}

// Five messages; 1..3 folded into one summary, 4 and 5 active
Session folded_session() {
    Session session("recall");
    session.append(Role::User, "kafka consumer lag on partition seven keeps growing", 0.3);
    session.append(Role::Assistant, "raise the fetch size and check the rebalance logs", 0.3);
    session.append(Role::User, "the flamingo handshake still times out behind the proxy", 0.3);
    session.append(Role::Assistant, "kafka brokers look healthy on the dashboard today", 0.3);
    session.append(Role::User, "what about the grafana alerts for disk usage", 0.3);

    Compressor compressor(memory_config());
    REQUIRE(compressor.compress(session, Span{1, 3}).has_value());
    return session;
}

}  // namespace

TEST_CASE("Summarized messages are still recalled", "[recall]") {
    auto session = folded_session();
    RecallEngine engine(RecallConfig{});

    auto chunks = engine.recall(session, "flamingo handshake");
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].id == 3);
    REQUIRE(chunks[0].role == Role::User);
    REQUIRE(chunks[0].content.find("flamingo") != std::string::npos);
    REQUIRE(chunks[0].tokens == session.find_message(3)->token_estimate);
    REQUIRE(chunks[0].score > 0.0);
}

TEST_CASE("Active messages are not recalled", "[recall]") {
    auto session = folded_session();
    RecallEngine engine(RecallConfig{});

    // Message 4 matches too but is already in the window
    auto chunks = engine.recall(session, "kafka");
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].id == 1);

    REQUIRE(engine.recall(session, "grafana alerts").empty());
}

TEST_CASE("Recall has no duplicates and respects k", "[recall]") {
    auto session = folded_session();
    RecallEngine engine(RecallConfig{});

    auto chunks = engine.recall(session, "kafka partition fetch rebalance flamingo proxy", 2);
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0].score >= chunks[1].score);

    std::set<MessageId> ids;
    for (const auto& c : chunks) ids.insert(c.id);
    REQUIRE(ids.size() == chunks.size());

    REQUIRE(engine.recall(session, "kafka", 0).empty());
}

TEST_CASE("Recall is deterministic", "[recall]") {
    auto session = folded_session();
    RecallEngine engine(RecallConfig{});

    auto first = engine.recall(session, "kafka logs proxy");
    auto second = engine.recall(session, "kafka logs proxy");
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].id == second[i].id);
        REQUIRE(first[i].score == second[i].score);
    }
}

TEST_CASE("Recall stops at the token sub-budget", "[recall]") {
    auto session = folded_session();

    RecallConfig config;
    config.token_budget = session.find_message(1)->token_estimate;
    RecallEngine engine(config);

    auto chunks = engine.recall(session, "kafka partition fetch rebalance flamingo proxy", 3);
    REQUIRE(chunks.size() <= 1);

    int used = 0;
    for (const auto& c : chunks) used += c.tokens;
    REQUIRE(used <= config.token_budget);
}

TEST_CASE("Low scores are dropped", "[recall]") {
    auto session = folded_session();

    RecallConfig config;
    config.min_score = 1000.0;
    RecallEngine engine(config);

    REQUIRE(engine.recall(session, "kafka").empty());
}

TEST_CASE("Recall chunk JSON", "[recall]") {
    auto session = folded_session();
    RecallEngine engine(RecallConfig{});

    auto chunks = engine.recall(session, "flamingo");
    REQUIRE(chunks.size() == 1);

    auto j = chunks[0].to_json();
    REQUIRE(j["id"] == 3);
    REQUIRE(j["role"] == "user");
    REQUIRE(j.contains("score"));
}
