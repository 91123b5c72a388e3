#include <catch2/catch_test_macros.hpp>
#include "mnemo/memory/session.hpp"

using namespace mnemo::core;
using mnemo::memory::Session;

namespace {

Summary make_summary(const std::string& text) {
    Summary s;
    s.text = text;
    s.token_estimate = 1;
    s.created_at = now();
    return s;
}

}  // namespace

TEST_CASE("Append assigns ids and estimates", "[session]") {
    Session session("demo", "test-model");

    const auto& first = session.append(Role::User, std::string(40, 'a'), 0.3);
    REQUIRE(first.id == 1);
    REQUIRE(first.token_estimate == 10);
    REQUIRE_FALSE(first.compressed);

    const auto& second = session.append(Role::Assistant, "reply about kafka partitions", 0.3);
    REQUIRE(second.id == 2);

    REQUIRE(session.message_count() == 2);
    REQUIRE(session.active_size() == 2);
    REQUIRE(session.next_id() == 3);
    REQUIRE(session.index().contains(2));
    REQUIRE(session.name() == "demo");
    REQUIRE(session.model() == "test-model");
}

TEST_CASE("Fold places the summary at the span position", "[session]") {
    Session session("demo");
    for (int i = 0; i < 5; ++i) {
        session.append(Role::User, "message number " + std::to_string(i + 1), 0.3);
    }
    int before = session.active_tokens();

    auto result = session.fold(Span{2, 3}, make_summary("two and three"));
    REQUIRE(result.is_ok());

    REQUIRE(session.message_count() == 5);
    REQUIRE(session.summary_count() == 1);
    REQUIRE(session.active_size() == 4);
    REQUIRE(session.active_tokens() < before);

    auto active = session.active();
    REQUIRE(std::get<Message>(*active[0]).id == 1);
    const auto& summary = std::get<Summary>(*active[1]);
    REQUIRE(summary.first_id == 2);
    REQUIRE(summary.last_id == 3);
    REQUIRE(std::get<Message>(*active[2]).id == 4);

    REQUIRE(session.find_message(2)->compressed);
    REQUIRE(session.find_message(3)->compressed);
    REQUIRE_FALSE(session.find_message(4)->compressed);
}

TEST_CASE("Fold rejects spans that are not active runs", "[session]") {
    Session session("demo");
    for (int i = 0; i < 4; ++i) {
        session.append(Role::User, "entry " + std::to_string(i + 1), 0.3);
    }
    REQUIRE(session.fold(Span{1, 2}, make_summary("one and two")).is_ok());

    SECTION("already compressed") {
        auto result = session.fold(Span{2, 3}, make_summary("again"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::SpanNotEligible);
    }

    SECTION("unknown start") {
        REQUIRE(session.fold(Span{42, 43}, make_summary("nothing")).is_err());
    }

    SECTION("past the end") {
        REQUIRE(session.fold(Span{4, 6}, make_summary("too far")).is_err());
    }

    REQUIRE(session.summary_count() == 1);
    REQUIRE(session.active_size() == 3);
}

TEST_CASE("Compressed messages stay indexed", "[session]") {
    Session session("demo");
    session.append(Role::User, "the flamingo protocol handshake", 0.3);
    session.append(Role::User, "unrelated chatter about lunch", 0.3);
    REQUIRE(session.fold(Span{1, 1}, make_summary("handshake")).is_ok());

    auto hits = session.index().query("flamingo", 5);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].id == 1);
}

TEST_CASE("Restore re-derives the index and ids", "[session]") {
    Message a;
    a.id = 3;
    a.role = Role::User;
    a.content = "gradient checkpointing";
    Message b;
    b.id = 7;
    b.role = Role::Assistant;
    b.content = "mixed precision";

    auto session = Session::restore("restored", now(), "", {Entity{a}, Entity{b}});

    REQUIRE(session.next_id() == 8);
    REQUIRE(session.index().document_count() == 2);
    REQUIRE(session.append(Role::User, "next", 0.1).id == 8);
}
