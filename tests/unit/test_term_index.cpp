#include <catch2/catch_test_macros.hpp>
#include "mnemo/memory/term_index.hpp"

#include <algorithm>
#include <set>

using namespace mnemo::core;
using mnemo::memory::TermIndex;

namespace {

bool has_term(const std::vector<std::string>& terms, const std::string& term) {
    return std::find(terms.begin(), terms.end(), term) != terms.end();
}

}  // namespace

TEST_CASE("Tokenizer folds case and drops stop words", "[index]") {
    auto terms = TermIndex::tokenize("The Parser is FAST, and the lexer was slow!");

    REQUIRE(has_term(terms, "parser"));
    REQUIRE(has_term(terms, "fast"));
    REQUIRE(has_term(terms, "lexer"));
    REQUIRE_FALSE(has_term(terms, "the"));
    REQUIRE_FALSE(has_term(terms, "and"));
    REQUIRE_FALSE(has_term(terms, "Parser"));
}

TEST_CASE("Tokenizer splits identifiers", "[index]") {
    auto terms = TermIndex::tokenize("call parseHttpRequest then token_budget");

    REQUIRE(has_term(terms, "parsehttprequest"));
    REQUIRE(has_term(terms, "parse"));
    REQUIRE(has_term(terms, "http"));
    REQUIRE(has_term(terms, "request"));
    REQUIRE(has_term(terms, "token_budget"));
    REQUIRE(has_term(terms, "token"));
    REQUIRE(has_term(terms, "budget"));
}

TEST_CASE("Index add and counters", "[index]") {
    TermIndex index;

    REQUIRE(index.add(1, "sqlite database migration"));
    REQUIRE(index.add(2, "database backup schedule"));
    REQUIRE_FALSE(index.add(1, "something else entirely"));

    REQUIRE(index.document_count() == 2);
    REQUIRE(index.contains(1));
    REQUIRE_FALSE(index.contains(3));
    REQUIRE(index.term_count() == 5);
    REQUIRE(index.query("entirely", 5).empty());
}

TEST_CASE("Query ranks the closest document first", "[index]") {
    TermIndex index;
    index.add(1, "postgres connection pool settings");
    index.add(2, "the rocket launch window opens at dawn");
    index.add(3, "connection pool exhausted under load");

    auto hits = index.query("connection pool", 10);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].score >= hits[1].score);

    std::set<MessageId> ids;
    for (const auto& hit : hits) ids.insert(hit.id);
    REQUIRE(ids == std::set<MessageId>{1, 3});

    auto launch = index.query("rocket launch", 10);
    REQUIRE(launch.size() == 1);
    REQUIRE(launch[0].id == 2);
    REQUIRE(launch[0].score > 0.0);
}

TEST_CASE("Query ties go to the newer message", "[index]") {
    TermIndex index;
    index.add(4, "retry budget");
    index.add(9, "retry budget");
    index.add(6, "retry budget");

    auto hits = index.query("retry budget", 3);
    REQUIRE(hits.size() == 3);
    REQUIRE(hits[0].id == 9);
    REQUIRE(hits[1].id == 6);
    REQUIRE(hits[2].id == 4);
}

TEST_CASE("Query is deterministic and bounded by k", "[index]") {
    TermIndex index;
    for (MessageId id = 1; id <= 20; ++id) {
        index.add(id, "cache eviction policy number " + std::to_string(id % 4));
    }

    auto first = index.query("cache eviction", 5);
    auto second = index.query("cache eviction", 5);
    REQUIRE(first.size() == 5);
    REQUIRE(first == second);

    REQUIRE(index.query("cache eviction", 0).empty());
    REQUIRE(index.query("the and of", 5).empty());
    REQUIRE(index.query("unrelated", 5).empty());
}

TEST_CASE("Rebuild replays messages", "[index]") {
    TermIndex index;
    index.add(1, "stale entry");

    Message a;
    a.id = 5;
    a.content = "websocket reconnect";
    Message b;
    b.id = 6;
    b.content = "websocket heartbeat";

    index.rebuild({a, b});

    REQUIRE(index.document_count() == 2);
    REQUIRE_FALSE(index.contains(1));
    REQUIRE(index.query("stale", 5).empty());
    REQUIRE(index.query("websocket", 5).size() == 2);

    index.clear();
    REQUIRE(index.document_count() == 0);
    REQUIRE(index.term_count() == 0);
}
