#include <catch2/catch_test_macros.hpp>
#include "context_window.hpp"

using namespace memora;

static Message msg(Role role, const std::string& content, const std::string& id = "") {
    Message m;
    m.id = id.empty() ? content.substr(0, 8) : id;
    m.role = role;
    m.content = content;
    return m;
}

static uint32_t non_system_tokens(const std::vector<Message>& history) {
    std::vector<Message> rest;
    for (const auto& m : history) {
        if (m.role != Role::System) rest.push_back(m);
    }
    return estimate_tokens(rest);
}

// ── estimate_tokens ─────────────────────────────────────────────

TEST_CASE("estimate_tokens: total characters over four", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::User, std::string(6, 'a')),
        msg(Role::Assistant, std::string(6, 'b')),
    };
    REQUIRE(estimate_tokens(history) == 3);
    REQUIRE(estimate_tokens(std::vector<Message>{}) == 0);
}

// ── truncate_history ────────────────────────────────────────────

TEST_CASE("truncate_history: keeps the newest suffix that fits", "[context_window]") {
    std::vector<Message> history;
    for (int i = 0; i < 5; i++) {
        history.push_back(msg(Role::User, std::string(100, static_cast<char>('a' + i)),
                              "m" + std::to_string(i)));
    }

    auto kept = truncate_history(history, 40);
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].id == "m4");

    kept = truncate_history(history, 75);
    REQUIRE(kept.size() == 3);
    REQUIRE(kept[0].id == "m2");
    REQUIRE(kept[1].id == "m3");
    REQUIRE(kept[2].id == "m4");
}

TEST_CASE("truncate_history: system messages always kept in place", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::System, std::string(40, 's'), "sys"),
        msg(Role::User, std::string(40, 'a'), "u1"),
        msg(Role::Assistant, std::string(40, 'b'), "a1"),
        msg(Role::User, std::string(40, 'c'), "u2"),
    };

    // 30 budget - 10 system = 20 for the rest: two messages of 10
    auto kept = truncate_history(history, 30);
    REQUIRE(kept.size() == 3);
    REQUIRE(kept[0].id == "sys");
    REQUIRE(kept[0].content == std::string(40, 's'));
    REQUIRE(kept[1].id == "a1");
    REQUIRE(kept[2].id == "u2");
    REQUIRE(non_system_tokens(kept) <= 30 - 10);
}

TEST_CASE("truncate_history: stops at the first message that does not fit", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::User, std::string(8, 'a'), "small_old"),
        msg(Role::User, std::string(400, 'b'), "big"),
        msg(Role::User, std::string(8, 'c'), "small_new"),
    };
    auto kept = truncate_history(history, 20);
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].id == "small_new");
}

TEST_CASE("truncate_history: oversized single message is dropped", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::System, "be brief", "sys"),
        msg(Role::User, std::string(1000, 'x'), "only"),
    };
    auto kept = truncate_history(history, 10);
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].id == "sys");
    REQUIRE(estimate_tokens(kept) <= 10);
}

TEST_CASE("truncate_history: mid-history system message keeps its position", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::System, std::string(20, 's'), "sys"),
        msg(Role::User, std::string(40, 'a'), "u1"),
        msg(Role::User, std::string(40, 'b'), "u2"),
        msg(Role::System, std::string(20, 't'), "sys2"),
        msg(Role::User, std::string(40, 'c'), "u3"),
    };

    // 120 characters: both system messages plus u3 and u2
    auto kept = truncate_history(history, 30);
    REQUIRE(kept.size() == 4);
    REQUIRE(kept[0].id == "sys");
    REQUIRE(kept[1].id == "u2");
    REQUIRE(kept[2].id == "sys2");
    REQUIRE(kept[3].id == "u3");
}

TEST_CASE("truncate_history: estimate of the result stays within budget", "[context_window]") {
    // 103 chars is 25 tokens alone, but four of them estimate to 103
    std::vector<Message> history;
    for (int i = 0; i < 5; i++) {
        history.push_back(msg(Role::User, std::string(103, 'x'), "m" + std::to_string(i)));
    }

    auto kept = truncate_history(history, 100);
    REQUIRE(kept.size() == 3);
    REQUIRE(kept.front().id == "m2");
    REQUIRE(estimate_tokens(kept) <= 100);
}

TEST_CASE("truncate_history: system larger than budget drops all others", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::System, std::string(200, 's'), "sys"),
        msg(Role::User, "hello there", "u1"),
        msg(Role::User, "and again", "u2"),
    };
    auto kept = truncate_history(history, 10);
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].id == "sys");
}

// ── manage_context_window ───────────────────────────────────────

TEST_CASE("manage_context_window: no-op under budget", "[context_window]") {
    std::vector<Message> history = {
        msg(Role::User, "short", "u1"),
        msg(Role::Assistant, "reply", "a1"),
    };
    REQUIRE(manage_context_window(history, 3000) == 0);
    REQUIRE(history.size() == 2);
}

TEST_CASE("manage_context_window: reports dropped count", "[context_window]") {
    std::vector<Message> history;
    for (int i = 0; i < 10; i++) {
        history.push_back(msg(Role::User, std::string(40, 'a'), "m" + std::to_string(i)));
    }
    REQUIRE(manage_context_window(history, 30) == 7);
    REQUIRE(history.size() == 3);
    REQUIRE(history.front().id == "m7");
    REQUIRE(history.back().id == "m9");
}
