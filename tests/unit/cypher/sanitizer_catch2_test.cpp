#include <catch2/catch_test_macros.hpp>

#include <neograph/cypher/sanitizer.h>

using namespace neograph::cypher;

TEST_CASE("Sanitizer: removes every forbidden character", "[unit][cypher][sanitizer]") {
    CHECK(sanitize("Alice`) DETACH DELETE n; //") == "Alice DETACH DELETE n ");
    CHECK(sanitize("{name}") == "name");
    CHECK(sanitize("a/b;c`d(e)f{g}h") == "abcdefgh");
    CHECK(sanitize("`;/(){}") == "");
}

TEST_CASE("Sanitizer: keeps everything else", "[unit][cypher][sanitizer]") {
    CHECK(sanitize("") == "");
    CHECK(sanitize("Mary-Jane Watson") == "Mary-Jane Watson");
    CHECK(sanitize("O'Brien") == "O'Brien");
    CHECK(sanitize("Zo\xC3\xAB") == "Zo\xC3\xAB");
    CHECK(sanitize("tab\there") == "tab\there");
    CHECK(sanitize("[x]:<y>") == "[x]:<y>");
}

TEST_CASE("Sanitizer: is idempotent", "[unit][cypher][sanitizer]") {
    const char* inputs[] = {"", "plain", "x`y", "(((nested)))", "{a: 1}; MATCH (n)", "/*c*/"};
    for (const auto* input : inputs) {
        auto once = sanitize(input);
        CHECK(sanitize(once) == once);
        CHECK(isSanitized(once));
    }
}

TEST_CASE("Sanitizer: isSanitized detects forbidden characters", "[unit][cypher][sanitizer]") {
    CHECK(isSanitized("Person"));
    CHECK(isSanitized(""));
    CHECK_FALSE(isSanitized("Per(son"));
    CHECK_FALSE(isSanitized("x;"));
}

TEST_CASE("Sanitizer: sanitizeAll preserves order", "[unit][cypher][sanitizer]") {
    std::string label = "Per;son";
    auto [a, b, c] = sanitizeAll(label, "Al(ice)", std::string_view("{ok}"));
    CHECK(a == "Person");
    CHECK(b == "Alice");
    CHECK(c == "ok");
}
