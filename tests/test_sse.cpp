#include <catch2/catch_test_macros.hpp>
#include "sse.hpp"
#include <vector>

using namespace shellhost;

// Helper: collect all payloads from a single feed
static std::vector<std::string> collect_frames(SSEParser& parser, const std::string& chunk) {
    std::vector<std::string> frames;
    parser.feed(chunk, [&](const std::string& payload) {
        frames.push_back(payload);
        return true;
    });
    return frames;
}

// ── Line parsing ─────────────────────────────────────────────────

TEST_CASE("SSEParser::parse_line: data line yields trimmed payload", "[sse]") {
    REQUIRE(SSEParser::parse_line("data: {\"a\":1}") == std::optional<std::string>("{\"a\":1}"));
    REQUIRE(SSEParser::parse_line("data:no_space") == std::optional<std::string>("no_space"));
    REQUIRE(SSEParser::parse_line("   data:  padded  ") == std::optional<std::string>("padded"));
}

TEST_CASE("SSEParser::parse_line: blank, comment and other fields carry nothing", "[sse]") {
    REQUIRE_FALSE(SSEParser::parse_line(""));
    REQUIRE_FALSE(SSEParser::parse_line("   "));
    REQUIRE_FALSE(SSEParser::parse_line(": keep-alive"));
    REQUIRE_FALSE(SSEParser::parse_line("event: message"));
    REQUIRE_FALSE(SSEParser::parse_line("id: 7"));
}

TEST_CASE("SSEParser::parse_line: end marker is swallowed", "[sse]") {
    REQUIRE_FALSE(SSEParser::parse_line("data: [DONE]"));
    REQUIRE_FALSE(SSEParser::parse_line("data:[DONE]"));
}

TEST_CASE("SSEParser::parse_line: empty data line yields empty payload", "[sse]") {
    auto payload = SSEParser::parse_line("data:");
    REQUIRE(payload.has_value());
    REQUIRE(payload->empty());
}

// ── Framing ──────────────────────────────────────────────────────

TEST_CASE("SSEParser: each data line is its own frame", "[sse]") {
    SSEParser parser;
    auto frames = collect_frames(parser, "data: line1\ndata: line2\n\n");
    REQUIRE(frames == std::vector<std::string>{"line1", "line2"});
}

TEST_CASE("SSEParser: multiple frames in one chunk", "[sse]") {
    SSEParser parser;
    auto frames = collect_frames(parser, "data: first\n\ndata: second\n\n");
    REQUIRE(frames == std::vector<std::string>{"first", "second"});
}

TEST_CASE("SSEParser: comment and event lines are skipped", "[sse]") {
    SSEParser parser;
    auto frames = collect_frames(parser, ": this is a comment\nevent: x\ndata: hello\n\n");
    REQUIRE(frames == std::vector<std::string>{"hello"});
}

TEST_CASE("SSEParser: [DONE] produces no frame", "[sse]") {
    SSEParser parser;
    auto frames = collect_frames(parser, "data: {\"n\":1}\ndata: [DONE]\n");
    REQUIRE(frames == std::vector<std::string>{"{\"n\":1}"});
}

// ── Streaming / chunked delivery ─────────────────────────────────

TEST_CASE("SSEParser: frame split across two chunks", "[sse]") {
    SSEParser parser;

    auto frames1 = collect_frames(parser, "data: hel");
    REQUIRE(frames1.empty());

    auto frames2 = collect_frames(parser, "lo\n");
    REQUIRE(frames2 == std::vector<std::string>{"hello"});
}

TEST_CASE("SSEParser: byte-at-a-time delivery gives the same frames", "[sse]") {
    const std::string stream = "data: {\"a\":1}\r\n: ping\n\ndata: two\ndata: [DONE]\n";

    SSEParser whole;
    auto expected = collect_frames(whole, stream);

    SSEParser split;
    std::vector<std::string> got;
    for (char c : stream) {
        auto frames = collect_frames(split, std::string(1, c));
        got.insert(got.end(), frames.begin(), frames.end());
    }

    REQUIRE(expected == std::vector<std::string>{"{\"a\":1}", "two"});
    REQUIRE(got == expected);
}

TEST_CASE("SSEParser: handles \\r\\n line endings", "[sse]") {
    SSEParser parser;
    auto frames = collect_frames(parser, "data: hello\r\n\r\n");
    REQUIRE(frames == std::vector<std::string>{"hello"});
}

// ── End of stream ────────────────────────────────────────────────

TEST_CASE("SSEParser: flush processes an unterminated last line", "[sse]") {
    SSEParser parser;
    REQUIRE(collect_frames(parser, "data: a\ndata: tail").size() == 1);

    std::vector<std::string> frames;
    parser.flush([&](const std::string& p) { frames.push_back(p); return true; });
    REQUIRE(frames == std::vector<std::string>{"tail"});
}

TEST_CASE("SSEParser: flush of blank remainder emits nothing", "[sse]") {
    SSEParser parser;
    collect_frames(parser, "data: a\n   ");
    int calls = 0;
    parser.flush([&](const std::string&) { calls++; return true; });
    REQUIRE(calls == 0);
}

// ── Callback stopping ────────────────────────────────────────────

TEST_CASE("SSEParser: callback returning false stops parsing", "[sse]") {
    SSEParser parser;
    std::vector<std::string> frames;
    parser.feed("data: first\ndata: second\n", [&](const std::string& p) {
        frames.push_back(p);
        return false; // stop after first frame
    });
    REQUIRE(frames == std::vector<std::string>{"first"});
}

// ── Reset ────────────────────────────────────────────────────────

TEST_CASE("SSEParser: reset clears buffer state", "[sse]") {
    SSEParser parser;
    collect_frames(parser, "data: partial");
    parser.reset();

    auto frames = collect_frames(parser, "data: fresh\n");
    REQUIRE(frames == std::vector<std::string>{"fresh"});
}

TEST_CASE("SSEParser: empty input produces no frames", "[sse]") {
    SSEParser parser;
    REQUIRE(collect_frames(parser, "").empty());
}
