#include <catch2/catch.hpp>
#include "chunker.hpp"
#include "encoding.hpp"
#include "errors.hpp"

static std::string sample_text() {
    std::string s;
    for (int i = 0; i < 40; ++i) s += "Sentence number " + std::to_string(i) + " talks about something. ";
    return s;
}

TEST_CASE("chunking is deterministic with increasing starts and bounded sizes", "[chunker]") {
    auto text = sample_text();
    auto a = chunk_text(text, 100, 30);
    auto b = chunk_text(text, 100, 30);
    REQUIRE(a.size() == b.size());
    REQUIRE(a.size() > 1);
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].text == b[i].text);
        CHECK(a[i].start == b[i].start);
        CHECK(a[i].sequence_index == (int)i);
        CHECK(a[i].text.size() <= 100);
        CHECK(a[i].overlap == 30);
        if (i > 0) CHECK(a[i].start > a[i - 1].start);
    }
    CHECK(a.back().end == text.size());
}

TEST_CASE("windows advance by chunk_size - overlap", "[chunker]") {
    std::string text(250, 'x');
    auto chunks = chunk_text(text, 100, 20);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].start == 0);
    CHECK(chunks[1].start == 80);
    CHECK(chunks[2].start == 160);
    CHECK(chunks[2].end == 250);
    CHECK(chunks[2].text.size() == 90);
}

TEST_CASE("non-overlapping regions reconstruct the text", "[chunker]") {
    auto text = sample_text();
    auto chunks = chunk_text(text, 97, 13);
    std::string rebuilt;
    for (size_t i = 0; i < chunks.size(); ++i) {
        size_t next = i + 1 < chunks.size() ? chunks[i + 1].start : chunks[i].end;
        rebuilt += text.substr(chunks[i].start, next - chunks[i].start);
    }
    CHECK(rebuilt == text);
}

TEST_CASE("the final short chunk is kept", "[chunker]") {
    auto chunks = chunk_text("abcdefghijk", 5, 0);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[2].text == "k");
}

TEST_CASE("empty text yields no chunks", "[chunker]") {
    CHECK(chunk_text("", 10, 2).empty());
}

TEST_CASE("invalid chunk configuration is rejected", "[chunker]") {
    CHECK_THROWS_AS(chunk_text("abc", 0, 0), InvalidChunkConfigError);
    CHECK_THROWS_AS(chunk_text("abc", 10, 10), InvalidChunkConfigError);
    CHECK_THROWS_AS(chunk_text("abc", 10, -1), InvalidChunkConfigError);
    CHECK_THROWS_AS(validate_chunk_config(5, 7), InvalidChunkConfigError);
    CHECK_NOTHROW(validate_chunk_config(5, 4));
}

TEST_CASE("boundaries never split a UTF-8 sequence", "[chunker]") {
    std::string text;
    for (int i = 0; i < 30; ++i) text += "h\xC3\xA9llo w\xC3\xB6rld \xE2\x82\xAC ";
    auto chunks = chunk_text(text, 7, 2);
    REQUIRE_FALSE(chunks.empty());
    for (const auto& c : chunks) {
        CHECK(is_valid_utf8(c.text));
        CHECK(c.text.size() <= 7);
    }
    CHECK(chunks.back().end == text.size());
}

TEST_CASE("a window smaller than one code point still makes progress", "[chunker]") {
    std::string text = "\xE2\x82\xAC\xE2\x82\xAC"; // two 3-byte euro signs
    auto chunks = chunk_text(text, 1, 0);
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0].text == "\xE2\x82\xAC");
    CHECK(chunks[1].text == "\xE2\x82\xAC");
}

TEST_CASE("chunks carry the page of their start offset", "[chunker]") {
    auto doc = extract_text(std::string(50, 'a') + "\f" + std::string(50, 'b'), DocumentFormat::paged);
    auto chunks = chunk_text(doc, 20, 0);
    REQUIRE(chunks.size() == 6);
    CHECK(chunks.front().page == 1);
    CHECK(chunks[2].page == 1);  // starts at 40
    CHECK(chunks[3].page == 2);  // starts at 60
    CHECK(chunks.back().page == 2);
}
