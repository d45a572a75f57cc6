#include <catch2/catch.hpp>
#include "errors.hpp"
#include "generation.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace {

struct Collected {
    std::vector<std::string> fragments;
    FragmentSink sink() { return [this](const std::string& f){ fragments.push_back(f); }; }
    std::string text() const {
        std::string out;
        for (const auto& f : fragments) out += f;
        return out;
    }
};

const std::string kStream =
    "{\"message\":{\"role\":\"assistant\",\"content\":\"Zebras \"},\"done\":false}\n"
    "{\"message\":{\"role\":\"assistant\",\"content\":\"have caf\xC3\xA9 \"},\"done\":false}\n"
    "\n"
    "{\"message\":{\"role\":\"assistant\",\"content\":\"stripes [1].\"},\"done\":false}\r\n"
    "{\"message\":{\"role\":\"assistant\",\"content\":\"\"},\"done\":true,\"eval_count\":12}\n";

}

TEST_CASE("an NDJSON stream is reassembled in order whatever the chunking", "[generation]") {
    for (size_t piece : {size_t(1), size_t(2), size_t(7), size_t(64), kStream.size()}) {
        Collected got;
        NdjsonAssembler stream(got.sink());
        for (size_t i = 0; i < kStream.size(); i += piece) {
            stream.feed(kStream.data() + i, std::min(piece, kStream.size() - i));
        }
        stream.finish();
        CHECK(stream.done());
        CHECK(got.text() == "Zebras have caf\xC3\xA9 stripes [1].");
        CHECK(got.fragments.size() == 3);
    }
}

TEST_CASE("a final line without a newline is still read", "[generation]") {
    Collected got;
    NdjsonAssembler stream(got.sink());
    std::string body = "{\"message\":{\"content\":\"one\"},\"done\":false}\n"
                       "{\"message\":{\"content\":\" two\"},\"done\":true}";
    stream.feed(body.data(), body.size());
    CHECK_FALSE(stream.done());
    stream.finish();
    CHECK(stream.done());
    CHECK(got.text() == "one two");
}

TEST_CASE("a stream that never finishes is a transient failure", "[generation]") {
    Collected got;
    NdjsonAssembler stream(got.sink());
    std::string body = "{\"message\":{\"content\":\"partial\"},\"done\":false}\n";
    stream.feed(body.data(), body.size());
    try {
        stream.finish();
        FAIL("expected an incomplete stream to be rejected");
    } catch (const UpstreamError& e) {
        CHECK(e.transient());
    }
    CHECK(got.text() == "partial");
}

TEST_CASE("errors and garbage in the stream are terminal", "[generation]") {
    Collected got;
    NdjsonAssembler stream(got.sink());
    std::string err = "{\"error\":\"model 'nope' not found\"}\n";
    try {
        stream.feed(err.data(), err.size());
        FAIL("expected the error object to be raised");
    } catch (const UpstreamError& e) {
        CHECK_FALSE(e.transient());
        CHECK(std::string(e.what()).find("not found") != std::string::npos);
    }

    NdjsonAssembler broken(got.sink());
    std::string junk = "{\"message\":{\"content\":\"x\"}\n";
    CHECK_THROWS_AS(broken.feed(junk.data(), junk.size()), UpstreamError);
}

TEST_CASE("a single chat reply forwards its content once", "[generation]") {
    Collected got;
    CHECK(emit_chat_message("{\"message\":{\"role\":\"assistant\",\"content\":\"All of it.\"},\"done\":true}",
                            got.sink()));
    CHECK(got.fragments == std::vector<std::string>{"All of it."});
    CHECK_FALSE(emit_chat_message("{\"done\":false}", got.sink()));
    CHECK(got.fragments.size() == 1);
}
