#include <catch2/catch.hpp>
#include "errors.hpp"
#include "fakes.hpp"
#include "rag.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace {

// Three 100-byte paragraphs; with chunk_size 100 and no overlap each is one chunk.
std::string three_chunk_document() {
    return pad_to("Lions hunt on the savanna. The lion is a big cat.", 100) +
           pad_to("Zebra stripes are unique. Each zebra has its own stripes pattern.", 100) +
           pad_to("The whale lives in the ocean. Ocean whale songs travel far.", 100);
}

IngestRequest text_request(std::string bytes, const std::string& filename = "animals.txt") {
    IngestRequest req;
    req.bytes = std::move(bytes);
    req.filename = filename;
    req.chunk_size = 100;
    req.chunk_overlap = 0;
    return req;
}

QueryRequest ask(const std::string& question, std::optional<std::string> session = std::nullopt) {
    QueryRequest q;
    q.question = question;
    q.session_id = std::move(session);
    return q;
}

bool wait_for_status(RagService& svc, const std::string& id, ProcessingStatus want) {
    for (int i = 0; i < 500; ++i) {
        if (svc.status(id) == want) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

struct ServiceFixture {
    TempDir dir;
    std::shared_ptr<KeywordEmbedder> embedder = std::make_shared<KeywordEmbedder>();
    std::shared_ptr<ScriptedGenerator> generator =
        std::make_shared<ScriptedGenerator>(std::vector<std::string>{"Each zebra has ", "unique stripes [1]."});
    ServiceConfig cfg = test_config(dir.str());

    std::unique_ptr<RagService> start() {
        auto svc = std::make_unique<RagService>(cfg, embedder, generator);
        svc->init();
        return svc;
    }
};

}

TEST_CASE("end to end: the answer is grounded in the one matching chunk", "[service][e2e]") {
    ServiceFixture f;
    auto svc = f.start();
    auto receipt = svc->ingest(text_request(three_chunk_document()));
    CHECK(receipt.queued);
    svc->wait_for_ingestion();
    REQUIRE(svc->status(receipt.document_id) == ProcessingStatus::ready);
    auto detail = svc->document(receipt.document_id);
    REQUIRE(detail.chunks.size() == 3);
    CHECK(detail.document.chunk_count == 3);
    CHECK(detail.document.encoding == "UTF-8");

    auto hit = svc->query(ask("Tell me about zebra stripes"));
    CHECK(hit.found);
    REQUIRE(hit.sources.size() == 1);
    CHECK(hit.sources[0].document_id == receipt.document_id);
    CHECK(hit.sources[0].chunk_id == receipt.document_id + ":1");
    CHECK(hit.sources[0].filename == "animals.txt");
    CHECK(hit.answer == "Each zebra has unique stripes [1].");
    CHECK(f.generator->calls == 1);
    auto prompt = f.generator->last_prompt();
    CHECK(prompt.user.find("Zebra stripes are unique.") != std::string::npos);
    CHECK(prompt.user.find("Lions hunt") == std::string::npos);

    auto miss = svc->query(ask("What is quantum chromodynamics?"));
    CHECK_FALSE(miss.found);
    CHECK(miss.sources.empty());
    CHECK(miss.confidence == 0.0);
    CHECK(hit.confidence > miss.confidence);
    CHECK(f.generator->calls == 1);

    auto s = svc->stats();
    CHECK(s.document_count == 1);
    CHECK(s.ready_document_count == 1);
    CHECK(s.chunk_count == 3);
    CHECK(s.index_size == 3);
    CHECK(s.dimension == KeywordEmbedder::dimension());
    CHECK(s.total_queries == 2);
    svc->shutdown();
}

TEST_CASE("concurrent ingestion of the same document is coalesced", "[service][concurrency]") {
    ServiceFixture f;
    auto svc = f.start();
    f.embedder->hold();
    std::vector<std::thread> threads;
    std::vector<IngestReceipt> receipts(8);
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]{ receipts[(size_t)i] = svc->ingest(text_request(three_chunk_document())); });
    }
    for (auto& t : threads) t.join();
    f.embedder->release();
    svc->wait_for_ingestion();

    int queued = 0;
    for (const auto& r : receipts) {
        CHECK(r.document_id == receipts[0].document_id);
        if (r.queued) ++queued;
    }
    CHECK(queued == 1);
    CHECK(svc->stats().index_size == 3);
    CHECK(f.embedder->texts_seen == 3);

    // A ready document is not ingested again.
    auto again = svc->ingest(text_request(three_chunk_document()));
    CHECK_FALSE(again.queued);
    CHECK(again.status == ProcessingStatus::ready);
    CHECK(svc->stats().index_size == 3);
}

TEST_CASE("documents ingest in parallel and failures stay isolated", "[service]") {
    ServiceFixture f;
    auto svc = f.start();
    auto good = svc->ingest(text_request("The glacier sits on the mountain.", "ice.txt"));
    IngestRequest bad;
    bad.bytes = "this is not a zip container";
    bad.filename = "broken.docx";
    auto broken = svc->ingest(std::move(bad));
    auto empty = svc->ingest(text_request("", "empty.txt"));
    svc->wait_for_ingestion();

    CHECK(svc->status(good.document_id) == ProcessingStatus::ready);
    CHECK(svc->status(broken.document_id) == ProcessingStatus::failed);
    CHECK_FALSE(svc->document(broken.document_id).document.error.empty());
    CHECK(svc->status(empty.document_id) == ProcessingStatus::ready);
    CHECK(svc->document(empty.document_id).document.chunk_count == 0);

    auto res = svc->query(ask("How big is the glacier on the mountain?"));
    CHECK(res.found);
}

TEST_CASE("embedding failures mark only that document failed", "[service]") {
    ServiceFixture f;
    f.cfg.ingest_workers = 1;
    auto svc = f.start();
    f.embedder->fail_next(std::make_exception_ptr(UpstreamError("unauthorized", false, 401)));
    auto first = svc->ingest(text_request("zebra zebra", "a.txt"));
    svc->wait_for_ingestion();
    auto second = svc->ingest(text_request("whale whale", "b.txt"));
    svc->wait_for_ingestion();
    CHECK(svc->status(first.document_id) == ProcessingStatus::failed);
    CHECK(svc->document(first.document_id).document.error.find("unauthorized") != std::string::npos);
    CHECK(svc->status(second.document_id) == ProcessingStatus::ready);
    CHECK(svc->stats().index_size == 1);

    // A failed document can be ingested again.
    auto retry = svc->ingest(text_request("zebra zebra", "a.txt"));
    CHECK(retry.queued);
    svc->wait_for_ingestion();
    CHECK(svc->status(first.document_id) == ProcessingStatus::ready);
}

TEST_CASE("ingestion requests are validated up front", "[service]") {
    ServiceFixture f;
    f.cfg.max_file_bytes = 16;
    auto svc = f.start();
    CHECK_THROWS_AS(svc->ingest(text_request(std::string(17, 'x'))), ValidationError);
    CHECK_THROWS_AS(svc->ingest(text_request("hello", "picture.png")), UnsupportedFormatError);
    auto req = text_request("hello");
    req.chunk_overlap = 100;
    CHECK_THROWS_AS(svc->ingest(req), InvalidChunkConfigError);
    CHECK(svc->list_documents(10, 0).total == 0);
}

TEST_CASE("deleting a document removes it from search", "[service]") {
    ServiceFixture f;
    auto svc = f.start();
    auto r = svc->ingest(text_request(three_chunk_document()));
    svc->wait_for_ingestion();
    CHECK(svc->query(ask("zebra stripes")).found);

    CHECK(svc->remove(r.document_id));
    CHECK_FALSE(svc->remove(r.document_id));
    CHECK_THROWS_AS(svc->status(r.document_id), DocumentNotFoundError);
    CHECK(svc->stats().index_size == 0);
    for (const auto& q : {"zebra stripes", "lion savanna", "ocean whale"}) {
        auto res = svc->query(ask(q));
        CHECK_FALSE(res.found);
        CHECK(res.sources.empty());
    }
}

TEST_CASE("deleting a document mid-ingestion leaves nothing behind", "[service][concurrency]") {
    ServiceFixture f;
    auto svc = f.start();
    f.embedder->hold();
    auto r = svc->ingest(text_request(three_chunk_document()));
    REQUIRE(wait_for_status(*svc, r.document_id, ProcessingStatus::processing));
    CHECK(svc->remove(r.document_id));
    f.embedder->release();
    svc->wait_for_ingestion();
    CHECK(svc->stats().index_size == 0);
    CHECK(svc->stats().document_count == 0);
    CHECK_THROWS_AS(svc->document(r.document_id), DocumentNotFoundError);
}

TEST_CASE("state survives a restart", "[service][persist]") {
    ServiceFixture f;
    std::string id;
    {
        auto svc = f.start();
        id = svc->ingest(text_request(three_chunk_document())).document_id;
        svc->wait_for_ingestion();
        svc->shutdown();
    }
    auto svc = f.start();
    CHECK(svc->status(id) == ProcessingStatus::ready);
    CHECK(svc->stats().index_size == 3);
    auto page = svc->list_documents(10, 0);
    REQUIRE(page.items.size() == 1);
    CHECK(page.items[0].filename == "animals.txt");
    auto res = svc->query(ask("zebra stripes"));
    REQUIRE(res.found);
    CHECK(res.sources[0].chunk_id == id + ":1");
}

TEST_CASE("a failed write after commit keeps the document ready", "[service][persist]") {
    ServiceFixture f;
    auto svc = f.start();
    // A non-empty directory where index.bin belongs makes the atomic rename fail.
    auto blocker = f.dir.path() / "index.bin";
    std::filesystem::create_directories(blocker / "occupied");
    auto r = svc->ingest(text_request(three_chunk_document()));
    svc->wait_for_ingestion();
    CHECK(svc->status(r.document_id) == ProcessingStatus::ready);
    CHECK(svc->document(r.document_id).document.error.empty());
    CHECK(svc->query(ask("zebra stripes")).found);

    CHECK(svc->remove(r.document_id));
    CHECK(svc->stats().index_size == 0);

    std::filesystem::remove_all(blocker);
    svc->shutdown();
    CHECK(std::filesystem::is_regular_file(blocker));
}

TEST_CASE("a corrupt index store starts empty and flags affected documents", "[service][persist]") {
    ServiceFixture f;
    std::string id;
    {
        auto svc = f.start();
        id = svc->ingest(text_request(three_chunk_document())).document_id;
        svc->wait_for_ingestion();
        svc->shutdown();
    }
    std::ofstream(f.dir.path() / "index.bin", std::ios::binary | std::ios::trunc) << "junk";
    auto svc = f.start();
    CHECK(svc->running());
    CHECK(svc->stats().index_size == 0);
    CHECK(svc->status(id) == ProcessingStatus::failed);
    CHECK_FALSE(svc->query(ask("zebra stripes")).found);
}

TEST_CASE("shutdown interrupts in-flight ingestion", "[service][concurrency]") {
    ServiceFixture f;
    auto svc = f.start();
    f.embedder->hold();
    auto r = svc->ingest(text_request(three_chunk_document()));
    REQUIRE(wait_for_status(*svc, r.document_id, ProcessingStatus::processing));
    svc->shutdown();
    CHECK_FALSE(svc->running());
    CHECK(svc->status(r.document_id) == ProcessingStatus::failed);
    CHECK(svc->document(r.document_id).document.error == "interrupted by shutdown");
}

TEST_CASE("queries are validated before any work", "[service]") {
    ServiceFixture f;
    auto svc = f.start();
    CHECK_THROWS_AS(svc->query(ask("")), InvalidQueryError);
    CHECK_THROWS_AS(svc->query(ask("   ")), InvalidQueryError);
    CHECK_THROWS_AS(svc->query(ask(std::string(1001, 'q'))), InvalidQueryError);
    auto q = ask("zebra");
    q.k = 0;
    CHECK_THROWS_AS(svc->query(q), InvalidQueryError);
    q.k = 21;
    CHECK_THROWS_AS(svc->query(q), InvalidQueryError);
    q.k = 3;
    q.context_budget = 0;
    CHECK_THROWS_AS(svc->query(q), InvalidQueryError);
    CHECK(f.embedder->calls == 0);
}

TEST_CASE("queries record bounded session history", "[service][session]") {
    ServiceFixture f;
    f.cfg.session.max_messages = 4;
    auto svc = f.start();
    svc->ingest(text_request(three_chunk_document()));
    svc->wait_for_ingestion();

    auto first = svc->query(ask("zebra stripes"));
    CHECK(first.session_id.size() == 32);
    auto h = svc->session_history(first.session_id, 10, 0);
    REQUIRE(h.size() == 2);
    CHECK(h[0].role == "user");
    CHECK(h[0].text == "zebra stripes");
    CHECK(h[1].role == "assistant");

    svc->query(ask("and the ocean whale?", first.session_id));
    svc->query(ask("what about it?", first.session_id));
    h = svc->session_history(first.session_id, 10, 0);
    REQUIRE(h.size() == 4);
    CHECK(h[0].text == "and the ocean whale?");
    CHECK(svc->session_history(first.session_id, 1, 0).size() == 1);

    // Prior turns reach the prompt.
    CHECK(f.generator->last_prompt().user.find("Conversation so far:") != std::string::npos);

    auto named = svc->query(ask("zebra", std::string("client-chosen")));
    CHECK(named.session_id == "client-chosen");
    CHECK(svc->list_sessions().size() == 2);
    CHECK(svc->delete_session("client-chosen"));
    CHECK_THROWS_AS(svc->session_history("client-chosen", 5, 0), SessionNotFoundError);
}

TEST_CASE("generation failures abort only the query", "[service]") {
    ServiceFixture f;
    auto svc = f.start();
    svc->ingest(text_request(three_chunk_document()));
    svc->wait_for_ingestion();
    f.generator->fail_next(std::make_exception_ptr(UpstreamError("model missing", false, 404)));
    CHECK_THROWS_AS(svc->query(ask("zebra stripes")), AnswerGenerationError);
    CHECK(svc->stats().index_size == 3);
    CHECK(svc->query(ask("zebra stripes")).found);
}

TEST_CASE("a cancelled query stops before any backend call", "[service]") {
    ServiceFixture f;
    auto svc = f.start();
    svc->ingest(text_request(three_chunk_document()));
    svc->wait_for_ingestion();
    int embeds = f.embedder->calls;

    auto q = ask("zebra stripes");
    q.token.cancel();
    CHECK_THROWS_AS(svc->query(q), CancelledError);
    CHECK(f.embedder->calls == embeds);
    CHECK(f.generator->calls == 0);
}

TEST_CASE("answers can be rated and the ratings survive a restart", "[service][feedback]") {
    ServiceFixture f;
    std::string answer_id;
    {
        auto svc = f.start();
        svc->ingest(text_request(three_chunk_document()));
        svc->wait_for_ingestion();
        answer_id = svc->query(ask("zebra stripes")).answer_id;

        FeedbackRequest fb;
        fb.answer_id = answer_id;
        fb.rating = 4;
        fb.comment = "close enough";
        CHECK_FALSE(svc->submit_feedback(fb).empty());
        fb.rating = 2;
        fb.comment.reset();
        svc->submit_feedback(fb);

        fb.rating = 0;
        CHECK_THROWS_AS(svc->submit_feedback(fb), ValidationError);
        fb.rating = 6;
        CHECK_THROWS_AS(svc->submit_feedback(fb), ValidationError);
        fb.rating = 3;
        fb.comment = std::string(1001, 'x');
        CHECK_THROWS_AS(svc->submit_feedback(fb), ValidationError);
        fb.comment = std::string(1000, 'x');
        svc->submit_feedback(fb);

        FeedbackRequest unknown;
        unknown.answer_id = "no-such-answer";
        unknown.rating = 5;
        CHECK_THROWS_AS(svc->submit_feedback(unknown), AnswerNotFoundError);
        CHECK_THROWS_AS(svc->feedback("no-such-answer"), AnswerNotFoundError);
        svc->shutdown();
    }
    auto svc = f.start();
    auto rows = svc->feedback(answer_id);
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].rating == 4);
    CHECK(rows[0].comment == "close enough");
    CHECK(rows[1].rating == 2);
    CHECK(rows[1].comment.empty());
    CHECK(rows[2].comment.size() == 1000);
}

TEST_CASE("a query can forward its answer as it is generated", "[service]") {
    ServiceFixture f;
    auto svc = f.start();
    std::vector<std::string> seen;
    auto q = ask("anything about glaciers");
    q.on_fragment = [&](const std::string& text){ seen.push_back(text); };
    auto miss = svc->query(q);
    CHECK_FALSE(miss.found);
    CHECK(seen == std::vector<std::string>{miss.answer});

    svc->ingest(text_request(three_chunk_document()));
    svc->wait_for_ingestion();
    seen.clear();
    q.question = "zebra stripes";
    auto hit = svc->query(q);
    CHECK(hit.found);
    CHECK(seen == std::vector<std::string>{"Each zebra has ", "unique stripes [1]."});
}

TEST_CASE("a document URL is ingested and every question answered", "[service][url]") {
    ServiceFixture f;
    auto svc = f.start();
    std::vector<std::string> fetched;
    svc->set_url_fetcher([&](const std::string& url, const CallOptions&) {
        fetched.push_back(url);
        return FetchedDocument{three_chunk_document(), "text/plain; charset=utf-8"};
    });

    auto out = svc->ask_url("https://files.example.com/docs/animals?sig=abc",
                            {"zebra stripes", "   ", "whale ocean"});
    CHECK(fetched == std::vector<std::string>{"https://files.example.com/docs/animals?sig=abc"});
    CHECK(out.filename == "animals");
    CHECK(svc->status(out.document_id) == ProcessingStatus::ready);
    CHECK(svc->document(out.document_id).document.format == "text");
    REQUIRE(out.answers.size() == 3);
    CHECK(out.answers[0].question == "zebra stripes");
    CHECK(out.answers[0].error.empty());
    CHECK(out.answers[0].result.found);
    CHECK(out.answers[0].result.sources[0].chunk_id == out.document_id + ":1");
    CHECK_FALSE(out.answers[1].error.empty());
    CHECK(out.answers[2].error.empty());
    CHECK(out.answers[2].result.found);
    // Batch questions run without a session.
    CHECK(svc->list_sessions().empty());
    CHECK(out.answers[2].result.session_id.empty());
}

TEST_CASE("a URL document that cannot be used fails the whole request", "[service][url]") {
    ServiceFixture f;
    auto svc = f.start();

    CHECK_THROWS_AS(svc->ask_url("ftp://example.com/a.txt", {"q"}), ValidationError);
    CHECK_THROWS_AS(svc->ask_url("https://example.com/a.txt", {}), ValidationError);
    ServiceFixture g;
    g.cfg.max_url_questions = 2;
    auto small = g.start();
    CHECK_THROWS_AS(small->ask_url("https://example.com/a.txt", {"a", "b", "c"}), ValidationError);

    svc->set_url_fetcher([](const std::string& url, const CallOptions&) -> FetchedDocument {
        throw UpstreamError("download of " + url + " failed: status 404", false, 404);
    });
    CHECK_THROWS_AS(svc->ask_url("https://example.com/missing.txt", {"q"}), UpstreamError);

    svc->set_url_fetcher([](const std::string&, const CallOptions&) {
        return FetchedDocument{"%PDF-1.4 truncated", "application/octet-stream"};
    });
    CHECK_THROWS_AS(svc->ask_url("https://example.com/download", {"q"}), DocumentProcessingError);

    svc->set_url_fetcher([](const std::string&, const CallOptions&) {
        return FetchedDocument{"<html></html>", "text/html"};
    });
    CHECK_THROWS_AS(svc->ask_url("https://example.com/page", {"q"}), UnsupportedFormatError);
    CHECK(f.generator->calls == 0);
}
