#include <catch2/catch.hpp>
#include "api.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

ApiRequest request(const std::string& method, const std::string& path, std::string body = {},
                   std::map<std::string, std::string> query = {}) {
    ApiRequest r;
    r.method = method;
    r.path = path;
    r.body = std::move(body);
    r.query = std::move(query);
    return r;
}

struct ApiFixture {
    TempDir dir;
    std::shared_ptr<KeywordEmbedder> embedder = std::make_shared<KeywordEmbedder>();
    std::shared_ptr<ScriptedGenerator> generator =
        std::make_shared<ScriptedGenerator>(std::vector<std::string>{"Stripes [1]."});
    RagService svc{test_config(dir.str()), embedder, generator};

    ApiFixture() { svc.init(); }
};

}

TEST_CASE("query bodies are parsed and validated", "[api]") {
    auto q = parse_query_request(R"({"question":"why stripes?","k":3,"context_budget":500,"session_id":"s1"})");
    CHECK(q.question == "why stripes?");
    CHECK(q.k == 3);
    CHECK(q.context_budget == 500);
    CHECK(q.session_id == std::string("s1"));

    auto bare = parse_query_request(R"({"question":"hi","session_id":null})");
    CHECK_FALSE(bare.k);
    CHECK_FALSE(bare.session_id);

    CHECK_THROWS_AS(parse_query_request("not json"), ValidationError);
    CHECK_THROWS_AS(parse_query_request("[1,2]"), ValidationError);
    CHECK_THROWS_AS(parse_query_request(R"({"k":3})"), InvalidQueryError);
    CHECK_THROWS_AS(parse_query_request(R"({"question":""})"), InvalidQueryError);
    CHECK_THROWS_AS(parse_query_request(R"({"question":"q","k":0})"), InvalidQueryError);
    CHECK_THROWS_AS(parse_query_request(R"({"question":"q","k":"5"})"), ValidationError);
    CHECK_THROWS_AS(parse_query_request(R"({"question":"q","context_budget":100001})"), InvalidQueryError);
    CHECK_THROWS_AS(parse_query_request(R"({"question":"q","session_id":7})"), ValidationError);
}

TEST_CASE("ingest parameters are parsed and validated", "[api]") {
    auto r = parse_ingest_request({{"filename", "a.txt"}, {"chunk_size", "200"}, {"chunk_overlap", "20"}}, "body");
    CHECK(r.filename == "a.txt");
    CHECK(r.chunk_size == 200);
    CHECK(r.chunk_overlap == 20);
    CHECK(r.bytes == "body");

    CHECK_THROWS_AS(parse_ingest_request({}, "body"), ValidationError);
    CHECK_THROWS_AS(parse_ingest_request({{"format", "txt"}, {"chunk_size", "0"}}, "x"), InvalidChunkConfigError);
    CHECK_THROWS_AS(parse_ingest_request({{"format", "txt"}, {"chunk_size", "5001"}}, "x"), InvalidChunkConfigError);
    CHECK_THROWS_AS(parse_ingest_request({{"format", "txt"}, {"chunk_overlap", "-1"}}, "x"), InvalidChunkConfigError);
    CHECK_THROWS_AS(parse_ingest_request({{"format", "txt"}, {"chunk_size", "12abc"}}, "x"), ValidationError);
}

TEST_CASE("paging parameters are bounded", "[api]") {
    auto p = parse_page_request({});
    CHECK(p.limit == 50);
    CHECK(p.offset == 0);
    CHECK(parse_page_request({{"limit", "10"}, {"offset", "5"}}).offset == 5);
    CHECK_THROWS_AS(parse_page_request({{"limit", "0"}}), ValidationError);
    CHECK_THROWS_AS(parse_page_request({{"limit", "501"}}), ValidationError);
    CHECK_THROWS_AS(parse_page_request({{"offset", "-2"}}), ValidationError);
}

TEST_CASE("error kinds map onto status codes", "[api]") {
    CHECK(http_status_for(ErrorKind::validation) == 400);
    CHECK(http_status_for(ErrorKind::not_found) == 404);
    CHECK(http_status_for(ErrorKind::upstream) == 502);
    CHECK(http_status_for(ErrorKind::internal) == 500);
    auto r = error_response(ErrorKind::not_found, "document not found: x");
    CHECK(r.status == 404);
    auto j = json::parse(r.body);
    CHECK(j["error"] == "not_found");
    CHECK(j["message"] == "document not found: x");
}

TEST_CASE("documents can be uploaded, inspected and deleted over the API", "[api]") {
    ApiFixture f;
    auto up = handle_request(f.svc, request("POST", "/documents", "Zebra stripes are unique.", {{"filename", "z.txt"}}));
    REQUIRE(up.status == 202);
    auto receipt = json::parse(up.body);
    std::string id = receipt["document_id"];
    CHECK(receipt["queued"] == true);
    f.svc.wait_for_ingestion();

    auto st = handle_request(f.svc, request("GET", "/documents/" + id + "/status"));
    CHECK(st.status == 200);
    CHECK(json::parse(st.body)["status"] == "ready");

    auto detail = json::parse(handle_request(f.svc, request("GET", "/documents/" + id)).body);
    CHECK(detail["filename"] == "z.txt");
    CHECK(detail["chunks"].size() == 1);

    auto list = json::parse(handle_request(f.svc, request("GET", "/documents")).body);
    CHECK(list["total"] == 1);
    CHECK(list["documents"][0]["id"] == id);

    auto q = handle_request(f.svc, request("POST", "/query", R"({"question":"zebra stripes?"})"));
    REQUIRE(q.status == 200);
    auto qj = json::parse(q.body);
    CHECK(qj["found"] == true);
    CHECK(qj["sources"][0]["document_id"] == id);
    CHECK(qj["sources"][0]["marker"] == 1);

    CHECK(handle_request(f.svc, request("DELETE", "/documents/" + id)).status == 200);
    auto gone = handle_request(f.svc, request("DELETE", "/documents/" + id));
    CHECK(gone.status == 404);
    CHECK(json::parse(gone.body)["error"] == "not_found");
    CHECK(handle_request(f.svc, request("GET", "/documents/" + id + "/status")).status == 404);
}

TEST_CASE("request failures become error responses", "[api]") {
    ApiFixture f;
    auto bad = handle_request(f.svc, request("POST", "/query", R"({"question":"  "})"));
    CHECK(bad.status == 400);
    CHECK(json::parse(bad.body)["error"] == "validation_error");

    auto fmt = handle_request(f.svc, request("POST", "/documents", "x", {{"filename", "a.exe"}}));
    CHECK(fmt.status == 400);

    CHECK(handle_request(f.svc, request("GET", "/nowhere")).status == 404);
    CHECK(handle_request(f.svc, request("PUT", "/documents")).status == 404);

    f.generator->fail_next(std::make_exception_ptr(UpstreamError("model unavailable", false, 503)));
    handle_request(f.svc, request("POST", "/documents", "whale ocean", {{"format", "txt"}}));
    f.svc.wait_for_ingestion();
    auto upstream = handle_request(f.svc, request("POST", "/query", R"({"question":"whale?"})"));
    CHECK(upstream.status == 502);
    CHECK(json::parse(upstream.body)["error"] == "upstream_error");
}

TEST_CASE("sessions and stats are exposed", "[api]") {
    ApiFixture f;
    auto q = json::parse(handle_request(f.svc, request("POST", "/query", R"({"question":"anything","session_id":"abc"})")).body);
    CHECK(q["session_id"] == "abc");
    CHECK(q["found"] == false);

    auto sessions = json::parse(handle_request(f.svc, request("GET", "/sessions")).body);
    REQUIRE(sessions["sessions"].size() == 1);
    CHECK(sessions["sessions"][0]["message_count"] == 2);

    auto hist = json::parse(handle_request(f.svc, request("GET", "/sessions/abc/history", {}, {{"limit", "1"}})).body);
    REQUIRE(hist["messages"].size() == 1);
    CHECK(hist["messages"][0]["role"] == "assistant");

    auto stats = json::parse(handle_request(f.svc, request("GET", "/stats")).body);
    CHECK(stats["total_queries"] == 1);
    CHECK(stats["session_count"] == 1);
    CHECK(stats["dimension"] == KeywordEmbedder::dimension());

    CHECK(handle_request(f.svc, request("DELETE", "/sessions/abc")).status == 200);
    CHECK(handle_request(f.svc, request("DELETE", "/sessions/abc")).status == 404);
    CHECK(handle_request(f.svc, request("GET", "/sessions/abc/history")).status == 404);
}

TEST_CASE("feedback and URL bodies are parsed and validated", "[api]") {
    auto f = parse_feedback_request(R"({"answer_id":"a1","rating":5,"comment":"spot on"})");
    CHECK(f.answer_id == "a1");
    CHECK(f.rating == 5);
    CHECK(f.comment == std::string("spot on"));
    CHECK_FALSE(parse_feedback_request(R"({"answer_id":"a1","rating":1,"comment":null})").comment);
    CHECK_THROWS_AS(parse_feedback_request(R"({"rating":3})"), ValidationError);
    CHECK_THROWS_AS(parse_feedback_request(R"({"answer_id":"a1"})"), ValidationError);
    CHECK_THROWS_AS(parse_feedback_request(R"({"answer_id":"a1","rating":9})"), ValidationError);
    CHECK_THROWS_AS(parse_feedback_request(R"({"answer_id":"a1","rating":"3"})"), ValidationError);

    auto u = parse_url_qa_request(R"({"documents":"https://x.test/a.pdf","questions":["one","two"]})");
    CHECK(u.url == "https://x.test/a.pdf");
    CHECK(u.questions == std::vector<std::string>{"one", "two"});
    CHECK_THROWS_AS(parse_url_qa_request(R"({"questions":["one"]})"), ValidationError);
    CHECK_THROWS_AS(parse_url_qa_request(R"({"documents":"https://x.test/a.pdf","questions":[]})"), ValidationError);
    CHECK_THROWS_AS(parse_url_qa_request(R"({"documents":"https://x.test/a.pdf","questions":[1]})"), ValidationError);
}

TEST_CASE("answers are rated over the API", "[api][feedback]") {
    ApiFixture f;
    auto q = json::parse(handle_request(f.svc, request("POST", "/query", R"({"question":"anything"})")).body);
    std::string answer_id = q["answer_id"];

    auto rated = handle_request(f.svc, request("POST", "/feedback",
                                               json({{"answer_id", answer_id}, {"rating", 5}, {"comment", "great"}}).dump()));
    REQUIRE(rated.status == 201);
    CHECK(json::parse(rated.body)["rating"] == 5);

    auto listed = json::parse(handle_request(f.svc, request("GET", "/feedback", {}, {{"answer_id", answer_id}})).body);
    REQUIRE(listed["feedback"].size() == 1);
    CHECK(listed["feedback"][0]["comment"] == "great");

    auto bad = handle_request(f.svc, request("POST", "/feedback",
                                             json({{"answer_id", answer_id}, {"rating", 0}}).dump()));
    CHECK(bad.status == 400);
    auto unknown = handle_request(f.svc, request("POST", "/feedback", R"({"answer_id":"nope","rating":3})"));
    CHECK(unknown.status == 404);
    CHECK(handle_request(f.svc, request("GET", "/feedback")).status == 400);
}

TEST_CASE("a document URL and its questions are answered in one call", "[api][url]") {
    ApiFixture f;
    f.svc.set_url_fetcher([](const std::string&, const CallOptions&) {
        return FetchedDocument{"Zebra stripes are unique.", "text/plain"};
    });
    auto r = handle_request(f.svc, request("POST", "/run",
                                           R"({"documents":"https://x.test/zebra.txt","questions":["zebra stripes?",""]})"));
    REQUIRE(r.status == 200);
    auto body = json::parse(r.body);
    CHECK(body["filename"] == "zebra.txt");
    REQUIRE(body["answers"].size() == 2);
    CHECK(body["answers"][0]["question"] == "zebra stripes?");
    CHECK(body["answers"][0]["found"] == true);
    CHECK(body["answers"][0]["answer"] == "Stripes [1].");
    CHECK_FALSE(body["answers"][0].contains("session_id"));
    CHECK(body["answers"][1].contains("error"));
    CHECK_FALSE(body["answers"][1].contains("answer"));

    auto ftp = handle_request(f.svc, request("POST", "/run", R"({"documents":"ftp://x.test/a.txt","questions":["q"]})"));
    CHECK(ftp.status == 400);
}

TEST_CASE("a request from a departed client is cancelled", "[api]") {
    ApiFixture f;
    handle_request(f.svc, request("POST", "/documents", "Zebra stripes are unique.", {{"filename", "z.txt"}}));
    f.svc.wait_for_ingestion();
    int embeds = f.embedder->calls;

    auto req = request("POST", "/query", R"({"question":"zebra stripes?"})");
    req.token.cancel();
    auto r = handle_request(f.svc, req);
    CHECK(r.status == 502);
    CHECK(json::parse(r.body)["error"] == "upstream_error");
    CHECK(f.embedder->calls == embeds);
    CHECK(f.generator->calls == 0);
}

TEST_CASE("health reflects whether the service is running", "[api]") {
    ApiFixture f;
    auto up = handle_request(f.svc, request("GET", "/health"));
    CHECK(up.status == 200);
    CHECK(json::parse(up.body)["status"] == "healthy");
    f.svc.shutdown();
    auto down = handle_request(f.svc, request("GET", "/health"));
    CHECK(down.status == 503);
    CHECK(json::parse(down.body)["status"] == "stopped");
}

namespace {

std::vector<json> stream_events(RagService& svc, QueryRequest q, bool* saw_done) {
    std::vector<std::string> frames;
    run_query_stream(svc, std::move(q), [&](const std::string& frame){ frames.push_back(frame); });
    std::vector<json> events;
    *saw_done = false;
    for (const auto& fr : frames) {
        REQUIRE(fr.rfind("data: ", 0) == 0);
        REQUIRE(fr.size() >= 8);
        REQUIRE(fr.compare(fr.size() - 2, 2, "\n\n") == 0);
        std::string data = fr.substr(6, fr.size() - 8);
        if (data == "[DONE]") {
            *saw_done = true;
            continue;
        }
        events.push_back(json::parse(data));
    }
    return events;
}

}

TEST_CASE("a streamed query emits start, fragments and a final result", "[api][stream]") {
    ApiFixture f;
    f.generator->set_fragments({"Zebra ", "stripes [1]."});
    handle_request(f.svc, request("POST", "/documents", "Zebra stripes are unique.", {{"filename", "z.txt"}}));
    f.svc.wait_for_ingestion();

    QueryRequest q;
    q.question = "zebra stripes?";
    bool done = false;
    auto events = stream_events(f.svc, q, &done);
    CHECK(done);
    REQUIRE(events.size() == 4);
    CHECK(events[0]["type"] == "start");
    CHECK(events[0]["question"] == "zebra stripes?");
    CHECK(events[1]["type"] == "fragment");
    CHECK(events[1]["text"] == "Zebra ");
    CHECK(events[2]["text"] == "stripes [1].");
    CHECK(events[3]["type"] == "complete");
    CHECK(events[3]["answer"] == "Zebra stripes [1].");
    CHECK(events[3]["found"] == true);
    CHECK(events[3]["sources"].size() == 1);
}

TEST_CASE("a failing streamed query ends with an error event", "[api][stream]") {
    ApiFixture f;
    QueryRequest q;
    q.question = "  ";
    bool done = false;
    auto events = stream_events(f.svc, q, &done);
    CHECK(done);
    REQUIRE(events.size() == 2);
    CHECK(events[0]["type"] == "start");
    CHECK(events[1]["type"] == "error");
    CHECK(events[1]["error"] == "validation_error");
}
