#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/rag.hpp"
#include "../include/util.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>

static void usage() {
    std::cerr << "rag_cli usage:\n"
              << "  ingest (--file <path> | --dir <path>) [--chunk-size N] [--chunk-overlap N]\n"
              << "  query --question \"...\" [--k N] [--budget N] [--session ID]\n"
              << "  delete --id <document_id>\n"
              << "  list [--limit N] [--offset N]\n"
              << "  stats\n"
              << "common options: [--store <dir>] [--ollama <url>] [--embed-model <name>] [--llm <name>]\n";
}

static std::string format_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    try {
        ServiceConfig cfg = load_config_from_env();
        std::vector<std::string> files;
        std::string dir, question, session, id;
        std::optional<int> chunk_size, chunk_overlap, k, budget;
        size_t limit = 50, offset = 0;
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--store" && i + 1 < argc) cfg.store_dir = argv[++i];
            else if (a == "--ollama" && i + 1 < argc) cfg.embed.ollama_url = cfg.llm.ollama_url = argv[++i];
            else if (a == "--embed-model" && i + 1 < argc) cfg.embed.embed_model = argv[++i];
            else if (a == "--llm" && i + 1 < argc) cfg.llm.llm_model = argv[++i];
            else if (a == "--file" && i + 1 < argc) files.push_back(argv[++i]);
            else if (a == "--dir" && i + 1 < argc) dir = argv[++i];
            else if (a == "--chunk-size" && i + 1 < argc) chunk_size = std::stoi(argv[++i]);
            else if (a == "--chunk-overlap" && i + 1 < argc) chunk_overlap = std::stoi(argv[++i]);
            else if (a == "--question" && i + 1 < argc) question = argv[++i];
            else if (a == "--k" && i + 1 < argc) k = std::stoi(argv[++i]);
            else if (a == "--budget" && i + 1 < argc) budget = std::stoi(argv[++i]);
            else if (a == "--session" && i + 1 < argc) session = argv[++i];
            else if (a == "--id" && i + 1 < argc) id = argv[++i];
            else if (a == "--limit" && i + 1 < argc) limit = (size_t)std::stoul(argv[++i]);
            else if (a == "--offset" && i + 1 < argc) offset = (size_t)std::stoul(argv[++i]);
            else { usage(); return 2; }
        }
        set_log_level(cfg.log_level);
        // The CLI waits for ingestion anyway; one persist at shutdown is enough.
        cfg.persist_on_write = false;

        if (cmd == "ingest") {
            if (!dir.empty()) {
                for (auto& p : list_files(dir, {".txt", ".md", ".pdf", ".docx"},
                                          {".git", ".svn", ".hg", "build", "out", "node_modules", "venv"})) {
                    files.push_back(p.string());
                }
            }
            if (files.empty()) { usage(); return 2; }
            if (chunk_size && *chunk_size > kMaxChunkSize) throw InvalidChunkConfigError("--chunk-size is above 5000");
            if (chunk_overlap && *chunk_overlap > kMaxChunkOverlap) {
                throw InvalidChunkConfigError("--chunk-overlap is above 1000");
            }

            RagService svc(cfg);
            svc.init();
            std::vector<std::pair<std::string, std::string>> queued; // filename, id
            int failures = 0;
            for (const auto& f : files) {
                try {
                    IngestRequest req;
                    req.bytes = read_binary_file(f);
                    req.filename = std::filesystem::path(f).filename().string();
                    req.chunk_size = chunk_size;
                    req.chunk_overlap = chunk_overlap;
                    auto receipt = svc.ingest(std::move(req));
                    queued.emplace_back(f, receipt.document_id);
                } catch (const std::exception& e) {
                    std::cout << "[SKIP] " << f << ": " << e.what() << "\n";
                    ++failures;
                }
            }
            svc.wait_for_ingestion();
            for (const auto& q : queued) {
                auto d = svc.document(q.second).document;
                if (d.status == ProcessingStatus::ready) {
                    std::cout << "[OK] " << q.first << " -> " << d.id << " (" << d.chunk_count << " chunks, "
                              << d.encoding << ")\n";
                } else {
                    std::cout << "[FAILED] " << q.first << ": " << d.error << "\n";
                    ++failures;
                }
            }
            svc.shutdown();
            return failures ? 1 : 0;
        } else if (cmd == "query") {
            if (question.empty()) { usage(); return 2; }
            RagService svc(cfg);
            svc.init();
            QueryRequest req;
            req.question = question;
            req.k = k;
            req.context_budget = budget;
            if (!session.empty()) req.session_id = session;
            auto res = svc.query(req);
            std::cout << "\n==== Answer ====\n\n" << res.answer << "\n\n";
            std::cout << "confidence: " << format_score(res.confidence) << "  session: " << res.session_id << "\n\n";
            if (!res.sources.empty()) {
                std::cout << "==== Sources ====\n";
                for (auto& s : res.sources) {
                    std::cout << "[" << s.marker << "] " << (s.filename.empty() ? s.document_id : s.filename);
                    if (s.page > 0) std::cout << " (page " << s.page << ")";
                    std::cout << " score " << format_score(s.score) << "\n";
                }
            }
            svc.shutdown();
            return res.found ? 0 : 3;
        } else if (cmd == "delete") {
            if (id.empty()) { usage(); return 2; }
            RagService svc(cfg);
            svc.init();
            bool ok = svc.remove(id);
            svc.shutdown();
            std::cout << (ok ? "[OK] deleted " : "[NOT FOUND] ") << id << "\n";
            return ok ? 0 : 4;
        } else if (cmd == "list") {
            RagService svc(cfg);
            svc.init();
            auto page = svc.list_documents(limit, offset);
            for (const auto& d : page.items) {
                std::cout << d.id << "  " << status_name(d.status) << "  " << d.chunk_count << " chunks  "
                          << d.filename << "\n";
            }
            std::cout << page.items.size() << " of " << page.total << " documents\n";
            svc.shutdown();
            return 0;
        } else if (cmd == "stats") {
            RagService svc(cfg);
            svc.init();
            auto s = svc.stats();
            std::cout << "documents: " << s.document_count << " (" << s.ready_document_count << " ready)\n"
                      << "chunks: " << s.chunk_count << "\n"
                      << "index entries: " << s.index_size << " x " << s.dimension << "\n";
            svc.shutdown();
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
