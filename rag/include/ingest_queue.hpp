#pragma once
#include "cancel.hpp"
#include "extractor.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct IngestJob {
    std::string document_id;
    std::string filename;
    DocumentFormat format{DocumentFormat::text};
    std::shared_ptr<const std::string> bytes;
    int chunk_size{0};
    int chunk_overlap{0};
    CancellationToken token;
};

// FIFO of ingestion jobs keyed by document id. At most one job per id is queued or
// in flight at a time.
class IngestQueue {
public:
    // False when a job for the same document is already queued or running, or the queue is closed.
    bool enqueue(IngestJob job);
    // Blocks until a job is available. Returns nullopt once the queue is closed.
    std::optional<IngestJob> dequeue();
    void complete(const std::string& document_id);
    // Drops a queued job or cancels a running one. Returns false when the id is not active.
    bool cancel(const std::string& document_id);
    bool active(const std::string& document_id);
    // Stops handing out work, cancels running jobs and returns the jobs that never started.
    std::vector<IngestJob> close();
    // Blocks until nothing is queued or running.
    void wait_idle();

    std::size_t queued();
    std::size_t inflight();

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<IngestJob> queued_;
    std::unordered_map<std::string, IngestJob> inflight_;
    bool closed_{false};
};
