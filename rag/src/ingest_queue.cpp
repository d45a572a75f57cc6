#include "../include/ingest_queue.hpp"
#include <algorithm>
#include <utility>

bool IngestQueue::enqueue(IngestJob job) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return false;
    if (inflight_.count(job.document_id)) return false;
    for (const auto& j : queued_) {
        if (j.document_id == job.document_id) return false;
    }
    queued_.push_back(std::move(job));
    cv_.notify_one();
    return true;
}

std::optional<IngestJob> IngestQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]{ return closed_ || !queued_.empty(); });
    if (closed_) return std::nullopt;
    IngestJob j = std::move(queued_.front());
    queued_.pop_front();
    inflight_.emplace(j.document_id, j);
    return j;
}

void IngestQueue::complete(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    inflight_.erase(document_id);
    if (queued_.empty() && inflight_.empty()) idle_cv_.notify_all();
}

bool IngestQueue::cancel(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto running = inflight_.find(document_id);
    if (running != inflight_.end()) {
        running->second.token.cancel();
        return true;
    }
    auto it = std::find_if(queued_.begin(), queued_.end(),
                           [&](const IngestJob& j){ return j.document_id == document_id; });
    if (it == queued_.end()) return false;
    queued_.erase(it);
    if (queued_.empty() && inflight_.empty()) idle_cv_.notify_all();
    return true;
}

bool IngestQueue::active(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (inflight_.count(document_id)) return true;
    return std::any_of(queued_.begin(), queued_.end(),
                       [&](const IngestJob& j){ return j.document_id == document_id; });
}

std::vector<IngestJob> IngestQueue::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    for (auto& kv : inflight_) kv.second.token.cancel();
    std::vector<IngestJob> dropped(std::make_move_iterator(queued_.begin()), std::make_move_iterator(queued_.end()));
    queued_.clear();
    cv_.notify_all();
    if (inflight_.empty()) idle_cv_.notify_all();
    return dropped;
}

void IngestQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mtx_);
    idle_cv_.wait(lock, [&]{ return queued_.empty() && inflight_.empty(); });
}

std::size_t IngestQueue::queued() {
    std::lock_guard<std::mutex> lock(mtx_);
    return queued_.size();
}

std::size_t IngestQueue::inflight() {
    std::lock_guard<std::mutex> lock(mtx_);
    return inflight_.size();
}
