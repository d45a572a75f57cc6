#pragma once
#include <atomic>
#include <memory>

// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Carried by every call that leaves the process.
struct CallOptions {
    long timeout_ms{30000};
    CancellationToken token;
};
