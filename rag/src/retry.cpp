#include "../include/retry.hpp"
#include <algorithm>
#include <random>
#include <thread>

RetryPolicy::RetryPolicy(RetryConfig cfg, Predicate retryable)
    : cfg_(cfg), retryable_(std::move(retryable)) {
    if (cfg_.max_attempts < 1) cfg_.max_attempts = 1;
    cfg_.jitter = std::clamp(cfg_.jitter, 0.0, 1.0);
    if (!retryable_) retryable_ = default_retryable;
}

bool RetryPolicy::default_retryable(const std::exception& e) {
    if (auto* up = dynamic_cast<const UpstreamError*>(&e)) return up->transient();
    return false;
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    double d = (double)cfg_.base_delay_ms;
    for (int i = 1; i < attempt && d < (double)cfg_.max_delay_ms; ++i) d *= 2.0;
    d = std::min(d, (double)cfg_.max_delay_ms);
    if (cfg_.jitter > 0.0) {
        thread_local std::mt19937 rng(std::random_device{}());
        std::uniform_real_distribution<double> dist(1.0 - cfg_.jitter, 1.0);
        d *= dist(rng);
    }
    return std::chrono::milliseconds((long)d);
}

bool RetryPolicy::sleep_for(std::chrono::milliseconds delay, const CancellationToken& token) {
    const auto slice = std::chrono::milliseconds(10);
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (token.cancelled()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(slice, std::max(left, std::chrono::milliseconds(0))));
    }
    return !token.cancelled();
}
