#pragma once
#include "cancel.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <utility>

struct RetryConfig {
    int max_attempts{4};
    long base_delay_ms{500};
    long max_delay_ms{8000};
    double jitter{0.2};      // fraction of each delay that is randomized away
    long max_total_ms{60000}; // wall-clock cap measured from the first attempt
};

// Exponential backoff shared by the embedding and generation wrappers.
class RetryPolicy {
public:
    using Predicate = std::function<bool(const std::exception&)>;

    explicit RetryPolicy(RetryConfig cfg = {}, Predicate retryable = default_retryable);

    using Clock = std::chrono::steady_clock;

    // The wall-clock point past which no attempt starts and no backoff sleeps.
    Clock::time_point deadline() const { return Clock::now() + std::chrono::milliseconds(cfg_.max_total_ms); }

    // Calls fn(remaining_ms) until it returns, a non-retryable error is thrown, attempts
    // run out, or the budget is spent. fn must not run past remaining_ms. The last error
    // is rethrown unchanged; a budget spent before an attempt is a terminal UpstreamError.
    template <typename Fn>
    auto run(const std::string& what, const CancellationToken& token, Fn&& fn) const -> decltype(fn(0L)) {
        return run(what, token, deadline(), std::forward<Fn>(fn));
    }

    // Shares one budget across several runs, e.g. every batch of one embedding request.
    template <typename Fn>
    auto run(const std::string& what, const CancellationToken& token, Clock::time_point until, Fn&& fn) const
        -> decltype(fn(0L)) {
        for (int attempt = 1;; ++attempt) {
            long remaining = remaining_ms(until);
            if (remaining <= 0) {
                throw UpstreamError(what + ": retry budget of " + std::to_string(cfg_.max_total_ms) + "ms exhausted",
                                    false);
            }
            try {
                return fn(remaining);
            } catch (const std::exception& e) {
                if (!retryable_(e) || token.cancelled()) throw;
                if (attempt >= cfg_.max_attempts) {
                    log_warn("retry", what + ": giving up after " + std::to_string(attempt) + " attempts: " + e.what());
                    throw;
                }
                auto delay = delay_for(attempt);
                if (delay.count() >= remaining_ms(until)) {
                    log_warn("retry", what + ": retry budget of " + std::to_string(cfg_.max_total_ms) +
                                      "ms exhausted: " + e.what());
                    throw;
                }
                log_debug("retry", what + ": attempt " + std::to_string(attempt) + " failed (" + e.what() +
                                   "), retrying in " + std::to_string(delay.count()) + "ms");
                if (!sleep_for(delay, token)) throw CancelledError(what + ": cancelled during backoff");
            }
        }
    }

    std::chrono::milliseconds delay_for(int attempt) const;

    static bool default_retryable(const std::exception& e);

private:
    static long remaining_ms(Clock::time_point until) {
        return (long)std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now()).count();
    }
    // Returns false when the token fires before the delay elapses.
    static bool sleep_for(std::chrono::milliseconds delay, const CancellationToken& token);

    RetryConfig cfg_;
    Predicate retryable_;
};
