#ifndef METRICDB_CORE_QUERY_CONTEXT_H_
#define METRICDB_CORE_QUERY_CONTEXT_H_

#include <atomic>
#include <chrono>
#include <memory>

namespace metricdb {
namespace core {

/**
 * @brief Shared flag a caller flips to abandon a running query
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Deadline and cancellation state of one query invocation
 *
 * Long-running stages call check() at bucket granularity (and periodically
 * while scanning) so a query never outlives its time budget.
 */
class QueryContext {
public:
    using Clock = std::chrono::steady_clock;
    
    // No deadline and no cancellation
    QueryContext();
    explicit QueryContext(std::chrono::milliseconds timeout,
                          std::shared_ptr<CancellationToken> token = nullptr);
    
    bool expired() const;
    bool cancelled() const;
    
    /**
     * @throws TimeoutError when the deadline has passed
     * @throws CancelledError when the token was cancelled
     */
    void check() const;
    
    std::chrono::milliseconds elapsed() const;
    std::chrono::milliseconds timeout() const { return timeout_; }
    bool has_deadline() const { return has_deadline_; }

private:
    Clock::time_point start_;
    Clock::time_point deadline_;
    std::chrono::milliseconds timeout_;
    bool has_deadline_;
    std::shared_ptr<CancellationToken> token_;
};

} // namespace core
} // namespace metricdb

#endif // METRICDB_CORE_QUERY_CONTEXT_H_
