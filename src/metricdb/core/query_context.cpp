#include "metricdb/core/query_context.h"
#include "metricdb/core/error.h"
#include <string>

namespace metricdb {
namespace core {

QueryContext::QueryContext()
    : start_(Clock::now()),
      deadline_(Clock::time_point::max()),
      timeout_(0),
      has_deadline_(false) {}

QueryContext::QueryContext(std::chrono::milliseconds timeout,
                           std::shared_ptr<CancellationToken> token)
    : start_(Clock::now()),
      deadline_(Clock::time_point::max()),
      timeout_(timeout),
      has_deadline_(false),
      token_(std::move(token)) {
    // Timeouts past the clock's range mean no deadline
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - start_);
    if (timeout <= std::chrono::milliseconds::zero()) {
        deadline_ = start_;
        has_deadline_ = true;
    } else if (timeout < headroom) {
        deadline_ = start_ + std::chrono::duration_cast<Clock::duration>(timeout);
        has_deadline_ = true;
    }
}

bool QueryContext::expired() const {
    return has_deadline_ && Clock::now() >= deadline_;
}

bool QueryContext::cancelled() const {
    return token_ && token_->cancelled();
}

void QueryContext::check() const {
    if (cancelled()) {
        throw CancelledError("Query cancelled");
    }
    if (expired()) {
        throw TimeoutError("Query exceeded its time budget of " +
                           std::to_string(timeout_.count()) + "ms");
    }
}

std::chrono::milliseconds QueryContext::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_);
}

} // namespace core
} // namespace metricdb
