#ifndef METRICDB_STORAGE_METRIC_PARTITION_H_
#define METRICDB_STORAGE_METRIC_PARTITION_H_

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "metricdb/core/types.h"
#include "metricdb/core/query_context.h"

namespace metricdb {
namespace storage {

/**
 * @brief Position of a point in a time-ordered index
 *
 * Entries order by (timestamp, sequence); the sequence is the per-metric
 * insertion counter, so equal timestamps keep insertion order.
 */
struct IndexEntry {
    core::Timestamp timestamp;
    uint64_t sequence;
    
    bool operator<(const IndexEntry& other) const {
        return timestamp < other.timestamp ||
               (timestamp == other.timestamp && sequence < other.sequence);
    }
};

/**
 * @brief Append-only storage of one metric's points
 *
 * Layout:
 * 1. points_ holds every point by sequence number
 * 2. time_index_ orders all points by (timestamp, sequence)
 * 3. postings_ keeps one time-ordered posting list per key:value tag
 *
 * A filtered scan walks the shortest posting list among the filter tags
 * from a binary-searched start, so its cost is O(log n + k) in the
 * candidates it visits. Appends are serialized by the partition's writer
 * lock; scans copy their result under the shared lock, which makes the copy
 * the caller's snapshot.
 */
class MetricPartition {
public:
    explicit MetricPartition(size_t initial_capacity = 0);
    
    MetricPartition(const MetricPartition&) = delete;
    MetricPartition& operator=(const MetricPartition&) = delete;
    
    /**
     * @brief Append already-validated points, returns the number appended
     */
    size_t append(std::vector<core::Point> points);
    
    /**
     * @brief Points in [range.start, range.end) carrying every filter tag
     *
     * Result is ascending by timestamp, ties in insertion order. The context
     * is checked every check_interval visited candidates.
     *
     * @throws TimeoutError, CancelledError from the context
     */
    std::vector<core::Point> scan(const core::TimeRange& range,
                                  const std::vector<core::Tag>& filter,
                                  const core::QueryContext& context,
                                  size_t check_interval) const;
    
    size_t size() const;
    
    // Distinct values of a tag key, first-seen order
    std::vector<std::string> tag_values(const std::string& key) const;

private:
    using PostingList = std::vector<IndexEntry>;
    
    static void insert_sorted(PostingList& list, const IndexEntry& entry);
    
    std::vector<core::Point> points_;
    PostingList time_index_;
    absl::flat_hash_map<std::pair<std::string, std::string>, PostingList> postings_;
    absl::flat_hash_map<std::string, std::vector<std::string>> tag_values_;
    
    mutable std::shared_mutex mutex_;
};

} // namespace storage
} // namespace metricdb

#endif // METRICDB_STORAGE_METRIC_PARTITION_H_
