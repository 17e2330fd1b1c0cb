#include "metricdb/storage/metric_partition.h"
#include <algorithm>
#include <mutex>

namespace metricdb {
namespace storage {

MetricPartition::MetricPartition(size_t initial_capacity) {
    points_.reserve(initial_capacity);
    time_index_.reserve(initial_capacity);
}

void MetricPartition::insert_sorted(PostingList& list, const IndexEntry& entry) {
    // In-order arrivals are the common case and append in O(1)
    if (list.empty() || !(entry < list.back())) {
        list.push_back(entry);
        return;
    }
    auto pos = std::upper_bound(list.begin(), list.end(), entry);
    list.insert(pos, entry);
}

size_t MetricPartition::append(std::vector<core::Point> points) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    for (auto& point : points) {
        IndexEntry entry{point.timestamp(), static_cast<uint64_t>(points_.size())};
        
        insert_sorted(time_index_, entry);
        for (const auto& [key, value] : point.tags().map()) {
            auto& posting_list = postings_[std::make_pair(key, value)];
            if (posting_list.empty()) {
                tag_values_[key].push_back(value);
            }
            insert_sorted(posting_list, entry);
        }
        
        points_.push_back(std::move(point));
    }
    return points.size();
}

std::vector<core::Point> MetricPartition::scan(const core::TimeRange& range,
                                               const std::vector<core::Tag>& filter,
                                               const core::QueryContext& context,
                                               size_t check_interval) const {
    std::vector<core::Point> result;
    if (range.empty()) {
        return result;
    }
    
    std::shared_lock<std::shared_mutex> lock(mutex_);
    
    // 1. Pick the candidate list: the shortest posting list of the filter tags
    const PostingList* candidates = &time_index_;
    for (const auto& tag : filter) {
        auto it = postings_.find(std::make_pair(tag.key, tag.value));
        if (it == postings_.end()) {
            return result;
        }
        if (it->second.size() < candidates->size() || candidates == &time_index_) {
            candidates = &it->second;
        }
    }
    
    // 2. Binary search the range start
    auto begin = std::lower_bound(candidates->begin(), candidates->end(), range.start,
        [](const IndexEntry& entry, core::Timestamp ts) {
            return entry.timestamp < ts;
        });
    
    // 3. Walk until range end, verifying the remaining filter tags
    size_t visited = 0;
    for (auto it = begin; it != candidates->end() && it->timestamp < range.end; ++it) {
        if (check_interval > 0 && ++visited % check_interval == 0) {
            context.check();
        }
        const auto& point = points_[it->sequence];
        if (filter.size() > 1 && !point.tags().matches(filter)) {
            continue;
        }
        result.push_back(point);
    }
    
    return result;
}

size_t MetricPartition::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return points_.size();
}

std::vector<std::string> MetricPartition::tag_values(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tag_values_.find(key);
    if (it == tag_values_.end()) {
        return {};
    }
    return it->second;
}

} // namespace storage
} // namespace metricdb
