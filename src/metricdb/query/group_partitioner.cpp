#include "metricdb/query/group_partitioner.h"
#include <unordered_map>

namespace metricdb {
namespace query {

GroupPartitioner::GroupPartitioner(std::string ungrouped_label)
    : ungrouped_label_(std::move(ungrouped_label)) {}

std::vector<Group> GroupPartitioner::partition(std::vector<core::Point> points,
                                               const std::optional<std::string>& group_by) const {
    std::vector<Group> groups;
    
    if (!group_by) {
        Group group;
        group.points = std::move(points);
        groups.push_back(std::move(group));
        return groups;
    }
    
    std::unordered_map<std::string, size_t> positions;
    for (auto& point : points) {
        auto value = point.tags().get(*group_by);
        const std::string& label = value ? *value : ungrouped_label_;
        
        auto it = positions.find(label);
        if (it == positions.end()) {
            it = positions.emplace(label, groups.size()).first;
            Group group;
            group.label = label;
            groups.push_back(std::move(group));
        }
        groups[it->second].points.push_back(std::move(point));
    }
    
    return groups;
}

} // namespace query
} // namespace metricdb
