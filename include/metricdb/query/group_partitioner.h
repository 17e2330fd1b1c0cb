#ifndef METRICDB_QUERY_GROUP_PARTITIONER_H_
#define METRICDB_QUERY_GROUP_PARTITIONER_H_

#include <optional>
#include <string>
#include <vector>

#include "metricdb/core/types.h"

namespace metricdb {
namespace query {

/**
 * @brief Points sharing one value of the group_by tag
 *
 * The label is empty for the single implicit group of an ungrouped query.
 */
struct Group {
    std::optional<std::string> label;
    std::vector<core::Point> points;
};

/**
 * @brief Splits scanned points into groups by the value of a tag key
 *
 * Groups come out in first-seen label order and keep the scan order of their
 * points. Points lacking the key fall into the ungrouped label.
 */
class GroupPartitioner {
public:
    explicit GroupPartitioner(std::string ungrouped_label);
    
    std::vector<Group> partition(std::vector<core::Point> points,
                                 const std::optional<std::string>& group_by) const;
    
    const std::string& ungrouped_label() const { return ungrouped_label_; }

private:
    std::string ungrouped_label_;
};

} // namespace query
} // namespace metricdb

#endif // METRICDB_QUERY_GROUP_PARTITIONER_H_
