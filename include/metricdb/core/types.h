#ifndef METRICDB_CORE_TYPES_H_
#define METRICDB_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace metricdb {
namespace core {

/**
 * @brief Represents a timestamp in seconds since Unix epoch (sub-second precision)
 */
using Timestamp = double;

/**
 * @brief Represents a duration in seconds
 */
using Duration = double;

/**
 * @brief Represents a metric value
 */
using Value = double;

/**
 * @brief Defines the kind of metric
 */
enum class MetricKind {
    GAUGE,      // An instantaneous reading
    COUNTER     // A cumulative value, non-decreasing per source by convention
};

const char* MetricKindName(MetricKind kind);
std::optional<MetricKind> ParseMetricKind(const std::string& name);

/**
 * @brief A single key:value tag
 */
struct Tag {
    std::string key;
    std::string value;

    Tag() = default;
    Tag(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}

    /**
     * @brief Parse "key:value", splitting on the first ':'
     * @throws InvalidArgumentError if there is no ':' or the key is empty
     */
    static Tag Parse(const std::string& text);

    std::string to_string() const { return key + ":" + value; }

    bool operator==(const Tag& other) const { return key == other.key && value == other.value; }
    bool operator!=(const Tag& other) const { return !(*this == other); }
    bool operator<(const Tag& other) const {
        return key < other.key || (key == other.key && value < other.value);
    }
};

/**
 * @brief Set of tags attached to a point, unique by key
 */
class Tags {
public:
    using Map = std::map<std::string, std::string>;
    
    Tags() = default;
    explicit Tags(const Map& tags);
    
    /**
     * @throws InvalidArgumentError on an empty key or a key already present
     */
    void add(const std::string& key, const std::string& value);
    void add(const Tag& tag) { add(tag.key, tag.value); }
    bool has(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    
    /**
     * @brief True if every tag in the filter is present with the same value
     */
    bool matches(const std::vector<Tag>& filter) const;
    
    const Map& map() const { return tags_; }
    bool empty() const { return tags_.empty(); }
    size_t size() const { return tags_.size(); }
    
    std::vector<Tag> to_vector() const;
    
    bool operator==(const Tags& other) const { return tags_ == other.tags_; }
    bool operator!=(const Tags& other) const { return tags_ != other.tags_; }
    
    std::string to_string() const;

    /**
     * @brief Build a tag set from "key:value" strings
     * @throws InvalidArgumentError on malformed or duplicate tags
     */
    static Tags Parse(const std::vector<std::string>& tags);

private:
    Map tags_;
};

/**
 * @brief A stored or to-be-stored measurement
 */
class Point {
public:
    Point() : timestamp_(0), value_(0) {}
    Point(Timestamp ts, Value val);
    Point(Timestamp ts, Value val, Tags tags);
    
    Timestamp timestamp() const { return timestamp_; }
    Value value() const { return value_; }
    const Tags& tags() const { return tags_; }
    Tags& mutable_tags() { return tags_; }
    
    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

private:
    Timestamp timestamp_;
    Value value_;
    Tags tags_;
};

/**
 * @brief A single (timestamp, value) entry of a series
 */
class Sample {
public:
    Sample(Timestamp ts, Value val) : timestamp_(ts), value_(val) {}
    
    Timestamp timestamp() const { return timestamp_; }
    Value value() const { return value_; }
    
    bool operator==(const Sample& other) const;
    bool operator!=(const Sample& other) const { return !(*this == other); }

private:
    Timestamp timestamp_;
    Value value_;
};

/**
 * @brief Samples ordered ascending by timestamp
 */
using Series = std::vector<Sample>;

/**
 * @brief Half-open interval [start, end)
 */
struct TimeRange {
    Timestamp start;
    Timestamp end;
    
    TimeRange() : start(0), end(0) {}
    TimeRange(Timestamp s, Timestamp e) : start(s), end(e) {}
    
    bool contains(Timestamp ts) const { return ts >= start && ts < end; }
    bool empty() const { return end <= start; }
    Duration length() const { return end - start; }
};

} // namespace core
} // namespace metricdb

#endif // METRICDB_CORE_TYPES_H_
