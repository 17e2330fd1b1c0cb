#include "metricdb/core/types.h"
#include "metricdb/core/error.h"
#include <sstream>

namespace metricdb {
namespace core {

const char* MetricKindName(MetricKind kind) {
    switch (kind) {
        case MetricKind::GAUGE: return "gauge";
        case MetricKind::COUNTER: return "counter";
    }
    return "unknown";
}

std::optional<MetricKind> ParseMetricKind(const std::string& name) {
    if (name == "gauge" || name == "Gauge") {
        return MetricKind::GAUGE;
    }
    // "count" is the name the ingestion routes use
    if (name == "counter" || name == "Counter" || name == "count" || name == "Count") {
        return MetricKind::COUNTER;
    }
    return std::nullopt;
}

Tag Tag::Parse(const std::string& text) {
    auto pos = text.find(':');
    if (pos == std::string::npos) {
        throw InvalidArgumentError("Tag must have the format key:value, got '" + text + "'");
    }
    if (pos == 0) {
        throw InvalidArgumentError("Tag key cannot be empty in '" + text + "'");
    }
    return Tag(text.substr(0, pos), text.substr(pos + 1));
}

Tags::Tags(const Map& tags) {
    for (const auto& [key, value] : tags) {
        add(key, value);
    }
}

void Tags::add(const std::string& key, const std::string& value) {
    if (key.empty()) {
        throw InvalidArgumentError("Tag key cannot be empty");
    }
    if (!tags_.emplace(key, value).second) {
        throw InvalidArgumentError("Duplicate tag key '" + key + "'");
    }
}

bool Tags::has(const std::string& key) const {
    return tags_.find(key) != tags_.end();
}

std::optional<std::string> Tags::get(const std::string& key) const {
    auto it = tags_.find(key);
    if (it != tags_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Tags::matches(const std::vector<Tag>& filter) const {
    for (const auto& tag : filter) {
        auto it = tags_.find(tag.key);
        if (it == tags_.end() || it->second != tag.value) {
            return false;
        }
    }
    return true;
}

std::vector<Tag> Tags::to_vector() const {
    std::vector<Tag> result;
    result.reserve(tags_.size());
    for (const auto& [key, value] : tags_) {
        result.emplace_back(key, value);
    }
    return result;
}

std::string Tags::to_string() const {
    std::ostringstream ss;
    ss << "[";
    bool first = true;
    for (const auto& [key, value] : tags_) {
        if (!first) {
            ss << ",";
        }
        ss << key << ":" << value;
        first = false;
    }
    ss << "]";
    return ss.str();
}

Tags Tags::Parse(const std::vector<std::string>& tags) {
    Tags result;
    for (const auto& text : tags) {
        result.add(Tag::Parse(text));
    }
    return result;
}

Point::Point(Timestamp ts, Value val)
    : timestamp_(ts), value_(val) {}

Point::Point(Timestamp ts, Value val, Tags tags)
    : timestamp_(ts), value_(val), tags_(std::move(tags)) {}

bool Point::operator==(const Point& other) const {
    return timestamp_ == other.timestamp_ &&
           value_ == other.value_ &&
           tags_ == other.tags_;
}

bool Sample::operator==(const Sample& other) const {
    return timestamp_ == other.timestamp_ && value_ == other.value_;
}

} // namespace core
} // namespace metricdb
