#include "metricdb/api/json_codec.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <cmath>

using namespace rapidjson;

namespace metricdb {
namespace api {

namespace {

void ParseBody(Document& doc, const std::string& body) {
    doc.Parse(body.c_str(), body.size());
    if (doc.HasParseError()) {
        throw core::InvalidArgumentError(std::string("Malformed JSON at offset ") +
                                         std::to_string(doc.GetErrorOffset()) + ": " +
                                         GetParseError_En(doc.GetParseError()));
    }
}

const Value* FindOptional(const Value& object, const char* name) {
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

const Value& FindRequired(const Value& object, const char* name) {
    if (!object.IsObject()) {
        throw core::InvalidArgumentError(std::string("Expected an object holding '") + name + "'");
    }
    const Value* value = FindOptional(object, name);
    if (!value) {
        throw core::InvalidArgumentError(std::string("Missing field '") + name + "'");
    }
    return *value;
}

double AsNumber(const Value& value, const char* name) {
    if (!value.IsNumber()) {
        throw core::InvalidArgumentError(std::string("Field '") + name + "' must be a number");
    }
    return value.GetDouble();
}

std::string AsString(const Value& value, const char* name) {
    if (!value.IsString()) {
        throw core::InvalidArgumentError(std::string("Field '") + name + "' must be a string");
    }
    return std::string(value.GetString(), value.GetStringLength());
}

std::optional<double> OptionalNumber(const Value& object, const char* name) {
    const Value* value = FindOptional(object, name);
    if (!value) {
        return std::nullopt;
    }
    return AsNumber(*value, name);
}

std::optional<std::string> OptionalString(const Value& object, const char* name) {
    const Value* value = FindOptional(object, name);
    if (!value) {
        return std::nullopt;
    }
    return AsString(*value, name);
}

// A closed variant: an object with exactly one member naming the alternative
struct Variant {
    std::string name;
    const Value* body;
};

Variant AsVariant(const Value& value, const char* what) {
    if (value.IsString()) {
        // Unit alternatives such as "InputValue"
        return Variant{AsString(value, what), nullptr};
    }
    if (!value.IsObject() || value.MemberCount() != 1) {
        throw core::InvalidArgumentError(std::string("Expected a single-key ") + what + " object");
    }
    auto member = value.MemberBegin();
    return Variant{std::string(member->name.GetString(), member->name.GetStringLength()), &member->value};
}

const Value& VariantBody(const Variant& variant, const char* what) {
    if (!variant.body) {
        throw core::InvalidArgumentError(std::string(what) + " '" + variant.name + "' requires a body");
    }
    return *variant.body;
}

core::MetricKind ParseKind(const std::string& kind) {
    auto parsed = core::ParseMetricKind(kind);
    if (!parsed) {
        throw core::InvalidArgumentError("Unknown metric kind '" + kind + "'");
    }
    return *parsed;
}

query::ArithmeticOp ParseArithmetic(const Value& object) {
    auto name = AsString(FindRequired(object, "operation"), "operation");
    auto op = query::ParseArithmeticOp(name);
    if (!op) {
        throw core::InvalidArgumentError("Unknown arithmetic operation '" + name + "'");
    }
    return *op;
}

query::Function ParseFunctionName(const Value& object) {
    auto name = AsString(FindRequired(object, "function"), "function");
    auto function = query::ParseFunction(name);
    if (!function) {
        throw core::InvalidArgumentError("Unknown function '" + name + "'");
    }
    return *function;
}

const Value& ArgumentArray(const Value& object) {
    const Value& args = FindRequired(object, "arguments");
    if (!args.IsArray()) {
        throw core::InvalidArgumentError("Field 'arguments' must be an array");
    }
    return args;
}

std::unique_ptr<query::TransformNode> ParseTransform(const Value& value) {
    Variant variant = AsVariant(value, "transform");
    if (variant.name == "InputValue") {
        return std::make_unique<query::InputValueTransform>();
    }
    if (variant.name == "Value") {
        return std::make_unique<query::ValueTransform>(AsNumber(VariantBody(variant, "Transform"), "Value"));
    }
    if (variant.name == "Arithmetic") {
        const Value& body = VariantBody(variant, "Transform");
        auto op = ParseArithmetic(body);
        return std::make_unique<query::ArithmeticTransform>(
            op, ParseTransform(FindRequired(body, "left")), ParseTransform(FindRequired(body, "right")));
    }
    if (variant.name == "Function") {
        const Value& body = VariantBody(variant, "Transform");
        auto function = ParseFunctionName(body);
        std::vector<std::unique_ptr<query::TransformNode>> args;
        for (const auto& arg : ArgumentArray(body).GetArray()) {
            args.push_back(ParseTransform(arg));
        }
        return std::make_unique<query::FunctionTransform>(function, std::move(args));
    }
    throw core::InvalidArgumentError("Unknown transform '" + variant.name + "'");
}

// Each side of a comparison is {"Transform": <transform>}
std::unique_ptr<query::TransformNode> ParseOperand(const Value& value) {
    Variant variant = AsVariant(value, "comparison operand");
    if (variant.name != "Transform") {
        throw core::InvalidArgumentError("Unknown comparison operand '" + variant.name + "'");
    }
    return ParseTransform(VariantBody(variant, "Operand"));
}

std::unique_ptr<query::FilterNode> ParseFilter(const Value& value) {
    Variant variant = AsVariant(value, "filter");
    const Value& body = VariantBody(variant, "Filter");
    if (variant.name == "Compare") {
        auto name = AsString(FindRequired(body, "operation"), "operation");
        auto op = query::ParseCompareOp(name);
        if (!op) {
            throw core::InvalidArgumentError("Unknown compare operation '" + name + "'");
        }
        return std::make_unique<query::CompareFilter>(
            *op, ParseOperand(FindRequired(body, "left")), ParseOperand(FindRequired(body, "right")));
    }
    if (variant.name == "And") {
        return std::make_unique<query::AndFilter>(
            ParseFilter(FindRequired(body, "left")), ParseFilter(FindRequired(body, "right")));
    }
    if (variant.name == "Or") {
        return std::make_unique<query::OrFilter>(
            ParseFilter(FindRequired(body, "left")), ParseFilter(FindRequired(body, "right")));
    }
    throw core::InvalidArgumentError("Unknown filter '" + variant.name + "'");
}

std::unique_ptr<query::FilterNode> OptionalFilter(const Value& object) {
    const Value* filter = FindOptional(object, "output_filter");
    return filter ? ParseFilter(*filter) : nullptr;
}

std::vector<core::Tag> ParseTagFilter(const Value& object) {
    std::vector<core::Tag> tags;
    const Value* array = FindOptional(object, "tags");
    if (!array) {
        return tags;
    }
    if (!array->IsArray()) {
        throw core::InvalidArgumentError("Field 'tags' must be an array");
    }
    for (const auto& tag : array->GetArray()) {
        tags.push_back(core::Tag::Parse(AsString(tag, "tags")));
    }
    return tags;
}

// {"group_by": "host", "tags": ["dc:eu"], "output_transform": {...}, "output_filter": {...}};
// every field optional
query::MetricQuery ParseMetricQuery(const Value& object) {
    if (!object.IsObject()) {
        throw core::InvalidArgumentError("Field 'query' must be an object");
    }
    query::MetricQuery result;
    result.group_by = OptionalString(object, "group_by");
    result.tags = ParseTagFilter(object);
    const Value* transform = FindOptional(object, "output_transform");
    if (transform) {
        result.output_transform = ParseTransform(*transform);
    }
    result.output_filter = OptionalFilter(object);
    return result;
}

// "Average" or {"Percentile": 99}
core::AggregationRequest ParseOperation(const Value& value) {
    Variant variant = AsVariant(value, "operation");
    if (variant.name == "Percentile") {
        return core::AggregationRequest::Of(core::AggregationOp::PERCENTILE,
                                            AsNumber(VariantBody(variant, "Operation"), "Percentile"));
    }
    if (variant.body) {
        throw core::InvalidArgumentError("Operation '" + variant.name + "' takes no parameter");
    }
    if (variant.name == "Average") return core::AggregationRequest::Of(core::AggregationOp::AVERAGE);
    if (variant.name == "Sum") return core::AggregationRequest::Of(core::AggregationOp::SUM);
    if (variant.name == "Min") return core::AggregationRequest::Of(core::AggregationOp::MIN);
    if (variant.name == "Max") return core::AggregationRequest::Of(core::AggregationOp::MAX);
    if (variant.name == "Count") return core::AggregationRequest::Of(core::AggregationOp::COUNT);
    throw core::InvalidArgumentError("Unknown operation '" + variant.name + "'");
}

std::unique_ptr<query::ExprNode> ParseExpression(const Value& value) {
    Variant variant = AsVariant(value, "expression");
    const Value& body = VariantBody(variant, "Expression");
    
    if (variant.name == "Value") {
        return std::make_unique<query::ValueNode>(AsNumber(body, "Value"));
    }
    if (variant.name == "Arithmetic") {
        auto op = ParseArithmetic(body);
        return std::make_unique<query::ArithmeticNode>(
            op, ParseExpression(FindRequired(body, "left")), ParseExpression(FindRequired(body, "right")));
    }
    if (variant.name == "Function") {
        auto function = ParseFunctionName(body);
        std::vector<std::unique_ptr<query::ExprNode>> args;
        for (const auto& arg : ArgumentArray(body).GetArray()) {
            args.push_back(ParseExpression(arg));
        }
        return std::make_unique<query::FunctionNode>(function, std::move(args));
    }
    
    core::AggregationRequest aggregation;
    if (variant.name == "Percentile") {
        aggregation = core::AggregationRequest::Of(core::AggregationOp::PERCENTILE,
                                                   AsNumber(FindRequired(body, "percentile"), "percentile"));
    } else if (variant.name == "Average") {
        aggregation = core::AggregationRequest::Of(core::AggregationOp::AVERAGE);
    } else if (variant.name == "Sum") {
        aggregation = core::AggregationRequest::Of(core::AggregationOp::SUM);
    } else if (variant.name == "Min") {
        aggregation = core::AggregationRequest::Of(core::AggregationOp::MIN);
    } else if (variant.name == "Max") {
        aggregation = core::AggregationRequest::Of(core::AggregationOp::MAX);
    } else if (variant.name == "Count") {
        aggregation = core::AggregationRequest::Of(core::AggregationOp::COUNT);
    } else {
        throw core::InvalidArgumentError("Unknown expression '" + variant.name + "'");
    }
    
    auto metric = AsString(FindRequired(body, "metric"), "metric");
    const Value* query_object = FindOptional(body, "query");
    query::MetricQuery metric_query = query_object ? ParseMetricQuery(*query_object) : query::MetricQuery();
    return std::make_unique<query::MetricRefNode>(std::move(metric), aggregation, std::move(metric_query));
}

const Value& RequireObject(const Document& doc) {
    if (!doc.IsObject()) {
        throw core::InvalidArgumentError("Request body must be a JSON object");
    }
    return doc;
}

template<typename Writer>
void WriteNumber(Writer& writer, double value) {
    if (std::isfinite(value)) {
        writer.Double(value);
    } else {
        writer.Null();
    }
}

template<typename Writer>
void WriteSeries(Writer& writer, const core::Series& samples) {
    writer.StartArray();
    for (const auto& sample : samples) {
        writer.StartArray();
        WriteNumber(writer, sample.timestamp());
        WriteNumber(writer, sample.value());
        writer.EndArray();
    }
    writer.EndArray();
}

template<typename T, typename Parse>
core::Result<T> Guarded(Parse&& parse) {
    try {
        return core::Result<T>(parse());
    } catch (const core::Error& e) {
        return core::Result<T>::from_error(e);
    }
}

} // namespace

core::Result<RegisterMetricRequest> JsonCodec::ParseRegisterMetric(const std::string& kind,
                                                                   const std::string& body) {
    return Guarded<RegisterMetricRequest>([&]() {
        Document doc;
        ParseBody(doc, body);
        RegisterMetricRequest request;
        request.kind = ParseKind(kind);
        request.name = AsString(FindRequired(RequireObject(doc), "name"), "name");
        return request;
    });
}

core::Result<SetAutoPrimaryTagRequest> JsonCodec::ParseSetAutoPrimaryTag(const std::string& metric,
                                                                         const std::string& body) {
    return Guarded<SetAutoPrimaryTagRequest>([&]() {
        Document doc;
        ParseBody(doc, body);
        SetAutoPrimaryTagRequest request;
        request.metric = metric;
        request.key = AsString(FindRequired(RequireObject(doc), "key"), "key");
        return request;
    });
}

core::Result<InsertBatchRequest> JsonCodec::ParseInsertBatch(const std::string& kind,
                                                             const std::string& metric,
                                                             const std::string& body,
                                                             const std::optional<std::string>& source) {
    return Guarded<InsertBatchRequest>([&]() {
        Document doc;
        ParseBody(doc, body);
        if (!doc.IsArray()) {
            throw core::InvalidArgumentError("Insert body must be a JSON array");
        }
        
        InsertBatchRequest request;
        request.kind = ParseKind(kind);
        request.metric = metric;
        request.source = source;
        request.entries.reserve(doc.Size());
        
        for (const auto& item : doc.GetArray()) {
            InsertEntry entry;
            entry.time = AsNumber(FindRequired(item, "time"), "time");
            const Value* value = FindOptional(item, "value");
            if (!value && request.kind == core::MetricKind::COUNTER) {
                value = FindOptional(item, "count");
            }
            if (!value) {
                throw core::InvalidArgumentError("Missing field 'value'");
            }
            entry.value = AsNumber(*value, "value");
            
            const Value* tags = FindOptional(item, "tags");
            if (tags) {
                if (!tags->IsArray()) {
                    throw core::InvalidArgumentError("Field 'tags' must be an array");
                }
                for (const auto& tag : tags->GetArray()) {
                    entry.tags.push_back(AsString(tag, "tags"));
                }
            }
            request.entries.push_back(std::move(entry));
        }
        return request;
    });
}

core::Result<LegacyQueryRequest> JsonCodec::ParseLegacyQuery(const std::string& metric,
                                                             const std::string& body) {
    return Guarded<LegacyQueryRequest>([&]() {
        Document doc;
        ParseBody(doc, body);
        const Value& object = RequireObject(doc);
        
        LegacyQueryRequest request;
        request.query.metric = metric;
        request.query.aggregation = ParseOperation(FindRequired(object, "operation"));
        request.query.duration = OptionalNumber(object, "duration");
        request.query.range = core::TimeRange(AsNumber(FindRequired(object, "start"), "start"),
                                              AsNumber(FindRequired(object, "end"), "end"));
        request.query.query = ParseMetricQuery(object);
        return request;
    });
}

core::Result<ExpressionQueryRequest> JsonCodec::ParseExpressionQuery(const std::string& body) {
    return Guarded<ExpressionQueryRequest>([&]() {
        Document doc;
        ParseBody(doc, body);
        const Value& object = RequireObject(doc);
        
        ExpressionQueryRequest request;
        const Value& range = FindRequired(object, "time_range");
        request.query.range = core::TimeRange(AsNumber(FindRequired(range, "start"), "start"),
                                              AsNumber(FindRequired(range, "end"), "end"));
        request.query.duration = OptionalNumber(object, "duration");
        request.query.expression = ParseExpression(FindRequired(object, "expression"));
        request.query.output_filter = OptionalFilter(object);
        return request;
    });
}

std::string JsonCodec::FormatResponse(const query::QueryResponse& response) {
    StringBuffer buffer;
    Writer<StringBuffer> writer(buffer);
    
    writer.StartObject();
    writer.Key("value");
    if (!response.grouped) {
        if (response.series.empty()) {
            writer.StartArray();
            writer.EndArray();
        } else {
            WriteSeries(writer, response.series.front().samples);
        }
    } else {
        writer.StartArray();
        for (const auto& group : response.series) {
            writer.StartArray();
            const std::string label = group.label.value_or("");
            writer.String(label.c_str(), static_cast<SizeType>(label.size()));
            WriteSeries(writer, group.samples);
            writer.EndArray();
        }
        writer.EndArray();
    }
    writer.EndObject();
    
    return buffer.GetString();
}

std::string JsonCodec::FormatInsertResponse(size_t num_inserted) {
    StringBuffer buffer;
    Writer<StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("num_inserted");
    writer.Uint64(num_inserted);
    writer.EndObject();
    return buffer.GetString();
}

std::string JsonCodec::FormatMetrics(const std::vector<catalog::MetricDescriptor>& metrics) {
    StringBuffer buffer;
    Writer<StringBuffer> writer(buffer);
    writer.StartArray();
    for (const auto& metric : metrics) {
        writer.StartObject();
        writer.Key("name");
        writer.String(metric.name.c_str(), static_cast<SizeType>(metric.name.size()));
        writer.Key("kind");
        writer.String(core::MetricKindName(metric.kind));
        writer.Key("auto_primary_tag");
        if (metric.auto_primary_tag_key) {
            const auto& key = *metric.auto_primary_tag_key;
            writer.String(key.c_str(), static_cast<SizeType>(key.size()));
        } else {
            writer.Null();
        }
        writer.EndObject();
    }
    writer.EndArray();
    return buffer.GetString();
}

std::string JsonCodec::FormatError(core::Error::Code code, const std::string& message) {
    StringBuffer buffer;
    Writer<StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("error");
    writer.String(core::ErrorCodeName(code));
    writer.Key("message");
    writer.String(message.c_str(), static_cast<SizeType>(message.size()));
    writer.EndObject();
    return buffer.GetString();
}

} // namespace api
} // namespace metricdb
