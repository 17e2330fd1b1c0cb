#include <gtest/gtest.h>
#include "metricdb/api/json_codec.h"

namespace metricdb {
namespace api {
namespace {

using core::Error;

TEST(JsonCodecTest, ParseRegisterMetric) {
    auto request = JsonCodec::ParseRegisterMetric("count", R"({"name": "context_switches"})");
    ASSERT_TRUE(request.ok()) << request.error();
    EXPECT_EQ(request.value().name, "context_switches");
    EXPECT_EQ(request.value().kind, core::MetricKind::COUNTER);
    
    EXPECT_EQ(JsonCodec::ParseRegisterMetric("ratio", R"({"name": "x"})").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(JsonCodec::ParseRegisterMetric("gauge", R"({"title": "x"})").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(JsonCodec::ParseRegisterMetric("gauge", R"({"name": )").code(), Error::Code::INVALID_ARGUMENT);
}

TEST(JsonCodecTest, ParseSetAutoPrimaryTag) {
    auto request = JsonCodec::ParseSetAutoPrimaryTag("cpu_usage", R"({"key": "host"})");
    ASSERT_TRUE(request.ok());
    EXPECT_EQ(request.value().metric, "cpu_usage");
    EXPECT_EQ(request.value().key, "host");
}

TEST(JsonCodecTest, ParseInsertBatch) {
    auto request = JsonCodec::ParseInsertBatch("gauge", "cpu_usage", R"([
        {"time": 1667652117.2578413, "value": 0.25, "tags": ["core:0", "host:a"]},
        {"time": 1667652118, "value": 1, "tags": []}
    ])", std::string("agent-1"));
    ASSERT_TRUE(request.ok()) << request.error();
    const auto& batch = request.value();
    EXPECT_EQ(batch.metric, "cpu_usage");
    EXPECT_EQ(*batch.source, "agent-1");
    ASSERT_EQ(batch.entries.size(), 2);
    EXPECT_DOUBLE_EQ(batch.entries[0].time, 1667652117.2578413);
    EXPECT_DOUBLE_EQ(batch.entries[0].value, 0.25);
    EXPECT_EQ(batch.entries[0].tags, (std::vector<std::string>{"core:0", "host:a"}));
}

TEST(JsonCodecTest, CounterEntriesMayUseCount) {
    auto request = JsonCodec::ParseInsertBatch("count", "context_switches",
                                               R"([{"time": 1, "count": 12, "tags": []}])");
    ASSERT_TRUE(request.ok()) << request.error();
    EXPECT_DOUBLE_EQ(request.value().entries[0].value, 12);
    
    auto gauge = JsonCodec::ParseInsertBatch("gauge", "cpu", R"([{"time": 1, "count": 12}])");
    EXPECT_EQ(gauge.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(JsonCodecTest, InsertBodyMustBeArray) {
    auto request = JsonCodec::ParseInsertBatch("gauge", "cpu", R"({"time": 1, "value": 1})");
    EXPECT_EQ(request.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(JsonCodecTest, ParseLegacyQuery) {
    auto request = JsonCodec::ParseLegacyQuery("cpu_usage", R"({
        "operation": "Average",
        "duration": 10.0,
        "group_by": "host",
        "start": 100.5,
        "end": 200.5,
        "output_filter": {
            "Compare": {
                "operation": "GreaterThan",
                "left": {"Transform": "InputValue"},
                "right": {"Transform": {"Value": 0.1}}
            }
        }
    })");
    ASSERT_TRUE(request.ok()) << request.error();
    const auto& query = request.value().query;
    EXPECT_EQ(query.metric, "cpu_usage");
    EXPECT_EQ(query.aggregation.op, core::AggregationOp::AVERAGE);
    EXPECT_DOUBLE_EQ(*query.duration, 10.0);
    EXPECT_EQ(*query.query.group_by, "host");
    EXPECT_DOUBLE_EQ(query.range.start, 100.5);
    EXPECT_DOUBLE_EQ(query.range.end, 200.5);
    ASSERT_TRUE(query.query.output_filter);
    EXPECT_EQ(query.query.output_filter->String(), "GreaterThan(InputValue, 0.1)");
}

TEST(JsonCodecTest, ParseLegacyQueryNullGroupAndPercentile) {
    auto request = JsonCodec::ParseLegacyQuery("cpu_usage", R"({
        "operation": {"Percentile": 99},
        "group_by": null,
        "tags": ["host:a"],
        "start": 0,
        "end": 60
    })");
    ASSERT_TRUE(request.ok()) << request.error();
    const auto& query = request.value().query;
    EXPECT_EQ(query.aggregation.op, core::AggregationOp::PERCENTILE);
    EXPECT_DOUBLE_EQ(query.aggregation.param, 99);
    EXPECT_FALSE(query.query.group_by.has_value());
    EXPECT_FALSE(query.duration.has_value());
    ASSERT_EQ(query.query.tags.size(), 1);
    EXPECT_EQ(query.query.tags[0], core::Tag("host", "a"));
}

TEST(JsonCodecTest, ParseExpressionQuery) {
    auto request = JsonCodec::ParseExpressionQuery(R"({
        "time_range": {"start": 0, "end": 3600},
        "duration": 60,
        "expression": {
            "Arithmetic": {
                "operation": "Divide",
                "left": {"Average": {"metric": "used_memory", "query": {"group_by": "host"}}},
                "right": {"Function": {"function": "Max", "arguments": [
                    {"Percentile": {"metric": "total_memory", "query": {}, "percentile": 95}},
                    {"Value": 1}
                ]}}
            }
        }
    })");
    ASSERT_TRUE(request.ok()) << request.error();
    const auto& query = request.value().query;
    EXPECT_DOUBLE_EQ(query.range.end, 3600);
    EXPECT_DOUBLE_EQ(*query.duration, 60);
    EXPECT_EQ(query.expression->String(),
              "Divide(Average(used_memory by host), Max(Percentile(95)(total_memory), 1))");
    EXPECT_FALSE(query.output_filter);
}

TEST(JsonCodecTest, ParseNestedFilter) {
    auto request = JsonCodec::ParseExpressionQuery(R"({
        "time_range": {"start": 0, "end": 10},
        "expression": {"Sum": {"metric": "m", "query": {}}},
        "output_filter": {"Or": {
            "left": {"Compare": {"operation": "LessThan",
                                 "left": {"Transform": {"Function": {"function": "Abs", "arguments": ["InputValue"]}}},
                                 "right": {"Transform": {"Value": 1}}}},
            "right": {"And": {
                "left": {"Compare": {"operation": "Equal", "left": {"Transform": "InputValue"}, "right": {"Transform": {"Value": 5}}}},
                "right": {"Compare": {"operation": "NotEqual",
                                      "left": {"Transform": {"Arithmetic": {"operation": "Add", "left": "InputValue", "right": {"Value": 1}}}},
                                      "right": {"Transform": {"Value": 0}}}}
            }}
        }}
    })");
    ASSERT_TRUE(request.ok()) << request.error();
    EXPECT_EQ(request.value().query.output_filter->String(),
              "Or(LessThan(Abs(InputValue), 1), And(Equal(InputValue, 5), NotEqual(Add(InputValue, 1), 0)))");
}

TEST(JsonCodecTest, ParseOutputTransform) {
    auto legacy = JsonCodec::ParseLegacyQuery("cpu_usage", R"({
        "operation": "Average", "start": 0, "end": 10,
        "output_transform": {"Function": {"function": "Sqrt", "arguments": ["InputValue"]}}
    })");
    ASSERT_TRUE(legacy.ok()) << legacy.error();
    ASSERT_TRUE(legacy.value().query.query.output_transform);
    EXPECT_EQ(legacy.value().query.query.output_transform->String(), "Sqrt(InputValue)");
    
    auto expression = JsonCodec::ParseExpressionQuery(R"({
        "time_range": {"start": 0, "end": 10},
        "expression": {"Average": {"metric": "used", "query": {
            "output_transform": {"Arithmetic": {"operation": "Multiply", "left": "InputValue", "right": {"Value": 100}}}
        }}}
    })");
    ASSERT_TRUE(expression.ok()) << expression.error();
    const auto* ref = static_cast<const query::MetricRefNode*>(expression.value().query.expression.get());
    ASSERT_TRUE(ref->query.output_transform);
    EXPECT_EQ(ref->query.output_transform->String(), "Multiply(InputValue, 100)");
    
    auto unknown = JsonCodec::ParseLegacyQuery("cpu_usage", R"({
        "operation": "Average", "start": 0, "end": 10, "output_transform": "InputNumerator"
    })");
    EXPECT_EQ(unknown.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(JsonCodecTest, UnknownVariantsRejected) {
    const char* bodies[] = {
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Median": {"metric": "m", "query": {}}}})",
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Arithmetic": {"operation": "Modulo", "left": {"Value": 1}, "right": {"Value": 2}}}})",
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Function": {"function": "Median", "arguments": []}}})",
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Value": 1, "Extra": 2}})",
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Value": 1}, "output_filter": {"Xor": {}}})",
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Value": 1}, "output_filter": {"Compare": {"operation": "Between", "left": {"Transform": "InputValue"}, "right": {"Transform": {"Value": 1}}}}})",
        R"({"time_range": {"start": 0, "end": 1}, "expression": {"Value": 1}, "output_filter": {"Compare": {"operation": "Equal", "left": {"Transform": "InputNumerator"}, "right": {"Transform": {"Value": 1}}}}})",
        R"({"expression": {"Value": 1}})",
        R"([1, 2, 3])",
    };
    for (const char* body : bodies) {
        auto request = JsonCodec::ParseExpressionQuery(body);
        EXPECT_FALSE(request.ok()) << body;
        if (!request.ok()) {
            EXPECT_EQ(request.code(), Error::Code::INVALID_ARGUMENT) << body;
        }
    }
}

TEST(JsonCodecTest, MalformedTagRejected) {
    auto request = JsonCodec::ParseLegacyQuery("cpu", R"({"operation": "Count", "tags": ["nocolon"], "start": 0, "end": 1})");
    EXPECT_EQ(request.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(JsonCodecTest, FormatUngroupedResponse) {
    query::QueryResponse response;
    core::Series samples;
    samples.emplace_back(0.0, 0.4);
    samples.emplace_back(10.5, 1.0);
    response.series.push_back(query::LabeledSeries{std::nullopt, samples});
    
    EXPECT_EQ(JsonCodec::FormatResponse(response), R"({"value":[[0.0,0.4],[10.5,1.0]]})");
}

TEST(JsonCodecTest, FormatGroupedResponse) {
    query::QueryResponse response;
    response.grouped = true;
    core::Series samples;
    samples.emplace_back(0.0, 2.0);
    response.series.push_back(query::LabeledSeries{std::string("a"), samples});
    response.series.push_back(query::LabeledSeries{std::string("b"), core::Series()});
    
    EXPECT_EQ(JsonCodec::FormatResponse(response), R"({"value":[["a",[[0.0,2.0]]],["b",[]]]})");
}

TEST(JsonCodecTest, FormatError) {
    EXPECT_EQ(JsonCodec::FormatError(Error::Code::NOT_FOUND, "Metric 'x' not found"),
              R"({"error":"NotFound","message":"Metric 'x' not found"})");
    
    auto failed = core::Result<size_t>::error(Error::Code::CONFLICT, "kind");
    EXPECT_EQ(JsonCodec::FormatError(failed), R"({"error":"Conflict","message":"kind"})");
}

TEST(JsonCodecTest, FormatInsertAndMetrics) {
    EXPECT_EQ(JsonCodec::FormatInsertResponse(3), R"({"num_inserted":3})");
    
    catalog::MetricDescriptor cpu;
    cpu.name = "cpu_usage";
    cpu.kind = core::MetricKind::GAUGE;
    cpu.auto_primary_tag_key = "host";
    catalog::MetricDescriptor switches;
    switches.name = "context_switches";
    switches.kind = core::MetricKind::COUNTER;
    
    EXPECT_EQ(JsonCodec::FormatMetrics({switches, cpu}),
              R"([{"name":"context_switches","kind":"counter","auto_primary_tag":null},)"
              R"({"name":"cpu_usage","kind":"gauge","auto_primary_tag":"host"}])");
}

} // namespace
} // namespace api
} // namespace metricdb
