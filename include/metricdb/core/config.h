#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace metricdb {
namespace core {

/**
 * @brief Configuration for the in-memory point store
 */
struct StorageConfig {
    size_t initial_partition_capacity;  // Points reserved per metric partition on creation
    std::string ungrouped_label;        // Group label for points lacking the group_by key
    
    // Default constructor
    StorageConfig() : initial_partition_capacity(0), ungrouped_label("__ungrouped__") {}
    
    static StorageConfig Default() {
        StorageConfig config;
        config.initial_partition_capacity = 1024;
        config.ungrouped_label = "__ungrouped__";
        return config;
    }
};

/**
 * @brief Configuration for query execution
 */
struct QueryConfig {
    std::chrono::milliseconds default_timeout;  // Used when the caller supplies none
    size_t max_buckets;                         // Maximum buckets per aggregation
    size_t scan_check_interval;                 // Points scanned between deadline checks
    
    // Default constructor
    QueryConfig() : default_timeout(0), max_buckets(0), scan_check_interval(0) {}
    
    static QueryConfig Default() {
        QueryConfig config;
        config.default_timeout = std::chrono::milliseconds(30 * 1000);  // 30 second timeout
        config.max_buckets = 1000000;                                   // Max 1M buckets
        config.scan_check_interval = 4096;
        return config;
    }
};

/**
 * @brief Top-level engine configuration
 */
struct EngineConfig {
    StorageConfig storage;
    QueryConfig query;
    
    EngineConfig() : storage(StorageConfig::Default()), query(QueryConfig::Default()) {}
    
    static EngineConfig Default() {
        return EngineConfig();
    }
};

} // namespace core
} // namespace metricdb
