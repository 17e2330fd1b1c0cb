#ifndef METRICDB_COMMON_LOGGER_H_
#define METRICDB_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace metricdb {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace metricdb

// Macros for convenient logging
#define METRICDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define METRICDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define METRICDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define METRICDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define METRICDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define METRICDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // METRICDB_COMMON_LOGGER_H_
