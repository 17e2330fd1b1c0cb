#include "metricdb/core/result.h"
#include "metricdb/core/error.h"

namespace metricdb {
namespace core {

// Explicit template instantiations
template class Result<std::string>;
template class Result<size_t>;

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "InvalidArgument";
        case Error::Code::NOT_FOUND: return "NotFound";
        case Error::Code::CONFLICT: return "Conflict";
        case Error::Code::TIMEOUT: return "Timeout";
        case Error::Code::CANCELLED: return "Cancelled";
        case Error::Code::INTERNAL: return "Internal";
        case Error::Code::UNKNOWN:
        default:
            return "Unknown";
    }
}

}  // namespace core
}  // namespace metricdb
