#include "csi/core/types.h"
#include <absl/time/time.h>
#include <sstream>

namespace csi {
namespace core {

namespace {

std::string format_timestamp(Timestamp ts) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", absl::FromUnixMillis(ts), absl::UTCTimeZone());
}

} // namespace

std::string TimeInterval::to_string() const {
    std::ostringstream oss;
    oss << "[" << format_timestamp(start_) << ", " << format_timestamp(end_) << ")";
    return oss.str();
}

} // namespace core
} // namespace csi
