// ============================================================================
// SIGNGATE - Core Types Implementation
// ============================================================================

#include "signgate/core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace signgate {

std::string to_iso8601(Timestamp ts) {
    const auto ms = to_epoch_ms(ts);
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return ss.str();
}

}  // namespace signgate
