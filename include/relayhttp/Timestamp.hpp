#ifndef RELAY_HTTP_TIMESTAMP_HPP
#define RELAY_HTTP_TIMESTAMP_HPP

#include <cstdint>
#include <string>

namespace relayhttp {

  namespace Timestamp {

    // Milliseconds since the epoch.
    int64_t getCurrentTimestamp();

    // Monotonic milliseconds, used for request deadlines.
    int64_t getSteadyTimestamp();

    std::string getFormatedTimestamp();

  } // namespace Timestamp

} // namespace relayhttp

#endif // RELAY_HTTP_TIMESTAMP_HPP
