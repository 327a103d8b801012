#include "relayhttp/Timestamp.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace relayhttp {

  namespace Timestamp {

    int64_t getCurrentTimestamp() {
      auto now = std::chrono::system_clock::now();
      return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }

    int64_t getSteadyTimestamp() {
      auto now = std::chrono::steady_clock::now();
      return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }

    std::string getFormatedTimestamp() {
      auto now = std::chrono::system_clock::now();
      std::time_t now_c = std::chrono::system_clock::to_time_t(now);
      std::tm parts{};
      #ifdef _WIN32
        localtime_s(&parts, &now_c);
      #else
        localtime_r(&now_c, &parts);
      #endif

      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
          now.time_since_epoch()).count() % 1'000;

      std::ostringstream oss;
      oss << std::put_time(&parts, "%Y-%m-%d %H:%M:%S");
      oss << "." << std::setfill('0') << std::setw(3) << ms;
      return oss.str();
    }

  } // namespace Timestamp

} // namespace relayhttp
