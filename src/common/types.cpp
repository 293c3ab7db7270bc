#include "common/types.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hacluster {
namespace common {

// Explicit template instantiations for the Result types used across modules
template class Result<bool>;
template class Result<uint64_t>;
template class Result<int64_t>;

int64_t to_unix_millis(const Timestamp &ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             ts.time_since_epoch())
      .count();
}

Timestamp from_unix_millis(int64_t millis) {
  return Timestamp(std::chrono::milliseconds(millis));
}

std::string format_iso8601(const Timestamp &ts) {
  auto time_t = std::chrono::system_clock::to_time_t(ts);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                ts.time_since_epoch()) %
            1000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count() << "Z";
  return oss.str();
}

} // namespace common
} // namespace hacluster
