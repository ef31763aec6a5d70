#include "Common/TimeUtils.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace BacLink {
namespace TimeUtils {

std::string ToIsoString(const Timestamp &tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
      tp.time_since_epoch());
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(micros);
  auto frac = micros - secs;
  if (frac.count() < 0) {
    secs -= std::chrono::seconds(1);
    frac += std::chrono::seconds(1);
  }

  std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm tm_buf;
  gmtime_r(&t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(6) << frac.count() << 'Z';
  return oss.str();
}

std::optional<Timestamp> FromIsoString(const std::string &text) {
  std::tm tm_buf{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  long long micros = 0;
  if (iss.peek() == '.') {
    iss.get();
    std::string digits;
    while (std::isdigit(iss.peek())) {
      digits.push_back(static_cast<char>(iss.get()));
    }
    if (digits.empty()) {
      return std::nullopt;
    }
    digits.resize(6, '0');
    micros = std::stoll(digits);
  }
  if (iss.peek() == 'Z') {
    iss.get();
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }

  std::time_t t = timegm(&tm_buf);
  return std::chrono::system_clock::from_time_t(t) +
         std::chrono::microseconds(micros);
}

} // namespace TimeUtils
} // namespace BacLink
