#include "Util.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string current_timestamp() {
  const auto  now     = std::chrono::system_clock::now();
  const auto  now_t   = std::chrono::system_clock::to_time_t(now);
  std::tm     local_t = {};

  localtime_r(&now_t, &local_t);

  std::ostringstream os;
  os << std::put_time(&local_t, "%Y-%m-%d %H:%M:%S");
  return os.str();
}
