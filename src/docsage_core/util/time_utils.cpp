#include "docsage_core/util/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace docsage_core {

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(ftime));
}

std::string time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

}  // namespace docsage_core
