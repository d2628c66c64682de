#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace docsage_core {

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type ftime);

// "YYYY-MM-DD HH:MM:SS" in UTC
std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);

}  // namespace docsage_core
