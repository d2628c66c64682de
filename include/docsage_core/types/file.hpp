#pragma once

#include <string>

namespace docsage_core {

// Closed set of source formats the loader understands
enum class FileType { Text, Markdown, Html, Csv, Json, Unknown };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

}  // namespace docsage_core
