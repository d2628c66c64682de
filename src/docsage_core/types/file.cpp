#include "docsage_core/types/file.hpp"

namespace docsage_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "text";
    case FileType::Markdown:
      return "markdown";
    case FileType::Html:
      return "html";
    case FileType::Csv:
      return "csv";
    case FileType::Json:
      return "json";
    default:
      return "unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "text")
    return FileType::Text;
  if (str == "markdown")
    return FileType::Markdown;
  if (str == "html")
    return FileType::Html;
  if (str == "csv")
    return FileType::Csv;
  if (str == "json")
    return FileType::Json;
  return FileType::Unknown;
}

}  // namespace docsage_core
