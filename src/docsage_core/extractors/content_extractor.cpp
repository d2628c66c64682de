#include "docsage_core/extractors/content_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace docsage_core {

std::string ContentExtractor::read_file(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw SourceError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw SourceError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

bool ContentExtractor::has_extension(const fs::path& file_path,
                                     std::initializer_list<const char*> extensions) {
  // Extensions compare case-insensitively so README.MD and Page.HTML are picked up
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const char* candidate : extensions) {
    if (extension == candidate) {
      return true;
    }
  }
  return false;
}

}  // namespace docsage_core
