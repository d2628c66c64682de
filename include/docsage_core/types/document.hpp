#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "docsage_core/types/file.hpp"

namespace docsage_core {

// One parsed source file. Lives only until it has been chunked.
struct Document {
  std::string path;
  std::string content;
  nlohmann::json metadata = nlohmann::json::object();
  FileType file_type = FileType::Unknown;
  std::string content_hash;
};

}  // namespace docsage_core
