#pragma once

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "docsage_core/types/file.hpp"

namespace fs = std::filesystem;

namespace docsage_core {

// Raised when a single source file cannot be read or parsed
class SourceError : public std::exception {
 public:
  explicit SourceError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ExtractedContent {
  std::string text;
  nlohmann::json metadata = nlohmann::json::object();
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Turns the raw file bytes into plain text plus whatever metadata the format carries.
  // Throws SourceError when the content cannot be parsed.
  virtual ExtractedContent extract(const std::string& raw_content,
                                   const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

  std::string read_file(const fs::path& file_path) const;

 protected:
  static bool has_extension(const fs::path& file_path,
                            std::initializer_list<const char*> extensions);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docsage_core
