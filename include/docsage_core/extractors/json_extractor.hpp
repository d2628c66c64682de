#pragma once
#include <vector>

#include "content_extractor.hpp"

namespace docsage_core {

// Flattens JSON documents into `path.to.field: value` lines.
// A top-level array is treated as a list of records separated by blank lines.
// Documents nested more than 128 levels deep are rejected with SourceError.
class JsonExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  ExtractedContent extract(const std::string& raw_content,
                           const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::Json; }

 private:
  static void flatten(const nlohmann::ordered_json& value, const std::string& path,
                      std::vector<std::string>& lines, size_t depth,
                      const fs::path& file_path);
};

}  // namespace docsage_core
