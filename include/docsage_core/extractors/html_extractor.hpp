#pragma once

#include "content_extractor.hpp"

namespace docsage_core {

// Flattens an HTML page to readable text. The <title> is reported as metadata.
class HtmlExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  ExtractedContent extract(const std::string& raw_content,
                           const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::Html; }

  static std::string decode_entities(const std::string& text);

 private:
  static std::string collapse_whitespace(const std::string& text);
};

}  // namespace docsage_core
