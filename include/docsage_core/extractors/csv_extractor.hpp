#pragma once
#include <vector>

#include "content_extractor.hpp"

namespace docsage_core {

/**
 * @class CsvExtractor
 * @brief Renders delimited tables as one `field: value` block per record.
 *
 * The first row is the header. `.csv` files are comma separated and `.tsv`
 * files tab separated. Quoted fields follow RFC 4180, so they may hold the
 * delimiter, doubled quotes and line breaks.
 */
class CsvExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  ExtractedContent extract(const std::string& raw_content,
                           const fs::path& file_path) const override;

  FileType get_file_type() const override { return FileType::Csv; }

  // Throws SourceError on an unterminated quoted field
  static std::vector<std::vector<std::string>> parse_rows(const std::string& content,
                                                          char delimiter);
};

}  // namespace docsage_core
