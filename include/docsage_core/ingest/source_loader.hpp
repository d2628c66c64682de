#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docsage_core/extractors/content_extractor_factory.hpp"
#include "docsage_core/types/document.hpp"

namespace docsage_core {

struct SourceFailure {
  std::string path;
  std::string reason;
};

struct LoadReport {
  std::vector<Document> documents;
  std::vector<SourceFailure> failures;
  std::vector<std::string> skipped_unsupported;
};

/**
 * @class SourceLoader
 * @brief Walks a source tree and turns every supported file into a Document.
 *
 * Files are visited in lexicographic order of their generic path so two loads
 * of an unchanged tree give the same documents in the same order. Hidden
 * files and directories are skipped. A file that fails to load is reported in
 * LoadReport::failures and the walk continues.
 */
class SourceLoader {
 public:
  explicit SourceLoader(std::shared_ptr<ContentExtractorFactory> content_extractor_factory);

  // Throws ConfigError if root does not exist or is not a directory
  LoadReport load(const std::filesystem::path& root) const;

  // Throws SourceError if the file cannot be read or parsed
  Document load_file(const std::filesystem::path& file_path) const;

  // Replaces invalid UTF-8 with U+FFFD and converts CRLF line endings to LF
  static std::string normalize_text(const std::string& raw);

 private:
  std::shared_ptr<ContentExtractorFactory> content_extractor_factory_;
};

}  // namespace docsage_core
