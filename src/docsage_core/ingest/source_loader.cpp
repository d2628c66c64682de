#include "docsage_core/ingest/source_loader.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

#include <utf8.h>

#include "docsage_core/config.hpp"
#include "docsage_core/util/hashing.hpp"
#include "docsage_core/util/time_utils.hpp"

namespace docsage_core {

namespace {

bool is_hidden(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

// File names are raw bytes on POSIX; metadata must stay valid UTF-8 to serialize
std::string to_valid_utf8(const std::string& text) {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
  return valid;
}

}  // namespace

SourceLoader::SourceLoader(std::shared_ptr<ContentExtractorFactory> content_extractor_factory)
    : content_extractor_factory_(std::move(content_extractor_factory)) {}

LoadReport SourceLoader::load(const std::filesystem::path& root) const {
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) {
    throw ConfigError("Source directory does not exist: " + root.string());
  }
  if (!std::filesystem::is_directory(root, ec)) {
    throw ConfigError("Source path is not a directory: " + root.string());
  }

  LoadReport report;
  std::vector<std::filesystem::path> candidates;

  auto it = std::filesystem::recursive_directory_iterator(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  const auto end = std::filesystem::recursive_directory_iterator();
  if (ec) {
    throw ConfigError("Cannot read source directory " + root.string() + ": " + ec.message());
  }

  while (it != end) {
    const auto& entry = *it;
    if (is_hidden(entry.path())) {
      if (entry.is_directory(ec)) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(ec)) {
      candidates.push_back(entry.path());
    }

    it.increment(ec);
    if (ec) {
      std::cerr << "[Loader] Warning: stopped walking " << root.string() << ": " << ec.message()
                << std::endl;
      report.failures.push_back({root.generic_string(), ec.message()});
      break;
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const std::filesystem::path& a, const std::filesystem::path& b) {
              return a.generic_string() < b.generic_string();
            });

  for (const auto& file_path : candidates) {
    if (!content_extractor_factory_->is_supported(file_path)) {
      report.skipped_unsupported.push_back(file_path.generic_string());
      continue;
    }

    try {
      report.documents.push_back(load_file(file_path));
    } catch (const SourceError& e) {
      std::cerr << "[Loader] Skipping " << file_path.generic_string() << ": " << e.what()
                << std::endl;
      report.failures.push_back({file_path.generic_string(), e.what()});
    } catch (const std::filesystem::filesystem_error& e) {
      std::cerr << "[Loader] Skipping " << file_path.generic_string() << ": " << e.what()
                << std::endl;
      report.failures.push_back({file_path.generic_string(), e.what()});
    } catch (const std::exception& e) {
      std::cerr << "[Loader] Skipping " << file_path.generic_string()
                << ": unexpected error: " << e.what() << std::endl;
      report.failures.push_back({file_path.generic_string(), e.what()});
    }
  }

  std::cout << "[Loader] Loaded " << report.documents.size() << " documents from "
            << root.string() << " (" << report.failures.size() << " failed, "
            << report.skipped_unsupported.size() << " unsupported)" << std::endl;
  return report;
}

Document SourceLoader::load_file(const std::filesystem::path& file_path) const {
  const ContentExtractor& extractor = content_extractor_factory_->get_extractor_for(file_path);

  const std::string raw = extractor.read_file(file_path);
  ExtractedContent extracted = extractor.extract(normalize_text(raw), file_path);

  Document document;
  document.path = to_valid_utf8(file_path.generic_string());
  document.content = std::move(extracted.text);
  document.file_type = extractor.get_file_type();
  document.content_hash = sha256_hex(raw);

  // Format metadata first, then the loader's own keys so they always win
  document.metadata = extracted.metadata.is_object() ? std::move(extracted.metadata)
                                                     : nlohmann::json::object();
  document.metadata["source"] = document.path;
  document.metadata["filename"] = to_valid_utf8(file_path.filename().string());
  document.metadata["filetype"] = to_string(document.file_type);
  document.metadata["last_modified"] =
      time_point_to_string(to_system_time(std::filesystem::last_write_time(file_path)));

  return document;
}

std::string SourceLoader::normalize_text(const std::string& raw) {
  const std::string valid = to_valid_utf8(raw);

  std::string normalized;
  normalized.reserve(valid.size());
  for (size_t i = 0; i < valid.size(); ++i) {
    if (valid[i] == '\r' && i + 1 < valid.size() && valid[i + 1] == '\n') {
      continue;
    }
    normalized.push_back(valid[i]);
  }
  return normalized;
}

}  // namespace docsage_core
