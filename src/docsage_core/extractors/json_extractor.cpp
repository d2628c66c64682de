#include "docsage_core/extractors/json_extractor.hpp"

namespace docsage_core {

namespace {

constexpr size_t kMaxNestingDepth = 128;

}  // namespace

bool JsonExtractor::can_handle(const std::filesystem::path& file_path) const {
  return has_extension(file_path, {".json"});
}

ExtractedContent JsonExtractor::extract(const std::string& raw_content,
                                        const std::filesystem::path& file_path) const {
  nlohmann::ordered_json parsed;
  try {
    parsed = nlohmann::ordered_json::parse(raw_content);
  } catch (const nlohmann::json::parse_error& e) {
    throw SourceError("Invalid JSON in " + file_path.string() + ": " + e.what());
  }

  ExtractedContent result;
  std::vector<nlohmann::ordered_json> records;
  if (parsed.is_array()) {
    for (const auto& item : parsed) {
      records.push_back(item);
    }
  } else {
    records.push_back(parsed);
  }

  for (size_t r = 0; r < records.size(); ++r) {
    std::vector<std::string> lines;
    flatten(records[r], "", lines, 0, file_path);
    if (r > 0) {
      result.text += "\n\n";
    }
    for (size_t i = 0; i < lines.size(); ++i) {
      if (i > 0) {
        result.text += "\n";
      }
      result.text += lines[i];
    }
  }

  result.metadata["record_count"] = records.size();
  return result;
}

void JsonExtractor::flatten(const nlohmann::ordered_json& value, const std::string& path,
                            std::vector<std::string>& lines, size_t depth,
                            const std::filesystem::path& file_path) {
  if (depth > kMaxNestingDepth) {
    throw SourceError("JSON in " + file_path.string() + " is nested deeper than " +
                      std::to_string(kMaxNestingDepth) + " levels");
  }

  if (value.is_object()) {
    for (const auto& item : value.items()) {
      const std::string& key = item.key();
      flatten(item.value(), path.empty() ? key : path + "." + key, lines, depth + 1, file_path);
    }
    return;
  }

  if (value.is_array()) {
    for (size_t i = 0; i < value.size(); ++i) {
      flatten(value[i], path + "[" + std::to_string(i) + "]", lines, depth + 1, file_path);
    }
    return;
  }

  // Strings are written without quotes, everything else in its JSON form
  const std::string rendered = value.is_string() ? value.get<std::string>() : value.dump();
  lines.push_back(path.empty() ? rendered : path + ": " + rendered);
}

}  // namespace docsage_core
