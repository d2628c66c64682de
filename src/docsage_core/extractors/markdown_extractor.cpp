#include "docsage_core/extractors/markdown_extractor.hpp"

#include <regex>
#include <sstream>
#include <vector>

namespace docsage_core {

namespace {

std::string trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

bool is_quoted(const std::string& s) {
  return s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                           (s.front() == '\'' && s.back() == '\''));
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

bool MarkdownExtractor::can_handle(const std::filesystem::path& file_path) const {
  return has_extension(file_path, {".md", ".markdown"});
}

ExtractedContent MarkdownExtractor::extract(const std::string& raw_content,
                                            const std::filesystem::path& /*file_path*/) const {
  auto [metadata, body] = split_front_matter(raw_content);
  return {std::move(body), std::move(metadata)};
}

std::pair<nlohmann::json, std::string> MarkdownExtractor::split_front_matter(
    const std::string& content) {
  std::string text = content;
  if (text.rfind("\xEF\xBB\xBF", 0) == 0) {
    text.erase(0, 3);
  }

  // The opening marker has to be the first line
  const auto first_newline = text.find('\n');
  if (first_newline == std::string::npos || trim(text.substr(0, first_newline)) != "---") {
    return {nlohmann::json::object(), text};
  }

  size_t line_start = first_newline + 1;
  while (line_start <= text.size()) {
    size_t line_end = text.find('\n', line_start);
    const bool last_line = line_end == std::string::npos;
    if (last_line) {
      line_end = text.size();
    }

    const std::string marker = trim(text.substr(line_start, line_end - line_start));
    if (marker == "---" || marker == "...") {
      const std::string block = text.substr(first_newline + 1, line_start - first_newline - 1);
      std::string body = last_line ? std::string() : text.substr(line_end + 1);

      // Drop the blank lines separating the header from the body
      const auto body_start = body.find_first_not_of("\r\n");
      body = body_start == std::string::npos ? std::string() : body.substr(body_start);
      return {parse_front_matter(block), body};
    }

    if (last_line) {
      break;
    }
    line_start = line_end + 1;
  }

  // Unterminated header: treat everything as body
  return {nlohmann::json::object(), text};
}

nlohmann::json MarkdownExtractor::parse_front_matter(const std::string& block) {
  nlohmann::json metadata = nlohmann::json::object();
  std::string open_key;  // key whose value continues on the following lines

  const auto lines = split_lines(block);
  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& raw_line = lines[i];
    const std::string line = trim(raw_line);
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const bool indented = raw_line.front() == ' ' || raw_line.front() == '\t';

    if (line == "-" || line.rfind("- ", 0) == 0) {
      if (open_key.empty()) {
        throw SourceError("Front matter list item without a key on line " +
                          std::to_string(i + 2));
      }
      auto& list = metadata[open_key];
      if (list.is_null()) {
        list = nlohmann::json::array();
      }
      if (!list.is_array()) {
        throw SourceError("Front matter key '" + open_key + "' mixes list and map entries");
      }
      list.push_back(parse_scalar(trim(line.substr(1))));
      continue;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      throw SourceError("Malformed front matter line " + std::to_string(i + 2) + ": " + line);
    }

    const std::string key = trim(line.substr(0, colon));
    const std::string value = trim(line.substr(colon + 1));
    if (key.empty()) {
      throw SourceError("Front matter line " + std::to_string(i + 2) + " has an empty key");
    }

    // One level of nesting: "author:\n  name: Ada"
    if (indented && !open_key.empty()) {
      auto& map = metadata[open_key];
      if (map.is_null()) {
        map = nlohmann::json::object();
      }
      if (!map.is_object()) {
        throw SourceError("Front matter key '" + open_key + "' mixes list and map entries");
      }
      map[key] = parse_scalar(value);
      continue;
    }

    if (value.empty()) {
      metadata[key] = nullptr;
      open_key = key;
      continue;
    }

    open_key.clear();
    if (value.front() == '[' && value.back() == ']') {
      nlohmann::json list = nlohmann::json::array();
      std::stringstream items(value.substr(1, value.size() - 2));
      std::string item;
      while (std::getline(items, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
          list.push_back(parse_scalar(item));
        }
      }
      metadata[key] = std::move(list);
    } else {
      metadata[key] = parse_scalar(value);
    }
  }

  return metadata;
}

nlohmann::json MarkdownExtractor::parse_scalar(const std::string& value) {
  static const std::regex integer_regex(R"(^[-+]?\d+$)");
  static const std::regex float_regex(R"(^[-+]?(\d+\.\d*|\.\d+|\d+)([eE][-+]?\d+)?$)");

  if (is_quoted(value)) {
    return value.substr(1, value.size() - 2);
  }
  if (value == "true" || value == "True") {
    return true;
  }
  if (value == "false" || value == "False") {
    return false;
  }
  if (value == "null" || value == "~") {
    return nullptr;
  }
  try {
    if (std::regex_match(value, integer_regex)) {
      return std::stoll(value);
    }
    if (std::regex_match(value, float_regex)) {
      return std::stod(value);
    }
  } catch (const std::out_of_range&) {
    // Too large for a number, keep the literal text
  }
  return value;
}

}  // namespace docsage_core
