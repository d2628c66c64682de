#include "docsage_core/extractors/csv_extractor.hpp"

#include <sstream>

namespace docsage_core {

namespace {

bool is_blank_row(const std::vector<std::string>& row) {
  for (const auto& field : row) {
    if (field.find_first_not_of(" \t") != std::string::npos) {
      return false;
    }
  }
  return true;
}

std::string trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

bool CsvExtractor::can_handle(const std::filesystem::path& file_path) const {
  return has_extension(file_path, {".csv", ".tsv"});
}

ExtractedContent CsvExtractor::extract(const std::string& raw_content,
                                       const std::filesystem::path& file_path) const {
  const char delimiter = file_path.extension() == ".tsv" ? '\t' : ',';
  auto rows = parse_rows(raw_content, delimiter);

  ExtractedContent result;
  if (rows.empty()) {
    result.metadata["columns"] = nlohmann::json::array();
    result.metadata["record_count"] = 0;
    return result;
  }

  std::vector<std::string> header;
  for (size_t i = 0; i < rows.front().size(); ++i) {
    std::string name = trim(rows.front()[i]);
    header.push_back(name.empty() ? "column_" + std::to_string(i + 1) : name);
  }

  std::stringstream text;
  size_t record_count = 0;
  for (size_t r = 1; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (record_count > 0) {
      text << "\n\n";
    }

    bool first_field = true;
    for (size_t i = 0; i < row.size(); ++i) {
      const std::string& name = i < header.size() ? header[i] : "column_" + std::to_string(i + 1);
      if (!first_field) {
        text << "\n";
      }
      text << name << ": " << row[i];
      first_field = false;
    }
    ++record_count;
  }

  result.text = text.str();
  result.metadata["columns"] = header;
  result.metadata["record_count"] = record_count;
  return result;
}

std::vector<std::vector<std::string>> CsvExtractor::parse_rows(const std::string& content,
                                                               char delimiter) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;

  auto end_row = [&]() {
    row.push_back(field);
    field.clear();
    field_started = false;
    if (!is_blank_row(row)) {
      rows.push_back(std::move(row));
    }
    row.clear();
  };

  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < content.size() && content[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"' && !field_started) {
      in_quotes = true;
      field_started = true;
    } else if (c == delimiter) {
      row.push_back(field);
      field.clear();
      field_started = false;
    } else if (c == '\n') {
      end_row();
    } else if (c == '\r') {
      // CRLF line endings
    } else {
      field.push_back(c);
      field_started = true;
    }
  }

  if (in_quotes) {
    throw SourceError("Unterminated quoted field in delimited file");
  }
  if (field_started || !field.empty() || !row.empty()) {
    end_row();
  }
  return rows;
}

}  // namespace docsage_core
