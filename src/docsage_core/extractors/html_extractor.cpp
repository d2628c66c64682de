#include "docsage_core/extractors/html_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <set>
#include <sstream>
#include <vector>

#include <utf8.h>

namespace docsage_core {

namespace {

std::string to_lower(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

// Drops every span from open_marker through close_marker (case-insensitive).
// An unclosed span runs to the end of the input.
std::string remove_between(const std::string& html, const std::string& open_marker,
                           const std::string& close_marker) {
  const std::string lower = to_lower(html);
  std::string out;
  size_t pos = 0;
  while (pos < html.size()) {
    const size_t open = lower.find(open_marker, pos);
    if (open == std::string::npos) {
      out.append(html, pos, std::string::npos);
      break;
    }
    out.append(html, pos, open - pos);
    const size_t close = lower.find(close_marker, open + open_marker.size());
    if (close == std::string::npos) {
      break;
    }
    pos = close + close_marker.size();
  }
  return out;
}

// Finds "<name" followed by whitespace, '>' or '/', starting at from
size_t find_tag(const std::string& lower, const std::string& name, size_t from) {
  const std::string marker = "<" + name;
  size_t pos = lower.find(marker, from);
  while (pos != std::string::npos) {
    const size_t after = pos + marker.size();
    if (after >= lower.size() || lower[after] == '>' || lower[after] == '/' ||
        std::isspace(static_cast<unsigned char>(lower[after]))) {
      return pos;
    }
    pos = lower.find(marker, after);
  }
  return std::string::npos;
}

std::string remove_element(const std::string& html, const std::string& name) {
  const std::string lower = to_lower(html);
  const std::string close_marker = "</" + name;
  std::string out;
  size_t pos = 0;
  while (pos < html.size()) {
    const size_t open = find_tag(lower, name, pos);
    if (open == std::string::npos) {
      out.append(html, pos, std::string::npos);
      break;
    }
    out.append(html, pos, open - pos);
    const size_t close = lower.find(close_marker, open);
    if (close == std::string::npos) {
      break;
    }
    const size_t close_end = lower.find('>', close);
    if (close_end == std::string::npos) {
      break;
    }
    pos = close_end + 1;
  }
  return out;
}

// Raw inner markup of the first <name> element, or "" if there is none
std::string element_text(const std::string& html, const std::string& name) {
  const std::string lower = to_lower(html);
  const size_t open = find_tag(lower, name, 0);
  if (open == std::string::npos) {
    return "";
  }
  const size_t content_start = lower.find('>', open);
  if (content_start == std::string::npos) {
    return "";
  }
  const size_t close = lower.find("</" + name, content_start);
  if (close == std::string::npos) {
    return "";
  }
  return html.substr(content_start + 1, close - content_start - 1);
}

void append_code_point(std::string& out, unsigned long code_point) {
  if (code_point == 0 || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    utf8::append(static_cast<uint32_t>(0xFFFD), std::back_inserter(out));
    return;
  }
  utf8::append(static_cast<uint32_t>(code_point), std::back_inserter(out));
}

bool is_block_tag(const std::string& name) {
  static const std::set<std::string> block_tags = {
      "p", "div", "br", "li", "ul", "ol", "tr", "table", "section", "article", "header",
      "footer", "pre", "blockquote", "h1", "h2", "h3", "h4", "h5", "h6"};
  return block_tags.count(name) > 0;
}

// Removes every "<...>" span in one pass. Block-level tags become a line break
// when mark_blocks is set. A '<' with no closing '>' is left as text.
std::string strip_tags(const std::string& html, bool mark_blocks) {
  std::string out;
  out.reserve(html.size());
  size_t pos = 0;
  while (pos < html.size()) {
    const size_t open = html.find('<', pos);
    if (open == std::string::npos) {
      out.append(html, pos, std::string::npos);
      break;
    }
    const size_t close = html.find('>', open + 1);
    if (close == std::string::npos) {
      out.append(html, pos, std::string::npos);
      break;
    }
    out.append(html, pos, open - pos);

    if (mark_blocks) {
      size_t name_begin = open + 1;
      if (name_begin < close && html[name_begin] == '/') {
        ++name_begin;
      }
      size_t name_end = name_begin;
      while (name_end < close && std::isalnum(static_cast<unsigned char>(html[name_end]))) {
        ++name_end;
      }
      if (is_block_tag(to_lower(html.substr(name_begin, name_end - name_begin)))) {
        out.push_back('\n');
      }
    }
    pos = close + 1;
  }
  return out;
}

}  // namespace

bool HtmlExtractor::can_handle(const std::filesystem::path& file_path) const {
  return has_extension(file_path, {".html", ".htm"});
}

ExtractedContent HtmlExtractor::extract(const std::string& raw_content,
                                        const std::filesystem::path& /*file_path*/) const {
  ExtractedContent result;

  std::string html = remove_between(raw_content, "<!--", "-->");
  html = remove_element(html, "script");
  html = remove_element(html, "style");

  const std::string title = collapse_whitespace(
      decode_entities(strip_tags(element_text(html, "title"), false)));
  if (!title.empty()) {
    result.metadata["title"] = title;
  }

  html = remove_element(html, "head");
  html = strip_tags(html, true);

  result.text = collapse_whitespace(decode_entities(html));
  return result;
}

std::string HtmlExtractor::decode_entities(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }

    const size_t semi = text.find(';', i);
    if (semi == std::string::npos || semi - i > 10) {
      out.push_back(text[i++]);
      continue;
    }

    const std::string entity = text.substr(i + 1, semi - i - 1);
    bool decoded = true;
    if (entity == "amp") {
      out.push_back('&');
    } else if (entity == "lt") {
      out.push_back('<');
    } else if (entity == "gt") {
      out.push_back('>');
    } else if (entity == "quot") {
      out.push_back('"');
    } else if (entity == "apos" || entity == "#39") {
      out.push_back('\'');
    } else if (entity == "nbsp") {
      out.push_back(' ');
    } else if (entity.size() > 1 && entity[0] == '#') {
      try {
        const bool hex = entity[1] == 'x' || entity[1] == 'X';
        const std::string digits = entity.substr(hex ? 2 : 1);
        size_t consumed = 0;
        const unsigned long code_point = std::stoul(digits, &consumed, hex ? 16 : 10);
        if (consumed != digits.size()) {
          decoded = false;
        } else {
          append_code_point(out, code_point);
        }
      } catch (const std::exception&) {
        decoded = false;
      }
    } else {
      decoded = false;
    }

    if (decoded) {
      i = semi + 1;
    } else {
      out.push_back(text[i++]);
    }
  }
  return out;
}

// Runs of spaces become one space, blank lines collapse to a single paragraph break
std::string HtmlExtractor::collapse_whitespace(const std::string& text) {
  std::stringstream input(text);
  std::string line;
  std::vector<std::string> paragraphs;
  std::string current;

  while (std::getline(input, line)) {
    std::string collapsed;
    bool pending_space = false;
    for (char c : line) {
      if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
        pending_space = !collapsed.empty();
        continue;
      }
      if (pending_space) {
        collapsed.push_back(' ');
        pending_space = false;
      }
      collapsed.push_back(c);
    }

    if (collapsed.empty()) {
      if (!current.empty()) {
        paragraphs.push_back(current);
        current.clear();
      }
      continue;
    }
    if (!current.empty()) {
      current += "\n";
    }
    current += collapsed;
  }
  if (!current.empty()) {
    paragraphs.push_back(current);
  }

  std::string out;
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0) {
      out += "\n\n";
    }
    out += paragraphs[i];
  }
  return out;
}

}  // namespace docsage_core
