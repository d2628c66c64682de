#include "docsage_core/extractors/plaintext_extractor.hpp"

namespace docsage_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
    return has_extension(file_path, {".txt", ".log", ".adoc"});
}

// Plain text, logs and AsciiDoc sources are indexed verbatim.
ExtractedContent PlainTextExtractor::extract(const std::string& raw_content,
                                             const std::filesystem::path& /*file_path*/) const {
    return {raw_content, nlohmann::json::object()};
}

} // namespace docsage_core
