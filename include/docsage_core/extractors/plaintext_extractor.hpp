#pragma once

#include "content_extractor.hpp"

namespace docsage_core {

class PlainTextExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    ExtractedContent extract(const std::string& raw_content,
                             const fs::path& file_path) const override;

    FileType get_file_type() const override { return FileType::Text; }
};

}
