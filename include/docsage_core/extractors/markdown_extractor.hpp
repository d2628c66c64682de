#pragma once
#include <utility>

#include "content_extractor.hpp"

namespace docsage_core {

class MarkdownExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    ExtractedContent extract(const std::string& raw_content,
                             const fs::path& file_path) const override;

    FileType get_file_type() const override { return FileType::Markdown; }

    /**
     * @brief Separates a leading front-matter block from the markdown body.
     *
     * The block must open on the very first line with `---` and close with a
     * `---` or `...` line. Without a closing marker the whole input is body.
     *
     * @return The parsed metadata object and the remaining body text.
     * @throw SourceError if the block contains a line that is not `key: value`
     *        or a list item.
     */
    static std::pair<nlohmann::json, std::string> split_front_matter(const std::string& content);

private:
    static nlohmann::json parse_front_matter(const std::string& block);
    static nlohmann::json parse_scalar(const std::string& value);
};

}
