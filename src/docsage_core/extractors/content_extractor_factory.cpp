#include "docsage_core/extractors/content_extractor_factory.hpp"

#include <stdexcept>

#include "docsage_core/extractors/csv_extractor.hpp"
#include "docsage_core/extractors/html_extractor.hpp"
#include "docsage_core/extractors/json_extractor.hpp"
#include "docsage_core/extractors/markdown_extractor.hpp"
#include "docsage_core/extractors/plaintext_extractor.hpp"

namespace docsage_core {
ContentExtractorFactory::ContentExtractorFactory() {
    extractors.push_back(std::make_unique<MarkdownExtractor>());
    extractors.push_back(std::make_unique<PlainTextExtractor>());
    extractors.push_back(std::make_unique<HtmlExtractor>());
    extractors.push_back(std::make_unique<CsvExtractor>());
    extractors.push_back(std::make_unique<JsonExtractor>());
}

void ContentExtractorFactory::register_extractor(ContentExtractorPtr extractor) {
    if (!extractor) {
        throw std::invalid_argument("Cannot register a null content extractor");
    }
    extractors.push_back(std::move(extractor));
}

const ContentExtractor* ContentExtractorFactory::find_extractor_for(
    const std::filesystem::path& file_path) const {
    for (const auto& extractor : extractors) {
        if (extractor->can_handle(file_path)) {
            return extractor.get();
        }
    }
    return nullptr;
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
    const ContentExtractor* extractor = find_extractor_for(file_path);
    if (extractor == nullptr) {
        throw SourceError("No suitable content extractor found for " + file_path.string());
    }
    return *extractor;
}
}  // namespace docsage_core
