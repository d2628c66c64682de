#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor that understands a given source file.
 *
 * Holds one instance of every supported extractor. The first extractor that
 * reports it can handle the file's extension wins. This class is non-copyable
 * and non-movable.
 */
namespace docsage_core {
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();

  /**
   * @brief Finds the extractor for the given file.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return The matching extractor, or nullptr for unsupported formats.
   */
  const ContentExtractor* find_extractor_for(const std::filesystem::path& file_path) const;

  /**
   * @brief Same as find_extractor_for, but unsupported formats are an error.
   *
   * @throw SourceError if no extractor handles the file.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  /**
   * @brief Adds an extractor after the built-in ones.
   *
   * @throw std::invalid_argument if extractor is null.
   */
  void register_extractor(ContentExtractorPtr extractor);

  bool is_supported(const std::filesystem::path& file_path) const {
    return find_extractor_for(file_path) != nullptr;
  }

  // The factory owns its extractors, so copying or moving it is not allowed.
  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors;
};
}  // namespace docsage_core
