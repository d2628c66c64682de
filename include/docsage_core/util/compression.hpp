#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docsage_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Compresses text into a single Zstandard frame.
 *
 * The frame records its content size, so decompress_text() can size its
 * output buffer up front. Empty input still produces a valid frame.
 */
std::vector<char> compress_text(std::string_view text, int compression_level = 3);

// Throws CompressionError if the blob is not a complete zstd frame
std::string decompress_text(const std::vector<char>& compressed);

}  // namespace docsage_core
