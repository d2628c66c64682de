#include "docsage_core/util/compression.hpp"

#include <zstd.h>

namespace docsage_core {

std::vector<char> compress_text(std::string_view text, int compression_level) {
  std::vector<char> frame(ZSTD_compressBound(text.size()));

  const size_t frame_size =
      ZSTD_compress(frame.data(), frame.size(), text.data(), text.size(), compression_level);
  if (ZSTD_isError(frame_size)) {
    throw CompressionError("zstd compression failed: " +
                           std::string(ZSTD_getErrorName(frame_size)));
  }

  frame.resize(frame_size);
  return frame;
}

std::string decompress_text(const std::vector<char>& compressed) {
  if (compressed.empty()) {
    throw CompressionError("zstd frame is empty");
  }

  const unsigned long long content_size =
      ZSTD_getFrameContentSize(compressed.data(), compressed.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    throw CompressionError("Data is not a zstd frame");
  }
  if (content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("zstd frame does not record its content size");
  }

  std::string text(static_cast<size_t>(content_size), '\0');
  const size_t written = ZSTD_decompress(text.data(), text.size(), compressed.data(), compressed.size());
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  if (written != content_size) {
    throw CompressionError("zstd frame decoded to " + std::to_string(written) +
                           " bytes, expected " + std::to_string(content_size));
  }
  return text;
}

}  // namespace docsage_core
