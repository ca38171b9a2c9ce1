#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Zstandard helpers for chunk text stored in snapshots.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;
  // Frames claiming a larger content size are rejected as corrupt
  static constexpr unsigned long long MAX_DECOMPRESSED_SIZE = 64ULL * 1024 * 1024;

  /**
   * @brief Compresses text into a single zstd frame. Empty input yields an empty blob.
   * @throw CompressionError if zstd reports a failure.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Inverse of compress().
   * @throw CompressionError if the blob is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace docqa_core
