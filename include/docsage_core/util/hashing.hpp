#pragma once

#include <string>
#include <string_view>

namespace docsage_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(std::string_view content);

}  // namespace docsage_core
