#pragma once

#include <exception>
#include <string>

namespace docqa_core {

// Error taxonomy shared by the indexing and retrieval pipeline. Each class
// carries its message; callers match on the type.

class DownloadError : public std::exception {
 public:
  explicit DownloadError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// No usable text after extraction and cleaning.
class ExtractionError : public std::exception {
 public:
  explicit ExtractionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class InvalidParameterError : public std::exception {
 public:
  explicit InvalidParameterError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DimensionMismatchError : public std::exception {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : message_("Vector dimension mismatch. Expected " + std::to_string(expected) + ", got " +
                 std::to_string(actual)) {}
  explicit DimensionMismatchError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class NotFoundError : public std::exception {
 public:
  explicit NotFoundError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Opaque failure from the answer generation boundary (network, quota, model).
class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace docqa_core
