#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docsage_core/index/vector_index.hpp"

namespace docsage_core {

// The artifact is missing, unreadable, corrupted or was built with different
// parameters. Callers recover by rebuilding.
class IndexIntegrityError : public std::exception {
 public:
  explicit IndexIntegrityError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Writing the artifact failed. The previous artifact, if any, is untouched.
class IndexStoreError : public std::exception {
 public:
  explicit IndexStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class IndexStore
 * @brief Persists a VectorIndex as a single SQLite file.
 *
 * save() writes a sibling `<index_path>.tmp` inside one transaction and then
 * renames it over the artifact, so readers only ever see a complete index.
 * load() opens the artifact read-only and checks the format version and the
 * fingerprint before handing back a new VectorIndex.
 */
class IndexStore {
 public:
  static constexpr int FORMAT_VERSION = 1;

  explicit IndexStore(std::filesystem::path index_path);

  // Throws IndexStoreError
  void save(const VectorIndex &index) const;

  // Throws IndexIntegrityError. A zero expected dimension accepts any dimension.
  std::shared_ptr<VectorIndex> load(const IndexFingerprint &expected,
                                    const SearchOptions &options) const;

  bool exists() const;
  const std::filesystem::path &path() const { return index_path_; }
  std::filesystem::path temporary_path() const;

 private:
  std::filesystem::path index_path_;

  void write_artifact(const std::filesystem::path &target, const VectorIndex &index) const;
};

}  // namespace docsage_core
