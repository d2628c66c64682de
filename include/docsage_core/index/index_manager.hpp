#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>

#include "docsage_core/index/index_builder.hpp"
#include "docsage_core/index/index_store.hpp"

namespace docsage_core {

using IndexHandle = std::shared_ptr<const VectorIndex>;

/**
 * @class IndexManager
 * @brief Owns the index currently being served.
 *
 * The served index is an immutable snapshot held in an atomic shared pointer.
 * A rebuild constructs and persists a complete new index before swapping it
 * in, so queries that already hold a handle keep using the old snapshot.
 */
class IndexManager {
 public:
  IndexManager(std::shared_ptr<IndexBuilder> index_builder,
               std::shared_ptr<IndexStore> index_store,
               std::filesystem::path docs_dir);

  // Loads the persisted index when it matches the configuration, rebuilds otherwise
  IndexHandle build_or_load();

  // Throws EmbeddingError or IndexStoreError; the served index is unchanged then
  IndexHandle rebuild();

  // nullptr until build_or_load() or rebuild() succeeded
  IndexHandle current() const { return current_.load(); }

  IndexManager(const IndexManager &) = delete;
  IndexManager &operator=(const IndexManager &) = delete;

 private:
  std::shared_ptr<IndexBuilder> index_builder_;
  std::shared_ptr<IndexStore> index_store_;
  std::filesystem::path docs_dir_;

  std::atomic<IndexHandle> current_;
  // Serializes rebuilds; readers never take it
  std::mutex rebuild_mutex_;

  IndexHandle rebuild_locked();
};

}  // namespace docsage_core
