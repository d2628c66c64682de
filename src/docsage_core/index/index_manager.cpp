#include "docsage_core/index/index_manager.hpp"

#include <iostream>

namespace docsage_core {

IndexManager::IndexManager(std::shared_ptr<IndexBuilder> index_builder,
                           std::shared_ptr<IndexStore> index_store,
                           std::filesystem::path docs_dir)
    : index_builder_(std::move(index_builder)),
      index_store_(std::move(index_store)),
      docs_dir_(std::move(docs_dir)) {}

IndexHandle IndexManager::build_or_load() {
  std::lock_guard<std::mutex> lock(rebuild_mutex_);

  try {
    IndexHandle loaded = index_store_->load(index_builder_->expected_fingerprint(),
                                            index_builder_->search_options());
    current_.store(loaded);
    return loaded;
  } catch (const IndexIntegrityError &e) {
    std::cerr << "[Index] " << e.what() << "; rebuilding" << std::endl;
  }

  return rebuild_locked();
}

IndexHandle IndexManager::rebuild() {
  std::lock_guard<std::mutex> lock(rebuild_mutex_);
  return rebuild_locked();
}

IndexHandle IndexManager::rebuild_locked() {
  IndexHandle fresh = index_builder_->build(docs_dir_);

  // Persist first: if the artifact cannot be written the new index is not served
  index_store_->save(*fresh);

  current_.store(fresh);
  return fresh;
}

}  // namespace docsage_core
