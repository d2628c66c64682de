#include "docsage_core/index/index_store.hpp"

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <map>

#include "docsage_core/db/sqlite_error_utils.hpp"
#include "docsage_core/db/transaction.hpp"
#include "docsage_core/util/compression.hpp"
#include "docsage_core/util/time_utils.hpp"

namespace docsage_core {

namespace {

struct StoredRow {
  int64_t position;
  std::string id;
  std::string source;
  int chunk_index;
  int64_t start_offset;
  int64_t end_offset;
  std::vector<char> content;
  std::string metadata;
  std::vector<char> vector;
};

std::vector<char> to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

const std::string &require_key(const std::map<std::string, std::string> &info,
                               const std::string &key) {
  auto it = info.find(key);
  if (it == info.end()) {
    throw IndexIntegrityError("Index artifact is missing '" + key + "' in index_info");
  }
  return it->second;
}

size_t require_count(const std::map<std::string, std::string> &info, const std::string &key) {
  const std::string &value = require_key(info, key);
  try {
    size_t consumed = 0;
    const long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size() || parsed < 0) {
      throw IndexIntegrityError("index_info '" + key + "' is not a count: " + value);
    }
    return static_cast<size_t>(parsed);
  } catch (const std::logic_error &) {
    throw IndexIntegrityError("index_info '" + key + "' is not a count: " + value);
  }
}

// Invalid UTF-8 in metadata strings is written as U+FFFD rather than failing the save
std::string dump_metadata(const nlohmann::json &metadata) {
  return metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

IndexStore::IndexStore(std::filesystem::path index_path) : index_path_(std::move(index_path)) {}

bool IndexStore::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(index_path_, ec);
}

std::filesystem::path IndexStore::temporary_path() const {
  std::filesystem::path tmp = index_path_;
  tmp += ".tmp";
  return tmp;
}

void IndexStore::save(const VectorIndex &index) const {
  const auto tmp = temporary_path();

  auto discard_tmp = [&]() {
    std::error_code remove_ec;
    std::filesystem::remove(tmp, remove_ec);
    std::filesystem::remove(std::filesystem::path(tmp.string() + "-journal"), remove_ec);
  };

  try {
    if (index_path_.has_parent_path()) {
      std::filesystem::create_directories(index_path_.parent_path());
    }
    // A crashed earlier save may have left a partial file behind
    std::filesystem::remove(tmp);

    write_artifact(tmp, index);
    std::filesystem::rename(tmp, index_path_);
  } catch (const sqlite::sqlite_exception &e) {
    discard_tmp();
    throw IndexStoreError(format_db_error("save_index", e));
  } catch (const std::filesystem::filesystem_error &e) {
    discard_tmp();
    throw IndexStoreError("Failed to write index artifact " + index_path_.string() + ": " +
                          e.what());
  } catch (const CompressionError &e) {
    discard_tmp();
    throw IndexStoreError("Failed to compress chunk content: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    discard_tmp();
    throw IndexStoreError("Failed to serialize chunk metadata: " + std::string(e.what()));
  }

  std::cout << "[Index] Saved " << index.size() << " entries to " << index_path_.string()
            << std::endl;
}

void IndexStore::write_artifact(const std::filesystem::path &target,
                                const VectorIndex &index) const {
  // Scoped so the connection is closed before the file is renamed
  sqlite::database db(target.string());

  db << "CREATE TABLE index_info ("
        "key TEXT PRIMARY KEY, "
        "value TEXT NOT NULL);";
  db << "CREATE TABLE entries ("
        "position INTEGER PRIMARY KEY, "
        "id TEXT NOT NULL UNIQUE, "
        "source TEXT NOT NULL, "
        "chunk_index INTEGER NOT NULL, "
        "start_offset INTEGER NOT NULL, "
        "end_offset INTEGER NOT NULL, "
        "content BLOB NOT NULL, "
        "metadata TEXT NOT NULL, "
        "vector BLOB NOT NULL);";

  Transaction tx(db);

  const IndexFingerprint &fingerprint = index.fingerprint();
  const std::map<std::string, std::string> info = {
      {"format_version", std::to_string(FORMAT_VERSION)},
      {"embedding_model", fingerprint.embedding_model},
      {"dimension", std::to_string(fingerprint.dimension)},
      {"chunk_size", std::to_string(fingerprint.chunk_size)},
      {"chunk_overlap", std::to_string(fingerprint.chunk_overlap)},
      {"entry_count", std::to_string(index.size())},
      {"built_at", time_point_to_string(std::chrono::system_clock::now())},
  };
  for (const auto &[key, value] : info) {
    db << "INSERT INTO index_info (key, value) VALUES (?, ?);" << key << value;
  }

  const auto &entries = index.entries();
  for (size_t position = 0; position < entries.size(); ++position) {
    const EmbeddedChunk &entry = entries[position];
    db << "INSERT INTO entries (position, id, source, chunk_index, start_offset, end_offset, "
          "content, metadata, vector) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);"
       << static_cast<int64_t>(position) << entry.id << entry.chunk.source
       << entry.chunk.chunk_index << static_cast<int64_t>(entry.chunk.start_offset)
       << static_cast<int64_t>(entry.chunk.end_offset) << compress_text(entry.chunk.content)
       << dump_metadata(entry.chunk.metadata) << to_blob(entry.vector_embedding);
  }

  tx.commit();
}

std::shared_ptr<VectorIndex> IndexStore::load(const IndexFingerprint &expected,
                                              const SearchOptions &options) const {
  if (!exists()) {
    throw IndexIntegrityError("No index artifact at " + index_path_.string());
  }

  std::map<std::string, std::string> info;
  std::vector<StoredRow> rows;
  try {
    sqlite::sqlite_config config;
    config.flags = sqlite::OpenFlags::READONLY;
    sqlite::database db(index_path_.string(), config);

    db << "SELECT key, value FROM index_info;" >> [&](std::string key, std::string value) {
      info.emplace(std::move(key), std::move(value));
    };

    db << "SELECT position, id, source, chunk_index, start_offset, end_offset, content, "
          "metadata, vector FROM entries ORDER BY position;" >>
        [&](int64_t position, std::string id, std::string source, int chunk_index,
            int64_t start_offset, int64_t end_offset, std::vector<char> content,
            std::string metadata, std::vector<char> vector) {
          rows.push_back({position, std::move(id), std::move(source), chunk_index, start_offset,
                          end_offset, std::move(content), std::move(metadata),
                          std::move(vector)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexIntegrityError(format_db_error("load_index", e));
  }

  const size_t format_version = require_count(info, "format_version");
  if (format_version != static_cast<size_t>(FORMAT_VERSION)) {
    throw IndexIntegrityError("Unsupported index format version " +
                              std::to_string(format_version) + ", expected " +
                              std::to_string(FORMAT_VERSION));
  }

  IndexFingerprint stored;
  stored.embedding_model = require_key(info, "embedding_model");
  stored.dimension = require_count(info, "dimension");
  stored.chunk_size = require_count(info, "chunk_size");
  stored.chunk_overlap = require_count(info, "chunk_overlap");

  const bool dimension_matches = expected.dimension == 0 || stored.dimension == 0 ||
                                 stored.dimension == expected.dimension;
  if (stored.embedding_model != expected.embedding_model ||
      stored.chunk_size != expected.chunk_size ||
      stored.chunk_overlap != expected.chunk_overlap || !dimension_matches) {
    throw IndexIntegrityError("Index fingerprint mismatch: artifact has {" + stored.to_string() +
                              "}, configuration expects {" + expected.to_string() + "}");
  }
  if (stored.dimension == 0) {
    stored.dimension = expected.dimension;
  }

  const size_t entry_count = require_count(info, "entry_count");
  if (entry_count != rows.size()) {
    throw IndexIntegrityError("index_info declares " + std::to_string(entry_count) +
                              " entries but the artifact holds " + std::to_string(rows.size()));
  }

  std::vector<EmbeddedChunk> entries;
  entries.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    StoredRow &row = rows[i];
    if (row.position != static_cast<int64_t>(i)) {
      throw IndexIntegrityError("Entry positions are not contiguous at " + std::to_string(i));
    }
    if (row.vector.size() != stored.dimension * sizeof(float)) {
      throw IndexIntegrityError("Entry " + row.id + " has a " + std::to_string(row.vector.size()) +
                                " byte vector, expected " +
                                std::to_string(stored.dimension * sizeof(float)));
    }

    EmbeddedChunk entry;
    entry.id = std::move(row.id);
    entry.chunk.source = std::move(row.source);
    entry.chunk.chunk_index = row.chunk_index;
    entry.chunk.start_offset = static_cast<size_t>(row.start_offset);
    entry.chunk.end_offset = static_cast<size_t>(row.end_offset);
    try {
      entry.chunk.content = decompress_text(row.content);
      entry.chunk.metadata = nlohmann::json::parse(row.metadata);
    } catch (const CompressionError &e) {
      throw IndexIntegrityError("Entry " + entry.id + " content is corrupted: " + e.what());
    } catch (const nlohmann::json::parse_error &e) {
      throw IndexIntegrityError("Entry " + entry.id + " metadata is corrupted: " + e.what());
    }

    const float *data = reinterpret_cast<const float *>(row.vector.data());
    entry.vector_embedding.assign(data, data + stored.dimension);
    entries.push_back(std::move(entry));
  }

  try {
    auto index = std::make_shared<VectorIndex>(stored, std::move(entries), options);
    std::cout << "[Index] Loaded " << index->size() << " entries from " << index_path_.string()
              << std::endl;
    return index;
  } catch (const VectorIndexError &e) {
    throw IndexIntegrityError("Index artifact is inconsistent: " + std::string(e.what()));
  }
}

}  // namespace docsage_core
