#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace docsage_core {

// Rolls back on scope exit unless commit() was reached
class Transaction {
 public:
  explicit Transaction(sqlite::database& db) : db_(db), active_(true) {
    db_ << "BEGIN IMMEDIATE;";
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  ~Transaction() noexcept {
    if (!active_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[Index] Warning: rollback failed: " << e.errstr() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool active_;
};

}  // namespace docsage_core
