#pragma once

#include "shortmint/storage/code_registry.h"
#include "shortmint/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace shortmint::storage::sqlite {

// SqliteCodeRegistry persists reserved short codes in the short_codes table (schema v1).
// reserve() relies on the PRIMARY KEY: INSERT OR IGNORE reports zero changes for a
// code that is already present, so the check-and-insert is a single statement.
//
// Every operation throws std::runtime_error when the database cannot answer;
// a failed lookup must not be mistaken for "code is free".
class SqliteCodeRegistry final : public ICodeRegistry {
 public:
  explicit SqliteCodeRegistry(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] bool reserve(const std::string& code, const std::string& reserved_at) override;
  [[nodiscard]] bool contains(const std::string& code) const override;
  [[nodiscard]] std::size_t count() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  // sqlite3_changes() is per-connection; hold this across insert + changes.
  mutable std::mutex mutex_;
};

}  // namespace shortmint::storage::sqlite
