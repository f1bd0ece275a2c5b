#include "shortmint/storage/sqlite/sqlite_code_registry.h"

#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace shortmint::storage::sqlite {

SqliteCodeRegistry::SqliteCodeRegistry(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

bool SqliteCodeRegistry::reserve(const std::string& code, const std::string& reserved_at) {
  const char* sql = "INSERT OR IGNORE INTO short_codes (code, reserved_at) VALUES (?, ?)";

  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare short code insert: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, code.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, reserved_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("Failed to reserve short code '" + code +
                             "': " + sqlite3_errmsg(db_->connection()));
  }

  return sqlite3_changes(db_->connection()) == 1;
}

bool SqliteCodeRegistry::contains(const std::string& code) const {
  const char* sql = "SELECT 1 FROM short_codes WHERE code = ?";

  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare short code lookup: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, code.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error("Failed to look up short code '" + code +
                             "': " + sqlite3_errmsg(db_->connection()));
  }
  return rc == SQLITE_ROW;
}

std::size_t SqliteCodeRegistry::count() const {
  const char* sql = "SELECT COUNT(*) FROM short_codes";

  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare short code count: " + stmt.error());
  }

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("Failed to count short codes: ") +
                             sqlite3_errmsg(db_->connection()));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace shortmint::storage::sqlite
