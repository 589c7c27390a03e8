#pragma once

#include "devflow/core/result.h"

#include <memory>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace devflow::storage::sqlite {

// Newest audit schema this build knows how to create.
inline constexpr int kAuditSchemaVersion = 1;

// Connection to an audit database file. Several devflow processes may hold
// the same file open; writers wait on each other through the busy timeout.
class SqliteDb {
 public:
  // ":memory:" gives a private database that disappears with the connection.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;
  ~SqliteDb() = default;

  // Highest migration recorded in schema_version, 0 on a fresh file.
  [[nodiscard]] int schema_version() const;

  // Applies every migration newer than schema_version(), each in its own
  // transaction. Safe to call on every start.
  [[nodiscard]] core::Result<bool, std::string> migrate();

  [[nodiscard]] core::Result<bool, std::string> exec(std::string_view sql);

  [[nodiscard]] sqlite3* handle() const { return handle_.get(); }

 private:
  struct Closer {
    void operator()(sqlite3* handle) const;
  };

  explicit SqliteDb(sqlite3* handle);

  std::unique_ptr<sqlite3, Closer> handle_;
};

// A compiled statement. Bind calls are chainable; a failed prepare leaves the
// statement invalid and every step() reports kError.
class Statement {
 public:
  enum class Step { kRow, kDone, kError };

  Statement(const SqliteDb& db, std::string_view sql);

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;
  ~Statement() = default;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  // 1-based, as in SQLite.
  Statement& bind(int index, std::string_view value);

  [[nodiscard]] Step step();

  // 0-based column accessors for the current row. NULL reads as "" and 0.
  [[nodiscard]] std::string text(int column) const;
  [[nodiscard]] int integer(int column) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  sqlite3* handle_;
  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
  std::string error_;
};

// BEGIN IMMEDIATE on construction. Rolls back on destruction unless commit()
// or rollback() already ended it.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;
  ~Transaction();

  // Empty when BEGIN succeeded.
  [[nodiscard]] const std::string& begin_error() const { return begin_error_; }

  [[nodiscard]] core::Result<bool, std::string> commit();
  [[nodiscard]] core::Result<bool, std::string> rollback();

 private:
  SqliteDb& db_;
  bool open_ = false;
  std::string begin_error_;
};

}  // namespace devflow::storage::sqlite
