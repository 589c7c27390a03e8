#include "devflow/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <array>
#include <iostream>

namespace devflow::storage::sqlite {

namespace {

struct Migration {
  int version;
  const char* sql;
};

constexpr std::array<Migration, kAuditSchemaVersion> kMigrations = {{
    {1, R"(
      CREATE TABLE audit_events (
        event_id   TEXT PRIMARY KEY,
        trace_id   TEXT NOT NULL,
        event_type TEXT NOT NULL,
        payload    TEXT NOT NULL,
        created_at TEXT NOT NULL,
        refs_json  TEXT NOT NULL,
        idx        INTEGER NOT NULL,
        UNIQUE(trace_id, idx)
      );
      CREATE INDEX audit_events_by_trace ON audit_events(trace_id, idx);
    )"},
}};

constexpr int kBusyTimeoutMs = 5000;

std::string take_message(char* message) {
  std::string text = message != nullptr ? message : "unknown SQLite error";
  sqlite3_free(message);
  return text;
}

}  // namespace

// ── SqliteDb ────────────────────────────────────────────────────────────────

void SqliteDb::Closer::operator()(sqlite3* handle) const { sqlite3_close(handle); }

SqliteDb::SqliteDb(sqlite3* handle) : handle_(handle) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* handle = nullptr;
  if (sqlite3_open(path.c_str(), &handle) != SQLITE_OK) {
    const std::string reason = handle != nullptr ? sqlite3_errmsg(handle) : "out of memory";
    sqlite3_close(handle);
    return OpenResult::err("cannot open audit database '" + path + "': " + reason);
  }
  sqlite3_busy_timeout(handle, kBusyTimeoutMs);

  return OpenResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(handle)));
}

core::Result<bool, std::string> SqliteDb::exec(const std::string_view sql) {
  const std::string text(sql);
  char* message = nullptr;
  if (sqlite3_exec(handle_.get(), text.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
    return core::Result<bool, std::string>::err(take_message(message));
  }
  return core::Result<bool, std::string>::ok(true);
}

int SqliteDb::schema_version() const {
  Statement query(*this, "SELECT MAX(version) FROM schema_version");
  if (query.step() != Statement::Step::kRow) {
    return 0;
  }
  return query.integer(0);
}

core::Result<bool, std::string> SqliteDb::migrate() {
  auto bookkeeping = exec(
      "CREATE TABLE IF NOT EXISTS schema_version ("
      "  version INTEGER PRIMARY KEY,"
      "  applied_at TEXT NOT NULL)");
  if (!bookkeeping.has_value()) {
    return bookkeeping;
  }

  for (const auto& migration : kMigrations) {
    Transaction tx(*this);
    if (!tx.begin_error().empty()) {
      return core::Result<bool, std::string>::err(tx.begin_error());
    }
    // Re-read inside the write lock; another process may have migrated meanwhile.
    if (schema_version() >= migration.version) {
      continue;
    }

    auto applied = exec(migration.sql);
    if (applied.has_value()) {
      applied = exec("INSERT INTO schema_version (version, applied_at) VALUES (" +
                     std::to_string(migration.version) + ", datetime('now'))");
    }
    if (!applied.has_value()) {
      return core::Result<bool, std::string>::err("audit schema v" +
                                                  std::to_string(migration.version) + ": " +
                                                  applied.error());
    }

    auto committed = tx.commit();
    if (!committed.has_value()) {
      return committed;
    }
  }
  return core::Result<bool, std::string>::ok(true);
}

// ── Statement ───────────────────────────────────────────────────────────────

void Statement::Finalizer::operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }

Statement::Statement(const SqliteDb& db, const std::string_view sql) : handle_(db.handle()) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(handle_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) !=
      SQLITE_OK) {
    error_ = sqlite3_errmsg(handle_);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

Statement& Statement::bind(const int index, const std::string_view value) {
  if (stmt_ != nullptr &&
      sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    error_ = sqlite3_errmsg(handle_);
  }
  return *this;
}

Statement::Step Statement::step() {
  if (stmt_ == nullptr || !error_.empty()) {
    return Step::kError;
  }
  switch (sqlite3_step(stmt_.get())) {
    case SQLITE_ROW:
      return Step::kRow;
    case SQLITE_DONE:
      return Step::kDone;
    default:
      error_ = sqlite3_errmsg(handle_);
      return Step::kError;
  }
}

std::string Statement::text(const int column) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), column);
  if (raw == nullptr) {
    return {};
  }
  return reinterpret_cast<const char*>(raw);  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

int Statement::integer(const int column) const { return sqlite3_column_int(stmt_.get(), column); }

// ── Transaction ─────────────────────────────────────────────────────────────

Transaction::Transaction(SqliteDb& db) : db_(db) {
  auto begun = db_.exec("BEGIN IMMEDIATE");
  if (begun.has_value()) {
    open_ = true;
  } else {
    begin_error_ = "cannot start transaction: " + begun.error();
  }
}

Transaction::~Transaction() {
  if (open_) {
    auto rolled_back = rollback();
    if (!rolled_back.has_value()) {
      std::cerr << "WARNING: audit rollback failed: " << rolled_back.error() << "\n";
    }
  }
}

core::Result<bool, std::string> Transaction::commit() {
  open_ = false;
  return db_.exec("COMMIT");
}

core::Result<bool, std::string> Transaction::rollback() {
  open_ = false;
  return db_.exec("ROLLBACK");
}

}  // namespace devflow::storage::sqlite
