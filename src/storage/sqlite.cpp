#include "storage/sqlite.hpp"

#include <iostream>

#include <sqlite3.h>

namespace netspeed::storage {

StoreError::StoreError(const std::string& message, const int code) : std::runtime_error(message), code_(code) {}

int StoreError::code() const noexcept { return code_; }

void Database::ConnectionDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close_v2(db);
  }
}

Database::Database(const std::string& path, const Mode mode, const int busy_timeout_ms) {
  const int flags = mode == Mode::READ_ONLY ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, flags | SQLITE_OPEN_NOMUTEX, nullptr);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    const std::string message = raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    throw StoreError("unable to open " + path + ": " + message, rc);
  }

  sqlite3_busy_timeout(db_.get(), busy_timeout_ms);
}

void Database::exec(const std::string& sql) {
  char* error = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    const std::string message = error != nullptr ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    throw StoreError(message, rc);
  }
}

std::int64_t Database::changes() const noexcept { return sqlite3_changes(db_.get()); }

sqlite3* Database::handle() const noexcept { return db_.get(); }

void Database::raise(const std::string& what, const int rc) const {
  throw StoreError(what + ": " + sqlite3_errmsg(db_.get()), rc);
}

void Statement::StatementDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

Statement::Statement(Database& db, const std::string& sql) : db_(db) {
  sqlite3_stmt* raw = nullptr;
  const int rc = sqlite3_prepare_v2(db.handle(), sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
  stmt_.reset(raw);
  if (rc != SQLITE_OK) {
    db.raise("prepare failed", rc);
  }
}

Statement& Statement::bind(const int index, const std::int64_t value) {
  if (const int rc = sqlite3_bind_int64(stmt_.get(), index, value); rc != SQLITE_OK) {
    db_.raise("bind failed", rc);
  }
  return *this;
}

Statement& Statement::bind(const int index, const double value) {
  if (const int rc = sqlite3_bind_double(stmt_.get(), index, value); rc != SQLITE_OK) {
    db_.raise("bind failed", rc);
  }
  return *this;
}

Statement& Statement::bind(const int index, const std::string& value) {
  if (const int rc = sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT);
      rc != SQLITE_OK) {
    db_.raise("bind failed", rc);
  }
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  db_.raise("step failed", rc);
}

void Statement::reset() {
  sqlite3_reset(stmt_.get());
  sqlite3_clear_bindings(stmt_.get());
}

std::int64_t Statement::column_int64(const int index) const { return sqlite3_column_int64(stmt_.get(), index); }

double Statement::column_double(const int index) const { return sqlite3_column_double(stmt_.get(), index); }

std::string Statement::column_text(const int index) const {
  const auto* text = sqlite3_column_text(stmt_.get(), index);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

Transaction::Transaction(Database& db) : db_(db) { db_.exec("BEGIN IMMEDIATE"); }

Transaction::~Transaction() {
  if (committed_) {
    return;
  }
  if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
    std::cerr << "[store] rollback failed: " << sqlite3_errmsg(db_.handle()) << '\n';
  }
}

void Transaction::commit() {
  db_.exec("COMMIT");
  committed_ = true;
}

ReadTransaction::ReadTransaction(Database& db) : db_(db) { db_.exec("BEGIN"); }

ReadTransaction::~ReadTransaction() {
  if (sqlite3_exec(db_.handle(), "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
    std::cerr << "[store] ending read transaction failed: " << sqlite3_errmsg(db_.handle()) << '\n';
  }
}

}  // namespace netspeed::storage
