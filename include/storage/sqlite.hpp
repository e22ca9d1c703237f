#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace netspeed::storage {

class StoreError : public std::runtime_error {
 public:
  StoreError(const std::string& message, int code);

  [[nodiscard]] int code() const noexcept;

 private:
  int code_;
};

class Database {
 public:
  enum class Mode : std::uint8_t {
    READ_WRITE = 0,
    READ_ONLY = 1,
  };

  Database(const std::string& path, Mode mode, int busy_timeout_ms = 5000);

  void exec(const std::string& sql);
  [[nodiscard]] std::int64_t changes() const noexcept;
  [[nodiscard]] sqlite3* handle() const noexcept;

  // Throws StoreError carrying rc and the connection's last message.
  [[noreturn]] void raise(const std::string& what, int rc) const;

 private:
  struct ConnectionDeleter {
    void operator()(sqlite3* db) const;
  };

  std::unique_ptr<sqlite3, ConnectionDeleter> db_;
};

class Statement {
 public:
  Statement(Database& db, const std::string& sql);

  Statement& bind(int index, std::int64_t value);
  Statement& bind(int index, double value);
  Statement& bind(int index, const std::string& value);

  // True while a row is available.
  bool step();
  void reset();

  [[nodiscard]] std::int64_t column_int64(int index) const;
  [[nodiscard]] double column_double(int index) const;
  [[nodiscard]] std::string column_text(int index) const;

 private:
  struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  Database& db_;
  std::unique_ptr<sqlite3_stmt, StatementDeleter> stmt_;
};

// Rolls back on destruction unless committed.
class Transaction {
 public:
  explicit Transaction(Database& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

 private:
  Database& db_;
  bool committed_{false};
};

// Deferred transaction for readers: in WAL mode every statement run while it
// is alive sees the snapshot taken by the first one.
class ReadTransaction {
 public:
  explicit ReadTransaction(Database& db);
  ~ReadTransaction();

  ReadTransaction(const ReadTransaction&) = delete;
  ReadTransaction& operator=(const ReadTransaction&) = delete;

 private:
  Database& db_;
};

}  // namespace netspeed::storage
