#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace lanlens {
namespace fs = std::filesystem;

// All read-write stores share <runtime_dir>/state/lanlens.db.
inline fs::path state_database_path(const fs::path &runtime_dir) {
  return runtime_dir / "state" / "lanlens.db";
}

// Owns one sqlite3 handle opened with the pragmas every store relies on.
class SqliteConnection {
public:
  ~SqliteConnection();
  SqliteConnection(const SqliteConnection &) = delete;
  SqliteConnection &operator=(const SqliteConnection &) = delete;

  // Opens (and creates the parent directory for) `path`, enables WAL with
  // synchronous=NORMAL and a 5s busy timeout, then runs `schema` statements.
  // Returns nullptr and fills `error` on failure.
  static std::unique_ptr<SqliteConnection>
  open(const fs::path &path, const std::vector<const char *> &schema,
       std::string &error);

  // Read-only open for databases shipped with the application.
  static std::unique_ptr<SqliteConnection> open_read_only(const fs::path &path,
                                                          std::string &error);

  sqlite3 *handle() const { return db_; }
  const fs::path &path() const { return path_; }

  std::optional<std::string> exec(const char *sql) const;

  // BEGIN IMMEDIATE ... COMMIT, rolled back when `body` returns an error.
  std::optional<std::string>
  with_transaction(const std::function<std::optional<std::string>()> &body) const;

  int64_t changes() const;
  std::string last_error() const;

private:
  SqliteConnection(sqlite3 *db, fs::path path);
  void rollback() const;

  sqlite3 *db_{nullptr};
  fs::path path_;
};

// Prepared statement, finalized on destruction.
class SqliteStatement {
public:
  SqliteStatement(const SqliteConnection &conn, const char *sql);
  ~SqliteStatement();
  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement &operator=(const SqliteStatement &) = delete;

  bool ok() const { return stmt_ != nullptr; }

  void bind(int index, const std::string &value);
  void bind(int index, int64_t value);
  void bind(int index, double value);
  void bind(int index, const std::optional<std::string> &value);
  void bind_null(int index);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int step();
  void reset();

  bool column_is_null(int col) const;
  std::string column_text(int col) const;
  std::optional<std::string> column_optional_text(int col) const;
  int64_t column_int64(int col) const;
  double column_double(int col) const;

private:
  sqlite3_stmt *stmt_{nullptr};
};

} // namespace lanlens
