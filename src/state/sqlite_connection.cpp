#include "state/sqlite_connection.hpp"

#include <boost/log/trivial.hpp>
#include <sqlite3.h>

#include <system_error>

namespace lanlens {

SqliteConnection::SqliteConnection(sqlite3 *db, fs::path path)
    : db_(db), path_(std::move(path)) {}

SqliteConnection::~SqliteConnection() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::unique_ptr<SqliteConnection>
SqliteConnection::open(const fs::path &path,
                       const std::vector<const char *> &schema,
                       std::string &error) {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      error = "Failed to create directory '" + path.parent_path().string() +
              "': " + ec.message();
      return nullptr;
    }
  }

  sqlite3 *db = nullptr;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr) !=
      SQLITE_OK) {
    error = std::string("Failed to open ") + path.string() + ": " +
            (db ? sqlite3_errmsg(db) : "out of memory");
    if (db) sqlite3_close(db);
    return nullptr;
  }
  std::unique_ptr<SqliteConnection> conn(new SqliteConnection(db, path));

  sqlite3_busy_timeout(db, 5000);
  if (auto err = conn->exec("PRAGMA journal_mode=WAL;")) {
    BOOST_LOG_TRIVIAL(warning) << "Failed to enable WAL mode: " << *err;
  }
  if (auto err = conn->exec("PRAGMA synchronous=NORMAL;")) {
    BOOST_LOG_TRIVIAL(warning) << "Failed to set synchronous=NORMAL: " << *err;
  }

  for (const char *sql : schema) {
    if (auto err = conn->exec(sql)) {
      error = "Failed to initialize schema in " + path.string() + ": " + *err;
      return nullptr;
    }
  }
  return conn;
}

std::unique_ptr<SqliteConnection>
SqliteConnection::open_read_only(const fs::path &path, std::string &error) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    error = "Database not found: " + path.string();
    return nullptr;
  }
  sqlite3 *db = nullptr;
  int flags = SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr) !=
      SQLITE_OK) {
    error = std::string("Failed to open ") + path.string() + ": " +
            (db ? sqlite3_errmsg(db) : "out of memory");
    if (db) sqlite3_close(db);
    return nullptr;
  }
  sqlite3_busy_timeout(db, 5000);
  return std::unique_ptr<SqliteConnection>(new SqliteConnection(db, path));
}

std::optional<std::string> SqliteConnection::exec(const char *sql) const {
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "unknown";
    sqlite3_free(errmsg);
    return err;
  }
  return std::nullopt;
}

std::optional<std::string> SqliteConnection::with_transaction(
    const std::function<std::optional<std::string>()> &body) const {
  if (auto err = exec("BEGIN IMMEDIATE TRANSACTION;")) {
    return "Failed to begin transaction: " + *err;
  }

  auto body_err = body();
  if (body_err) {
    rollback();
    return body_err;
  }

  if (auto err = exec("COMMIT;")) {
    rollback();
    return "Failed to commit transaction: " + *err;
  }
  return std::nullopt;
}

void SqliteConnection::rollback() const {
  if (auto err = exec("ROLLBACK;")) {
    BOOST_LOG_TRIVIAL(warning) << "Rollback failed on " << path_.string()
                               << ": " << *err;
  }
}

int64_t SqliteConnection::changes() const { return sqlite3_changes(db_); }

std::string SqliteConnection::last_error() const {
  return db_ ? sqlite3_errmsg(db_) : "database closed";
}

SqliteStatement::SqliteStatement(const SqliteConnection &conn,
                                 const char *sql) {
  if (sqlite3_prepare_v2(conn.handle(), sql, -1, &stmt_, nullptr) !=
      SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteStatement::bind(int index, const std::string &value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteStatement::bind(int index, int64_t value) {
  sqlite3_bind_int64(stmt_, index, value);
}

void SqliteStatement::bind(int index, double value) {
  sqlite3_bind_double(stmt_, index, value);
}

void SqliteStatement::bind(int index, const std::optional<std::string> &value) {
  if (value) {
    bind(index, *value);
  } else {
    bind_null(index);
  }
}

void SqliteStatement::bind_null(int index) { sqlite3_bind_null(stmt_, index); }

int SqliteStatement::step() { return sqlite3_step(stmt_); }

void SqliteStatement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool SqliteStatement::column_is_null(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string SqliteStatement::column_text(int col) const {
  const unsigned char *text = sqlite3_column_text(stmt_, col);
  return text ? reinterpret_cast<const char *>(text) : std::string{};
}

std::optional<std::string> SqliteStatement::column_optional_text(int col) const {
  if (column_is_null(col)) return std::nullopt;
  return column_text(col);
}

int64_t SqliteStatement::column_int64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

double SqliteStatement::column_double(int col) const {
  return sqlite3_column_double(stmt_, col);
}

} // namespace lanlens
