// ==============================================================================
// sqlite.cpp - Доступ к SQLite файлам ресурсов
// ==============================================================================
//
// Используется C API sqlite3 напрямую: sqlite3_open_v2 / prepare_v2 / step /
// finalize. Каждый DatabaseFile владеет своим соединением и не разделяется
// между потоками. Соединение закрывается через sqlite3_close_v2: пока живы
// подготовленные запросы, SQLite держит его в состоянии zombie и освобождает
// при последнем sqlite3_finalize.
//
// ==============================================================================

#include <winevtrc/error.hpp>
#include <winevtrc/platform.hpp>
#include <winevtrc/sqlite.hpp>

#include <sqlite3.h>

#include <utility>

namespace winevtrc::sqlite {

namespace {

[[noreturn]] void throw_sql_error(sqlite3* db, const std::string& context) {
    std::string message = context;
    if (db != nullptr) {
        message += ": ";
        message += sqlite3_errmsg(db);
    }
    throw ResourceError(ResourceErrorKind::Sql, message);
}

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result.append(separator);
        }
        result += items[i];
    }
    return result;
}

}  // namespace

std::string quote_literal(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    result += '\'';
    for (char c : text) {
        if (c == '\'') {
            result += '\'';
        }
        result += c;
    }
    result += '\'';
    return result;
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt, ConnectionState connection)
    : db_(db), stmt_(stmt), connection_(std::move(connection)) {}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      stmt_(std::exchange(other.stmt_, nullptr)),
      connection_(std::move(other.connection_)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
        connection_ = std::move(other.connection_);
    }
    return *this;
}

void Statement::require_connection(const char* operation) const {
    if (stmt_ == nullptr || !connection_ || !*connection_) {
        throw ResourceError(ResourceErrorKind::State,
                            std::string("Cannot ") + operation + " database not opened.");
    }
}

void Statement::bind(int index, const Value& value) {
    if (value.is_null()) {
        bind_null(index);
    } else if (value.is_integer()) {
        bind_int64(index, value.as_integer());
    } else if (value.is_real()) {
        require_connection("bind parameter");
        if (sqlite3_bind_double(stmt_, index, value.as_real()) != SQLITE_OK) {
            throw_sql_error(db_, "unable to bind parameter " + std::to_string(index));
        }
    } else if (value.is_text()) {
        bind_text(index, value.as_text());
    } else {
        // Списки строк хранятся как JSON текст
        bind_text(index, value.to_json());
    }
}

void Statement::bind_text(int index, std::string_view text) {
    require_connection("bind parameter");
    if (sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw_sql_error(db_, "unable to bind parameter " + std::to_string(index));
    }
}

void Statement::bind_int64(int index, std::int64_t value) {
    require_connection("bind parameter");
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        throw_sql_error(db_, "unable to bind parameter " + std::to_string(index));
    }
}

void Statement::bind_null(int index) {
    require_connection("bind parameter");
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw_sql_error(db_, "unable to bind parameter " + std::to_string(index));
    }
}

bool Statement::step() {
    require_connection("execute query");
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw_sql_error(db_, "unable to execute query");
}

int Statement::column_count() const {
    require_connection("retrieve columns");
    return sqlite3_column_count(stmt_);
}

Value Statement::column(int index) const {
    require_connection("retrieve values");
    switch (sqlite3_column_type(stmt_, index)) {
    case SQLITE_INTEGER:
        return Value(static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index)));
    case SQLITE_FLOAT:
        return Value(sqlite3_column_double(stmt_, index));
    case SQLITE_TEXT: {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
        int size = sqlite3_column_bytes(stmt_, index);
        return Value(std::string(text != nullptr ? text : "", static_cast<size_t>(size)));
    }
    case SQLITE_BLOB: {
        const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt_, index));
        int size = sqlite3_column_bytes(stmt_, index);
        return Value(std::string(blob != nullptr ? blob : "", static_cast<size_t>(size)));
    }
    case SQLITE_NULL:
    default:
        return Value();
    }
}

// ============================================================================
// RowCursor
// ============================================================================

RowCursor::RowCursor(Statement statement, std::vector<std::string> column_names)
    : statement_(std::move(statement)), column_names_(std::move(column_names)) {}

bool RowCursor::next(Row& out) {
    statement_.require_connection("retrieve values");
    if (done_) {
        return false;
    }
    if (!statement_.step()) {
        done_ = true;
        return false;
    }

    out.clear();
    for (size_t i = 0; i < column_names_.size(); ++i) {
        out[column_names_[i]] = statement_.column(static_cast<int>(i));
    }
    return true;
}

std::vector<Row> RowCursor::collect() {
    std::vector<Row> rows;
    Row row;
    while (next(row)) {
        rows.push_back(std::move(row));
    }
    return rows;
}

// ============================================================================
// DatabaseFile
// ============================================================================

DatabaseFile::DatabaseFile() = default;

DatabaseFile::~DatabaseFile() {
    release();
}

DatabaseFile::DatabaseFile(DatabaseFile&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      connection_(std::move(other.connection_)),
      path_(std::move(other.path_)),
      read_only_(other.read_only_) {}

DatabaseFile& DatabaseFile::operator=(DatabaseFile&& other) noexcept {
    if (this != &other) {
        release();
        db_ = std::exchange(other.db_, nullptr);
        connection_ = std::move(other.connection_);
        path_ = std::move(other.path_);
        read_only_ = other.read_only_;
    }
    return *this;
}

void DatabaseFile::release() {
    if (db_ == nullptr) {
        return;
    }
    if (connection_) {
        *connection_ = false;
        connection_.reset();
    }
    // close_v2 не возвращает SQLITE_BUSY: при незавершённых запросах
    // соединение освобождается после их finalize
    sqlite3_close_v2(db_);
    db_ = nullptr;
}

void DatabaseFile::require_open(const char* operation) const {
    if (db_ == nullptr) {
        throw ResourceError(ResourceErrorKind::State,
                            std::string("Cannot ") + operation + " database not opened.");
    }
}

bool DatabaseFile::open(const std::filesystem::path& path, bool read_only) {
    if (db_ != nullptr) {
        throw ResourceError(ResourceErrorKind::State, "Cannot open database already opened.");
    }

    int flags = read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    std::string path_utf8 = platform::path_to_utf8(path);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path_utf8.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        // sqlite3_open_v2 выделяет handle даже при ошибке
        if (db != nullptr) {
            sqlite3_close_v2(db);
        }
        return false;
    }

    db_ = db;
    connection_ = std::make_shared<bool>(true);
    path_ = path;
    read_only_ = read_only;
    return true;
}

void DatabaseFile::close() {
    require_open("close");

    int rc = sqlite3_close_v2(db_);
    if (rc != SQLITE_OK) {
        throw_sql_error(db_, "unable to close database");
    }
    if (connection_) {
        *connection_ = false;
        connection_.reset();
    }
    db_ = nullptr;
    path_.clear();
    read_only_ = false;
}

bool DatabaseFile::has_table(std::string_view table_name) {
    require_open("determine if table exists");

    Statement stmt = prepare("SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind_text(1, table_name);
    return stmt.step();
}

RowCursor DatabaseFile::get_values(const std::vector<std::string>& table_names,
                                   const std::vector<std::string>& column_names,
                                   std::string_view condition) {
    require_open("retrieve values");

    std::string sql = "SELECT " + join(column_names, ", ") + " FROM " + join(table_names, ", ");
    if (!condition.empty()) {
        sql += " WHERE ";
        sql.append(condition);
    }

    return RowCursor(prepare(sql), column_names);
}

Statement DatabaseFile::prepare(std::string_view sql) {
    require_open("prepare query");

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
        throw_sql_error(db_, "unable to prepare query: " + std::string(sql));
    }
    return Statement(db_, stmt, connection_);
}

void DatabaseFile::execute(std::string_view sql) {
    require_open("execute query");
    if (read_only_) {
        throw ResourceError(ResourceErrorKind::State,
                            "Cannot execute query database opened in read-only mode.");
    }

    std::string sql_str(sql);
    char* error_message = nullptr;
    int rc = sqlite3_exec(db_, sql_str.c_str(), nullptr, nullptr, &error_message);
    if (rc != SQLITE_OK) {
        std::string error = error_message != nullptr ? error_message : "unknown error";
        sqlite3_free(error_message);
        throw ResourceError(ResourceErrorKind::Sql, "unable to execute query: " + error);
    }
}

std::int64_t DatabaseFile::last_insert_rowid() const {
    require_open("retrieve last rowid");
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

}  // namespace winevtrc::sqlite
