// ==============================================================================
// winevtrc/sqlite.hpp - Доступ к SQLite файлам ресурсов
// ==============================================================================
//
// Назначение:
// - DatabaseFile: минимальная обёртка над sqlite3 (проверка таблиц,
//   выборка строк, режим "только чтение")
// - Statement: подготовленный запрос с привязкой параметров
// - RowCursor: ленивый обход результата SELECT, строка = map колонка -> Value
//
// Все операции кроме open() требуют открытой базы, иначе
// ResourceError(State). Statement и RowCursor, пережившие close(),
// тоже бросают ResourceError(State). Ошибки SQLite в запросах -> ResourceError(Sql).
// Ошибки драйвера при открытии -> open() возвращает false.
//
// ==============================================================================

#ifndef WINEVTRC_SQLITE_HPP
#define WINEVTRC_SQLITE_HPP

#include <winevtrc/value.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace winevtrc::sqlite {

/// Строка результата: имя колонки -> значение
using Row = std::unordered_map<std::string, Value>;

/// Экранировать строковый литерал SQL: O'Brien -> 'O''Brien'
std::string quote_literal(std::string_view text);

// ----------------------------------------------------------------------------
// Statement
// ----------------------------------------------------------------------------

/// Признак открытого соединения, общий для DatabaseFile и его запросов
using ConnectionState = std::shared_ptr<const bool>;

/// Подготовленный запрос SQLite (владеет sqlite3_stmt)
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt, ConnectionState connection);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /// Привязать параметр (индексы с 1, как в sqlite3_bind_*)
    void bind(int index, const Value& value);
    void bind_text(int index, std::string_view text);
    void bind_int64(int index, std::int64_t value);
    void bind_null(int index);

    /// Выполнить шаг
    /// @return true если получена строка, false если запрос завершён
    bool step();

    /// Количество колонок результата
    int column_count() const;

    /// Значение колонки текущей строки
    Value column(int index) const;

    /// @throws ResourceError(State) если DatabaseFile уже закрыт
    void require_connection(const char* operation) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    ConnectionState connection_;
};

// ----------------------------------------------------------------------------
// RowCursor
// ----------------------------------------------------------------------------

/// Ленивый обход результата get_values()
///
/// Использование:
/// @code
///   auto cursor = file.get_values({"event_log_providers"}, {"log_source"}, "");
///   Row row;
///   while (cursor.next(row)) {
///       // row["log_source"]
///   }
/// @endcode
class RowCursor {
public:
    RowCursor(Statement statement, std::vector<std::string> column_names);

    /// Получить следующую строку
    /// @return false если строки закончились
    bool next(Row& out);

    /// Прочитать все оставшиеся строки
    std::vector<Row> collect();

private:
    Statement statement_;
    std::vector<std::string> column_names_;
    bool done_ = false;
};

// ----------------------------------------------------------------------------
// DatabaseFile
// ----------------------------------------------------------------------------

/// SQLite файл базы данных
class DatabaseFile {
public:
    DatabaseFile();
    ~DatabaseFile();

    DatabaseFile(const DatabaseFile&) = delete;
    DatabaseFile& operator=(const DatabaseFile&) = delete;
    DatabaseFile(DatabaseFile&& other) noexcept;
    DatabaseFile& operator=(DatabaseFile&& other) noexcept;

    /// Открыть файл базы
    ///
    /// @param path Путь к файлу
    /// @param read_only Открыть без возможности записи; несуществующий файл
    ///                  в этом режиме не создаётся
    /// @return false при ошибке драйвера
    /// @throws ResourceError(State) если база уже открыта
    bool open(const std::filesystem::path& path, bool read_only = false);

    /// Закрыть базу
    ///
    /// Живые Statement / RowCursor после этого бросают ResourceError(State);
    /// соединение освобождается, когда последний из них уничтожен.
    /// @throws ResourceError(State) если база не открыта
    void close();

    bool is_open() const { return db_ != nullptr; }
    bool read_only() const { return read_only_; }
    const std::filesystem::path& path() const { return path_; }

    /// Проверить существование таблицы
    bool has_table(std::string_view table_name);

    /// Выбрать значения
    ///
    /// @param table_names Таблицы (FROM)
    /// @param column_names Колонки (SELECT), ключи строк результата
    /// @param condition Условие WHERE без ключевого слова; пустое = все строки
    RowCursor get_values(const std::vector<std::string>& table_names,
                         const std::vector<std::string>& column_names,
                         std::string_view condition);

    /// Подготовить произвольный запрос
    Statement prepare(std::string_view sql);

    /// Выполнить запрос без результата (DDL, INSERT)
    /// @throws ResourceError(State) в режиме только чтения
    void execute(std::string_view sql);

    /// rowid последней вставленной строки
    std::int64_t last_insert_rowid() const;

private:
    void require_open(const char* operation) const;
    void release();

    sqlite3* db_ = nullptr;
    std::shared_ptr<bool> connection_;
    std::filesystem::path path_;
    bool read_only_ = false;
};

}  // namespace winevtrc::sqlite

#endif  // WINEVTRC_SQLITE_HPP
