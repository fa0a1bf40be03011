// ==============================================================================
// winevtrc/error.hpp - Ошибки хранилищ ресурсов
// ==============================================================================
//
// Отсутствие провайдера / файла сообщений / строки не является ошибкой и
// возвращается как пустой std::optional. Исключения зарезервированы для
// состояний, при которых путь поиска дальше продолжать нельзя.
//
// ==============================================================================

#ifndef WINEVTRC_ERROR_HPP
#define WINEVTRC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace winevtrc {

/// Типы ошибок хранилищ ресурсов
enum class ResourceErrorKind {
    State,              // Операция над неоткрытой/закрытой базой (ошибка программы)
    Integrity,          // Больше одной строки там, где ожидается ровно одна
    UnsupportedFormat,  // Неподдерживаемая версия или string_format
    Io,                 // Ошибка хранилища контейнеров (метаданные, совместимость)
    Sql                 // Ошибка SQLite при подготовке/выполнении запроса
};

/// Имя типа ошибки для диагностики
const char* resource_error_kind_to_string(ResourceErrorKind kind);

/// Ошибка хранилища ресурсов
class ResourceError : public std::runtime_error {
public:
    ResourceError(ResourceErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ResourceErrorKind kind() const noexcept { return kind_; }

    /// Форматировать ошибку для вывода: "<kind> error: <message>"
    std::string format() const;

private:
    ResourceErrorKind kind_;
};

}  // namespace winevtrc

#endif  // WINEVTRC_ERROR_HPP
