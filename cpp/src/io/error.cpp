// ==============================================================================
// error.cpp - Ошибки хранилищ ресурсов
// ==============================================================================

#include <winevtrc/error.hpp>

namespace winevtrc {

const char* resource_error_kind_to_string(ResourceErrorKind kind) {
    switch (kind) {
    case ResourceErrorKind::State:
        return "state";
    case ResourceErrorKind::Integrity:
        return "integrity";
    case ResourceErrorKind::UnsupportedFormat:
        return "unsupported format";
    case ResourceErrorKind::Io:
        return "I/O";
    case ResourceErrorKind::Sql:
        return "SQL";
    }
    return "unknown";
}

std::string ResourceError::format() const {
    return std::string(resource_error_kind_to_string(kind_)) + " error: " + what();
}

}  // namespace winevtrc
