// ==============================================================================
// format.cpp - Конвертация строк сообщений Windows Resource (wrc)
// ==============================================================================
//
// Строки в таблицах сообщений используют спецификаторы FormatMessage:
//   %1..%99      - вставка параметра, возможно с printf-суффиксом (%1!s!)
//   %n %t %r     - перевод строки, табуляция, возврат каретки
//   %% %. %! %   - экранированный символ
//   %0           - конец сообщения, остаток строки не выводится
//   %b           - пробел-заполнитель, удаляется
// Результат использует позиционный формат: {0}..{98}, фигурные скобки
// удваиваются.
//
// ==============================================================================

#include <winevtrc/windows.hpp>

namespace winevtrc::windows {

namespace {

// Максимальная длина printf-суффикса между '!' (например "!s!", "!08lx!")
constexpr size_t MAX_PRINTF_SUFFIX = 16;

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

}  // namespace

std::string format_message_string_in_pep3101(std::string_view message_string) {
    std::string result;
    result.reserve(message_string.size() + 8);

    const size_t size = message_string.size();
    size_t i = 0;
    while (i < size) {
        char c = message_string[i];

        if (c == '\r' || c == '\n') {
            ++i;
            continue;
        }

        if (c == '{' || c == '}') {
            result += c;
            result += c;
            ++i;
            continue;
        }

        if (c != '%' || i + 1 >= size) {
            result += c;
            ++i;
            continue;
        }

        char specifier = message_string[i + 1];

        if (specifier >= '1' && specifier <= '9') {
            size_t end = i + 2;
            int number = specifier - '0';
            if (end < size && is_digit(message_string[end])) {
                number = number * 10 + (message_string[end] - '0');
                ++end;
            }

            // Необязательный printf-суффикс: %1!s!
            if (end < size && message_string[end] == '!') {
                size_t closing = message_string.find('!', end + 1);
                if (closing != std::string_view::npos && closing - end <= MAX_PRINTF_SUFFIX) {
                    end = closing + 1;
                }
            }

            result += '{';
            result += std::to_string(number - 1);
            result += '}';
            i = end;
            continue;
        }

        if (specifier == '0') {
            break;
        }

        switch (specifier) {
        case 'b':
            break;
        case 'n':
            result += '\n';
            break;
        case 't':
            result += '\t';
            break;
        case 'r':
            result += '\r';
            break;
        case '%':
        case '.':
        case '!':
        case ' ':
            result += specifier;
            break;
        default:
            // Неизвестный спецификатор оставляем как есть
            result += '%';
            ++i;
            continue;
        }
        i += 2;
    }

    return result;
}

}  // namespace winevtrc::windows
