// ==============================================================================
// crawlsink/result.hpp - MOD-0003: Модель данных событий краулера
// ==============================================================================
//
// MOD-0003 result
//
// Назначение:
// - Result: одно найденное краулером событие (endpoint + метаданные)
// - Фиксированная схема имён полей Result (для --fields / --store-fields)
// - Response: сырой HTTP ответ вместе с URL запроса
//
// ==============================================================================

#ifndef CRAWLSINK_RESULT_HPP
#define CRAWLSINK_RESULT_HPP

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace crawlsink {

// ----------------------------------------------------------------------------
// Result
// ----------------------------------------------------------------------------

/// Событие краулера. Значение по умолчанию любого поля означает "не задано":
/// epoch для timestamp, пустая строка для остальных.
struct Result {
    std::chrono::system_clock::time_point timestamp{};
    std::string method;
    std::string body;
    std::string url;
    std::string source;     // Где найден endpoint (body, header, js, ...)
    std::string tag;        // HTML тег
    std::string attribute;  // Атрибут тега, из которого взят URL
};

// ----------------------------------------------------------------------------
// Схема полей
// ----------------------------------------------------------------------------

/// Поле Result
enum class Field { Timestamp, Method, Body, URL, Source, Tag, Attribute };

/// Все поля в каноническом порядке схемы
constexpr std::array<Field, 7> ALL_FIELDS = {Field::Timestamp, Field::Method, Field::Body,
                                             Field::URL,       Field::Source, Field::Tag,
                                             Field::Attribute};

/// Имя поля в схеме ("URL", "Tag", ...), регистр значим
const char* field_name(Field field);

/// Ключ поля в JSON ("endpoint" для URL, остальные в нижнем регистре)
const char* field_json_key(Field field);

/// Найти поле по имени схемы (точное совпадение)
std::optional<Field> field_from_name(std::string_view name);

/// Строковое значение поля; пустая строка если поле не задано
std::string field_value(const Result& result, Field field);

/// То же по имени; nullopt для имени вне схемы
std::optional<std::string> field_value(const Result& result, std::string_view name);

/// Все поля в значении по умолчанию
bool is_empty(const Result& result);

// ----------------------------------------------------------------------------
// Timestamp
// ----------------------------------------------------------------------------

/// RFC 3339 UTC с миллисекундами: "2024-01-02T03:04:05.678Z"
/// Пустая строка для epoch (не задано)
std::string format_timestamp(std::chrono::system_clock::time_point tp);

/// Разбор RFC 3339 ("Z" или смещение +hh:mm), дробная часть опциональна
std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text);

// ----------------------------------------------------------------------------
// Response
// ----------------------------------------------------------------------------

/// Сырой HTTP ответ вместе с URL исходного запроса
struct Response {
    std::string url;
    std::string proto = "HTTP/1.1";
    int status_code = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

/// Reason phrase для кода статуса; пустая строка для неизвестного кода
std::string status_text(int code);

/// Дамп ответа: status line, заголовки, пустая строка, тело (CRLF)
std::string dump_response(const Response& response);

}  // namespace crawlsink

#endif  // CRAWLSINK_RESULT_HPP
