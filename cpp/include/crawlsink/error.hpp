// ==============================================================================
// crawlsink/error.hpp - MOD-0001: Модель ошибок
// ==============================================================================
//
// MOD-0001 error
//
// Назначение:
// - Единая таксономия ошибок конвейера вывода
// - Status: результат операции без полезной нагрузки
// - Исключения не пересекают публичный API: библиотечные исключения
//   перехватываются на границе модуля и превращаются в Error
//
// ==============================================================================

#ifndef CRAWLSINK_ERROR_HPP
#define CRAWLSINK_ERROR_HPP

#include <string>
#include <string_view>
#include <utility>

namespace crawlsink {

// ----------------------------------------------------------------------------
// ErrorKind - типы ошибок
// ----------------------------------------------------------------------------

enum class ErrorKind {
    InvalidField,      // Неизвестное имя поля Result
    ConfigValidation,  // Ошибка валидации конфигурации при создании Writer
    Format,            // Ошибка кодирования события
    Sink,              // Ошибка open/write/close файла
    ClosedSink,        // Запись в закрытый FileSink
    Archive,           // Ошибка архивации ответа
    Config             // Ошибка загрузки файла конфигурации
};

/// Преобразовать ErrorKind в строку
const char* error_kind_to_string(ErrorKind kind);

// ----------------------------------------------------------------------------
// Error
// ----------------------------------------------------------------------------

struct Error {
    ErrorKind kind = ErrorKind::Sink;
    std::string message;

    /// Объект ошибки: имя поля или путь (может быть пустым)
    std::string subject;

    /// Добавить контекст: "<context>: <message>", kind сохраняется
    Error wrap(std::string_view context) const;

    /// То же, но с заменой kind (ошибка подпути переклассифицируется)
    Error wrap(std::string_view context, ErrorKind as) const;
};

Error make_error(ErrorKind kind, std::string message, std::string subject = {});

// ----------------------------------------------------------------------------
// Status - результат операции
// ----------------------------------------------------------------------------

struct Status {
    bool ok = true;
    Error error;

    static Status success() { return Status{}; }
    static Status failure(Error e) { return Status{false, std::move(e)}; }

    explicit operator bool() const { return ok; }
};

}  // namespace crawlsink

#endif  // CRAWLSINK_ERROR_HPP
