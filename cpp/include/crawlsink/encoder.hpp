// ==============================================================================
// crawlsink/encoder.hpp - MOD-0005: Кодирование Result
// ==============================================================================
//
// MOD-0005 encoder
// RapidJSON для JSON сериализации
//
// Назначение:
// - Json: одна JSON-запись на событие, поля по умолчанию опускаются
// - Text: одна строка для человека, опционально с ANSI цветами
// - decolorize: удаление ANSI escape-последовательностей перед записью в файл
// - decode_json: обратный разбор JSON-записи в Result
// - escape_line_breaks: значение поля в одну строку (Text, файлы полей)
//
// Пустой результат encode() - не ошибка: событие не выводится.
//
// ==============================================================================

#ifndef CRAWLSINK_ENCODER_HPP
#define CRAWLSINK_ENCODER_HPP

#include <crawlsink/error.hpp>
#include <crawlsink/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crawlsink::encoder {

// ----------------------------------------------------------------------------
// Режим вывода
// ----------------------------------------------------------------------------

enum class OutputMode {
    Text,  // Строка для человека
    Json   // JSON Lines
};

// ----------------------------------------------------------------------------
// EncodeResult
// ----------------------------------------------------------------------------

struct EncodeResult {
    bool ok = false;
    std::string data;
    Error error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Encoder
// ----------------------------------------------------------------------------

class Encoder {
public:
    /// @param fields Поля для вывода; пустой список = набор по умолчанию
    Encoder(OutputMode mode, bool colors, bool verbose, std::vector<Field> fields = {});

    /// Закодировать событие. data пустая - событие подавляется.
    EncodeResult encode(const Result& result) const;

    OutputMode mode() const { return mode_; }

    /// Поля, попадающие в текстовую строку (в порядке схемы)
    const std::vector<Field>& text_fields() const { return text_fields_; }

private:
    EncodeResult encode_json(const Result& result) const;
    EncodeResult encode_text(const Result& result) const;

    OutputMode mode_;
    bool colors_;
    bool verbose_;
    std::vector<Field> fields_;
    std::vector<Field> text_fields_;
};

/// Набор полей текстового режима по умолчанию
std::vector<Field> default_text_fields(bool verbose);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Удалить все последовательности ESC '[' [0-9;]* [A-Za-z].
/// Незавершённая последовательность остаётся как есть.
std::string decolorize(std::string_view bytes);

/// Заменить CR и LF на %0D и %0A: значение занимает ровно одну строку
std::string escape_line_breaks(std::string_view value);

/// Разобрать JSON-запись обратно в Result; nullopt при ошибке разбора
std::optional<Result> decode_json(std::string_view line);

}  // namespace crawlsink::encoder

#endif  // CRAWLSINK_ENCODER_HPP
