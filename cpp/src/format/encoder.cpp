// ==============================================================================
// encoder.cpp - MOD-0005: Кодирование Result
// ==============================================================================
//
// MOD-0005 encoder
// RapidJSON для JSON сериализации
//
// ==============================================================================

#include "crawlsink/encoder.hpp"

#include "crawlsink/console.hpp"

#include <algorithm>
#include <array>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace crawlsink::encoder {

namespace {

// Порядок полей в текстовой строке: метаданные в скобках, затем URL и тело
constexpr std::array<Field, 7> TEXT_ORDER = {Field::Timestamp, Field::Method, Field::Source,
                                             Field::Tag,       Field::Attribute, Field::URL,
                                             Field::Body};

size_t text_rank(Field f) {
    auto it = std::find(TEXT_ORDER.begin(), TEXT_ORDER.end(), f);
    return static_cast<size_t>(it - TEXT_ORDER.begin());
}

console::Color field_color(Field f) {
    switch (f) {
    case Field::Timestamp:
    case Field::Source:
        return console::Color::Cyan;
    case Field::Method:
        return console::Color::Green;
    case Field::Tag:
        return console::Color::Magenta;
    case Field::Attribute:
        return console::Color::Yellow;
    case Field::URL:
    case Field::Body:
        return console::Color::Default;
    }
    return console::Color::Default;
}

bool is_bracketed(Field f) {
    return f != Field::URL && f != Field::Body;
}

// Невалидный UTF-8 в строке - ошибка кодирования, а не мусор в выводе
using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                     rapidjson::CrtAllocator, rapidjson::kWriteValidateEncodingFlag>;

}  // namespace

std::vector<Field> default_text_fields(bool verbose) {
    if (verbose) {
        return {Field::Timestamp, Field::Method, Field::Source, Field::Tag,
                Field::Attribute, Field::URL,    Field::Body};
    }
    return {Field::Method, Field::Source, Field::Tag, Field::Attribute, Field::URL};
}

Encoder::Encoder(OutputMode mode, bool colors, bool verbose, std::vector<Field> fields)
    : mode_(mode), colors_(colors), verbose_(verbose), fields_(std::move(fields)) {
    text_fields_ = fields_.empty() ? default_text_fields(verbose_) : fields_;

    // Порядок строки фиксирован, повторы убираются
    std::sort(text_fields_.begin(), text_fields_.end(),
              [](Field a, Field b) { return text_rank(a) < text_rank(b); });
    text_fields_.erase(std::unique(text_fields_.begin(), text_fields_.end()), text_fields_.end());
}

EncodeResult Encoder::encode(const Result& result) const {
    if (mode_ == OutputMode::Json) {
        return encode_json(result);
    }
    return encode_text(result);
}

EncodeResult Encoder::encode_json(const Result& result) const {
    EncodeResult out;

    // Событие без полей не выводится
    if (is_empty(result)) {
        out.ok = true;
        return out;
    }

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    bool good = writer.StartObject();
    for (Field f : ALL_FIELDS) {
        // При заданном --fields в JSON попадают только они
        if (!fields_.empty() && std::find(fields_.begin(), fields_.end(), f) == fields_.end()) {
            continue;
        }
        std::string value = field_value(result, f);
        if (value.empty()) {
            continue;
        }
        good = writer.Key(field_json_key(f)) &&
               writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
        if (!good) {
            out.error = make_error(ErrorKind::Format,
                                   std::string("cannot encode field '") + field_name(f) +
                                       "': invalid UTF-8",
                                   field_name(f));
            return out;
        }
    }
    good = good && writer.EndObject();
    if (!good || !writer.IsComplete()) {
        out.error = make_error(ErrorKind::Format, "cannot encode result");
        return out;
    }

    // "{}" - все запрошенные поля пусты
    if (buffer.GetSize() <= 2) {
        out.ok = true;
        return out;
    }

    out.data.assign(buffer.GetString(), buffer.GetSize());
    out.ok = true;
    return out;
}

EncodeResult Encoder::encode_text(const Result& result) const {
    EncodeResult out;

    std::string line;
    for (Field f : text_fields_) {
        std::string value = field_value(result, f);
        if (value.empty()) {
            continue;
        }
        if (!line.empty()) {
            line += ' ';
        }
        std::string colored =
            console::colorize(escape_line_breaks(value), field_color(f), colors_);
        if (is_bracketed(f)) {
            line += '[';
            line += colored;
            line += ']';
        } else {
            line += colored;
        }
    }

    out.data = std::move(line);
    out.ok = true;
    return out;
}

// ----------------------------------------------------------------------------
// decolorize
// ----------------------------------------------------------------------------

std::string decolorize(std::string_view bytes) {
    // Инвариант: out не содержит полной последовательности.
    // Последовательность заканчивается буквой, поэтому хвост проверяется после каждой буквы.
    std::string out;
    out.reserve(bytes.size());

    for (char c : bytes) {
        out += c;
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))) {
            continue;
        }
        size_t j = out.size() - 1;
        while (j > 0 && ((out[j - 1] >= '0' && out[j - 1] <= '9') || out[j - 1] == ';')) {
            --j;
        }
        if (j >= 2 && out[j - 1] == '[' && out[j - 2] == '\x1b') {
            out.resize(j - 2);
        }
    }
    return out;
}

std::string escape_line_breaks(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\n') {
            out += "%0A";
        } else if (c == '\r') {
            out += "%0D";
        } else {
            out += c;
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// decode_json
// ----------------------------------------------------------------------------

std::optional<Result> decode_json(std::string_view line) {
    rapidjson::Document doc;
    doc.Parse(line.data(), line.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }

    Result result;
    for (Field f : ALL_FIELDS) {
        auto it = doc.FindMember(field_json_key(f));
        if (it == doc.MemberEnd()) {
            continue;
        }
        if (!it->value.IsString()) {
            return std::nullopt;
        }
        std::string value(it->value.GetString(), it->value.GetStringLength());

        switch (f) {
        case Field::Timestamp: {
            auto tp = parse_timestamp(value);
            if (!tp) {
                return std::nullopt;
            }
            result.timestamp = *tp;
            break;
        }
        case Field::Method:
            result.method = std::move(value);
            break;
        case Field::Body:
            result.body = std::move(value);
            break;
        case Field::URL:
            result.url = std::move(value);
            break;
        case Field::Source:
            result.source = std::move(value);
            break;
        case Field::Tag:
            result.tag = std::move(value);
            break;
        case Field::Attribute:
            result.attribute = std::move(value);
            break;
        }
    }
    return result;
}

}  // namespace crawlsink::encoder
