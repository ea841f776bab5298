// ==============================================================================
// result.cpp - MOD-0003: Модель данных событий краулера
// ==============================================================================

#include "crawlsink/result.hpp"

#include <cstdint>
#include <cstdio>

namespace crawlsink {

// ----------------------------------------------------------------------------
// Схема полей
// ----------------------------------------------------------------------------

const char* field_name(Field field) {
    switch (field) {
    case Field::Timestamp:
        return "Timestamp";
    case Field::Method:
        return "Method";
    case Field::Body:
        return "Body";
    case Field::URL:
        return "URL";
    case Field::Source:
        return "Source";
    case Field::Tag:
        return "Tag";
    case Field::Attribute:
        return "Attribute";
    }
    return "";
}

const char* field_json_key(Field field) {
    switch (field) {
    case Field::Timestamp:
        return "timestamp";
    case Field::Method:
        return "method";
    case Field::Body:
        return "body";
    case Field::URL:
        return "endpoint";
    case Field::Source:
        return "source";
    case Field::Tag:
        return "tag";
    case Field::Attribute:
        return "attribute";
    }
    return "";
}

std::optional<Field> field_from_name(std::string_view name) {
    for (Field f : ALL_FIELDS) {
        if (name == field_name(f)) {
            return f;
        }
    }
    return std::nullopt;
}

std::string field_value(const Result& result, Field field) {
    switch (field) {
    case Field::Timestamp:
        return format_timestamp(result.timestamp);
    case Field::Method:
        return result.method;
    case Field::Body:
        return result.body;
    case Field::URL:
        return result.url;
    case Field::Source:
        return result.source;
    case Field::Tag:
        return result.tag;
    case Field::Attribute:
        return result.attribute;
    }
    return {};
}

std::optional<std::string> field_value(const Result& result, std::string_view name) {
    auto field = field_from_name(name);
    if (!field) {
        return std::nullopt;
    }
    return field_value(result, *field);
}

bool is_empty(const Result& result) {
    return result.timestamp.time_since_epoch().count() == 0 && result.method.empty() &&
           result.body.empty() && result.url.empty() && result.source.empty() &&
           result.tag.empty() && result.attribute.empty();
}

// ----------------------------------------------------------------------------
// Timestamp
// ----------------------------------------------------------------------------

namespace {

// Гражданская дата <-> число дней от 1970-01-01 (пролептический григорианский)

std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool read_digits(std::string_view text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect_char(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const std::int64_t total_ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::int64_t days = total_ms / 86400000;
    std::int64_t ms_of_day = total_ms % 86400000;
    if (ms_of_day < 0) {
        ms_of_day += 86400000;
        days -= 1;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    const auto hh = static_cast<int>(ms_of_day / 3600000);
    const auto mm = static_cast<int>((ms_of_day / 60000) % 60);
    const auto ss = static_cast<int>((ms_of_day / 1000) % 60);
    const auto ms = static_cast<int>(ms_of_day % 1000);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, hh, mm, ss, ms);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text) {
    using namespace std::chrono;

    size_t pos = 0;
    int year = 0, month = 0, day = 0, hh = 0, mm = 0, ss = 0;

    if (!read_digits(text, pos, 4, year) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hh) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, mm) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, ss)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hh > 23 || mm > 59 || ss > 60) {
        return std::nullopt;
    }

    // Дробная часть: берём до наносекунд, остальное отбрасываем
    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    // Зона: Z или +hh:mm / -hh:mm
    std::int64_t offset_s = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int oh = 0, om = 0;
        if (!read_digits(text, pos, 2, oh) || !expect_char(text, pos, ':') ||
            !read_digits(text, pos, 2, om)) {
            return std::nullopt;
        }
        offset_s = sign * (oh * 3600 + om * 60);
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days =
        days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t secs = days * 86400 + hh * 3600 + mm * 60 + ss - offset_s;

    auto since_epoch = duration_cast<system_clock::duration>(seconds(secs) + nanoseconds(nanos));
    return system_clock::time_point(since_epoch);
}

// ----------------------------------------------------------------------------
// Response
// ----------------------------------------------------------------------------

std::string status_text(int code) {
    switch (code) {
    case 100:
        return "Continue";
    case 101:
        return "Switching Protocols";
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 202:
        return "Accepted";
    case 204:
        return "No Content";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 303:
        return "See Other";
    case 304:
        return "Not Modified";
    case 307:
        return "Temporary Redirect";
    case 308:
        return "Permanent Redirect";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 408:
        return "Request Timeout";
    case 409:
        return "Conflict";
    case 410:
        return "Gone";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 501:
        return "Not Implemented";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "";
    }
}

std::string dump_response(const Response& response) {
    std::string out;
    out.reserve(64 + response.body.size());

    // Status line: "HTTP/1.1 200 OK"
    out += response.proto;
    out += ' ';
    out += std::to_string(response.status_code);
    std::string reason = status_text(response.status_code);
    if (!reason.empty()) {
        out += ' ';
        out += reason;
    }
    out += "\r\n";

    for (const auto& [name, value] : response.headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "\r\n";
    out += response.body;
    return out;
}

}  // namespace crawlsink
