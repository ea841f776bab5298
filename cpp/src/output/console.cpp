// ==============================================================================
// console.cpp - MOD-0008: Консольный вывод
// ==============================================================================
//
// MOD-0008 console
// Только этот модуль пишет в stdout/stderr
// Байты первичны, избегаем std::endl
//
// ==============================================================================

#include "crawlsink/console.hpp"

#include "crawlsink/platform.hpp"

#include <cstdio>

namespace crawlsink::console {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// "<prefix><message>\n"
std::string prefixed(std::string_view prefix, std::string_view message) {
    std::string line;
    line.reserve(prefix.size() + message.size() + 1);
    line.append(prefix);
    line.append(message);
    line += '\n';
    return line;
}

}  // namespace

// ----------------------------------------------------------------------------
// Console
// ----------------------------------------------------------------------------

Console::Console(const ConsoleConfig& cfg) : config_(cfg) {}

Console::~Console() {
    flush();
}

void Console::write_line(std::string_view line) {
    // Строка и перевод строки одной записью: строки разных потоков не смешиваются
    std::string buf = prefixed({}, line);

    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(Stream::Stdout, buf);
}

void Console::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(s, bytes);
}

void Console::write_impl(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Console::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Console::write_prefixed(std::string line, Color color) {
    // Окрашивается только префикс "[+]" и т.п.
    if (supports_color(Stream::Stderr) && line.size() >= 3) {
        line = colorize(std::string_view(line).substr(0, 3), color, true) + line.substr(3);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    write_impl(Stream::Stderr, line);
}

void Console::info(std::string_view message) {
    // Подавляем информационные сообщения при quiet
    if (config_.quiet) {
        return;
    }
    write_prefixed(format_info(message), Color::Green);
}

void Console::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed(format_warning(message), Color::Yellow);
}

void Console::error(std::string_view message) {
    // Ошибки всегда печатаются, даже при quiet
    write_prefixed(format_error(message), Color::Red);
}

void Console::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed(format_debug(message), Color::Cyan);
}

void Console::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// CapturingSink
// ----------------------------------------------------------------------------

void CapturingSink::write_line(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.emplace_back(line);
}

std::vector<std::string> CapturingSink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

size_t CapturingSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return prefixed("[+] ", message);
}

std::string format_error(std::string_view message) {
    return prefixed("[x] ", message);
}

std::string format_warning(std::string_view message) {
    return prefixed("[!] ", message);
}

std::string format_debug(std::string_view message) {
    return prefixed("[*] ", message);
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

std::string colorize(std::string_view text, Color color, bool enabled) {
    if (!enabled || text.empty() || color == Color::Default) {
        return std::string(text);
    }
    std::string result = ansi_color_code(color);
    result.append(text);
    result += ansi_reset_code();
    return result;
}

bool supports_color(Stream s) {
    return platform::is_tty(s == Stream::Stdout ? stdout : stderr);
}

}  // namespace crawlsink::console
