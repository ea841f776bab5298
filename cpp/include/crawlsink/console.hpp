// ==============================================================================
// crawlsink/console.hpp - MOD-0008: Консольный вывод
// ==============================================================================
//
// MOD-0008 console
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - LineSink: приёмник строк результатов, передаётся в Writer явно
// - Диагностика с префиксами "[+] [!] [x] [*]" в stderr
// - Цветной вывод (ANSI escape codes)
//
// ==============================================================================

#ifndef CRAWLSINK_CONSOLE_HPP
#define CRAWLSINK_CONSOLE_HPP

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace crawlsink::console {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Метод запроса, успех
    Yellow,  // Атрибут, предупреждения
    Red,     // Ошибки
    Cyan,    // Источник, отладка
    Magenta  // Тег
};

// ----------------------------------------------------------------------------
// LineSink - приёмник строк
// ----------------------------------------------------------------------------

/// Writer пишет результаты только через этот интерфейс
class LineSink {
public:
    virtual ~LineSink() = default;

    /// Записать строку; перевод строки добавляет реализация
    virtual void write_line(std::string_view line) = 0;
};

// ----------------------------------------------------------------------------
// Конфигурация консоли
// ----------------------------------------------------------------------------

struct ConsoleConfig {
    bool quiet = false;  // Подавить info/warn
    int verbose = 0;     // debug при verbose > 0
};

// ----------------------------------------------------------------------------
// Console
// ----------------------------------------------------------------------------

class Console : public LineSink {
public:
    explicit Console(const ConsoleConfig& cfg = {});
    ~Console() override;

    /// Строка результата в stdout (не подавляется quiet)
    void write_line(std::string_view line) override;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// Сбросить буферы
    void flush();

    const ConsoleConfig& config() const { return config_; }

private:
    /// Готовая строка format_* одной записью; префикс окрашивается при TTY
    void write_prefixed(std::string line, Color color);

    void write_impl(Stream s, std::string_view bytes);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    ConsoleConfig config_;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// CapturingSink - строки в памяти
// ----------------------------------------------------------------------------

class CapturingSink : public LineSink {
public:
    void write_line(std::string_view line) override;

    /// Копия накопленных строк
    std::vector<std::string> lines() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Форматирует информационное сообщение: "[+] <message>\n"
std::string format_info(std::string_view message);

/// Форматирует сообщение об ошибке: "[x] <message>\n"
std::string format_error(std::string_view message);

/// Форматирует предупреждение: "[!] <message>\n"
std::string format_warning(std::string_view message);

/// Форматирует отладочное сообщение: "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Обернуть текст в цвет; при enabled=false или пустом тексте - без изменений
std::string colorize(std::string_view text, Color color, bool enabled);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace crawlsink::console

#endif  // CRAWLSINK_CONSOLE_HPP
