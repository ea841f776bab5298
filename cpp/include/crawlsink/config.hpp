// ==============================================================================
// crawlsink/config.hpp - MOD-0009: Конфигурация вывода
// ==============================================================================
//
// MOD-0009 config
// yaml-cpp для файлов конфигурации
//
// Назначение:
// - Options: параметры Writer
// - load_options: чтение Options из YAML файла
//
// Пример файла:
// @code
//   colors: true
//   json: false
//   output: results.txt
//   fields: Method,URL
//   store-fields: [URL, Tag]
//   store-response: true
//   store-response-dir: responses
// @endcode
//
// ==============================================================================

#ifndef CRAWLSINK_CONFIG_HPP
#define CRAWLSINK_CONFIG_HPP

#include <crawlsink/encoder.hpp>
#include <crawlsink/error.hpp>
#include <crawlsink/fields.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace crawlsink::config {

struct Options {
    bool colors = false;
    encoder::OutputMode mode = encoder::OutputMode::Text;
    bool verbose = false;
    bool quiet = false;

    /// Файл вывода: каждое непустое событие дописывается сюда
    std::optional<std::filesystem::path> output_file;

    /// Поля для вывода ("Method,URL"); пусто = набор по умолчанию
    std::string fields;

    /// Поля для отдельного сохранения ("URL,Tag")
    std::string store_fields;
    std::filesystem::path store_fields_dir = fields::DEFAULT_STORE_DIR;

    /// Архивация HTTP ответов
    bool store_response = false;
    std::optional<std::filesystem::path> store_response_dir;
};

struct OptionsResult {
    bool ok = false;
    Options options;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить Options из YAML; неизвестные ключи - ошибка
OptionsResult load_options(const std::filesystem::path& path);

/// То же из строки (YAML документ)
OptionsResult parse_options(const std::string& yaml);

/// Директория архива: заданная или по умолчанию, если не задана/пустая
std::filesystem::path response_dir(const Options& options);

}  // namespace crawlsink::config

#endif  // CRAWLSINK_CONFIG_HPP
