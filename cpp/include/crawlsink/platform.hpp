// ==============================================================================
// crawlsink/platform.hpp - MOD-0002: Платформенные абстракции
// ==============================================================================
//
// MOD-0002 platform
//
// Назначение:
// - std::filesystem::path + явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Временные директории (тесты, пробные запуски)
//
// ==============================================================================

#ifndef CRAWLSINK_PLATFORM_HPP
#define CRAWLSINK_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace crawlsink::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

/// Поток подключён к терминалу (nullptr - нет)
bool is_tty(std::FILE* stream);

// ----------------------------------------------------------------------------
// Временные директории
// ----------------------------------------------------------------------------

/// Создать уникальную временную директорию "<tmp>/<prefix>_XXXXXX"
/// @throws std::runtime_error если директорию создать не удалось
std::filesystem::path make_temp_dir(std::string_view prefix);

}  // namespace crawlsink::platform

#endif  // CRAWLSINK_PLATFORM_HPP
