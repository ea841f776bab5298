// ==============================================================================
// crawlsink/archive.hpp - MOD-0007: Архив HTTP ответов
// ==============================================================================
//
// MOD-0007 archive
//
// Назначение:
// - Детерминированное имя файла ответа по URL запроса (FNV-1a 64)
// - Запись сырого ответа в <dir>/<hash>.txt
// - Индекс <dir>/index.txt: одна строка на ответ
//   "<filename> <url> (<code> <reason>)"
//
// Директория пересоздаётся при создании архиватора: ответы прошлого запуска
// не смешиваются с текущими.
//
// ==============================================================================

#ifndef CRAWLSINK_ARCHIVE_HPP
#define CRAWLSINK_ARCHIVE_HPP

#include <crawlsink/error.hpp>
#include <crawlsink/result.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace crawlsink::archive {

/// Директория архива по умолчанию
constexpr const char* DEFAULT_RESPONSE_DIR = "crawlsink_responses";

/// Имя файла индекса
constexpr const char* INDEX_FILE = "index.txt";

// ----------------------------------------------------------------------------
// Имена файлов
// ----------------------------------------------------------------------------

/// FNV-1a 64 по байтам строки
std::uint64_t fnv1a64(std::string_view bytes);

/// Имя файла ответа: 16 hex-цифр FNV-1a 64 от URL + ".txt"
std::string response_filename(std::string_view url);

// ----------------------------------------------------------------------------
// Индекс
// ----------------------------------------------------------------------------

struct IndexEntry {
    std::string filename;
    std::string url;
    int status_code = 0;
    std::string reason;
};

/// Строка индекса с '\n'. Пробельные символы и '%' в URL кодируются (%20, %09, %25, ...)
std::string format_index_line(const IndexEntry& entry);

/// Разбор строки индекса (с '\n' или без); URL декодируется обратно
std::optional<IndexEntry> parse_index_line(std::string_view line);

// ----------------------------------------------------------------------------
// ResponseArchiver
// ----------------------------------------------------------------------------

struct ArchiverResult;

class ResponseArchiver {
public:
    /// Пересоздать директорию и пустой индекс.
    /// Любая ошибка фатальна: архиватор не создаётся.
    static ArchiverResult create(const std::filesystem::path& directory);

    ResponseArchiver(const ResponseArchiver&) = delete;
    ResponseArchiver& operator=(const ResponseArchiver&) = delete;

    /// Записать ответ в свой файл и добавить строку в индекс.
    /// Ошибка касается только этого ответа.
    Status archive(const Response& response);

    const std::filesystem::path& directory() const { return directory_; }
    std::filesystem::path index_path() const { return directory_ / INDEX_FILE; }

private:
    explicit ResponseArchiver(std::filesystem::path directory);

    Status write_response_file(const std::filesystem::path& path, const std::string& dump);
    Status append_index(const IndexEntry& entry);

    std::filesystem::path directory_;

    // Сериализует дозапись индекса; файлы ответов пишутся без блокировки
    // во временные файлы и переименовываются на место
    std::mutex index_mutex_;

    // Суффикс временных файлов ответов
    std::atomic<std::uint64_t> temp_seq_{0};
};

struct ArchiverResult {
    bool ok = false;
    std::unique_ptr<ResponseArchiver> archiver;
    Error error;

    explicit operator bool() const { return ok; }
};

}  // namespace crawlsink::archive

#endif  // CRAWLSINK_ARCHIVE_HPP
