// ==============================================================================
// crawlsink/file_sink.hpp - MOD-0006: Файловый приёмник
// ==============================================================================
//
// MOD-0006 file_sink
//
// Назначение:
// - Дозапись байтов в один файл, привязанный при открытии
// - Каждый write() - один fwrite + fflush: строка попадает в файл целиком
// - После close() запись возвращает ErrorKind::ClosedSink
//
// ==============================================================================

#ifndef CRAWLSINK_FILE_SINK_HPP
#define CRAWLSINK_FILE_SINK_HPP

#include <crawlsink/error.hpp>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>

namespace crawlsink::io {

enum class FileMode {
    Truncate,  // Создать или обрезать
    Append     // Создать или дописывать в конец
};

struct FileSinkResult;

class FileSink {
public:
    /// Открыть файл
    static FileSinkResult open(const std::filesystem::path& path, FileMode mode);

    ~FileSink();

    FileSink(FileSink&& other) noexcept;
    FileSink& operator=(FileSink&& other) noexcept;
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    /// Дописать байты
    Status write(std::string_view bytes);

    /// Закрыть файл; повторный вызов - ErrorKind::ClosedSink
    Status close();

    bool is_open() const { return file_ != nullptr; }
    const std::filesystem::path& path() const { return path_; }

private:
    FileSink(std::filesystem::path path, FILE* file);

    std::filesystem::path path_;
    FILE* file_ = nullptr;
};

struct FileSinkResult {
    bool ok = false;
    std::unique_ptr<FileSink> sink;
    Error error;

    explicit operator bool() const { return ok; }
};

}  // namespace crawlsink::io

#endif  // CRAWLSINK_FILE_SINK_HPP
