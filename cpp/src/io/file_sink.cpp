// ==============================================================================
// file_sink.cpp - MOD-0006: Файловый приёмник
// ==============================================================================
//
// MOD-0006 file_sink
// Байты первичны: запись через fwrite без форматирования
//
// ==============================================================================

#include "crawlsink/file_sink.hpp"

#include "crawlsink/platform.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace crawlsink::io {

namespace {

std::string errno_message(int err) {
    return std::strerror(err);
}

}  // namespace

FileSink::FileSink(std::filesystem::path path, FILE* file)
    : path_(std::move(path)), file_(file) {}

FileSink::~FileSink() {
    if (file_ != nullptr) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

FileSink::FileSink(FileSink&& other) noexcept
    : path_(std::move(other.path_)), file_(std::exchange(other.file_, nullptr)) {}

FileSink& FileSink::operator=(FileSink&& other) noexcept {
    if (this != &other) {
        if (file_ != nullptr) {
            std::fclose(file_);
        }
        path_ = std::move(other.path_);
        file_ = std::exchange(other.file_, nullptr);
    }
    return *this;
}

FileSinkResult FileSink::open(const std::filesystem::path& path, FileMode mode) {
    FileSinkResult result;

#ifdef _WIN32
    // Windows: _wfopen для Unicode путей
    FILE* f = _wfopen(path.c_str(), mode == FileMode::Append ? L"ab" : L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    FILE* f = std::fopen(path_str.c_str(), mode == FileMode::Append ? "ab" : "wb");
#endif

    if (f == nullptr) {
        int err = errno;
        result.error = make_error(ErrorKind::Sink,
                                  "cannot open '" + platform::path_to_utf8(path) +
                                      "': " + errno_message(err),
                                  platform::path_to_utf8(path));
        return result;
    }

    result.sink.reset(new FileSink(path, f));
    result.ok = true;
    return result;
}

Status FileSink::write(std::string_view bytes) {
    if (file_ == nullptr) {
        return Status::failure(make_error(ErrorKind::ClosedSink,
                                          "write to closed sink '" +
                                              platform::path_to_utf8(path_) + "'",
                                          platform::path_to_utf8(path_)));
    }

    // Одна запись + fflush: строка не разрывается между буферами
    size_t written = std::fwrite(bytes.data(), 1, bytes.size(), file_);
    if (written != bytes.size()) {
        int err = errno;
        return Status::failure(make_error(ErrorKind::Sink,
                                          "short write to '" + platform::path_to_utf8(path_) +
                                              "': " + errno_message(err),
                                          platform::path_to_utf8(path_)));
    }
    if (std::fflush(file_) != 0) {
        int err = errno;
        return Status::failure(make_error(ErrorKind::Sink,
                                          "cannot flush '" + platform::path_to_utf8(path_) +
                                              "': " + errno_message(err),
                                          platform::path_to_utf8(path_)));
    }
    return Status::success();
}

Status FileSink::close() {
    if (file_ == nullptr) {
        return Status::failure(make_error(ErrorKind::ClosedSink,
                                          "sink '" + platform::path_to_utf8(path_) +
                                              "' already closed",
                                          platform::path_to_utf8(path_)));
    }

    FILE* f = std::exchange(file_, nullptr);
    if (std::fclose(f) != 0) {
        int err = errno;
        return Status::failure(make_error(ErrorKind::Sink,
                                          "cannot close '" + platform::path_to_utf8(path_) +
                                              "': " + errno_message(err),
                                          platform::path_to_utf8(path_)));
    }
    return Status::success();
}

}  // namespace crawlsink::io
