// ==============================================================================
// crawlsink/writer.hpp - MOD-0010: Writer - единая точка вывода событий
// ==============================================================================
//
// MOD-0010 writer
//
// Назначение:
// - Единственная точка входа для продюсеров (воркеров краулера)
// - Под одним mutex: сохранение полей -> кодирование -> консоль -> файл
// - Архивация ответов вне этого mutex (у архива своя блокировка индекса)
//
// Использование:
// @code
//   console::Console con;
//   auto created = Writer::create(options, con);
//   if (!created) {
//       con.error(created.error.message);
//       return 1;
//   }
//   Status st = created.writer->write(&result, &response);
//   created.writer->close();
// @endcode
//
// ==============================================================================

#ifndef CRAWLSINK_WRITER_HPP
#define CRAWLSINK_WRITER_HPP

#include <crawlsink/archive.hpp>
#include <crawlsink/config.hpp>
#include <crawlsink/console.hpp>
#include <crawlsink/encoder.hpp>
#include <crawlsink/error.hpp>
#include <crawlsink/fields.hpp>
#include <crawlsink/file_sink.hpp>
#include <crawlsink/result.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace crawlsink {

struct WriterResult;

class Writer {
public:
    /// Проверить конфигурацию и создать Writer.
    /// При любой ошибке Writer не создаётся.
    static WriterResult create(const config::Options& options, console::LineSink& console);

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать событие и/или ответ.
    ///
    /// @param result Событие (nullptr - только архивация)
    /// @param response Ответ (nullptr - без архивации)
    /// @return Первая ошибка с контекстом этапа
    Status write(const Result* result, const Response* response);

    /// Закрыть файл вывода; повторный вызов - ErrorKind::ClosedSink
    Status close();

    encoder::OutputMode mode() const { return encoder_.mode(); }

    /// Директория архива ответов (если архивация включена)
    std::optional<std::filesystem::path> response_dir() const;

private:
    Writer(console::LineSink& console, encoder::Encoder encoder);

    Status write_result(const Result& result);

    console::LineSink& console_;
    encoder::Encoder encoder_;

    std::unique_ptr<fields::FieldStore> field_store_;
    std::unique_ptr<io::FileSink> output_file_;
    std::unique_ptr<archive::ResponseArchiver> archiver_;

    // Сериализует вывод событий в консоль и файл
    std::mutex output_mutex_;
};

struct WriterResult {
    bool ok = false;
    std::unique_ptr<Writer> writer;
    Error error;

    explicit operator bool() const { return ok; }
};

}  // namespace crawlsink

#endif  // CRAWLSINK_WRITER_HPP
