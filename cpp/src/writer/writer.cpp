// ==============================================================================
// writer.cpp - MOD-0010: Writer - единая точка вывода событий
// ==============================================================================
//
// MOD-0010 writer
//
// Порядок обработки события (под output_mutex_):
// 1. FieldStore (побочный канал)
// 2. Encoder; пустой результат - событие подавляется
// 3. console.write_line (с цветом, если включён)
// 4. Файл вывода (text без ANSI кодов)
//
// Архивация ответа выполняется после, вне output_mutex_.
//
// ==============================================================================

#include "crawlsink/writer.hpp"

#include <utility>

namespace crawlsink {

Writer::Writer(console::LineSink& console, encoder::Encoder encoder)
    : console_(console), encoder_(std::move(encoder)) {}

WriterResult Writer::create(const config::Options& options, console::LineSink& console) {
    WriterResult result;

    // Проверка полей: две независимые проверки с разным контекстом
    if (!options.fields.empty()) {
        Status st = fields::validate_field_names(options.fields);
        if (!st) {
            result.error =
                st.error.wrap("could not validate fields", ErrorKind::ConfigValidation);
            return result;
        }
    }
    std::vector<Field> store_fields;
    if (!options.store_fields.empty()) {
        Status st = fields::validate_field_names(options.store_fields);
        if (!st) {
            result.error =
                st.error.wrap("could not validate store fields", ErrorKind::ConfigValidation);
            return result;
        }
        store_fields = fields::parse_fields(options.store_fields);
    }

    encoder::Encoder enc(options.mode, options.colors, options.verbose,
                         fields::parse_fields(options.fields));
    std::unique_ptr<Writer> writer(new Writer(console, std::move(enc)));

    if (!store_fields.empty()) {
        writer->field_store_ =
            std::make_unique<fields::FieldStore>(options.store_fields_dir, std::move(store_fields));
    }

    if (options.output_file.has_value()) {
        auto opened = io::FileSink::open(*options.output_file, io::FileMode::Truncate);
        if (!opened) {
            result.error = opened.error.wrap("could not create output file");
            return result;
        }
        writer->output_file_ = std::move(opened.sink);
    }

    if (options.store_response) {
        auto created = archive::ResponseArchiver::create(config::response_dir(options));
        if (!created) {
            result.error = created.error.wrap("could not create response archive");
            return result;
        }
        writer->archiver_ = std::move(created.archiver);
    }

    result.writer = std::move(writer);
    result.ok = true;
    return result;
}

Status Writer::write(const Result* result, const Response* response) {
    if (result != nullptr) {
        Status st = write_result(*result);
        if (!st) {
            return st;
        }
    }

    if (archiver_ != nullptr && response != nullptr) {
        Status st = archiver_->archive(*response);
        if (!st) {
            return Status::failure(st.error.wrap("could not store response", ErrorKind::Archive));
        }
    }
    return Status::success();
}

Status Writer::write_result(const Result& result) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (field_store_ != nullptr) {
        Status st = field_store_->store(result);
        if (!st) {
            return Status::failure(st.error.wrap("could not store fields"));
        }
    }

    auto encoded = encoder_.encode(result);
    if (!encoded) {
        return Status::failure(encoded.error.wrap("could not format output"));
    }
    if (encoded.data.empty()) {
        return Status::success();
    }

    console_.write_line(encoded.data);

    if (output_file_ != nullptr) {
        // JSON не содержит ANSI кодов; строка пишется одной записью
        std::string line = encoder_.mode() == encoder::OutputMode::Text
                               ? encoder::decolorize(encoded.data)
                               : std::move(encoded.data);
        line += '\n';
        Status st = output_file_->write(line);
        if (!st) {
            return Status::failure(st.error.wrap("could not write to output"));
        }
    }
    return Status::success();
}

Status Writer::close() {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (output_file_ == nullptr) {
        return Status::success();
    }
    return output_file_->close();
}

std::optional<std::filesystem::path> Writer::response_dir() const {
    if (archiver_ == nullptr) {
        return std::nullopt;
    }
    return archiver_->directory();
}

}  // namespace crawlsink
