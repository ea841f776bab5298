// ==============================================================================
// fields.cpp - MOD-0004: Валидация и сохранение полей
// ==============================================================================

#include "crawlsink/fields.hpp"

#include "crawlsink/encoder.hpp"
#include "crawlsink/file_sink.hpp"
#include "crawlsink/platform.hpp"

#include <system_error>

namespace crawlsink::fields {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

std::vector<std::string> split_field_names(std::string_view list) {
    std::vector<std::string> names;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string_view::npos) {
            comma = list.size();
        }
        std::string_view token = trim(list.substr(start, comma - start));
        if (!token.empty()) {
            names.emplace_back(token);
        }
        start = comma + 1;
    }
    return names;
}

Status validate_field_names(std::string_view list) {
    for (const auto& name : split_field_names(list)) {
        if (!field_from_name(name)) {
            return Status::failure(
                make_error(ErrorKind::InvalidField, "unknown field name '" + name + "'", name));
        }
    }
    return Status::success();
}

std::vector<Field> parse_fields(std::string_view list) {
    std::vector<Field> result;
    for (const auto& name : split_field_names(list)) {
        if (auto field = field_from_name(name)) {
            result.push_back(*field);
        }
    }
    return result;
}

// ----------------------------------------------------------------------------
// FieldStore
// ----------------------------------------------------------------------------

FieldStore::FieldStore(std::filesystem::path directory, std::vector<Field> fields)
    : directory_(std::move(directory)), fields_(std::move(fields)) {
    for (Field f : fields_) {
        if (locks_.find(f) == locks_.end()) {
            locks_.emplace(f, std::make_unique<std::mutex>());
        }
    }
}

std::filesystem::path FieldStore::path_for(Field field) const {
    return directory_ / (std::string(field_name(field)) + ".txt");
}

Status FieldStore::ensure_directory() {
    std::lock_guard<std::mutex> lock(dir_mutex_);
    if (dir_ready_) {
        return Status::success();
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Status::failure(make_error(ErrorKind::Sink,
                                          "cannot create field directory '" +
                                              platform::path_to_utf8(directory_) +
                                              "': " + ec.message(),
                                          platform::path_to_utf8(directory_)));
    }
    dir_ready_ = true;
    return Status::success();
}

Status FieldStore::store(const Result& result) {
    if (fields_.empty()) {
        return Status::success();
    }

    Status st = ensure_directory();
    if (!st) {
        return st;
    }

    for (Field f : fields_) {
        // Одно значение - одна строка, даже если в нём есть переводы строк
        std::string line = encoder::escape_line_breaks(field_value(result, f));
        line += '\n';

        std::lock_guard<std::mutex> lock(*locks_.at(f));
        auto opened = io::FileSink::open(path_for(f), io::FileMode::Append);
        if (!opened) {
            return Status::failure(opened.error);
        }
        st = opened.sink->write(line);
        if (!st) {
            return st;
        }
        st = opened.sink->close();
        if (!st) {
            return st;
        }
    }
    return Status::success();
}

}  // namespace crawlsink::fields
