// ==============================================================================
// archive.cpp - MOD-0007: Архив HTTP ответов
// ==============================================================================

#include "crawlsink/archive.hpp"

#include "crawlsink/file_sink.hpp"
#include "crawlsink/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace crawlsink::archive {

namespace {

// Пробельные символы URL ломают разбор колонок индекса; '%' кодируется,
// чтобы разбор строки был однозначным
std::string escape_index_url(std::string_view url) {
    std::string out;
    out.reserve(url.size());
    for (char c : url) {
        switch (c) {
        case '%':
            out += "%25";
            break;
        case ' ':
            out += "%20";
            break;
        case '\t':
            out += "%09";
            break;
        case '\n':
            out += "%0A";
            break;
        case '\r':
            out += "%0D";
            break;
        default:
            out += c;
        }
    }
    return out;
}

// Обратное к escape_index_url; прочие "%XX" остаются как есть
std::string unescape_index_url(std::string_view url) {
    std::string out;
    out.reserve(url.size());
    for (size_t i = 0; i < url.size(); ++i) {
        if (url[i] == '%' && i + 2 < url.size()) {
            std::string_view code = url.substr(i + 1, 2);
            char decoded = 0;
            if (code == "25") {
                decoded = '%';
            } else if (code == "20") {
                decoded = ' ';
            } else if (code == "09") {
                decoded = '\t';
            } else if (code == "0A") {
                decoded = '\n';
            } else if (code == "0D") {
                decoded = '\r';
            }
            if (decoded != 0) {
                out += decoded;
                i += 2;
                continue;
            }
        }
        out += url[i];
    }
    return out;
}

Error archive_error(const std::string& message, const std::filesystem::path& path) {
    return make_error(ErrorKind::Archive, message, platform::path_to_utf8(path));
}

}  // namespace

// ----------------------------------------------------------------------------
// Имена файлов
// ----------------------------------------------------------------------------

std::uint64_t fnv1a64(std::string_view bytes) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : bytes) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ull;
    }
    return h;
}

std::string response_filename(std::string_view url) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::uint64_t v = fnv1a64(url);
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = HEX[v & 0xF];
        v >>= 4;
    }
    out += ".txt";
    return out;
}

// ----------------------------------------------------------------------------
// Индекс
// ----------------------------------------------------------------------------

std::string format_index_line(const IndexEntry& entry) {
    std::string line = entry.filename;
    line += ' ';
    line += escape_index_url(entry.url);
    line += " (";
    line += std::to_string(entry.status_code);
    if (!entry.reason.empty()) {
        line += ' ';
        line += entry.reason;
    }
    line += ")\n";
    return line;
}

std::optional<IndexEntry> parse_index_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    size_t first_space = line.find(' ');
    if (first_space == std::string_view::npos || first_space == 0) {
        return std::nullopt;
    }
    size_t status_open = line.rfind(" (");
    if (status_open == std::string_view::npos || status_open <= first_space ||
        line.back() != ')') {
        return std::nullopt;
    }

    IndexEntry entry;
    entry.filename = std::string(line.substr(0, first_space));
    entry.url = unescape_index_url(line.substr(first_space + 1, status_open - first_space - 1));

    // "(<code> <reason>)" или "(<code>)"
    std::string_view status = line.substr(status_open + 2, line.size() - status_open - 3);
    size_t space = status.find(' ');
    std::string code_str(status.substr(0, space));
    if (code_str.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long code = std::strtol(code_str.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE || code < 0 ||
        code > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    entry.status_code = static_cast<int>(code);
    if (space != std::string_view::npos) {
        entry.reason = std::string(status.substr(space + 1));
    }
    return entry;
}

// ----------------------------------------------------------------------------
// ResponseArchiver
// ----------------------------------------------------------------------------

ResponseArchiver::ResponseArchiver(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

ArchiverResult ResponseArchiver::create(const std::filesystem::path& directory) {
    ArchiverResult result;

    // Чистый лист на каждый запуск
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    if (ec) {
        result.error = archive_error("cannot remove response directory '" +
                                         platform::path_to_utf8(directory) + "': " + ec.message(),
                                     directory);
        return result;
    }
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        result.error = archive_error("cannot create response directory '" +
                                         platform::path_to_utf8(directory) + "': " + ec.message(),
                                     directory);
        return result;
    }

    auto index = io::FileSink::open(directory / INDEX_FILE, io::FileMode::Truncate);
    if (!index) {
        result.error = index.error.wrap("cannot create index file", ErrorKind::Archive);
        return result;
    }
    Status st = index.sink->close();
    if (!st) {
        result.error = st.error.wrap("cannot create index file", ErrorKind::Archive);
        return result;
    }

    result.archiver.reset(new ResponseArchiver(directory));
    result.ok = true;
    return result;
}

Status ResponseArchiver::archive(const Response& response) {
    IndexEntry entry;
    entry.filename = response_filename(response.url);
    entry.url = response.url;
    entry.status_code = response.status_code;
    entry.reason = status_text(response.status_code);

    // Ответ пишется во временный файл и переименовывается на место:
    // одновременная архивация одного URL оставляет один целый дамп
    auto target = directory_ / entry.filename;
    auto temp = directory_ / (entry.filename + "." + std::to_string(++temp_seq_) + ".tmp");

    Status st = write_response_file(temp, dump_response(response));
    if (st) {
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            st = Status::failure(archive_error("cannot create response file '" +
                                                   platform::path_to_utf8(target) +
                                                   "': " + ec.message(),
                                               target));
        }
    }
    if (!st) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return st;
    }

    return append_index(entry);
}

Status ResponseArchiver::write_response_file(const std::filesystem::path& path,
                                             const std::string& dump) {
    auto opened = io::FileSink::open(path, io::FileMode::Truncate);
    if (!opened) {
        return Status::failure(opened.error.wrap("cannot create response file", ErrorKind::Archive));
    }
    Status st = opened.sink->write(dump);
    if (!st) {
        return Status::failure(st.error.wrap("cannot write response file", ErrorKind::Archive));
    }
    st = opened.sink->close();
    if (!st) {
        return Status::failure(st.error.wrap("cannot close response file", ErrorKind::Archive));
    }
    return Status::success();
}

Status ResponseArchiver::append_index(const IndexEntry& entry) {
    std::string line = format_index_line(entry);

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto opened = io::FileSink::open(index_path(), io::FileMode::Append);
    if (!opened) {
        return Status::failure(opened.error.wrap("cannot update index", ErrorKind::Archive));
    }
    Status st = opened.sink->write(line);
    if (!st) {
        return Status::failure(st.error.wrap("cannot update index", ErrorKind::Archive));
    }
    st = opened.sink->close();
    if (!st) {
        return Status::failure(st.error.wrap("cannot update index", ErrorKind::Archive));
    }
    return Status::success();
}

}  // namespace crawlsink::archive
