// ==============================================================================
// platform.cpp - MOD-0002: Платформенные абстракции
// ==============================================================================
//
// MOD-0002 platform
// Платформенная специфика изолирована здесь
//
// ==============================================================================

#include "crawlsink/platform.hpp"

#include <cerrno>
#include <random>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#else
#include <cstdlib>
#include <unistd.h>
#endif

namespace crawlsink::platform {

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // На Windows u8path перекодирует в UTF-16, на Unix байты не меняются
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_tty(std::FILE* stream) {
    if (stream == nullptr) {
        return false;
    }
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

std::filesystem::path make_temp_dir(std::string_view prefix) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("cannot locate temp directory: " + ec.message());
    }
    std::string stem = std::string(prefix) + "_";

#ifdef _WIN32
    std::random_device rd;
    std::mt19937_64 gen(rd());
    static const char HEX[] = "0123456789abcdef";
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::string name = stem;
        for (int i = 0; i < 8; ++i) {
            name += HEX[gen() % 16];
        }
        if (std::filesystem::create_directory(base / name, ec)) {
            return base / name;
        }
    }
    throw std::runtime_error("cannot create temp directory under " + path_to_utf8(base));
#else
    std::string tmpl = (base / (stem + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("cannot create temp directory " + tmpl + ": " +
                                 std::generic_category().message(errno));
    }
    return std::filesystem::path(buf.data());
#endif
}

}  // namespace crawlsink::platform
