// ==============================================================================
// main.cpp - MOD-0011: Точка входа приложения
// ==============================================================================
//
// MOD-0011 app
// Перехват исключений на границе app
//
// Точка входа:
// 1. Загрузка Options (-c config.yaml)
// 2. Создание Console и Writer
// 3. Чтение событий JSON Lines (файл или stdin) и передача в Writer
// 4. Возврат exit code
//
// ==============================================================================

#include "crawlsink/config.hpp"
#include "crawlsink/console.hpp"
#include "crawlsink/encoder.hpp"
#include "crawlsink/platform.hpp"
#include "crawlsink/writer.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr const char* USAGE =
    "Usage: crawlsink [-c <config.yaml>] [<results.jsonl>]\n"
    "\n"
    "Reads crawl results (one JSON object per line) from a file or stdin\n"
    "and writes them to the console, the output file and the field stores\n"
    "configured in <config.yaml>.\n";

struct Arguments {
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> input;
    bool help = false;
};

// "<вид ошибки>: <сообщение>"
std::string describe(const crawlsink::Error& error) {
    return std::string(crawlsink::error_kind_to_string(error.kind)) + ": " + error.message;
}

bool parse_arguments(int argc, char** argv, Arguments& args, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                error = "option '" + arg + "' requires a value";
                return false;
            }
            args.config = crawlsink::platform::path_from_utf8(argv[++i]);
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            error = "unknown option '" + arg + "'";
            return false;
        } else if (!args.input.has_value()) {
            if (arg != "-") {
                args.input = crawlsink::platform::path_from_utf8(arg);
            }
        } else {
            error = "unexpected argument '" + arg + "'";
            return false;
        }
    }
    return true;
}

int run(const Arguments& args) {
    using namespace crawlsink;

    config::Options options;
    if (args.config.has_value()) {
        auto loaded = config::load_options(*args.config);
        if (!loaded) {
            console::Console con;
            con.error(loaded.error.message);
            return 1;
        }
        options = loaded.options;
    }

    console::ConsoleConfig con_cfg;
    con_cfg.quiet = options.quiet;
    con_cfg.verbose = options.verbose ? 1 : 0;
    console::Console con(con_cfg);

    auto created = Writer::create(options, con);
    if (!created) {
        con.error(created.error.message);
        return 1;
    }
    Writer& writer = *created.writer;

    std::ifstream file;
    std::istream* in = &std::cin;
    if (args.input.has_value()) {
        file.open(*args.input);
        if (!file.is_open()) {
            con.error("cannot open input file: " + platform::path_to_utf8(*args.input));
            return 1;
        }
        in = &file;
    }

    std::size_t line_no = 0;
    std::size_t written = 0;
    std::size_t failed = 0;
    std::string line;
    while (std::getline(*in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        auto result = encoder::decode_json(line);
        if (!result) {
            con.warn("skipping malformed result on line " + std::to_string(line_no));
            ++failed;
            continue;
        }

        Status st = writer.write(&*result, nullptr);
        if (!st) {
            con.error("line " + std::to_string(line_no) + ": " + describe(st.error));
            ++failed;
            continue;
        }
        ++written;
    }

    Status st = writer.close();
    if (!st) {
        con.error(describe(st.error));
        return 1;
    }

    con.debug("processed " + std::to_string(written) + " results (" + std::to_string(failed) +
              " failed)");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        Arguments args;
        std::string error;
        if (!parse_arguments(argc, argv, args, error)) {
            crawlsink::console::Console con;
            con.error(error);
            con.write(crawlsink::console::Stream::Stderr, USAGE);
            return 2;
        }
        if (args.help) {
            crawlsink::console::Console con;
            con.write(crawlsink::console::Stream::Stdout, USAGE);
            return 0;
        }
        return run(args);
    } catch (const std::exception& e) {
        crawlsink::console::Console con;
        con.error(std::string("unexpected error: ") + e.what());
        return 1;
    }
}
