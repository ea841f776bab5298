// ==============================================================================
// config.cpp - MOD-0009: Конфигурация вывода
// ==============================================================================
//
// MOD-0009 config
// yaml-cpp для файлов конфигурации
//
// ==============================================================================

#include "crawlsink/config.hpp"

#include "crawlsink/archive.hpp"
#include "crawlsink/platform.hpp"

#include <fstream>
#include <set>
#include <yaml-cpp/yaml.h>

namespace crawlsink::config {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "colors", "json",           "verbose",        "quiet",
    "output", "fields",         "store-fields",   "store-fields-dir",
    "store-response",           "store-response-dir"};

// Список полей: строка "URL,Tag" или последовательность [URL, Tag]
std::string field_list(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!joined.empty()) {
                joined += ',';
            }
            joined += item.as<std::string>();
        }
        return joined;
    }
    return node.as<std::string>();
}

OptionsResult options_from_node(const YAML::Node& root) {
    OptionsResult result;

    // Пустой документ - все значения по умолчанию
    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = make_error(ErrorKind::Config, "configuration must be a mapping");
        return result;
    }

    for (const auto& kv : root) {
        auto key = kv.first.as<std::string>();
        if (KNOWN_KEYS.count(key) == 0) {
            result.error = make_error(ErrorKind::Config, "unknown option '" + key + "'", key);
            return result;
        }
    }

    Options& opt = result.options;
    if (root["colors"]) {
        opt.colors = root["colors"].as<bool>();
    }
    if (root["json"]) {
        opt.mode = root["json"].as<bool>() ? encoder::OutputMode::Json : encoder::OutputMode::Text;
    }
    if (root["verbose"]) {
        opt.verbose = root["verbose"].as<bool>();
    }
    if (root["quiet"]) {
        opt.quiet = root["quiet"].as<bool>();
    }
    if (root["output"]) {
        auto path = root["output"].as<std::string>();
        if (!path.empty()) {
            opt.output_file = platform::path_from_utf8(path);
        }
    }
    if (root["fields"]) {
        opt.fields = field_list(root["fields"]);
    }
    if (root["store-fields"]) {
        opt.store_fields = field_list(root["store-fields"]);
    }
    if (root["store-fields-dir"]) {
        opt.store_fields_dir = platform::path_from_utf8(root["store-fields-dir"].as<std::string>());
    }
    if (root["store-response"]) {
        opt.store_response = root["store-response"].as<bool>();
    }
    if (root["store-response-dir"]) {
        auto dir = root["store-response-dir"].as<std::string>();
        if (!dir.empty()) {
            opt.store_response_dir = platform::path_from_utf8(dir);
        }
    }

    result.ok = true;
    return result;
}

}  // anonymous namespace

OptionsResult parse_options(const std::string& yaml) {
    OptionsResult result;
    try {
        return options_from_node(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        result.error = make_error(ErrorKind::Config, std::string("YAML parse error: ") + e.what());
        return result;
    }
}

OptionsResult load_options(const std::filesystem::path& path) {
    OptionsResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = make_error(ErrorKind::Config,
                                  "cannot open config file: " + platform::path_to_utf8(path),
                                  platform::path_to_utf8(path));
        return result;
    }

    try {
        result = options_from_node(YAML::Load(file));
    } catch (const YAML::Exception& e) {
        result.error = make_error(ErrorKind::Config, std::string("YAML parse error: ") + e.what(),
                                  platform::path_to_utf8(path));
        result.ok = false;
    }
    return result;
}

std::filesystem::path response_dir(const Options& options) {
    if (options.store_response_dir.has_value() && !options.store_response_dir->empty()) {
        return *options.store_response_dir;
    }
    return archive::DEFAULT_RESPONSE_DIR;
}

}  // namespace crawlsink::config
