#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "utils/debug.h"

using json = nlohmann::json;

namespace nestsh {

namespace {

template <typename T>
void read_key(const json& data, const char* key, T& target) {
    if (data.contains(key)) {
        target = data.at(key).get<T>();
    }
}

}  // namespace

DispatcherOptions Config::dispatcher_options() const {
    DispatcherOptions options;
    options.reply_separator = reply_separator;
    options.report_unknown_commands = report_unknown_commands;
    options.fail_on_error = fail_on_error;
    return options;
}

ParserOptions Config::parser_options() const {
    ParserOptions options;
    options.max_depth = max_nesting_depth;
    return options;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && xdg[0] != '\0') {
        return (std::filesystem::path(xdg) / "nestsh" / "config.json").string();
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return (std::filesystem::path(home) / ".config" / "nestsh" / "config.json").string();
    }
    return "";
}

Result<Config> parse_config(const std::string& json_text) {
    Config config;
    try {
        json data = json::parse(json_text);
        if (!data.is_object()) {
            return Result<Config>::error("configuration root must be a JSON object");
        }

        read_key(data, "reply_separator", config.reply_separator);
        read_key(data, "suppress_empty_replies", config.suppress_empty_replies);
        read_key(data, "report_unknown_commands", config.report_unknown_commands);
        read_key(data, "fail_on_error", config.fail_on_error);
        read_key(data, "prompt", config.prompt);

        if (data.contains("max_nesting_depth")) {
            const json& depth = data.at("max_nesting_depth");
            if (!depth.is_number_unsigned()) {
                return Result<Config>::error("max_nesting_depth must be a non-negative integer");
            }
            config.max_nesting_depth = depth.get<size_t>();
        }
    } catch (const json::exception& e) {
        return Result<Config>::error(std::string("invalid configuration: ") + e.what());
    }
    return Result<Config>::ok(config);
}

Result<Config> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::error("cannot open configuration file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    debug_msg("loading configuration from %s", path.c_str());
    return parse_config(buffer.str());
}

Result<Config> load_config_if_present(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<Config>::ok(Config{});
    }
    return load_config(path);
}

Result<void> save_config(const std::string& path, const Config& config) {
    namespace fs = std::filesystem;

    json data;
    data["reply_separator"] = config.reply_separator;
    data["max_nesting_depth"] = config.max_nesting_depth;
    data["suppress_empty_replies"] = config.suppress_empty_replies;
    data["report_unknown_commands"] = config.report_unknown_commands;
    data["fail_on_error"] = config.fail_on_error;
    data["prompt"] = config.prompt;

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Result<void>::error("cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<void>::error("cannot write configuration file " + path);
    }
    file << data.dump(4) << "\n";
    if (!file) {
        return Result<void>::error("failed writing configuration file " + path);
    }
    return Result<void>::ok();
}

}  // namespace nestsh
