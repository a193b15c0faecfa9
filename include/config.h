#pragma once

#include <cstddef>
#include <string>

#include "command_dispatcher.h"
#include "interpolation_parser.h"
#include "utils/result.h"

namespace nestsh {

struct Config {
    std::string reply_separator = " ";
    size_t max_nesting_depth = 0;
    bool suppress_empty_replies = true;
    bool report_unknown_commands = true;
    bool fail_on_error = false;
    std::string prompt = "nestsh> ";

    DispatcherOptions dispatcher_options() const;
    ParserOptions parser_options() const;
};

// $XDG_CONFIG_HOME/nestsh/config.json, else $HOME/.config/nestsh/config.json.
// Empty when neither variable is set.
std::string default_config_path();

// Keys missing from the file keep their defaults. Malformed JSON, a non-object
// root, or a value of the wrong type is an error.
Result<Config> parse_config(const std::string& json_text);
Result<Config> load_config(const std::string& path);

// Like load_config, but a missing file yields the defaults.
Result<Config> load_config_if_present(const std::string& path);

Result<void> save_config(const std::string& path, const Config& config);

}  // namespace nestsh
