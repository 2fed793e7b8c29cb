#pragma once

#include <regex>
#include <string>

#include <CLI/CLI.hpp>

#include "meshlink/log/logger.hpp"


namespace meshlink::examples::cli {

// -------------------------------------------------------------
// Radio address validator
// -------------------------------------------------------------
inline auto address_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        static const std::regex mac{"^([0-9A-Fa-f]{2}:){5}[0-9A-Fa-f]{2}$"};
        if (std::regex_match(value, mac)) {
            return {};
        }
        return "Address must look like AA:BB:CC:DD:EE:FF";
    },
    "Radio address validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (log::parse_level(value).has_value()) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

} // namespace meshlink::examples::cli
