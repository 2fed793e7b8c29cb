#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "meshlink/log/logger.hpp"

namespace meshlink::examples::cli {

struct Params {
    std::string device_name = "T-Beam 1a2b";
    std::string address     = "AA:BB:CC:DD:EE:01";
    std::size_t packets     = 5;
    int drop_code           = 8;
    std::string quirks_file = "";
    std::string codes_file  = "";
    std::string log_level   = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Device      : " << device_name << " [" << address << "]\n"
           << "  Packets     : " << packets << "\n"
           << "  Drop code   : " << drop_code << "\n"
           << "  Quirks file : " << (quirks_file.empty() ? "(built-in)" : quirks_file) << "\n"
           << "  Codes file  : " << (codes_file.empty() ? "(built-in)" : codes_file) << "\n"
           << "  Log Level   : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description, std::string_view footer) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-n,--name", params.device_name, "Advertised radio name (selects the device class)")->default_val(params.device_name);
    app.add_option("-a,--address", params.address, "Radio address (e.g. AA:BB:CC:DD:EE:01)")->check(address_validator)->default_val(params.address);
    app.add_option("-p,--packets", params.packets, "Tracked packets to send")->check(CLI::Range(1, 64))->default_val(params.packets);
    app.add_option("-d,--drop-code", params.drop_code, "Disconnect code the simulated radio reports (133, 8, 257, ...)")->default_val(params.drop_code);
    app.add_option("--quirks", params.quirks_file, "Device quirks JSON file")->check(CLI::ExistingFile);
    app.add_option("--codes", params.codes_file, "Failure codes JSON file")->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(std::string(footer));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    // Validated above
    log::Logger::instance().set_level(log::parse_level(params.log_level).value_or(log::Level::Info));
    return params;
}

} // namespace meshlink::examples::cli
