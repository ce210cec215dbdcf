#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "stowage/log/logger.hpp"
#include "common/cli/validators.hpp"


namespace stowage::examples::cli::history {

    // -------------------------------------------------------------
    // ring_history parameters
    // -------------------------------------------------------------
    struct Params {
        std::size_t capacity  = 8;
        std::size_t events    = 20;
        std::size_t resize_to = 0;
        std::string log_level = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Capacity  : " << capacity << "\n"
               << "  Events    : " << events << "\n"
               << "  Resize to : " << (resize_to == 0 ? std::string("(none)") : std::to_string(resize_to)) << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-c,--capacity", params.capacity, "History capacity (slots)")->check(ring_capacity_validator)->default_val(params.capacity);
        app.add_option("-n,--events", params.events, "Number of events to record")->check(CLI::NonNegativeNumber)->default_val(params.events);
        app.add_option("-r,--resize", params.resize_to, "Resize the history to this capacity before replaying (0 = keep)")->check(CLI::NonNegativeNumber)->default_val(params.resize_to);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Only the newest <capacity> events survive.\n"
            "Replay runs newest first."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        stowage::log::set_level(params.log_level);
        return params;
    }

} // namespace stowage::examples::cli::history
