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


namespace stowage::examples::cli::contention {

    // -------------------------------------------------------------
    // concurrent_map_contention parameters
    // -------------------------------------------------------------
    struct Params {
        unsigned threads      = 4;
        std::size_t ops       = 1000000;
        std::size_t keys      = 64;
        std::string log_level = "warn";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Threads        : " << threads << "\n"
               << "  Ops per thread : " << ops << "\n"
               << "  Keys           : " << keys << "\n"
               << "  Log Level      : " << log_level << "\n";
        }
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-t,--threads", params.threads, "Worker threads")->check(CLI::Range(1u, 256u))->default_val(params.threads);
        app.add_option("-n,--ops", params.ops, "Operations per thread")->check(CLI::PositiveNumber)->default_val(params.ops);
        app.add_option("-k,--keys", params.keys, "Distinct keys shared by all threads")->check(CLI::PositiveNumber)->default_val(params.keys);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        stowage::log::set_level(params.log_level);
        return params;
    }

} // namespace stowage::examples::cli::contention
