#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "stowage/log/logger.hpp"
#include "stowage/local/self_rehashing_map.hpp"
#include "common/cli/validators.hpp"


namespace stowage::examples::cli::rehash {

    // -------------------------------------------------------------
    // rehash_tuning parameters
    // -------------------------------------------------------------
    struct Params {
        std::size_t keys        = 100000;
        std::size_t minimum     = local::rehash_policy{}.minimum_needed_for_rehash;
        double multiplier       = local::rehash_policy{}.threshold_multiplier;
        bool string_keys        = false;
        std::string log_level   = "info";

        [[nodiscard]] inline local::rehash_policy policy() const noexcept {
            return local::rehash_policy{ .minimum_needed_for_rehash = minimum,
                                         .threshold_multiplier = multiplier };
        }

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Keys        : " << keys << "\n"
               << "  Minimum     : " << minimum << "\n"
               << "  Multiplier  : " << multiplier << "\n"
               << "  String keys : " << (string_keys ? "true" : "false") << "\n"
               << "  Log Level   : " << log_level << "\n";
        }
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-k,--keys", params.keys, "Number of distinct keys to insert")->check(CLI::NonNegativeNumber)->default_val(params.keys);
        app.add_option("-m,--minimum", params.minimum, "New keys needed before a rehash is considered")->check(CLI::NonNegativeNumber)->default_val(params.minimum);
        app.add_option("-x,--multiplier", params.multiplier, "Growth factor over the last rehash size (> 1.0)")->check(multiplier_validator)->default_val(params.multiplier);
        app.add_flag("--string-keys", params.string_keys, "Use std::string keys (XXH3 hasher) instead of integers");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Every rehash is reported by the observer callback.\n"
            "Use -l trace to also see the container's own rehash logs."
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

} // namespace stowage::examples::cli::rehash
