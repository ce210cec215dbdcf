#pragma once

#include <cstddef>
#include <exception>
#include <string>

#include <CLI/CLI.hpp>


namespace stowage::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});


// -------------------------------------------------------------
// Rehash threshold multiplier validator (must be > 1.0)
// -------------------------------------------------------------
inline auto multiplier_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            std::size_t used = 0;
            const double m = std::stod(value, &used);
            if (used != value.size()) {
                return "Multiplier must be a number";
            }
            if (m > 1.0) {
                return {};
            }
            return "Multiplier must be greater than 1.0";
        } catch (const std::exception&) {
            return "Multiplier must be a number";
        }
    },
    "Rehash multiplier validator"
);


// -------------------------------------------------------------
// Ring capacity validator (fixed rings need at least 2 slots)
// -------------------------------------------------------------
inline auto ring_capacity_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            if (std::stoul(value) >= 2) {
                return {};
            }
            return "Capacity must be at least 2";
        } catch (const std::exception&) {
            return "Capacity must be a valid integer";
        }
    },
    "Ring capacity validator"
);

} // namespace stowage::examples::cli
