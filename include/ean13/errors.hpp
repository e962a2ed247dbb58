#pragma once

#include <stdexcept>
#include <string>

namespace EAN13 {
    // Malformed identifier, checksum mismatch, bad prefix or undecodable bars
    class ValidationError: public std::runtime_error {
        public:
            explicit ValidationError(const std::string &msg): std::runtime_error(msg) {}
    };

    // Inconsistent symbol tables or an invalid configuration file
    class ConfigError: public std::runtime_error {
        public:
            explicit ConfigError(const std::string &msg): std::runtime_error(msg) {}
    };

    // Every suffix for a prefix is already taken
    class ExhaustionError: public std::runtime_error {
        public:
            explicit ExhaustionError(const std::string &msg): std::runtime_error(msg) {}
    };

    class StoreError: public std::runtime_error {
        public:
            explicit StoreError(const std::string &msg): std::runtime_error(msg) {}
    };
}
