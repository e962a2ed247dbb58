#pragma once

#include "logger.hpp"
#include "render.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace EAN13 {
    // Section -> key -> value, section names are lower cased
    using IniData = std::map<std::string, std::map<std::string, std::string>>;

    // Parse INI text: [section], `key = value` or `key: value`, ';' and '#' comments.
    // Throws ConfigError with the offending line number.
    [[nodiscard]] IniData parseIni(std::string_view raw);

    struct Config {
        std::string prefix {};
        std::string database {"codes.db"};
        std::optional<std::uint32_t> seed {};
        SheetOptions sheet {};
        Logging::Level logLevel {Logging::Level::WARN};

        // Values missing from the text keep their defaults; unknown
        // sections, keys and out of range values are a ConfigError
        [[nodiscard]] static Config parse(std::string_view raw);
        [[nodiscard]] static Config load(const fs::path &path);
    };
}
