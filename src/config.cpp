#include "../include/ean13/config.hpp"
#include "../include/ean13/checksum.hpp"
#include "../include/ean13/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace EAN13 {
    namespace {
        std::string trim(std::string_view str) {
            auto isSpace {[](unsigned char ch) { return std::isspace(ch) != 0; }};
            while (!str.empty() && isSpace(static_cast<unsigned char>(str.front()))) str.remove_prefix(1);
            while (!str.empty() && isSpace(static_cast<unsigned char>(str.back()))) str.remove_suffix(1);
            return std::string{str};
        }

        std::string tolower(std::string str) {
            std::transform(str.begin(), str.end(), str.begin(), [](unsigned char ch) {
                return static_cast<char>(std::tolower(ch));
            });
            return str;
        }

        // Inline comments need whitespace before the marker, eg: `seed = 42 ; reproducible`
        std::string_view stripComment(std::string_view value) {
            for (std::size_t i {1}; i < value.size(); i++) {
                if ((value[i] == ';' || value[i] == '#') && std::isspace(static_cast<unsigned char>(value[i - 1])))
                    return value.substr(0, i);
            }
            return value;
        }

        const std::map<std::string, std::set<std::string>> KNOWN_KEYS {
            {"generator", {"prefix", "database", "seed"}},
            {"render",    {"module-width", "height", "quiet-zone"}},
            {"sheet",     {"columns", "rows", "margin", "font", "font-size"}},
            {"log",       {"level"}},
        };

        template<typename T>
        T number(const std::string &section, const std::string &key, const std::string &value, T min, T max) {
            T result {};
            auto [ptr, ec] {std::from_chars(value.data(), value.data() + value.size(), result)};
            if (ec != std::errc() || ptr != value.data() + value.size())
                throw ConfigError(std::format("[{}] {}: '{}' is not a number", section, key, value));
            if (result < min || result > max)
                throw ConfigError(std::format("[{}] {}: {} is outside [{}, {}]", section, key, result, min, max));
            return result;
        }
    }

    IniData parseIni(std::string_view raw) {
        IniData data; std::string section; bool inSection {false};
        std::size_t lineNo {0}, start {0};
        while (start <= raw.size()) {
            std::size_t end {raw.find('\n', start)};
            if (end == std::string_view::npos) end = raw.size();
            std::string line {trim(raw.substr(start, end - start))};
            start = end + 1; ++lineNo;

            if (line.empty() || line.front() == ';' || line.front() == '#') continue;

            if (line.front() == '[' && line.back() == ']') {
                section = tolower(trim(std::string_view{line}.substr(1, line.size() - 2)));
                if (section.empty())
                    throw ConfigError(std::format("Line #{}: Empty section name", lineNo));
                if (data.contains(section))
                    throw ConfigError(std::format("Line #{}: Section '{}' already exists.", lineNo, section));
                data[section]; inSection = true;
                continue;
            }

            std::size_t sep {line.find_first_of(":=")};
            if (sep == std::string::npos || sep == 0)
                throw ConfigError(std::format("Line #{}: Error parsing line: {}", lineNo, line));
            if (!inSection)
                throw ConfigError(std::format("Line #{}: Option outside of any section: {}", lineNo, line));

            std::string key {tolower(trim(std::string_view{line}.substr(0, sep)))};
            std::string value {trim(stripComment(std::string_view{line}.substr(sep + 1)))};
            auto [it, inserted] {data[section].try_emplace(key, value)};
            if (!inserted)
                throw ConfigError(std::format("Line #{}: Option '{}' in section '{}' already exists.", lineNo, key, section));
        }
        return data;
    }

    Config Config::parse(std::string_view raw) {
        Config config;
        for (const auto &[section, options]: parseIni(raw)) {
            auto known {KNOWN_KEYS.find(section)};
            if (known == KNOWN_KEYS.end())
                throw ConfigError(std::format("Unknown section [{}]", section));

            for (const auto &[key, value]: options) {
                if (!known->second.contains(key))
                    throw ConfigError(std::format("Unknown option '{}' in section [{}]", key, section));

                constexpr unsigned MAX {std::numeric_limits<unsigned short>::max()};
                if (section == "generator" && key == "prefix") {
                    if (value.size() >= PAYLOAD_LENGTH || !isDigits(value))
                        throw ConfigError(std::format("[generator] prefix: '{}' must be at most {} digits", value, PAYLOAD_LENGTH - 1));
                    config.prefix = value;
                }
                else if (section == "generator" && key == "database") config.database = value;
                else if (section == "generator" && key == "seed")
                    config.seed = number<std::uint32_t>(section, key, value, 0, std::numeric_limits<std::uint32_t>::max());
                else if (section == "render" && key == "module-width") config.sheet.render.moduleWidth = number(section, key, value, 1u, 64u);
                else if (section == "render" && key == "height") config.sheet.render.height = number(section, key, value, 1u, MAX);
                else if (section == "render" && key == "quiet-zone") config.sheet.render.quietZone = number(section, key, value, 0u, 255u);
                else if (section == "sheet" && key == "columns") config.sheet.columns = number(section, key, value, 1u, 64u);
                else if (section == "sheet" && key == "rows") config.sheet.rows = number(section, key, value, 1u, 256u);
                else if (section == "sheet" && key == "margin") config.sheet.margin = number(section, key, value, 0u, MAX);
                else if (section == "sheet" && key == "font-size") config.sheet.fontSize = number(section, key, value, 4u, 512u);
                else if (section == "sheet" && key == "font") config.sheet.font = value;
                else if (section == "log" && key == "level")
                    config.logLevel = static_cast<Logging::Level>(number(section, key, value, 1, 5));
            }
        }
        return config;
    }

    Config Config::load(const fs::path &path) {
        std::ifstream ifs {path};
        if (!ifs) throw ConfigError("Unable to read config file: " + path.string());
        std::ostringstream oss; oss << ifs.rdbuf();
        return parse(oss.str());
    }
}
