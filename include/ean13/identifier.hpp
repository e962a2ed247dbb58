#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace EAN13 {
    // 13 decimal digits, the last one being the checksum of the first 12
    class Identifier {
        private:
            std::string digits;

            explicit Identifier(std::string digits);

        public:
            // 12 digits get their checksum appended, 13 digits are verified.
            // Throws ValidationError("malformed identifier" / "checksum mismatch")
            [[nodiscard]] static Identifier from(std::string_view value);

            // Complete codes only, a 12 digit payload is malformed here
            [[nodiscard]] static Identifier verify(std::string_view code);

            // Integers are zero padded on the left to 12 digits first
            [[nodiscard]] static Identifier from(std::uint64_t value);

            [[nodiscard]] const std::string &str() const { return digits; }
            [[nodiscard]] std::string_view payload() const { return std::string_view{digits}.substr(0, 12); }
            [[nodiscard]] char checkDigit() const { return digits.back(); }
            [[nodiscard]] unsigned leading() const { return static_cast<unsigned>(digits.front() - '0'); }
            [[nodiscard]] unsigned digit(std::size_t idx) const { return static_cast<unsigned>(digits.at(idx) - '0'); }

            // D-DDDDDD-DDDDDD, the grouping printed under the bars
            [[nodiscard]] std::string dashed() const;

            bool startsWith(std::string_view prefix) const { return digits.starts_with(prefix); }

            auto operator<=>(const Identifier &other) const = default;
    };

    struct HashIdentifier {
        std::size_t operator()(const Identifier &id) const {
            return std::hash<std::string>{}(id.str());
        }
    };
}
