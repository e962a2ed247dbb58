#include "../include/ean13/identifier.hpp"
#include "../include/ean13/checksum.hpp"
#include "../include/ean13/errors.hpp"

#include <format>
#include <utility>

namespace EAN13 {
    Identifier::Identifier(std::string digits): digits {std::move(digits)} {}

    Identifier Identifier::from(std::string_view value) {
        if (!isDigits(value) || (value.size() != PAYLOAD_LENGTH && value.size() != IDENTIFIER_LENGTH))
            throw ValidationError(std::format("malformed identifier: '{}'", value));

        std::string digits {value.substr(0, PAYLOAD_LENGTH)};
        const char expected {checksum(digits)};
        if (value.size() == IDENTIFIER_LENGTH && value.back() != expected)
            throw ValidationError(std::format("checksum mismatch: '{}' should end with '{}'", value, expected));

        digits += expected;
        return Identifier{std::move(digits)};
    }

    Identifier Identifier::verify(std::string_view code) {
        if (code.size() != IDENTIFIER_LENGTH)
            throw ValidationError(std::format("malformed identifier: '{}' is not a {} digit code", code, IDENTIFIER_LENGTH));
        return from(code);
    }

    Identifier Identifier::from(std::uint64_t value) {
        // Padded to a 12 digit payload, wider values are verified as full 13 digit identifiers
        return from(std::string_view{std::format("{:012}", value)});
    }

    std::string Identifier::dashed() const {
        return std::format("{}-{}-{}", digits.substr(0, 1), digits.substr(1, 6), digits.substr(7, 6));
    }
}
