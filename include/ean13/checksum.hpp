#pragma once

#include <cstddef>
#include <string_view>

namespace EAN13 {
    inline constexpr std::size_t PAYLOAD_LENGTH {12};
    inline constexpr std::size_t IDENTIFIER_LENGTH {13};

    // Weighted mod 10 check digit of a 12 digit payload. Digits at even
    // (0 based) positions weigh 1, odd positions weigh 3.
    // Throws ValidationError on a malformed payload.
    [[nodiscard]] char checksum(std::string_view payload);

    [[nodiscard]] bool isDigits(std::string_view str);
}
