#include "../include/ean13/checksum.hpp"
#include "../include/ean13/errors.hpp"

#include <algorithm>
#include <format>

namespace EAN13 {
    bool isDigits(std::string_view str) {
        return std::ranges::all_of(str, [](char ch) { return ch >= '0' && ch <= '9'; });
    }

    char checksum(std::string_view payload) {
        if (payload.size() != PAYLOAD_LENGTH || !isDigits(payload))
            throw ValidationError(std::format("malformed identifier: checksum needs {} digits, got '{}'", 
                PAYLOAD_LENGTH, payload));

        unsigned ones {0}, threes {0};
        for (std::size_t i {0}; i < payload.size(); i++) {
            unsigned digit {static_cast<unsigned>(payload[i] - '0')};
            if (i % 2 == 0) ones += digit;
            else threes += digit;
        }

        // Outer mod keeps a weighted sum that is already a multiple of 10 at '0'
        unsigned weighted {3 * threes + ones};
        return static_cast<char>('0' + (10 - weighted % 10) % 10);
    }
}
