#include "../include/ean13/bit_sequence.hpp"
#include "../include/ean13/errors.hpp"

#include <algorithm>
#include <format>

namespace EAN13 {
    BitSequence::BitSequence(std::initializer_list<Bar> bars): bars {bars} {}

    BitSequence::BitSequence(std::vector<Bar> bars): bars {std::move(bars)} {}

    BitSequence BitSequence::fromString(std::string_view bits) {
        std::vector<Bar> result; result.reserve(bits.size());
        for (std::size_t i {0}; i < bits.size(); i++) {
            if (bits[i] == '1') result.push_back(Bar::Black);
            else if (bits[i] == '0') result.push_back(Bar::White);
            else throw ValidationError(std::format("Invalid bar '{}' at position {}", bits[i], i));
        }
        return BitSequence{std::move(result)};
    }

    BitSequence BitSequence::of(Bar bar, std::size_t count) {
        return BitSequence{std::vector<Bar>(count, bar)};
    }

    BitSequence BitSequence::invert() const {
        std::vector<Bar> result(bars.size());
        std::transform(bars.begin(), bars.end(), result.begin(), [](Bar bar) { return !bar; });
        return BitSequence{std::move(result)};
    }

    BitSequence BitSequence::repeat(std::size_t count) const {
        std::vector<Bar> result; result.reserve(bars.size() * count);
        for (std::size_t i {0}; i < count; i++)
            result.insert(result.end(), bars.begin(), bars.end());
        return BitSequence{std::move(result)};
    }

    BitSequence BitSequence::concat(const BitSequence &other) const {
        std::vector<Bar> result; result.reserve(bars.size() + other.bars.size());
        result.insert(result.end(), bars.begin(), bars.end());
        result.insert(result.end(), other.bars.begin(), other.bars.end());
        return BitSequence{std::move(result)};
    }

    BitSequence BitSequence::slice(std::size_t pos, std::size_t count) const {
        if (pos > bars.size() || count > bars.size() - pos)
            throw std::out_of_range(std::format("Slice [{}, {}) out of range for {} bars", pos, pos + count, bars.size()));
        auto first {bars.begin() + static_cast<std::ptrdiff_t>(pos)};
        return BitSequence{std::vector<Bar>(first, first + static_cast<std::ptrdiff_t>(count))};
    }

    std::vector<std::pair<Bar, std::size_t>> BitSequence::runs() const {
        std::vector<std::pair<Bar, std::size_t>> result;
        for (const Bar bar: bars) {
            if (!result.empty() && result.back().first == bar) ++result.back().second;
            else result.emplace_back(bar, 1);
        }
        return result;
    }

    std::string BitSequence::toString() const {
        std::string result; result.reserve(bars.size());
        for (const Bar bar: bars)
            result += bar == Bar::Black? '1': '0';
        return result;
    }
}
