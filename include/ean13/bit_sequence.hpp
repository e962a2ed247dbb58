#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace EAN13 {
    enum class Bar: bool { White = false, Black = true };

    constexpr Bar operator!(Bar bar) { return bar == Bar::Black? Bar::White: Bar::Black; }

    // Immutable run of bars, text form is '1' for black and '0' for white
    class BitSequence {
        private:
            std::vector<Bar> bars;

        public:
            using const_iterator = std::vector<Bar>::const_iterator;

            BitSequence() = default;
            BitSequence(std::initializer_list<Bar> bars);
            explicit BitSequence(std::vector<Bar> bars);

            // Only '0' and '1' are accepted, anything else is a ValidationError
            [[nodiscard]] static BitSequence fromString(std::string_view bits);

            // A single bar repeated `count` times
            [[nodiscard]] static BitSequence of(Bar bar, std::size_t count);

            [[nodiscard]] BitSequence invert() const;
            [[nodiscard]] BitSequence repeat(std::size_t count) const;
            [[nodiscard]] BitSequence concat(const BitSequence &other) const;

            // Sub range [pos, pos + count)
            [[nodiscard]] BitSequence slice(std::size_t pos, std::size_t count) const;

            // Run length form consumed by renderers, eg: 0001101 => (W,3) (B,2) (W,1) (B,1)
            [[nodiscard]] std::vector<std::pair<Bar, std::size_t>> runs() const;

            [[nodiscard]] std::string toString() const;

            std::size_t size() const { return bars.size(); }
            bool empty() const { return bars.empty(); }
            Bar operator[](std::size_t idx) const { return bars[idx]; }

            const_iterator begin() const { return bars.cbegin(); }
            const_iterator end() const { return bars.cend(); }

            bool operator==(const BitSequence &other) const = default;
    };

    // Free function forms of the sequence operations
    [[nodiscard]] inline BitSequence invert(const BitSequence &seq) { return seq.invert(); }
    [[nodiscard]] inline BitSequence repeat(const BitSequence &seq, std::size_t n) { return seq.repeat(n); }
    [[nodiscard]] inline BitSequence concat(const BitSequence &a, const BitSequence &b) { return a.concat(b); }
}
