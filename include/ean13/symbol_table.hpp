#pragma once

#include "bit_sequence.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace EAN13 {
    // Symbols of the 15 slot layout: guards and the three parity sets
    enum class Symbol: std::uint8_t { NormalGuard, CentralGuard, A, B, C };

    enum class ParitySet: std::uint8_t { A, B, C };

    constexpr std::string_view str(Symbol symbol) {
        switch (symbol) {
            case Symbol::NormalGuard:  return "n";
            case Symbol::CentralGuard: return "c";
            case Symbol::A:            return "A";
            case Symbol::B:            return "B";
            case Symbol::C:            return "C";
        }
        return "?";
    }

    // Number of slots and bars in a full EAN-13 symbol
    inline constexpr std::size_t LAYOUT_SIZE {15};
    inline constexpr std::size_t ELEMENT_WIDTH {7};
    inline constexpr std::size_t CODE_WIDTH {95};

    using Layout = std::array<Symbol, LAYOUT_SIZE>;

    // 4 run widths of a digit element, first run uses the table's starting colour
    using LengthPattern = std::array<unsigned, 4>;

    struct ParityLengths {
        Bar first;
        std::array<LengthPattern, 10> lengths;
    };

    class SymbolTable {
        private:
            std::array<std::array<BitSequence, 10>, 3> digits;
            BitSequence normalGuard, centralGuard;
            std::array<Layout, 10> layouts;

            SymbolTable() = default;
            friend SymbolTable buildSymbolTable();

        public:
            // Built once on first use, immutable afterwards
            [[nodiscard]] static const SymbolTable &instance();

            // Expand a run pattern into its 7 bars, ConfigError if it is malformed
            [[nodiscard]] static BitSequence expand(const LengthPattern &pattern, Bar first);

            [[nodiscard]] const BitSequence &digit(ParitySet set, unsigned value) const;
            [[nodiscard]] const BitSequence &guard(Symbol symbol) const;
            [[nodiscard]] const Layout &layout(unsigned leading) const;

            // 6 letter parity structure of the left half, eg: "AABABB" for leading 1
            [[nodiscard]] static std::string_view structure(unsigned leading);

            // Reverse lookup of a 7 bar element in one set
            [[nodiscard]] std::optional<unsigned> find(ParitySet set, const BitSequence &element) const;
    };

    // Pure construction of the tables from the literal run lengths
    [[nodiscard]] SymbolTable buildSymbolTable();

    [[nodiscard]] constexpr std::optional<ParitySet> paritySet(Symbol symbol) {
        switch (symbol) {
            case Symbol::A: return ParitySet::A;
            case Symbol::B: return ParitySet::B;
            case Symbol::C: return ParitySet::C;
            default:        return std::nullopt;
        }
    }
}
