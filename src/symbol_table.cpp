#include "../include/ean13/symbol_table.hpp"
#include "../include/ean13/errors.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace EAN13 {
    namespace {
        // https://en.wikipedia.org/wiki/International_Article_Number#Binary_encoding_of_data_digits_into_EAN-13_barcode
        constexpr ParityLengths A_LENGTHS {Bar::White, {{
            {3, 2, 1, 1}, {2, 2, 2, 1}, {2, 1, 2, 2}, {1, 4, 1, 1}, {1, 1, 3, 2},
            {1, 2, 3, 1}, {1, 1, 1, 4}, {1, 3, 1, 2}, {1, 2, 1, 3}, {3, 1, 1, 2}
        }}};

        constexpr ParityLengths B_LENGTHS {Bar::White, {{
            {1, 1, 2, 3}, {1, 2, 2, 2}, {2, 2, 1, 2}, {1, 1, 4, 1}, {2, 3, 1, 1},
            {1, 3, 2, 1}, {4, 1, 1, 1}, {2, 1, 3, 1}, {3, 1, 2, 1}, {2, 1, 1, 3}
        }}};

        // Same widths as A, starting from the other colour
        constexpr ParityLengths C_LENGTHS {Bar::Black, A_LENGTHS.lengths};

        constexpr std::array<std::string_view, 10> STRUCTURES {
            "AAAAAA", "AABABB", "AABBAB", "AABBBA", "ABAABB",
            "ABBAAB", "ABBBAA", "ABABAB", "ABABBA", "ABBABA"
        };

        std::array<BitSequence, 10> expandAll(const ParityLengths &table) {
            std::array<BitSequence, 10> result;
            for (std::size_t i {0}; i < result.size(); i++)
                result[i] = SymbolTable::expand(table.lengths[i], table.first);
            return result;
        }
    }

    BitSequence SymbolTable::expand(const LengthPattern &pattern, Bar first) {
        unsigned total {std::accumulate(pattern.begin(), pattern.end(), 0u)};
        bool positive {std::ranges::all_of(pattern, [](unsigned len) { return len > 0; })};
        if (!positive || total != ELEMENT_WIDTH)
            throw ConfigError(std::format("Length pattern {}{}{}{} must hold 4 positive runs summing to {}",
                pattern[0], pattern[1], pattern[2], pattern[3], ELEMENT_WIDTH));

        BitSequence result; Bar color {first};
        for (const unsigned len: pattern) {
            result = result.concat(BitSequence::of(color, len));
            color = !color;
        }
        return result;
    }

    SymbolTable buildSymbolTable() {
        SymbolTable table;
        table.digits[static_cast<std::size_t>(ParitySet::A)] = expandAll(A_LENGTHS);
        table.digits[static_cast<std::size_t>(ParitySet::B)] = expandAll(B_LENGTHS);
        table.digits[static_cast<std::size_t>(ParitySet::C)] = expandAll(C_LENGTHS);
        table.normalGuard = BitSequence{Bar::Black, Bar::White, Bar::Black};
        table.centralGuard = BitSequence{Bar::White, Bar::Black, Bar::White, Bar::Black, Bar::White};

        // n + left structure + c + CCCCCC + n
        for (std::size_t leading {0}; leading < STRUCTURES.size(); leading++) {
            Layout &layout {table.layouts[leading]}; std::size_t pos {0};
            layout[pos++] = Symbol::NormalGuard;
            for (const char letter: STRUCTURES[leading])
                layout[pos++] = letter == 'A'? Symbol::A: Symbol::B;
            layout[pos++] = Symbol::CentralGuard;
            for (std::size_t i {0}; i < 6; i++) layout[pos++] = Symbol::C;
            layout[pos++] = Symbol::NormalGuard;
        }

        return table;
    }

    const SymbolTable &SymbolTable::instance() {
        static const SymbolTable table {buildSymbolTable()};
        return table;
    }

    const BitSequence &SymbolTable::digit(ParitySet set, unsigned value) const {
        if (value > 9) throw std::out_of_range(std::format("Digit out of range: {}", value));
        return digits[static_cast<std::size_t>(set)][value];
    }

    const BitSequence &SymbolTable::guard(Symbol symbol) const {
        switch (symbol) {
            case Symbol::NormalGuard:  return normalGuard;
            case Symbol::CentralGuard: return centralGuard;
            default: throw std::invalid_argument(std::format("'{}' is not a guard symbol", str(symbol)));
        }
    }

    const Layout &SymbolTable::layout(unsigned leading) const {
        if (leading > 9) throw std::out_of_range(std::format("Leading digit out of range: {}", leading));
        return layouts[leading];
    }

    std::string_view SymbolTable::structure(unsigned leading) {
        if (leading > 9) throw std::out_of_range(std::format("Leading digit out of range: {}", leading));
        return STRUCTURES[leading];
    }

    std::optional<unsigned> SymbolTable::find(ParitySet set, const BitSequence &element) const {
        const auto &row {digits[static_cast<std::size_t>(set)]};
        for (unsigned i {0}; i < row.size(); i++)
            if (row[i] == element) return i;
        return std::nullopt;
    }
}
