#include "../include/ean13/encoder.hpp"
#include "../include/ean13/errors.hpp"

#include <format>

namespace EAN13 {
    EncodedCode::EncodedCode(Identifier id, BitSequence bars, std::vector<Element> elements):
        id {std::move(id)}, fullBars {std::move(bars)}, parts {std::move(elements)} {}

    std::string EncodedCode::dashedBars() const {
        std::string result;
        for (const Element &element: parts) {
            if (!result.empty()) result += '-';
            result += element.bars.toString();
        }
        return result;
    }

    EncodedCode encode(const Identifier &id) {
        const SymbolTable &table {SymbolTable::instance()};
        const Layout &layout {table.layout(id.leading())};

        // Leading digit only selects the layout, the remaining 12 fill the parity slots
        std::size_t next {1};
        std::vector<Element> elements; elements.reserve(LAYOUT_SIZE);
        BitSequence bars;
        for (const Symbol symbol: layout) {
            if (auto set {paritySet(symbol)}) {
                unsigned value {id.digit(next++)};
                elements.push_back(Element{symbol, table.digit(*set, value), static_cast<int>(value)});
            } else {
                elements.push_back(Element{symbol, table.guard(symbol)});
            }
            bars = bars.concat(elements.back().bars);
        }

        return EncodedCode{id, std::move(bars), std::move(elements)};
    }

    Identifier decode(const BitSequence &bars) {
        if (bars.size() != CODE_WIDTH)
            throw ValidationError(std::format("Cannot decode {} bars, EAN-13 holds {}", bars.size(), CODE_WIDTH));

        const SymbolTable &table {SymbolTable::instance()};
        const BitSequence &normal {table.guard(Symbol::NormalGuard)};
        const BitSequence &central {table.guard(Symbol::CentralGuard)};

        std::size_t pos {0};
        auto take {[&bars, &pos](std::size_t count) {
            BitSequence part {bars.slice(pos, count)};
            pos += count; return part;
        }};
        auto expectGuard {[&pos, &take](const BitSequence &guard, std::string_view name) {
            std::size_t at {pos};
            if (take(guard.size()) != guard)
                throw ValidationError(std::format("Missing {} guard at bar {}", name, at));
        }};

        std::string digits, structure;
        expectGuard(normal, "start");
        for (std::size_t i {0}; i < 6; i++) {
            BitSequence element {take(ELEMENT_WIDTH)};
            if (auto a {table.find(ParitySet::A, element)}) {
                digits += static_cast<char>('0' + *a); structure += 'A';
            } else if (auto b {table.find(ParitySet::B, element)}) {
                digits += static_cast<char>('0' + *b); structure += 'B';
            } else {
                throw ValidationError(std::format("Unknown left element {} at bar {}", element.toString(), pos - ELEMENT_WIDTH));
            }
        }

        expectGuard(central, "central");
        for (std::size_t i {0}; i < 6; i++) {
            BitSequence element {take(ELEMENT_WIDTH)};
            auto digit {table.find(ParitySet::C, element)};
            if (!digit)
                throw ValidationError(std::format("Unknown right element {} at bar {}", element.toString(), pos - ELEMENT_WIDTH));
            digits += static_cast<char>('0' + *digit);
        }
        expectGuard(normal, "end");

        // Parity structure of the left half names the implicit leading digit
        for (unsigned leading {0}; leading < 10; leading++) {
            if (SymbolTable::structure(leading) == structure)
                return Identifier::from(std::to_string(leading) + digits);
        }
        throw ValidationError(std::format("Left half structure {} matches no leading digit", structure));
    }
}
