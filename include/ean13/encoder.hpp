#pragma once

#include "bit_sequence.hpp"
#include "identifier.hpp"
#include "symbol_table.hpp"

#include <string>
#include <vector>

namespace EAN13 {
    struct Element {
        Symbol symbol;
        BitSequence bars;

        // Digit carried by a parity element, -1 for guards
        int digit {-1};

        bool isGuard() const { return digit < 0; }
    };

    // Read only result of encoding an identifier
    class EncodedCode {
        private:
            Identifier id;
            BitSequence fullBars;
            std::vector<Element> parts;

        public:
            EncodedCode(Identifier id, BitSequence bars, std::vector<Element> elements);

            const Identifier &identifier() const { return id; }
            const BitSequence &bars() const { return fullBars; }
            const std::vector<Element> &elements() const { return parts; }

            std::string dashed() const { return id.dashed(); }

            // Bar strings of each element joined with '-'
            // eg: 101-0001101-...-01010-...-101
            std::string dashedBars() const;
    };

    [[nodiscard]] EncodedCode encode(const Identifier &id);

    // Bit level inverse of encode, throws ValidationError on guards,
    // elements or a structure that does not belong to EAN-13
    [[nodiscard]] Identifier decode(const BitSequence &bars);
}
