#include "../include/ean13/digit_walker.hpp"

#include <format>
#include <stdexcept>

namespace EAN13 {
    DigitWalker::DigitWalker(std::string_view start, std::string_view alphabet): symbols {alphabet} {
        if (symbols.empty())
            throw std::invalid_argument("Walker alphabet cannot be empty");
        for (std::size_t i {0}; i < symbols.size(); i++) {
            if (symbols.find(symbols[i], i + 1) != std::string::npos)
                throw std::invalid_argument(std::format("Duplicate symbol '{}' in walker alphabet", symbols[i]));
        }
        reset(start);
    }

    void DigitWalker::reset(std::string_view start) {
        std::vector<std::size_t> positions; positions.reserve(start.size());
        for (const char ch: start) {
            std::size_t idx {symbols.find(ch)};
            if (idx == std::string::npos)
                throw std::invalid_argument(std::format("'{}' has symbols outside of '{}'", start, symbols));
            positions.push_back(idx);
        }
        indices = std::move(positions); wraps = 0; moved = 0;
    }

    bool DigitWalker::advance() {
        // Carry ripples left only while positions overflow
        moved = 0;
        for (std::size_t i {indices.size()}; i-- > 0;) {
            ++moved;
            if (++indices[i] < symbols.size()) return false;
            indices[i] = 0;
        }
        ++wraps;
        return true;
    }

    std::string DigitWalker::current() const {
        std::string result; result.reserve(indices.size());
        for (const std::size_t idx: indices) result += symbols[idx];
        return result;
    }

    BoundedWalk::BoundedWalk(std::string_view start, const WalkOptions &options):
        walker {start, options.alphabet}, stop {options.stop.value_or(std::string{start})},
        value {start}, includeLast {options.includeLast}
    {
        // A stop string the walker can never produce would make the walk endless
        if (stop.size() != start.size())
            throw std::invalid_argument(std::format("Stop '{}' and start '{}' differ in length", stop, start));
        for (const char ch: stop) {
            if (walker.alphabet().find(ch) == std::string::npos)
                throw std::invalid_argument(std::format("Stop '{}' has symbols outside of '{}'", stop, walker.alphabet()));
        }
        for (std::size_t i {0}; i < value.size(); i++)
            if (value[i] != stop[i]) ++mismatches;
    }

    void BoundedWalk::step() {
        if (finished) return;
        if (atLast) { finished = true; return; }

        // Only the positions the carry reached change, the mismatch count follows them
        walker.advance();
        for (std::size_t i {value.size() - walker.changed()}; i < value.size(); i++) {
            const bool matched {value[i] == stop[i]};
            value[i] = walker.at(i);
            if (matched && value[i] != stop[i]) ++mismatches;
            else if (!matched && value[i] == stop[i]) --mismatches;
        }
        if (mismatches == 0) {
            if (includeLast) atLast = true;
            else finished = true;
        }
    }

    std::optional<std::string> BoundedWalk::next() {
        if (finished) return std::nullopt;
        std::string result {value};
        step();
        return result;
    }

    BoundedWalk walkRound(std::string_view start, const WalkOptions &options) {
        return BoundedWalk{start, options};
    }
}
