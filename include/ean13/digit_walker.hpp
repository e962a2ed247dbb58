#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace EAN13 {
    inline constexpr std::string_view DECIMAL {"0123456789"};

    // Odometer over fixed length strings of an alphabet, rightmost symbol
    // moves fastest. Wraps from the all-last string to the all-first one.
    class DigitWalker {
        private:
            std::string symbols;
            std::vector<std::size_t> indices;
            std::uint64_t wraps {0};
            std::size_t moved {0};

        public:
            // Throws std::invalid_argument if `start` leaves the alphabet
            // or the alphabet is empty / holds duplicates
            explicit DigitWalker(std::string_view start, std::string_view alphabet = DECIMAL);

            // Move to the next string, true if the step carried out of the
            // most significant position (a full cycle just completed)
            bool advance();

            void reset(std::string_view start);

            [[nodiscard]] std::string current() const;

            // Symbol at `pos` without building the whole string
            [[nodiscard]] char at(std::size_t pos) const { return symbols[indices.at(pos)]; }

            // Rightmost positions rewritten by the last advance()
            [[nodiscard]] std::size_t changed() const { return moved; }
            [[nodiscard]] std::size_t length() const { return indices.size(); }
            [[nodiscard]] std::uint64_t cycles() const { return wraps; }
            [[nodiscard]] const std::string &alphabet() const { return symbols; }
    };

    struct WalkOptions {
        // Defaults to the starting string
        std::optional<std::string> stop {};
        bool includeLast {false};
        std::string alphabet {DECIMAL};
    };

    // Lazy, single pass walk from a start string up to the first recurrence of `stop`
    class BoundedWalk {
        private:
            DigitWalker walker;
            std::string stop, value;
            std::size_t mismatches {0};
            bool includeLast, atLast {false}, finished {false};

            void step();

        public:
            struct Iterator {
                using iterator_category = std::input_iterator_tag;
                using value_type = std::string;
                using difference_type = std::ptrdiff_t;

                BoundedWalk *walk {};

                const std::string &operator*() const { return walk->value; }
                Iterator &operator++() { walk->step(); return *this; }
                void operator++(int) { walk->step(); }
                bool operator==(std::default_sentinel_t) const { return walk->finished; }
            };

            BoundedWalk(std::string_view start, const WalkOptions &options);

            Iterator begin() { return Iterator{this}; }
            std::default_sentinel_t end() const { return std::default_sentinel; }

            // Pull style access, nullopt once the walk is over
            std::optional<std::string> next();
    };

    // Yields `start`, then every following string in odometer order, ending just
    // before (or at, with includeLast) the first recurrence of the stop string.
    // With the default stop every string of the length is visited exactly once.
    [[nodiscard]] BoundedWalk walkRound(std::string_view start, const WalkOptions &options = {});
}
