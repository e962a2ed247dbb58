#pragma once

#include "encoder.hpp"
#include "identifier.hpp"

#include <cstdint>
#include <functional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace EAN13 {
    class CodeGenerator {
        public:
            // Produces a candidate suffix of the requested length
            using SuffixSource = std::function<std::string(std::size_t)>;

        private:
            SuffixSource source;

            // Used suffixes of the identifiers sharing `prefix`, prefix and checksum stripped
            static std::unordered_set<std::string> usedSuffixes(std::string_view prefix, std::span<const Identifier> used);

            static void validatePrefix(std::string_view prefix);

            // Walk from `candidate` to the first suffix not in `taken`
            [[nodiscard]] static EncodedCode firstFree(std::string_view prefix,
                const std::unordered_set<std::string> &taken, std::string_view candidate);

        public:
            // Uniform random digits from a std::mt19937 seeded by std::random_device
            CodeGenerator();

            // Reproducible random digits
            explicit CodeGenerator(std::uint32_t seed);

            explicit CodeGenerator(SuffixSource source);

            // Fresh identifier starting with `prefix` that is not in `used`.
            // Collisions advance the candidate in odometer order; once the walk
            // returns to the first candidate ExhaustionError is thrown.
            [[nodiscard]] EncodedCode generate(std::string_view prefix, std::span<const Identifier> used);

            // Same walk from a caller supplied first candidate
            [[nodiscard]] static EncodedCode generate(std::string_view prefix,
                std::span<const Identifier> used, std::string_view candidate);

            // Generates `count` codes, each new code counts as used for the next one
            [[nodiscard]] std::vector<EncodedCode> generateBatch(std::string_view prefix,
                std::span<const Identifier> used, std::size_t count);
    };

    // Random digit string source backed by a std::mt19937
    [[nodiscard]] CodeGenerator::SuffixSource randomDigits(std::uint32_t seed);
}
