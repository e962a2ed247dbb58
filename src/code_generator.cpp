#include "../include/ean13/code_generator.hpp"
#include "../include/ean13/checksum.hpp"
#include "../include/ean13/digit_walker.hpp"
#include "../include/ean13/errors.hpp"
#include "../include/ean13/logger.hpp"

#include <format>
#include <memory>

namespace EAN13 {
    CodeGenerator::SuffixSource randomDigits(std::uint32_t seed) {
        // Shared so that copies of the source keep drawing from one engine
        auto rng {std::make_shared<std::mt19937>(seed)};
        return [rng](std::size_t length) {
            std::uniform_int_distribution<int> gen {0, 9};
            std::string result; result.reserve(length);
            for (std::size_t i {0}; i < length; i++)
                result += static_cast<char>('0' + gen(*rng));
            return result;
        };
    }

    CodeGenerator::CodeGenerator(): source {randomDigits(std::random_device{}())} {}

    CodeGenerator::CodeGenerator(std::uint32_t seed): source {randomDigits(seed)} {}

    CodeGenerator::CodeGenerator(SuffixSource source): source {std::move(source)} {
        if (!this->source) throw std::invalid_argument("Suffix source cannot be empty");
    }

    void CodeGenerator::validatePrefix(std::string_view prefix) {
        if (prefix.size() >= PAYLOAD_LENGTH || !isDigits(prefix))
            throw ValidationError(std::format("Invalid prefix '{}', expected at most {} digits",
                prefix, PAYLOAD_LENGTH - 1));
    }

    std::unordered_set<std::string> CodeGenerator::usedSuffixes(std::string_view prefix, std::span<const Identifier> used) {
        std::unordered_set<std::string> result;
        for (const Identifier &id: used) {
            if (id.startsWith(prefix))
                result.emplace(id.payload().substr(prefix.size()));
        }
        return result;
    }

    EncodedCode CodeGenerator::generate(std::string_view prefix, std::span<const Identifier> used) {
        validatePrefix(prefix);
        std::string candidate {source(PAYLOAD_LENGTH - prefix.size())};
        return generate(prefix, used, candidate);
    }

    EncodedCode CodeGenerator::generate(std::string_view prefix, std::span<const Identifier> used, std::string_view candidate) {
        validatePrefix(prefix);
        return firstFree(prefix, usedSuffixes(prefix, used), candidate);
    }

    EncodedCode CodeGenerator::firstFree(std::string_view prefix, const std::unordered_set<std::string> &taken,
        std::string_view candidate)
    {
        if (candidate.size() != PAYLOAD_LENGTH - prefix.size() || !isDigits(candidate))
            throw ValidationError(std::format("Candidate suffix '{}' must hold {} digits",
                candidate, PAYLOAD_LENGTH - prefix.size()));
        Logging::Dynamic::Debug("Prefix '{}' has {} used suffixes, first candidate {}", prefix, taken.size(), candidate);

        std::size_t collisions {0};
        for (const std::string &suffix: walkRound(candidate)) {
            if (!taken.contains(suffix)) {
                if (collisions > 0)
                    Logging::Dynamic::Debug("Free suffix {} found after {} collisions", suffix, collisions);
                return encode(Identifier::from(std::string{prefix} + suffix));
            }
            Logging::Dynamic::Trace("Suffix {} is taken, advancing", suffix);
            ++collisions;
        }

        throw ExhaustionError(std::format("database is full: all {} suffixes of prefix '{}' are used",
            collisions, prefix));
    }

    std::vector<EncodedCode> CodeGenerator::generateBatch(std::string_view prefix,
        std::span<const Identifier> used, std::size_t count)
    {
        validatePrefix(prefix);
        std::unordered_set<std::string> taken {usedSuffixes(prefix, used)};
        const std::size_t length {PAYLOAD_LENGTH - prefix.size()};

        // One set for the whole batch, each new suffix joins it
        std::vector<EncodedCode> result; result.reserve(count);
        for (std::size_t i {0}; i < count; i++) {
            result.push_back(firstFree(prefix, taken, source(length)));
            taken.emplace(result.back().identifier().payload().substr(prefix.size()));
        }
        Logging::Dynamic::Info("Generated {} codes for prefix '{}'", count, prefix);
        return result;
    }
}
