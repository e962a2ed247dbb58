#include "../include/ean13/code_generator.hpp"
#include "../include/ean13/errors.hpp"
#include "testing.hpp"

#include <set>
#include <unordered_set>
#include <vector>

using namespace EAN13;

namespace {
    // Always proposes the all zero suffix first
    CodeGenerator zeros() {
        return CodeGenerator{CodeGenerator::SuffixSource{[](std::size_t length) { return std::string(length, '0'); }}};
    }
}

int main() {
    Testing::Suite suite {"CodeGenerator"};

    // Free candidate is taken as is
    {
        EncodedCode code {CodeGenerator::generate("2000000000", {}, "42")};
        assert(code.identifier().payload() == "200000000042");
        assert(code.bars() == encode(code.identifier()).bars());

        EncodedCode empty {zeros().generate("", {})};
        assert(empty.identifier().str() == "0000000000000");
        suite.pass("Free candidate");
    }

    // Collisions advance in odometer order and wrap at the top
    {
        std::vector<Identifier> used {
            Identifier::from("200000000042"), Identifier::from("200000000043"),
            Identifier::from("300000000044"),   // other prefix, ignored
        };
        EncodedCode code {CodeGenerator::generate("2000000000", used, "42")};
        assert(code.identifier().payload() == "200000000044");

        std::vector<Identifier> top {Identifier::from("400000000009")};
        assert(CodeGenerator::generate("40000000000", top, "9").identifier().payload() == "400000000000");
        suite.pass("Collision walk");
    }

    // All 10 suffixes of an 11 digit prefix used
    {
        const std::string prefix {"12345678901"};
        std::vector<Identifier> used;
        for (char d {'0'}; d <= '9'; d++) used.push_back(Identifier::from(prefix + d));

        assert(Testing::expectThrows<ExhaustionError>([&] { (void) CodeGenerator::generate(prefix, used, "5"); }, "database is full"));
        CodeGenerator generator {7};
        assert(Testing::expectThrows<ExhaustionError>([&] { (void) generator.generate(prefix, used); }, "database is full"));

        used.pop_back();
        assert(CodeGenerator::generate(prefix, used, "3").identifier().payload() == prefix + '9');
        suite.pass("Exhaustion");
    }

    // Seeded generators are reproducible
    {
        CodeGenerator a {42}, b {42};
        for (int i {0}; i < 5; i++)
            assert(a.generate("590", {}).identifier() == b.generate("590", {}).identifier());
        assert(a.generate("590", {}).identifier().startsWith("590"));
        suite.pass("Seeded randomness");
    }

    // Batches see their own output as used
    {
        CodeGenerator generator {zeros()};
        std::vector<Identifier> used {Identifier::from("123456789000")};
        std::vector<EncodedCode> batch {generator.generateBatch("1234567890", used, 99)};
        assert(batch.size() == 99);
        assert(batch.front().identifier().payload() == "123456789001");
        assert(batch.back().identifier().payload() == "123456789099");

        std::set<Identifier> unique;
        for (const EncodedCode &code: batch) unique.insert(code.identifier());
        assert(unique.size() == 99);
        assert(!unique.contains(used.front()));

        for (const EncodedCode &code: batch) used.push_back(code.identifier());
        assert(Testing::expectThrows<ExhaustionError>([&] { (void) generator.generate("1234567890", used); }));
        assert(generator.generateBatch("1234567890", {}, 0).empty());
        suite.pass("generateBatch");
    }

    // Large batches fill half of a 5 digit suffix space without slowing down per code
    {
        CodeGenerator generator {2024};
        std::vector<Identifier> used {Identifier::from("123456700000"), Identifier::from("999999900000")};
        std::vector<EncodedCode> batch {generator.generateBatch("1234567", used, 50000)};
        assert(batch.size() == 50000);

        std::unordered_set<Identifier, HashIdentifier> unique;
        for (const EncodedCode &code: batch) {
            assert(code.identifier().startsWith("1234567"));
            unique.insert(code.identifier());
        }
        assert(unique.size() == 50000);
        assert(!unique.contains(used.front()));
        suite.pass("Large batch");
    }

    // Prefix and candidate validation
    {
        CodeGenerator generator {1};
        assert(Testing::expectThrows<ValidationError>([&] { (void) generator.generate("12a", {}); }));
        assert(Testing::expectThrows<ValidationError>([&] { (void) generator.generate("123456789012", {}); }));
        assert(Testing::expectThrows<ValidationError>([] { (void) CodeGenerator::generate("1234567890", {}, "123"); }));
        assert(Testing::expectThrows<ValidationError>([] { (void) CodeGenerator::generate("1234567890", {}, "1x"); }));
        assert(Testing::expectThrows<std::invalid_argument>([] { CodeGenerator generator {CodeGenerator::SuffixSource{}}; }));
        suite.pass("Validation");
    }

    return suite.done();
}
