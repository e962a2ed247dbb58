#include "../include/ean13/errors.hpp"
#include "../include/ean13/identifier.hpp"
#include "testing.hpp"

#include <unordered_set>

using namespace EAN13;

int main() {
    Testing::Suite suite {"Identifier"};

    // 12 digits get the check digit, 13 digits are verified
    {
        Identifier fromPayload {Identifier::from("590123412345")};
        Identifier fromFull {Identifier::from("5901234123457")};
        assert(fromPayload == fromFull);
        assert(fromPayload.str() == "5901234123457");
        assert(fromPayload.payload() == "590123412345");
        assert(fromPayload.checkDigit() == '7');
        assert(fromPayload.leading() == 5);
        assert(fromPayload.digit(1) == 9 && fromPayload.digit(12) == 7);
        assert(fromPayload.dashed() == "5-901234-123457");
        suite.pass("Payload & full forms");
    }

    // Integers are zero padded to 12 digits
    {
        assert(Identifier::from(std::uint64_t{42}).str() == "0000000000420");
        assert(Identifier::from(std::uint64_t{0}).str() == "0000000000000");
        assert(Identifier::from(std::uint64_t{590123412345}).str() == "5901234123457");
        assert(Identifier::from(std::uint64_t{5901234123457}).str() == "5901234123457");
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::from(std::uint64_t{12345678901234}); }));
        suite.pass("Integer input");
    }

    // Strings are never padded; wrong check digits are reported as such
    {
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::from("12345"); }, "malformed identifier"));
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::from("59012341234a"); }, "malformed identifier"));
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::from(""); }, "malformed identifier"));
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::from("9782940199618"); }, "checksum mismatch"));
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::from("5901234123458"); }, "checksum mismatch"));
        suite.pass("Malformed & mismatching input");
    }

    // Checking a printed code needs all 13 digits
    {
        assert(Identifier::verify("5901234123457").str() == "5901234123457");
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::verify("590123412345"); }, "malformed identifier"));
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::verify("5901234123458"); }, "checksum mismatch"));
        assert(Testing::expectThrows<ValidationError>([] { (void) Identifier::verify("590123412345x"); }, "malformed identifier"));
        suite.pass("verify");
    }

    // Ordering, prefix checks and hashing
    {
        Identifier low {Identifier::from("200000000001")}, high {Identifier::from("200000000002")};
        assert(low < high);
        assert(low.startsWith("2000") && !low.startsWith("21"));
        assert(low.startsWith(""));

        std::unordered_set<Identifier, HashIdentifier> ids {low, high, Identifier::from(low.str())};
        assert(ids.size() == 2);
        suite.pass("Comparison & hashing");
    }

    return suite.done();
}
