#include "../include/ean13/digit_walker.hpp"
#include "testing.hpp"

#include <set>
#include <stdexcept>
#include <vector>

using namespace EAN13;

namespace {
    std::vector<std::string> collect(BoundedWalk walk) {
        std::vector<std::string> result;
        for (const std::string &value: walk) result.push_back(value);
        return result;
    }
}

int main() {
    Testing::Suite suite {"DigitWalker"};

    // Odometer steps with carry out of the top position
    {
        DigitWalker walker {"09"};
        assert(!walker.advance());
        assert(walker.current() == "10");

        walker.reset("99");
        assert(walker.advance());
        assert(walker.current() == "00");
        assert(walker.cycles() == 1);
        assert(walker.length() == 2);
        assert(walker.alphabet() == DECIMAL);

        DigitWalker letters {"cc", "abc"};
        assert(letters.advance() && letters.current() == "aa");
        suite.pass("advance / reset");
    }

    // A step only rewrites the positions its carry reached
    {
        DigitWalker walker {"0990"};
        assert(!walker.advance() && walker.changed() == 1);
        assert(walker.current() == "0991" && walker.at(3) == '1');

        walker.reset("0999");
        assert(walker.changed() == 0);
        assert(!walker.advance() && walker.changed() == 4);
        assert(walker.at(0) == '1' && walker.at(1) == '0' && walker.current() == "1000");

        walker.reset("99");
        assert(walker.advance() && walker.changed() == 2);
        assert(Testing::expectThrows<std::out_of_range>([&walker] { (void) walker.at(2); }));

        // Stop strings several carries away are still found
        assert(collect(walkRound("0998", {.stop = "1001"})) == (std::vector<std::string>{"0998", "0999", "1000"}));
        assert(collect(walkRound("")) == (std::vector<std::string>{""}));
        suite.pass("Incremental steps");
    }

    // Round trip from "ba" over "abc"
    {
        const std::vector<std::string> expected {"ba", "bb", "bc", "ca", "cb", "cc", "aa", "ab", "ac"};
        assert(collect(walkRound("ba", {.alphabet = "abc"})) == expected);

        std::vector<std::string> withLast {expected};
        withLast.push_back("ba");
        assert(collect(walkRound("ba", {.includeLast = true, .alphabet = "abc"})) == withLast);
        suite.pass("walkRound example");
    }

    // Custom stop strings, and a stop equal to the start's successor
    {
        assert(collect(walkRound("8", {.stop = "1"})) == (std::vector<std::string>{"8", "9", "0"}));
        assert(collect(walkRound("8", {.stop = "1", .includeLast = true})) == (std::vector<std::string>{"8", "9", "0", "1"}));
        assert(collect(walkRound("3", {.stop = "4"})) == (std::vector<std::string>{"3"}));
        suite.pass("Stop strings");
    }

    // Default stop visits every string of the length exactly once
    {
        std::vector<std::string> values {collect(walkRound("517"))};
        std::set<std::string> unique {values.begin(), values.end()};
        assert(values.size() == 1000);
        assert(unique.size() == 1000);
        assert(values.front() == "517" && values[483] == "000" && values.back() == "516");
        suite.pass("Full cycle");
    }

    // Pull style access
    {
        BoundedWalk walk {walkRound("9")};
        std::size_t count {0};
        while (auto value {walk.next()}) {
            if (count == 0) assert(*value == "9");
            if (count == 1) assert(*value == "0");
            ++count;
        }
        assert(count == 10);
        assert(!walk.next());
        suite.pass("next()");
    }

    // Arguments the walker could never finish
    {
        assert(Testing::expectThrows<std::invalid_argument>([] { (void) walkRound("12", {.stop = "123"}); }));
        assert(Testing::expectThrows<std::invalid_argument>([] { (void) walkRound("12", {.stop = "1x"}); }));
        assert(Testing::expectThrows<std::invalid_argument>([] { (void) walkRound("1a"); }));
        assert(Testing::expectThrows<std::invalid_argument>([] { DigitWalker walker {"0", ""}; }));
        assert(Testing::expectThrows<std::invalid_argument>([] { DigitWalker walker {"0", "00"}; }));
        suite.pass("Invalid arguments");
    }

    return suite.done();
}
