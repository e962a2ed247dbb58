#include "../include/ean13/bit_sequence.hpp"
#include "../include/ean13/errors.hpp"
#include "testing.hpp"

#include <stdexcept>
#include <utility>

using namespace EAN13;

int main() {
    Testing::Suite suite {"BitSequence"};

    // Text form uses '1' for black, '0' for white
    {
        BitSequence seq {BitSequence::fromString("0011")};
        assert(seq.size() == 4);
        assert(seq[0] == Bar::White && seq[3] == Bar::Black);
        assert(seq.toString() == "0011");
        assert((seq == BitSequence{Bar::White, Bar::White, Bar::Black, Bar::Black}));
        assert(BitSequence::fromString("").empty());
        assert(BitSequence::of(Bar::Black, 3).toString() == "111");
        assert(Testing::expectThrows<ValidationError>([] { (void) BitSequence::fromString("0120"); }));
        suite.pass("fromString / toString");
    }

    // Inversion flips polarity, repeat(0) is empty
    {
        BitSequence seq {BitSequence::fromString("0001101")};
        assert(invert(seq).toString() == "1110010");
        assert(invert(invert(seq)) == seq);
        assert(!Bar::White == Bar::Black);

        assert(repeat(seq, 0).empty());
        assert(repeat(BitSequence::fromString("10"), 3).toString() == "101010");
        assert(concat(seq, invert(seq)).toString() == "00011011110010");
        assert(concat(BitSequence{}, seq) == seq);
        suite.pass("invert / repeat / concat");
    }

    // Slices and run lengths
    {
        BitSequence seq {BitSequence::fromString("1010001101")};
        assert(seq.slice(3, 7).toString() == "0001101");
        assert(seq.slice(10, 0).empty());
        assert(Testing::expectThrows<std::out_of_range>([&seq] { (void) seq.slice(8, 3); }));
        assert(Testing::expectThrows<std::out_of_range>([&seq] { (void) seq.slice(11, 0); }));

        auto runs {BitSequence::fromString("0001101").runs()};
        assert(runs.size() == 4);
        assert(runs[0] == std::make_pair(Bar::White, std::size_t{3}));
        assert(runs[1] == std::make_pair(Bar::Black, std::size_t{2}));
        assert(runs[2] == std::make_pair(Bar::White, std::size_t{1}));
        assert(runs[3] == std::make_pair(Bar::Black, std::size_t{1}));
        assert(BitSequence{}.runs().empty());
        suite.pass("slice / runs");
    }

    return suite.done();
}
