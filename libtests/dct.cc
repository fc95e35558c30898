#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubDCT.hh>

#include <cstdlib>
#include <iostream>

static std::string
noise(size_t n)
{
    std::string result;
    unsigned long state = 12345;
    for (size_t i = 0; i < n; ++i) {
        state = state * 1103515245UL + 12345UL;
        result += static_cast<char>((state >> 16) & 0xff);
    }
    return result;
}

static void
test_compress()
{
    std::string gradient;
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            gradient += static_cast<char>(x * 16);
        }
    }
    auto jpeg = ScrubDCT::compress(gradient, 16, 16, 1, 90);
    assert(jpeg.substr(0, 2) == "\xff\xd8");
    assert(jpeg.substr(jpeg.size() - 2) == "\xff\xd9");
    // Four 8x8 blocks of one component
    assert(ScrubDCT::readACCoefficients(jpeg).size() == 4 * 63);

    auto rgb = ScrubDCT::compress(noise(16 * 16 * 3), 16, 16, 3, 75);
    auto coefficients = ScrubDCT::readACCoefficients(rgb);
    assert(!coefficients.empty());
    assert(coefficients.size() % 63 == 0);

    try {
        ScrubDCT::compress(gradient, 16, 16, 2, 90);
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ScrubDCT::compress("short", 16, 16, 1, 90);
        assert(false);
    } catch (std::runtime_error&) {
    }
}

static void
test_clear_low_bits()
{
    auto jpeg = ScrubDCT::compress(noise(64 * 64), 64, 64, 1, 100);
    auto before = ScrubDCT::readACCoefficients(jpeg);
    size_t odd = 0;
    for (auto c: before) {
        if ((c >= 2 || c <= -2) && (c & 1)) {
            ++odd;
        }
    }
    assert(odd > 0);

    size_t changed = 0;
    auto cleared = ScrubDCT::clearACLowBits(jpeg, changed);
    assert(changed == odd);
    auto after = ScrubDCT::readACCoefficients(cleared);
    assert(after.size() == before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        auto c = after.at(i);
        if (c >= 2 || c <= -2) {
            assert((c & 1) == 0);
        } else {
            // Small coefficients are left alone.
            assert(c == before.at(i));
        }
    }

    // Clearing twice changes nothing more.
    size_t again = 99;
    auto twice = ScrubDCT::clearACLowBits(cleared, again);
    assert(again == 0);
    assert(ScrubDCT::readACCoefficients(twice) == after);
}

static void
test_bad_data()
{
    size_t changed = 0;
    for (auto const& bad: {std::string("not a jpeg"), std::string("\xff\xd8\xff\xe0", 4)}) {
        try {
            ScrubDCT::readACCoefficients(bad);
            assert(false);
        } catch (std::runtime_error&) {
        }
        try {
            ScrubDCT::clearACLowBits(bad, changed);
            assert(false);
        } catch (std::runtime_error&) {
        }
    }
}

int
main()
{
    test_compress();
    test_clear_low_bits();
    test_bad_data();
    std::cout << "dct tests done" << std::endl;
    return 0;
}
