#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubIntC.hh>

#include <cstdint>
#include <iostream>
#include <string>

#define try_convert(exp_pass, fn, i) try_convert_real(#fn "(" #i ")", exp_pass, fn, i)

template <typename From, typename To>
static void
try_convert_real(char const* description, bool exp_pass, To (*fn)(From const&), From const& i)
{
    bool passed = false;
    try {
        fn(i);
        passed = true;
    } catch (std::range_error& e) {
        assert(std::string(e.what()).find("integer out of range converting") == 0);
        passed = false;
    }
    if (passed != exp_pass) {
        std::cout << description << ": " << (passed ? "passed" : "failed") << std::endl;
        assert(false);
    }
}

int
main()
{
    uint32_t u1 = 3141592653U;      // Too big for signed type
    int32_t i1 = -1153374643;       // Same bit pattern as u1
    uint64_t ul1 = 1099511627776LL; // Too big for 32-bit
    uint64_t ul2 = 12345;           // Fits into 32-bit
    int64_t il1 = -1;               // Offsets read from a file may be negative

    assert(static_cast<uint32_t>(i1) == u1);

    try_convert(true, ScrubIntC::to_int<int32_t>, i1);
    try_convert(true, ScrubIntC::to_uint<uint32_t>, u1);
    try_convert(false, ScrubIntC::to_int<uint32_t>, u1);
    try_convert(false, ScrubIntC::to_uint<int32_t>, i1);
    try_convert(false, ScrubIntC::to_int<uint64_t>, ul1);
    try_convert(true, ScrubIntC::to_int<uint64_t>, ul2);
    try_convert(true, ScrubIntC::to_uint<uint64_t>, ul2);
    try_convert(true, ScrubIntC::to_offset<uint32_t>, u1);
    try_convert(true, ScrubIntC::to_offset<int32_t>, i1);
    try_convert(false, ScrubIntC::to_size<int32_t>, i1);
    try_convert(false, ScrubIntC::to_size<int64_t>, il1);
    try_convert(true, ScrubIntC::to_size<uint64_t>, ul2);
    try_convert(true, ScrubIntC::to_longlong<uint32_t>, u1);
    try_convert(false, ScrubIntC::to_ulonglong<int64_t>, il1);
    try_convert(true, ScrubIntC::to_ulonglong<int32_t>, 81);

    assert(ScrubIntC::to_int(ul2) == 12345);
    assert(ScrubIntC::to_offset(u1) == 3141592653LL);
    assert(ScrubIntC::to_size(int64_t(4096)) == 4096U);

    std::cout << "intc tests done" << std::endl;
    return 0;
}
