#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubUtil.hh>

#include <climits>
#include <cstdio>
#include <iostream>
#include <locale>

template <class int_T>
static void
test_to_number(char const* str, int_T wanted, bool error, int_T (*fn)(char const*))
{
    bool threw = false;
    int_T result = 0;
    try {
        result = fn(str);
    } catch (std::runtime_error const&) {
        threw = true;
    }
    if (threw != error || (!threw && result != wanted)) {
        std::cout << str << ": conversion did not behave as expected" << std::endl;
        assert(false);
    }
}

static void
set_locale()
{
    try {
        // A locale that puts commas in numbers must not change the output.
        std::locale::global(std::locale("en_US.UTF-8"));
    } catch (std::runtime_error&) {
        // Not installed here; the classic locale is still checked.
    }
}

static void
string_conversion_test()
{
    set_locale();
    assert(ScrubUtil::int_to_string(16059) == "16059");
    assert(ScrubUtil::int_to_string(16059, 7) == "0016059");
    assert(ScrubUtil::int_to_string(16059, -7) == "16059  ");
    assert(ScrubUtil::uint_to_string(5000093552ULL) == "5000093552");
    assert(ScrubUtil::double_to_string(3.14159, 0, false) == "3.141590");
    assert(ScrubUtil::double_to_string(3.14159, 3) == "3.142");
    assert(ScrubUtil::double_to_string(1000.123, -1024, false) == "1000.123000");
    assert(ScrubUtil::double_to_string(.1234, 5, false) == "0.12340");
    assert(ScrubUtil::double_to_string(.0001234, 5) == "0.00012");
    assert(ScrubUtil::double_to_string(1.01020, 5, true) == "1.0102");
    assert(ScrubUtil::double_to_string(1, 5, true) == "1");
    assert(ScrubUtil::double_to_string(10, 2, false) == "10.00");
    assert(ScrubUtil::double_to_string(10, 2, true) == "10");
    assert(ScrubUtil::double_to_string(-0.0001, 2) == "0");

    std::string int_max_str = ScrubUtil::int_to_string(INT_MAX);
    std::string int_min_str = ScrubUtil::int_to_string(INT_MIN);
    long long int_max_plus_1 = static_cast<long long>(INT_MAX) + 1;
    long long int_min_minus_1 = static_cast<long long>(INT_MIN) - 1;
    std::string int_max_plus_1_str = ScrubUtil::int_to_string(int_max_plus_1);
    std::string int_min_minus_1_str = ScrubUtil::int_to_string(int_min_minus_1);
    test_to_number(int_min_str.c_str(), INT_MIN, false, ScrubUtil::string_to_int);
    test_to_number(int_max_str.c_str(), INT_MAX, false, ScrubUtil::string_to_int);
    test_to_number(int_max_plus_1_str.c_str(), 0, true, ScrubUtil::string_to_int);
    test_to_number(int_min_minus_1_str.c_str(), 0, true, ScrubUtil::string_to_int);
    test_to_number("9999999999999999999999999", 0, true, ScrubUtil::string_to_int);
    test_to_number(int_max_plus_1_str.c_str(), int_max_plus_1, false, ScrubUtil::string_to_ll);
    test_to_number(int_min_minus_1_str.c_str(), int_min_minus_1, false, ScrubUtil::string_to_ll);
    test_to_number(
        "99999999999999999999999999999999999999999999999999", 0LL, true, ScrubUtil::string_to_ll);
    test_to_number("+17", 17LL, false, ScrubUtil::string_to_ll);
}

static void
hex_test()
{
    assert(ScrubUtil::hex_encode(std::string("\x01\xab\x7f", 3)) == "01ab7f");
    assert(ScrubUtil::hex_encode("") == "");
    assert(ScrubUtil::hex_encode("\xff\x10") == "ff10");
}

static void
text_test()
{
    assert(ScrubUtil::toUTF8(0x41) == "A");
    assert(ScrubUtil::toUTF8(0xe9) == "\xc3\xa9");
    assert(ScrubUtil::toUTF8(0x3c0) == "\xcf\x80");
    assert(ScrubUtil::toUTF8(0x1f954) == "\xf0\x9f\xa5\x94");
    try {
        ScrubUtil::toUTF8(0x80000000UL);
        assert(false);
    } catch (std::runtime_error&) {
    }

    assert(ScrubUtil::is_printable_text("Author: A. Writer\r\n\t"));
    assert(ScrubUtil::is_printable_text(""));
    assert(!ScrubUtil::is_printable_text(std::string("a\0b", 3)));
    assert(!ScrubUtil::is_printable_text("caf\xc3\xa9"));

    assert(ScrubUtil::toUTF8(0x7ff) == "\xdf\xbf");
    assert(ScrubUtil::toUTF8(0x7fffffff) == "\xfd\xbf\xbf\xbf\xbf\xbf");

    assert(ScrubUtil::getWhoami("/usr/local/bin/pdfscrub.exe") == "pdfscrub");
    assert(ScrubUtil::getWhoami("C:\\tools\\pdfscrub") == "pdfscrub");
    assert(ScrubUtil::getWhoami("pdfscrub") == "pdfscrub");
    assert(ScrubUtil::getWhoami(".exe") == ".exe");

    std::string value = "unchanged";
    assert(!ScrubUtil::get_env("PDFSCRUB_TEST_NOT_A_VARIABLE", &value));
    assert(value == "unchanged");

    auto now = ScrubUtil::now_iso8601();
    assert(now.size() == 20);
    assert(now.at(4) == '-' && now.at(10) == 'T' && now.back() == 'Z');
}

static void
file_test()
{
    try {
        FILE* f = ScrubUtil::safe_fopen("/this/file/does/not/exist", "r");
        fclose(f);
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()).find("open /this/file/does/not/exist: ") == 0);
    }
    assert(!ScrubUtil::file_can_be_opened("/this/file/does/not/exist"));

    std::string data("%PDF-1.7\n\0binary\xff", 17);
    ScrubUtil::write_file_atomically("util-test.out", data);
    assert(ScrubUtil::file_can_be_opened("util-test.out"));
    assert(!ScrubUtil::file_can_be_opened("util-test.out.pdfscrub-tmp"));
    assert(ScrubUtil::read_file_into_string("util-test.out") == data);

    // Replacing an existing file
    ScrubUtil::write_file_atomically("util-test.out", "second");
    {
        FILE* f = ScrubUtil::safe_fopen("util-test.out", "rb");
        ScrubUtil::FileCloser fc(f);
        assert(ScrubUtil::read_file_into_string(f, "util-test.out") == "second");
    }
    remove("util-test.out");

    try {
        ScrubUtil::write_file_atomically("/this/directory/does/not/exist/out.pdf", data);
        assert(false);
    } catch (std::runtime_error&) {
    }
}

int
main()
{
    string_conversion_test();
    hex_test();
    text_test();
    file_test();
    std::cout << "util tests done" << std::endl;
    return 0;
}
