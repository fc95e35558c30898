#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_ASCII85Decoder.hh>
#include <pdfscrub/Pl_ASCIIHexDecoder.hh>
#include <pdfscrub/Pl_Count.hh>
#include <pdfscrub/Pl_Discard.hh>
#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/Pl_PNGFilter.hh>
#include <pdfscrub/Pl_String.hh>

#include <iostream>
#include <stdexcept>

template <typename P, typename... Args>
static std::string
run(std::string const& input, Args... args)
{
    std::string out;
    Pl_String s("out", nullptr, out);
    P p("decode", &s, args...);
    p.writeString(input);
    p.finish();
    return out;
}

template <typename P, typename... Args>
static void
expect_error(std::string const& input, std::string const& fragment, Args... args)
{
    try {
        run<P>(input, args...);
        assert(false);
    } catch (std::runtime_error& e) {
        if (std::string(e.what()).find(fragment) == std::string::npos) {
            std::cout << "unexpected message: " << e.what() << std::endl;
            assert(false);
        }
    }
}

static void
test_flate()
{
    std::string text;
    for (int i = 0; i < 5000; ++i) {
        text += "BT /F1 12 Tf 72 " + std::to_string(i) + " Td (line) Tj ET\n";
    }
    auto compressed = run<Pl_Flate>(text, Pl_Flate::a_deflate);
    assert(compressed.size() < text.size() / 10);
    assert(run<Pl_Flate>(compressed, Pl_Flate::a_inflate) == text);

    // Small output buffers give the same result.
    assert(run<Pl_Flate>(compressed, Pl_Flate::a_inflate, 17U) == text);

    expect_error<Pl_Flate>("this is not zlib data", "decode: inflate: data: ", Pl_Flate::a_inflate);

    std::string out;
    Pl_String s("out", nullptr, out);
    Pl_Flate limited("bomb", &s, Pl_Flate::a_inflate);
    limited.setMemoryLimit(1000);
    try {
        limited.writeString(compressed);
        limited.finish();
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "bomb: inflate memory limit exceeded");
    }

    int warnings = 0;
    std::string truncated_out;
    Pl_String t("out", nullptr, truncated_out);
    Pl_Flate truncated("truncated", &t, Pl_Flate::a_inflate);
    truncated.setWarnCallback([&warnings](char const*, int) { ++warnings; });
    truncated.writeString(compressed.substr(0, compressed.size() / 2));
    try {
        truncated.finish();
    } catch (std::runtime_error&) {
        // A truncated stream may fail at the end; the data before that point is kept.
    }
    assert(!truncated_out.empty());
    assert(text.starts_with(truncated_out));
}

static void
test_ascii()
{
    assert(run<Pl_ASCIIHexDecoder>("48 65\n6C6c6F>ignored") == "Hello");
    assert(run<Pl_ASCIIHexDecoder>("414>") == "A@");
    assert(run<Pl_ASCIIHexDecoder>("41") == "A");
    expect_error<Pl_ASCIIHexDecoder>("4g", "character out of range");

    assert(run<Pl_ASCII85Decoder>("9jqo^F*2M7/c~>") == "Man sure.");
    assert(run<Pl_ASCII85Decoder>("z 9jqo^~>garbage") == std::string("\0\0\0\0Man ", 8));
    expect_error<Pl_ASCII85Decoder>("9jqo^~x", "broken end-of-data");
    expect_error<Pl_ASCII85Decoder>("9j{", "character out of range");
    expect_error<Pl_ASCII85Decoder>("9jz~>", "unexpected z");
    expect_error<Pl_ASCII85Decoder>("9jqo^F~>", "single character group");
}

static void
test_png()
{
    // Three columns, one byte per pixel: a Sub row, an Up row, then an unfiltered row
    std::string rows(
        "\x01\x0a\x05\x05"
        "\x02\x01\x01\x01"
        "\x00\x07\x08\x09",
        12);
    assert(run<Pl_PNGFilter>(rows, 3U) == std::string("\x0a\x0f\x14\x0b\x10\x15\x07\x08\x09", 9));

    // Two samples per pixel: Sub uses the sample one pixel to the left.
    std::string rgb("\x01\x01\x02\x01\x01", 5);
    assert(run<Pl_PNGFilter>(rgb, 2U, 2U) == std::string("\x01\x02\x02\x03", 4));

    // Unknown filter types leave the row as it is.
    assert(run<Pl_PNGFilter>(std::string("\x07\x01\x01\x01", 4), 3U) == "\x01\x01\x01");

    // Average and Paeth against the row above. A truncated last row keeps only what arrived.
    std::string mixed(
        "\x00\x10\x20\x30"
        "\x03\x02\x02\x02"
        "\x04\x01\x01\x01"
        "\x02\x05",
        14);
    assert(
        run<Pl_PNGFilter>(mixed, 3U) ==
        std::string("\x10\x20\x30\x0a\x17\x25\x0b\x18\x26\x10", 10));
    try {
        std::string out;
        Pl_String s("out", nullptr, out);
        Pl_PNGFilter bad("png", &s, 3, 1, 3);
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()).find("bits_per_sample") != std::string::npos);
    }
}

static void
test_count()
{
    Pl_Discard discard;
    Pl_Count count("count", &discard);
    assert(count.getCount() == 0);
    count.writeString("%PDF-1.7\n");
    count.writeString("%%EOF\n");
    count.finish();
    assert(count.getCount() == 15);
    count.writeString("%%EOF\n");
    assert(count.getCount() == 21);
    try {
        Pl_Count orphan("orphan", nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    test_flate();
    test_ascii();
    test_png();
    test_count();
    std::cout << "pipeline tests done" << std::endl;
    return 0;
}
