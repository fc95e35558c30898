#ifndef UTIL_HH
#define UTIL_HH

#include <string>

// Character classes for PDF syntax. They never consult the locale, unlike <cctype>.
namespace pdfscrub::util
{
    // Value of a hexadecimal digit, or 16 if ch is not one
    inline constexpr int
    hex_value(char ch)
    {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'a' && ch <= 'f') {
            return ch - 'a' + 10;
        }
        if (ch >= 'A' && ch <= 'F') {
            return ch - 'A' + 10;
        }
        return 16;
    }

    inline constexpr char
    hex_decode_char(char digit)
    {
        return static_cast<char>(hex_value(digit));
    }

    inline constexpr bool
    is_hex_digit(char ch)
    {
        return hex_value(ch) < 16;
    }

    // PDF white space includes NUL.
    inline constexpr bool
    is_space(char ch)
    {
        switch (ch) {
        case '\0':
        case '\t':
        case '\n':
        case '\v':
        case '\f':
        case '\r':
        case ' ':
            return true;
        default:
            return false;
        }
    }

    inline bool
    is_digit(char ch)
    {
        return ch >= '0' && ch <= '9';
    }

    inline constexpr bool
    is_delimiter(char ch)
    {
        for (char d: "()<>[]{}/%") {
            if (d != '\0' && ch == d) {
                return true;
            }
        }
        return false;
    }

    // "#xx" with lower-case digits, as used to escape a byte in a name
    inline std::string
    hex_encode_char(char c)
    {
        static char const digits[] = "0123456789abcdef";
        auto byte = static_cast<unsigned char>(c);
        return {'#', digits[byte >> 4], digits[byte & 0xf]};
    }
} // namespace pdfscrub::util

#endif // UTIL_HH
