#include <pdfscrub/ScrubUtil.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace
{
    std::string
    pad(std::string digits, int length)
    {
        auto width = ScrubIntC::to_size(length < 0 ? -length : length);
        if (digits.size() < width) {
            if (length > 0) {
                digits.insert(0, width - digits.size(), '0');
            } else {
                digits.append(width - digits.size(), ' ');
            }
        }
        return digits;
    }

    std::string
    describe_read(std::string_view filename, std::string const& problem)
    {
        return problem + " reading file " + std::string(filename) + " into memory";
    }
} // namespace

std::string
ScrubUtil::int_to_string(long long num, int length)
{
    return pad(std::to_string(num), length);
}

std::string
ScrubUtil::uint_to_string(unsigned long long num, int length)
{
    return pad(std::to_string(num), length);
}

std::string
ScrubUtil::double_to_string(double num, int decimal_places, bool trim_trailing_zeroes)
{
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::fixed << std::setprecision(decimal_places > 0 ? decimal_places : 6) << num;
    auto result = out.str();
    if (trim_trailing_zeroes && result.find('.') != std::string::npos) {
        result.erase(result.find_last_not_of('0') + 1);
        if (result.back() == '.') {
            result.pop_back();
        }
    }
    return result == "-0" ? "0" : result;
}

long long
ScrubUtil::string_to_ll(char const* str)
{
    errno = 0;
    auto result = std::strtoll(str, nullptr, 10);
    if (errno == ERANGE) {
        throw std::range_error(std::string(str) + " does not fit in a 64-bit integer");
    }
    return result;
}

int
ScrubUtil::string_to_int(char const* str)
{
    return ScrubIntC::to_int(string_to_ll(str));
}

std::string
ScrubUtil::hex_encode(std::string const& input)
{
    static char const digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(2 * input.size());
    for (unsigned char ch: input) {
        result.push_back(digits[ch >> 4]);
        result.push_back(digits[ch & 0xf]);
    }
    return result;
}

void
ScrubUtil::throw_system_error(std::string const& description)
{
    throw std::runtime_error(description + ": " + std::strerror(errno));
}

FILE*
ScrubUtil::safe_fopen(char const* filename, char const* mode)
{
    FILE* f = std::fopen(filename, mode);
    if (f == nullptr) {
        throw_system_error(std::string("open ") + filename);
    }
    return f;
}

bool
ScrubUtil::file_can_be_opened(char const* filename)
{
    FILE* f = std::fopen(filename, "rb");
    if (f == nullptr) {
        return false;
    }
    std::fclose(f);
    return true;
}

std::string
ScrubUtil::read_file_into_string(char const* filename)
{
    FILE* f = safe_fopen(filename, "rb");
    FileCloser closer(f);
    return read_file_into_string(f, filename);
}

// Pipes can't report their size, so the file is always read in blocks until end of file.
std::string
ScrubUtil::read_file_into_string(FILE* f, std::string_view filename)
{
    std::string result;
    if (std::fseek(f, 0, SEEK_END) == 0) {
        auto size = std::ftell(f);
        if (size > 0) {
            result.reserve(ScrubIntC::to_size(size));
        }
        std::rewind(f);
    }
    std::clearerr(f);
    char block[8192];
    size_t got = 0;
    while ((got = std::fread(block, 1, sizeof(block), f)) > 0) {
        result.append(block, got);
    }
    if (std::ferror(f)) {
        throw std::runtime_error(describe_read(filename, "error"));
    }
    return result;
}

void
ScrubUtil::write_file_atomically(std::string const& filename, std::string_view data)
{
    auto temporary = filename + ".pdfscrub-tmp";
    FILE* f = safe_fopen(temporary.c_str(), "wb");
    FileCloser closer(f);
    bool written = std::fwrite(data.data(), 1, data.size(), f) == data.size();
    written = std::fflush(f) == 0 && written;
    int saved_errno = errno;
    closer.close();
    if (!written || std::rename(temporary.c_str(), filename.c_str()) != 0) {
        if (written) {
            saved_errno = errno;
        }
        std::remove(temporary.c_str());
        errno = saved_errno;
        throw_system_error(
            written ? "rename " + temporary + " to " + filename : "write " + temporary);
    }
}

std::string
ScrubUtil::getWhoami(std::string_view argv0)
{
    auto slash = argv0.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        argv0.remove_prefix(slash + 1);
    }
    if (argv0.size() > 4 && argv0.ends_with(".exe")) {
        argv0.remove_suffix(4);
    }
    return std::string(argv0);
}

bool
ScrubUtil::get_env(std::string const& var, std::string* value)
{
    char const* found = std::getenv(var.c_str());
    if (found && value) {
        *value = found;
    }
    return found != nullptr;
}

std::string
ScrubUtil::now_iso8601()
{
    std::time_t now = std::time(nullptr);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::string
ScrubUtil::toUTF8(unsigned long uval)
{
    if (uval > 0x7fffffff) {
        throw std::runtime_error(
            "ScrubUtil::toUTF8: " + std::to_string(uval) + " is not a valid code point");
    }
    if (uval < 0x80) {
        return std::string(1, static_cast<char>(uval));
    }
    // Continuation bytes carry six bits each. The lead byte holds one bit fewer for every byte
    // added.
    std::string tail;
    unsigned long capacity = 0x3f;
    unsigned char mark = 0x80;
    do {
        tail.insert(tail.begin(), static_cast<char>(0x80 | (uval & 0x3f)));
        uval >>= 6;
        capacity >>= 1;
        mark = static_cast<unsigned char>(0x80 | (mark >> 1));
    } while (uval > capacity);
    return static_cast<char>(mark | uval) + tail;
}

bool
ScrubUtil::is_printable_text(std::string_view s)
{
    for (unsigned char ch: s) {
        bool control = ch < 0x20 && ch != '\t' && ch != '\r' && ch != '\n';
        if (control || ch >= 0x7f) {
            return false;
        }
    }
    return true;
}
