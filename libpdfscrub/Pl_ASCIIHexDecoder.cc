#include <pdfscrub/Pl_ASCIIHexDecoder.hh>

#include <pdfscrub/Util.hh>

#include <cctype>
#include <stdexcept>

using namespace pdfscrub;

Pl_ASCIIHexDecoder::Pl_ASCIIHexDecoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_ASCIIHexDecoder with nullptr as next");
    }
}

void
Pl_ASCIIHexDecoder::write(unsigned char const* buf, size_t len)
{
    if (eod) {
        return;
    }
    for (size_t i = 0; i < len; ++i) {
        char ch = static_cast<char>(toupper(buf[i]));
        switch (ch) {
        case ' ':
        case '\f':
        case '\v':
        case '\t':
        case '\r':
        case '\n':
            // ignore whitespace
            break;

        case '>':
            eod = true;
            flush();
            break;

        default:
            if (util::is_hex_digit(ch)) {
                inbuf[pos++] = ch;
                if (pos == 2) {
                    flush();
                }
            } else {
                char t[2];
                t[0] = ch;
                t[1] = 0;
                throw std::runtime_error(
                    std::string("character out of range during base Hex decode: ") + t);
            }
            break;
        }
        if (eod) {
            break;
        }
    }
}

void
Pl_ASCIIHexDecoder::flush()
{
    if (pos == 0) {
        return;
    }
    auto ch = static_cast<unsigned char>(
        (util::hex_decode_char(inbuf[0]) << 4) + util::hex_decode_char(inbuf[1]));
    next()->write(&ch, 1);
    pos = 0;
    inbuf[0] = '0';
    inbuf[1] = '0';
    inbuf[2] = '\0';
}

void
Pl_ASCIIHexDecoder::finish()
{
    flush();
    next()->finish();
}
