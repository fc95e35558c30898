#include <pdfscrub/Pl_ASCII85Decoder.hh>

#include <cstring>
#include <stdexcept>

Pl_ASCII85Decoder::Pl_ASCII85Decoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_ASCII85Decoder with nullptr as next");
    }
}

void
Pl_ASCII85Decoder::write(unsigned char const* buf, size_t len)
{
    if (eod > 1) {
        return;
    }
    for (size_t i = 0; i < len; ++i) {
        if (eod > 1) {
            break;
        } else if (eod == 1) {
            if (buf[i] == '>') {
                flush();
                eod = 2;
            } else {
                throw std::runtime_error("broken end-of-data sequence in base 85 data");
            }
        } else {
            switch (buf[i]) {
            case ' ':
            case '\f':
            case '\v':
            case '\t':
            case '\r':
            case '\n':
                // ignore whitespace
                break;

            case '~':
                eod = 1;
                break;

            case 'z':
                if (pos != 0) {
                    throw std::runtime_error("unexpected z during base 85 decode");
                }
                {
                    unsigned char zeroes[4];
                    memset(zeroes, '\0', 4);
                    next()->write(zeroes, 4);
                }
                break;

            default:
                if ((buf[i] < 33) || (buf[i] > 117)) {
                    throw std::runtime_error("character out of range during base 85 decode");
                } else {
                    inbuf[pos++] = buf[i];
                    if (pos == 5) {
                        flush();
                    }
                }
                break;
            }
        }
    }
}

void
Pl_ASCII85Decoder::flush()
{
    if (pos == 0) {
        return;
    }
    if (pos == 1) {
        throw std::runtime_error("base 85 data ends with a single character group");
    }
    unsigned long long lval = 0;
    for (int i = 0; i < 5; ++i) {
        lval *= 85;
        lval += (inbuf[i] - 33U);
    }
    if (lval > 0xffffffffULL) {
        if (pos == 5) {
            throw std::runtime_error("base 85 group out of range");
        }
        // padding of a partial group can overflow; only the leading bytes are kept
        lval &= 0xffffffffULL;
    }

    unsigned char outbuf[4];
    memset(outbuf, 0, 4);
    for (int i = 3; i >= 0; --i) {
        outbuf[i] = lval & 0xff;
        lval >>= 8;
    }
    next()->write(outbuf, pos - 1);

    pos = 0;
    memset(inbuf, 117, 5);
}

void
Pl_ASCII85Decoder::finish()
{
    flush();
    next()->finish();
}
