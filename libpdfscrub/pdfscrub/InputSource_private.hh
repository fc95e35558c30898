#ifndef PDFSCRUB_INPUTSOURCE_PRIVATE_HH
#define PDFSCRUB_INPUTSOURCE_PRIVATE_HH

#include <pdfscrub/InputSource.hh>

#include <pdfscrub/ScrubIntC.hh>

inline size_t
InputSource::read(std::string& str, size_t count, scrub_offset_t at)
{
    if (at >= 0) {
        seek(at, SEEK_SET);
    }
    str.resize(count);
    auto got = read(str.data(), count);
    str.erase(got);
    return got;
}

inline std::string
InputSource::read(size_t count, scrub_offset_t at)
{
    std::string result;
    read(result, count, at);
    return result;
}

// Byte-at-a-time reading goes through a small window of the source. fastTell must come before the
// first fastRead, and fastUnread after the last one so the position matches what was consumed.

// read() leaves last_offset at the start of what it returned, or at the end of the source.
inline void
InputSource::loadBuffer()
{
    chunk_len = ScrubIntC::to_offset(read(chunk, chunk_size));
    chunk_start = last_offset;
    chunk_pos = 0;
}

inline scrub_offset_t
InputSource::fastTell()
{
    auto pos = tell();
    if (chunk_len > 0 && pos >= chunk_start && pos - chunk_start < chunk_len) {
        chunk_pos = pos - chunk_start;
        last_offset = pos;
    } else {
        loadBuffer();
    }
    return last_offset;
}

inline bool
InputSource::fastRead(char& ch)
{
    if (chunk_pos == chunk_len) {
        if (chunk_len == 0) {
            return false;
        }
        seek(chunk_start + chunk_len, SEEK_SET);
        loadBuffer();
        if (chunk_len == 0) {
            return false;
        }
    }
    ch = chunk[chunk_pos++];
    ++last_offset;
    return true;
}

inline void
InputSource::fastUnread(bool back)
{
    if (back) {
        --last_offset;
    }
    seek(last_offset, SEEK_SET);
}

#endif // PDFSCRUB_INPUTSOURCE_PRIVATE_HH
