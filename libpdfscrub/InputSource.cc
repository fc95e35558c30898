#include <pdfscrub/InputSource_private.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <stdexcept>
#include <string_view>

void
InputSource::setLastOffset(scrub_offset_t offset)
{
    last_offset = offset;
}

scrub_offset_t
InputSource::getLastOffset() const
{
    return last_offset;
}

// The line ends at the first \r or \n, and the whole run of end-of-line characters after it is
// skipped. last_offset is left at the start of the line.
std::string
InputSource::readLine(size_t max_line_length)
{
    auto start = tell();
    auto line = read(max_line_length);
    seek(start, SEEK_SET);
    auto eol = findAndSkipNextEOL();
    last_offset = start;
    auto length = ScrubIntC::to_size(eol - start);
    if (length < line.size()) {
        line.erase(length);
    }
    return line;
}

bool
InputSource::findFirst(char const* start_chars, scrub_offset_t offset, size_t len, Finder& finder)
{
    static size_t const block_size = 1024;
    std::string_view pattern(start_chars);
    if (pattern.empty() || pattern.size() > block_size) {
        throw std::logic_error(
            "InputSource::findFirst: the search string must be 1 to 1024 characters long");
    }
    // Blocks overlap by one byte less than the pattern, so a match is never split between them.
    size_t const wanted = block_size + pattern.size() - 1;
    std::string block;
    for (auto block_start = offset;; block_start += ScrubIntC::to_offset(block_size)) {
        auto searched = ScrubIntC::to_size(block_start - offset);
        if (len != 0 && searched >= len) {
            return false;
        }
        read(block, wanted, block_start);
        for (auto at = block.find(pattern); at < block_size;
             at = block.find(pattern, at + 1)) {
            if (len != 0 && searched + at >= len) {
                return false;
            }
            seek(block_start + ScrubIntC::to_offset(at), SEEK_SET);
            if (finder.check()) {
                return true;
            }
        }
        if (block.size() < wanted) {
            return false;
        }
    }
}

bool
InputSource::findLast(char const* start_chars, scrub_offset_t offset, size_t len, Finder& finder)
{
    bool found = false;
    scrub_offset_t resume = offset;
    size_t remaining = len;
    while (findFirst(start_chars, resume, remaining, finder)) {
        found = true;
        resume = tell();
        if (len != 0) {
            auto used = ScrubIntC::to_size(resume - offset);
            if (used >= len) {
                break;
            }
            remaining = len - used;
        }
    }
    if (found) {
        seek(resume, SEEK_SET);
    }
    return found;
}
