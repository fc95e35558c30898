#include <pdfscrub/BufferInputSource.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <stdexcept>

BufferInputSource::BufferInputSource(std::string const& description, std::string_view data) :
    description(description),
    data(data),
    max_offset(ScrubIntC::to_offset(data.size()))
{
}

BufferInputSource::BufferInputSource(std::string const& description, std::string const& contents) :
    description(description),
    content(contents),
    data(content),
    max_offset(ScrubIntC::to_offset(content.size()))
{
}

BufferInputSource::~BufferInputSource() = default;

// At the end of the data, last_offset moves to the end as well.
scrub_offset_t
BufferInputSource::findAndSkipNextEOL()
{
    if (cur_offset >= max_offset) {
        last_offset = cur_offset = max_offset;
        return max_offset;
    }
    auto eol = data.find_first_of("\r\n", ScrubIntC::to_size(cur_offset));
    if (eol == std::string_view::npos) {
        cur_offset = max_offset;
        return max_offset;
    }
    auto after = data.find_first_not_of("\r\n", eol);
    cur_offset = after == std::string_view::npos ? max_offset : ScrubIntC::to_offset(after);
    return ScrubIntC::to_offset(eol);
}

std::string const&
BufferInputSource::getName() const
{
    return description;
}

scrub_offset_t
BufferInputSource::tell()
{
    return cur_offset;
}

// Seeking past the end is allowed; reads there return nothing. A failed seek leaves the position
// alone.
void
BufferInputSource::seek(scrub_offset_t offset, int whence)
{
    scrub_offset_t base = 0;
    if (whence == SEEK_END) {
        base = max_offset;
    } else if (whence == SEEK_CUR) {
        base = cur_offset;
    } else if (whence != SEEK_SET) {
        throw std::logic_error("BufferInputSource::seek: unknown whence " + std::to_string(whence));
    }
    if (base + offset < 0) {
        throw std::runtime_error(description + ": seek before beginning of buffer");
    }
    cur_offset = base + offset;
}

void
BufferInputSource::rewind()
{
    cur_offset = 0;
}

size_t
BufferInputSource::read(char* buffer, size_t length)
{
    if (cur_offset >= max_offset) {
        last_offset = max_offset;
        return 0;
    }
    last_offset = cur_offset;
    auto got = data.substr(ScrubIntC::to_size(cur_offset)).copy(buffer, length);
    cur_offset += ScrubIntC::to_offset(got);
    return got;
}

void
BufferInputSource::unreadCh(char)
{
    if (cur_offset > 0) {
        --cur_offset;
    }
}

std::string_view
BufferInputSource::view() const
{
    return data;
}
