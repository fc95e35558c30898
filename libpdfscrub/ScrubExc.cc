#include <pdfscrub/ScrubExc.hh>

namespace
{
    std::string
    located(
        std::string const& filename,
        std::string const& object,
        scrub_offset_t offset,
        std::string const& message)
    {
        std::string where = object;
        if (offset >= 0) {
            where += (where.empty() ? "" : ", ") + std::string("offset ") + std::to_string(offset);
        }
        if (!filename.empty() && !where.empty()) {
            where = filename + " (" + where + ")";
        } else if (!filename.empty()) {
            where = filename;
        }
        return where.empty() ? message : where + ": " + message;
    }
} // namespace

ScrubExc::ScrubExc(
    scrub_error_code_e error_code,
    std::string const& filename,
    std::string const& object,
    scrub_offset_t offset,
    std::string const& message,
    bool zero_offset_valid) :
    std::runtime_error(
        located(filename, object, offset || zero_offset_valid ? offset : -1, message)),
    error_code(error_code),
    object(object),
    offset(offset || zero_offset_valid ? offset : -1),
    message(message)
{
}

scrub_error_code_e
ScrubExc::getErrorCode() const
{
    return error_code;
}

std::string const&
ScrubExc::getObject() const
{
    return object;
}

scrub_offset_t
ScrubExc::getFilePosition() const
{
    return offset > 0 ? offset : 0;
}

std::string const&
ScrubExc::getMessageDetail() const
{
    return message;
}
