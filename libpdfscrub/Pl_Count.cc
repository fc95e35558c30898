#include <pdfscrub/Pl_Count.hh>

#include <pdfscrub/ScrubIntC.hh>

#include <stdexcept>

Pl_Count::Pl_Count(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error(
            std::string("Pl_Count ") + identifier + ": a next pipeline is required");
    }
}

Pl_Count::~Pl_Count() = default;

void
Pl_Count::write(unsigned char const* buf, size_t len)
{
    count += ScrubIntC::to_offset(len);
    next()->write(buf, len);
}

void
Pl_Count::finish()
{
    next()->finish();
}

scrub_offset_t
Pl_Count::getCount() const
{
    return count;
}
