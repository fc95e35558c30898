#include <pdfscrub/ScrubUsage.hh>

ScrubUsage::ScrubUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
