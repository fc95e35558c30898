#include <pdfscrub/ScrubRunContext.hh>

#include <pdfscrub/ScrubExc.hh>

std::shared_ptr<ScrubCancel>
ScrubCancel::create()
{
    return std::shared_ptr<ScrubCancel>(new ScrubCancel());
}

std::shared_ptr<ScrubCancel>
ScrubCancel::withTimeout(double seconds)
{
    auto result = create();
    if (seconds > 0) {
        result->setDeadline(
            std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(seconds)));
    }
    return result;
}

void
ScrubCancel::cancel()
{
    cancelled = true;
}

bool
ScrubCancel::isCancelled() const
{
    return cancelled || (has_deadline && std::chrono::steady_clock::now() >= deadline);
}

void
ScrubCancel::setDeadline(std::chrono::steady_clock::time_point when)
{
    deadline = when;
    has_deadline = true;
}

void
ScrubCancel::check(char const* where) const
{
    if (cancelled) {
        throw ScrubExc(scrub_e_cancelled, "", where, 0, "operation cancelled");
    }
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
        throw ScrubExc(scrub_e_cancelled, "", where, 0, "timeout expired");
    }
}
