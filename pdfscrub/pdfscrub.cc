#include <pdfscrub/ScrubJob.hh>
#include <pdfscrub/ScrubUsage.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <cstdlib>
#include <iostream>

namespace
{
    [[noreturn]] void
    usage_exit(std::string const& whoami, std::string const& msg)
    {
        std::cerr << "\n"
                  << whoami << ": " << msg << "\n\n"
                  << "Run \"" << whoami << " --help=usage\" for usage information or \""
                  << whoami << " --help\" for the list of help topics.\n"
                  << std::endl;
        std::exit(ScrubJob::EXIT_ERROR);
    }
} // namespace

int
main(int argc, char* argv[])
{
    auto whoami = ScrubUtil::getWhoami(argc > 0 ? argv[0] : "pdfscrub");
    ScrubJob job;
    job.setMessagePrefix(whoami);
    try {
        job.initializeFromArgv(argv);
        job.run();
    } catch (ScrubUsage& e) {
        usage_exit(whoami, e.what());
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        return ScrubJob::EXIT_ERROR;
    }
    return job.getExitCode();
}
