#ifndef SCRUBJOB_PRIVATE_HH
#define SCRUBJOB_PRIVATE_HH

#include <pdfscrub/ScrubJob.hh>

#include <pdfscrub/ScrubChainStore.hh>
#include <pdfscrub/ScrubLogger.hh>

#include <fstream>

class ScrubJob::Members
{
    friend class ScrubJob;

  public:
    Members();
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    std::shared_ptr<ScrubLogger> log;
    std::string message_prefix{"pdfscrub"};
    bool verbose{false};
    bool help_shown{false};
    ScrubConfig scrub_config;
    ScrubRunContext context;
    std::shared_ptr<ScrubChainStore> chain_store;
    std::string infilename;
    std::string outfilename;
    std::string report_filename;
    std::string chain_dir;
    std::string events_filename;
    std::unique_ptr<std::ofstream> events_file;
    std::shared_ptr<Pipeline> events_pipeline;

    // Results of the last run
    bool ran{false};
    ScrubReport report;
    std::string output;
};

#endif // SCRUBJOB_PRIVATE_HH
