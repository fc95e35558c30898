#include <pdfscrub/ScrubJob_private.hh>

#include <pdfscrub/ScrubUsage.hh>

#include <list>

using namespace std::literals;

namespace
{
    char const* const job_schema = R"json({
  "input": "(string)",
  "output": "(string)",
  "report": "(string)",
  "chain_dir": "(string)",
  "lineage": "(string)",
  "identity": "(string)",
  "timestamp": "(string)",
  "events": "(string)",
  "verbose": "(boolean)",
  "config": "see ScrubConfig"
})json";
} // namespace

std::string
ScrubJob::job_json_schema()
{
    return job_schema;
}

void
ScrubJob::usage(std::string const& msg)
{
    throw ScrubUsage(msg);
}

void
ScrubJob::initializeFromJson(std::string const& json, bool partial)
{
    JSON j;
    try {
        j = JSON::parse(json);
    } catch (std::runtime_error& e) {
        usage("job JSON is not valid: "s + e.what());
    }
    std::list<std::string> errors;
    if (!j.checkSchema(JSON::parse(job_schema), JSON::f_optional, errors)) {
        std::string msg = "job JSON has errors:";
        for (auto const& e: errors) {
            msg += "\n  " + e;
        }
        usage(msg);
    }

    auto c = config();
    j.forEachDictItem([this, &c](std::string const& key, JSON value) {
        std::string s;
        bool b = false;
        if (key == "config") {
            try {
                m->scrub_config.updateFromJSON(value);
            } catch (std::runtime_error& e) {
                usage(e.what());
            }
        } else if (key == "verbose") {
            if (value.getBool(b) && b) {
                c->verbose();
            }
        } else if (value.getString(s)) {
            if (key == "input") {
                c->inputFile(s);
            } else if (key == "output") {
                c->outputFile(s);
            } else if (key == "report") {
                c->report(s);
            } else if (key == "chain_dir") {
                c->chainDir(s);
            } else if (key == "lineage") {
                c->lineage(s);
            } else if (key == "identity") {
                c->identity(s);
            } else if (key == "timestamp") {
                c->timestamp(s);
            } else if (key == "events") {
                c->events(s);
            }
        }
    });
    if (!partial) {
        checkConfiguration();
    }
}
