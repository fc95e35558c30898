#include <pdfscrub/ScrubJob_private.hh>

#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

#include <cerrno>
#include <cstdlib>
#include <cstring>

using namespace pdfscrub;

void
ScrubJob::Config::checkConfiguration()
{
    o.checkConfiguration();
}

ScrubJob::Config*
ScrubJob::Config::inputFile(std::string const& filename)
{
    if (filename.empty()) {
        usage("the input file name may not be empty");
    }
    if (o.m->infilename.empty()) {
        o.m->infilename = filename;
    } else {
        usage("input file has already been given");
    }
    return this;
}

ScrubJob::Config*
ScrubJob::Config::outputFile(std::string const& filename)
{
    if (filename.empty()) {
        usage("the output file name may not be empty");
    }
    if (o.m->outfilename.empty()) {
        o.m->outfilename = filename;
    } else {
        usage("output file has already been given");
    }
    return this;
}

ScrubJob::Config*
ScrubJob::Config::report(std::string const& filename)
{
    o.m->report_filename = filename;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::chainDir(std::string const& path)
{
    o.m->chain_dir = path;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::lineage(std::string const& key)
{
    o.m->context.lineage = key;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::identity(std::string const& name)
{
    o.m->context.identity = name;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::timestamp(std::string const& iso8601)
{
    // Only the shape is checked: YYYY-MM-DDTHH:MM:SS followed by anything (fraction, zone).
    static char const* const shape = "dddd-dd-ddTdd:dd:dd";
    bool okay = iso8601.length() >= strlen(shape);
    for (size_t i = 0; okay && shape[i]; ++i) {
        char ch = iso8601.at(i);
        okay = (shape[i] == 'd') ? util::is_digit(ch) : (ch == shape[i]);
    }
    if (!okay) {
        usage("timestamp must be in the form YYYY-MM-DDTHH:MM:SS");
    }
    o.m->context.timestamp = iso8601;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::keepDocumentId()
{
    o.m->scrub_config.keep_document_id = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::allowMetadata(std::string const& field)
{
    auto name = field.starts_with("/") ? field.substr(1) : field;
    if (name.empty()) {
        usage("allow-metadata requires a field name");
    }
    o.m->scrub_config.allowed_metadata_fields.insert(name);
    return this;
}

ScrubJob::Config*
ScrubJob::Config::waive(std::string const& category)
{
    scrub_artifact_e kind;
    if (!ScrubFinding::kindFromName(category, kind)) {
        usage("unknown artifact category " + category);
    }
    o.m->scrub_config.waived.insert(kind);
    return this;
}

ScrubJob::Config*
ScrubJob::Config::disableDetector(std::string const& name)
{
    scrub_detector_e detector;
    if (!ScrubFinding::detectorFromName(name, detector)) {
        usage("unknown detector " + name);
    }
    o.m->scrub_config.disabled_detectors.insert(detector);
    return this;
}

ScrubJob::Config*
ScrubJob::Config::forceRemove()
{
    o.m->scrub_config.force_remove = true;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::xrefStream()
{
    o.m->scrub_config.xref_mode = scrub_xref_stream;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::noCompress()
{
    o.m->scrub_config.compress_streams = false;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::noVerifyOutput()
{
    o.m->scrub_config.verify_output = false;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::timeout(std::string const& seconds)
{
    char* end = nullptr;
    errno = 0;
    double value = seconds.empty() ? -1 : strtod(seconds.c_str(), &end);
    if (errno != 0 || value < 0 || (end && *end)) {
        usage("timeout must be a non-negative number of seconds");
    }
    o.m->scrub_config.timeout_seconds = value;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::jobJsonFile(std::string const& parameter)
{
    auto data = ScrubUtil::read_file_into_string(parameter.c_str());
    try {
        o.initializeFromJson(data, true);
    } catch (std::exception& e) {
        throw std::runtime_error(
            "error with job-json file " + parameter + ": " + e.what() + "\nRun " +
            o.m->message_prefix + " --help=job-json for information on the file format.");
    }
    return this;
}

ScrubJob::Config*
ScrubJob::Config::events(std::string const& filename)
{
    o.m->events_filename = filename;
    return this;
}

ScrubJob::Config*
ScrubJob::Config::verbose()
{
    o.m->verbose = true;
    return this;
}
