#include <pdfscrub/ScrubJob_private.hh>

#include <pdfscrub/ScrubArgParser.hh>
#include <pdfscrub/ScrubFinding.hh>

#include <memory>

namespace
{
    class ArgParser
    {
      public:
        ArgParser(ScrubArgParser& ap, std::shared_ptr<ScrubJob::Config> c_main);
        void parseOptions();

      private:
        void argPositional(std::string const&);
        void argVersion();
        void argReport(std::string const&);
        void argChainDir(std::string const&);
        void argLineage(std::string const&);
        void argIdentity(std::string const&);
        void argTimestamp(std::string const&);
        void argKeepDocumentId();
        void argAllowMetadata(std::string const&);
        void argWaive(std::string const&);
        void argDisableDetector(std::string const&);
        void argForceRemove();
        void argXrefStream();
        void argNoCompress();
        void argNoVerifyOutput();
        void argTimeout(std::string const&);
        void argJobJsonFile(std::string const&);
        void argEvents(std::string const&);
        void argVerbose();

        void usage(std::string const& message);
        void initOptionTables();
        void addHelp();

        ScrubArgParser& ap;
        std::shared_ptr<ScrubJob::Config> c_main;
        bool gave_input{false};
        bool gave_output{false};
    };
} // namespace

ArgParser::ArgParser(ScrubArgParser& ap, std::shared_ptr<ScrubJob::Config> c_main) :
    ap(ap),
    c_main(c_main)
{
    initOptionTables();
}

void
ArgParser::initOptionTables()
{
    auto b = [this](void (ArgParser::*f)()) { return ScrubArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return ScrubArgParser::bindParam(f, this);
    };

    ap.addHelpOption("version", b(&ArgParser::argVersion));
    ap.addPositional(p(&ArgParser::argPositional));
    ap.addRequiredParameter("report", p(&ArgParser::argReport), "file");
    ap.addRequiredParameter("chain-dir", p(&ArgParser::argChainDir), "dir");
    ap.addRequiredParameter("lineage", p(&ArgParser::argLineage), "key");
    ap.addRequiredParameter("identity", p(&ArgParser::argIdentity), "name");
    ap.addRequiredParameter("timestamp", p(&ArgParser::argTimestamp), "iso8601");
    ap.addBare("keep-document-id", b(&ArgParser::argKeepDocumentId));
    ap.addRequiredParameter("allow-metadata", p(&ArgParser::argAllowMetadata), "field");
    ap.addRequiredParameter("waive", p(&ArgParser::argWaive), "category");
    ap.addRequiredParameter("disable-detector", p(&ArgParser::argDisableDetector), "detector");
    ap.addBare("force-remove", b(&ArgParser::argForceRemove));
    ap.addBare("xref-stream", b(&ArgParser::argXrefStream));
    ap.addBare("no-compress", b(&ArgParser::argNoCompress));
    ap.addBare("no-verify-output", b(&ArgParser::argNoVerifyOutput));
    ap.addRequiredParameter("timeout", p(&ArgParser::argTimeout), "seconds");
    ap.addRequiredParameter("job-json-file", p(&ArgParser::argJobJsonFile), "file");
    ap.addRequiredParameter("events", p(&ArgParser::argEvents), "file");
    ap.addBare("verbose", b(&ArgParser::argVerbose));
    ap.addFinalCheck([this]() { c_main->checkConfiguration(); });
    addHelp();
}

void
ArgParser::addHelp()
{
    ap.addHelpFooter("Run \"pdfscrub --help=exit-status\" for the meaning of exit codes.\n");
    ap.addHelpTopic(
        "usage",
        "basic invocation",
        R"(Usage: pdfscrub [options] input.pdf [output.pdf]

The input is parsed, scanned for forensic artifacts, cleaned, and
scanned again. If nothing but waived findings remain, a rebuilt PDF
is written to output.pdf. A JSON report is always written, to the
file given with --report or to standard output.

The input file is never modified.
)");
    ap.addHelpTopic(
        "exit-status",
        "meaning of exit codes",
        R"(pdfscrub exits with one of these codes:

0: the document was cleaned and the output written
2: a usage or I/O error occurred
3: findings survived cleaning, or the output could not be rebuilt;
   no output was written
4: the input could not be parsed; no output was written
5: the run was cancelled or ran past its timeout; no output was
   written
)");
    std::string categories =
        "These names are accepted by --waive and appear in reports.\n\n";
    for (auto kind: ScrubFinding::allKinds()) {
        categories += std::string(ScrubFinding::kindName(kind)) + " (" +
            ScrubFinding::detectorName(ScrubFinding::detectorOf(kind)) + ")\n";
    }
    ap.addHelpTopic("categories", "artifact categories and their detectors", categories);
    ap.addHelpTopic(
        "job-json",
        "job JSON file format",
        "A job JSON file, given with --job-json-file, has this form:\n\n" +
            ScrubJob::job_json_schema() +
            "\n\nThe \"config\" member takes the keys below.\n\n" +
            ScrubConfig::schema().unparse() + "\n");
    ap.addHelpTopic(
        "cleaning", "options that change what is cleaned", "These options change what is cleaned.\n");
    ap.addHelpTopic(
        "output", "options that control the output", "These options control the output files.\n");
    ap.addHelpTopic(
        "context",
        "options that describe the run",
        R"(Each verification record carries a timestamp, an identity, and a
lineage. Records with the same lineage form a hash chain. By
default the timestamp is the current time, the identity is
"pdfscrub", and the lineage is the SHA-256 of the input.
)");
    ap.addHelpTopic(
        "diagnostics", "progress and event output", "These options report on the run itself.\n");

    ap.addOptionHelp("--report", "output", "write the report to a file", R"(--report=file

Write the JSON report to the file instead of standard output.
)");
    ap.addOptionHelp("--xref-stream", "output", "write a cross-reference stream", R"(--xref-stream

Write a cross-reference stream instead of a classic table. The
output version is at least 1.5.
)");
    ap.addOptionHelp("--no-compress", "output", "leave unfiltered streams uncompressed", R"(--no-compress

Streams that have no filter are normally written with /FlateDecode.
With this option they are written as they are.
)");
    ap.addOptionHelp("--no-verify-output", "output", "don't re-scan the rebuilt PDF", R"(--no-verify-output

The rebuilt PDF is normally parsed and scanned once more before it
is written. This option skips that check.
)");
    ap.addOptionHelp("--keep-document-id", "cleaning", "keep the original /ID", R"(--keep-document-id

Keep the first element of the original document ID and do not report
it. The second element is always computed from the output.
)");
    ap.addOptionHelp("--allow-metadata", "cleaning", "keep an Info field", R"(--allow-metadata=field

Keep this field of the document information dictionary. May be
repeated. CreationDate is kept by default.
)");
    ap.addOptionHelp("--waive", "cleaning", "waive an artifact category", R"(--waive=category

Report findings of this category separately and neither clean them
nor count them against verification. May be repeated. See
--help=categories.
)");
    ap.addOptionHelp("--disable-detector", "cleaning", "turn off a detector", R"(--disable-detector=detector

Do not run this detector: structural, metadata, signature, stream,
or hidden-data. May be repeated.
)");
    ap.addOptionHelp("--force-remove", "cleaning", "remove findings that survive the retry", R"(--force-remove

When findings survive the second cleaning pass, delete the objects
or dictionary entries that carry them and verify once more instead
of rejecting the document.
)");
    ap.addOptionHelp("--timeout", "cleaning", "give up after this many seconds", R"(--timeout=seconds

Cancel the run if it takes longer than this. 0 means no limit. The
default is 30.
)");
    ap.addOptionHelp("--job-json-file", "cleaning", "read options from a JSON file", R"(--job-json-file=file

Read options from a job JSON file. See --help=job-json.
)");
    ap.addOptionHelp("--chain-dir", "context", "persist verification records", R"(--chain-dir=dir

Append verification records to one JSON-lines file per lineage in
this directory, which is created if needed.
)");
    ap.addOptionHelp("--lineage", "context", "set the lineage key", R"(--lineage=key

Chain this run's verification records to earlier records with the
same key.
)");
    ap.addOptionHelp("--identity", "context", "who requested the run", R"(--identity=name

Record this identity in the verification records.
)");
    ap.addOptionHelp("--timestamp", "context", "time of the run", R"(--timestamp=iso8601

Record this time, in the form YYYY-MM-DDTHH:MM:SS, instead of the
current time.
)");
    ap.addOptionHelp("--events", "diagnostics", "write structured events", R"(--events=file

Write one JSON object per line to the file for each stage of the
pipeline.
)");
    ap.addOptionHelp("--verbose", "diagnostics", "print progress", R"(--verbose

Print pipeline events and other progress to standard output.
)");
}

void
ArgParser::usage(std::string const& message)
{
    ap.usage(message);
}

void
ArgParser::argPositional(std::string const& arg)
{
    if (!gave_input) {
        c_main->inputFile(arg);
        gave_input = true;
    } else if (!gave_output) {
        c_main->outputFile(arg);
        gave_output = true;
    } else {
        usage("unknown argument " + arg);
    }
}

void
ArgParser::argVersion()
{
    auto whoami = ap.getProgname();
    ScrubLogger::defaultLogger()->info(whoami + " version " + PDFSCRUB_VERSION + "\n");
}

void
ArgParser::argReport(std::string const& parameter)
{
    c_main->report(parameter);
}

void
ArgParser::argChainDir(std::string const& parameter)
{
    c_main->chainDir(parameter);
}

void
ArgParser::argLineage(std::string const& parameter)
{
    c_main->lineage(parameter);
}

void
ArgParser::argIdentity(std::string const& parameter)
{
    c_main->identity(parameter);
}

void
ArgParser::argTimestamp(std::string const& parameter)
{
    c_main->timestamp(parameter);
}

void
ArgParser::argKeepDocumentId()
{
    c_main->keepDocumentId();
}

void
ArgParser::argAllowMetadata(std::string const& parameter)
{
    c_main->allowMetadata(parameter);
}

void
ArgParser::argWaive(std::string const& parameter)
{
    c_main->waive(parameter);
}

void
ArgParser::argDisableDetector(std::string const& parameter)
{
    c_main->disableDetector(parameter);
}

void
ArgParser::argForceRemove()
{
    c_main->forceRemove();
}

void
ArgParser::argXrefStream()
{
    c_main->xrefStream();
}

void
ArgParser::argNoCompress()
{
    c_main->noCompress();
}

void
ArgParser::argNoVerifyOutput()
{
    c_main->noVerifyOutput();
}

void
ArgParser::argTimeout(std::string const& parameter)
{
    c_main->timeout(parameter);
}

void
ArgParser::argJobJsonFile(std::string const& parameter)
{
    c_main->jobJsonFile(parameter);
}

void
ArgParser::argEvents(std::string const& parameter)
{
    c_main->events(parameter);
}

void
ArgParser::argVerbose()
{
    c_main->verbose();
}

void
ArgParser::parseOptions()
{
    ap.parseArgs();
}

void
ScrubJob::initializeFromArgv(char const* const argv[])
{
    int argc = 0;
    for (auto k = argv; *k; ++k) {
        ++argc;
    }
    ScrubArgParser qap(argc, argv);
    ArgParser ap(qap, config());
    ap.parseOptions();
    m->help_shown = qap.helpShown();
}
