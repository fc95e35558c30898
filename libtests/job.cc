#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/JSON.hh>
#include <pdfscrub/ScrubJob.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubUsage.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <cstdio>
#include <iostream>
#include <vector>

static std::shared_ptr<ScrubLogger>
quiet_logger()
{
    auto l = ScrubLogger::create();
    l->setInfo(l->discard());
    l->setWarn(l->discard());
    l->setError(l->discard());
    return l;
}

static std::shared_ptr<ScrubJob>
make_job()
{
    auto j = std::make_shared<ScrubJob>();
    j->setLogger(quiet_logger());
    return j;
}

static std::shared_ptr<ScrubJob>
from_args(std::vector<char const*> args)
{
    args.insert(args.begin(), "pdfscrub");
    args.push_back(nullptr);
    auto j = make_job();
    j->initializeFromArgv(args.data());
    return j;
}

static void
expect_usage(std::vector<char const*> const& args, std::string const& fragment)
{
    try {
        from_args(args);
        assert(false);
    } catch (ScrubUsage& e) {
        if (std::string(e.what()).find(fragment) == std::string::npos) {
            std::cerr << "unexpected usage message: " << e.what() << std::endl;
            assert(false);
        }
    }
}

static void
expect_json_usage(std::string const& json, std::string const& fragment, bool partial = false)
{
    auto j = make_job();
    try {
        j->initializeFromJson(json, partial);
        assert(false);
    } catch (ScrubUsage& e) {
        if (std::string(e.what()).find(fragment) == std::string::npos) {
            std::cerr << "unexpected usage message: " << e.what() << std::endl;
            assert(false);
        }
    }
}

static std::string
report_status(std::string const& filename)
{
    auto j = JSON::parse(ScrubUtil::read_file_into_string(filename.c_str()));
    std::string status;
    assert(j.getDictItem("status").getString(status));
    return status;
}

static void
test_argv()
{
    auto j = from_args(
        {"--waive=OrphanedObject",
         "--keep-document-id",
         "--allow-metadata=/Title",
         "--disable-detector=hidden-data",
         "--timeout=2.5",
         "--xref-stream",
         "--no-compress",
         "in.pdf",
         "out.pdf"});
    assert(!j->helpShown());
    auto const& c = j->getScrubConfig();
    assert(c.waived.size() == 1);
    assert(c.waived.contains(ak_orphaned_object));
    assert(c.keep_document_id);
    assert(c.allowed_metadata_fields.contains("Title"));
    assert(c.disabled_detectors.contains(sd_hidden_data));
    assert(c.timeout_seconds == 2.5);
    assert(c.xref_mode == scrub_xref_stream);
    assert(!c.compress_streams);
    assert(c.verify_output);
    assert(!c.force_remove);
    // Nothing has run yet.
    assert(j->getExitCode() == ScrubJob::EXIT_CLEAN);

    expect_usage({"--waive=Nope", "in.pdf"}, "unknown artifact category Nope");
    expect_usage({"--disable-detector=Nope", "in.pdf"}, "unknown detector Nope");
    expect_usage({"--timestamp=yesterday", "in.pdf"}, "timestamp must be in the form");
    expect_usage({"--timeout=-1", "in.pdf"}, "non-negative number of seconds");
    expect_usage({"--timeout=soon", "in.pdf"}, "non-negative number of seconds");
    expect_usage({"--allow-metadata=/", "in.pdf"}, "requires a field name");
    expect_usage({}, "an input file name is required");
    expect_usage({"--xref-stream"}, "an input file name is required");
    expect_usage({"in.pdf", "in.pdf"}, "input file and output file are the same");
    expect_usage({"--report=out.pdf", "in.pdf", "out.pdf"}, "report file must differ");
    expect_usage({"a.pdf", "b.pdf", "c.pdf"}, "unknown argument c.pdf");
    expect_usage({"--bogus", "in.pdf"}, "unrecognized argument --bogus");
    expect_usage({"--waive", "in.pdf"}, "--waive must be given as --waive=category");
    expect_usage({"--verbose=yes", "in.pdf"}, "does not take a parameter");

    // A timestamp only has to start with the right shape.
    j = from_args({"--timestamp=2026-03-01T12:30:00.25+01:00", "in.pdf"});

    // Help is shown instead of running.
    j = from_args({"--help=exit-status"});
    assert(j->helpShown());
    j->run();
    assert(j->getExitCode() == ScrubJob::EXIT_CLEAN);
}

static void
test_json()
{
    auto j = make_job();
    j->initializeFromJson(R"({
  "input": "in.pdf",
  "output": "out.pdf",
  "identity": "json-test",
  "timestamp": "2026-02-02T02:02:02Z",
  "config": {
    "waived": "RevisionHistory",
    "allowed_metadata_fields": ["/Title", "Subject"],
    "xref_mode": "stream",
    "verify_output": false
  }
})");
    auto const& c = j->getScrubConfig();
    assert(c.waived.contains(ak_revision_history));
    assert(c.allowed_metadata_fields.contains("Title"));
    assert(c.allowed_metadata_fields.contains("Subject"));
    assert(c.xref_mode == scrub_xref_stream);
    assert(!c.verify_output);

    // Partial initialization leaves the check for later.
    j = make_job();
    j->initializeFromJson(R"({"output": "out.pdf"})", true);
    bool threw = false;
    try {
        j->checkConfiguration();
    } catch (ScrubUsage&) {
        threw = true;
    }
    assert(threw);

    expect_json_usage("{", "job JSON is not valid");
    expect_json_usage(R"({"potato": 1})", "job JSON has errors:");
    expect_json_usage(R"({"output": "out.pdf"})", "an input file name is required");
    expect_json_usage(R"({"timestamp": "noon"})", "timestamp must be in the form", true);
    expect_json_usage(
        R"({"config": {"waived": ["Nope"]}})", "unknown artifact category \"Nope\"", true);
}

static std::string
clean_pdf()
{
    TestPDF pdf;
    add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (Agenda) Tj ET");
    pdf.finishRevision();
    return pdf.str();
}

static void
remove_files(std::vector<char const*> const& names)
{
    for (auto name: names) {
        remove(name);
    }
}

static void
test_run()
{
    remove_files({"job-out.pdf", "job-report.json", "job-events.jsonl"});
    ScrubUtil::write_file_atomically("job-in.pdf", clean_pdf());

    auto j = from_args(
        {"--report=job-report.json",
         "--events=job-events.jsonl",
         "--identity=libtests",
         "--timestamp=2026-01-15T10:00:00Z",
         "job-in.pdf",
         "job-out.pdf"});
    j->run();
    assert(j->getStatus() == ss_clean);
    assert(j->getExitCode() == ScrubJob::EXIT_CLEAN);
    assert(ScrubUtil::file_can_be_opened("job-out.pdf"));
    auto written = ScrubUtil::read_file_into_string("job-out.pdf");
    assert(written == j->getOutput());
    assert(written.starts_with("%PDF-"));
    assert(report_status("job-report.json") == "Clean");
    auto report = JSON::parse(ScrubUtil::read_file_into_string("job-report.json"));
    std::string identity;
    assert(report.getDictItem("context").getDictItem("identity").getString(identity));
    assert(identity == "libtests");
    auto events = ScrubUtil::read_file_into_string("job-events.jsonl");
    assert(events.find("\"stage\"") != std::string::npos);
    // The input is never modified.
    assert(ScrubUtil::read_file_into_string("job-in.pdf") == clean_pdf());
    remove_files({"job-out.pdf", "job-report.json", "job-events.jsonl"});

    // Nothing is written for an input that can't be parsed, but the report is.
    ScrubUtil::write_file_atomically("job-in.pdf", "this is not a PDF file at all\n");
    j = from_args({"--report=job-report.json", "job-in.pdf", "job-out.pdf"});
    j->run();
    assert(j->getStatus() == ss_unrecoverable);
    assert(j->getExitCode() == ScrubJob::EXIT_UNRECOVERABLE);
    assert(!ScrubUtil::file_can_be_opened("job-out.pdf"));
    assert(report_status("job-report.json") == "Unrecoverable");
    remove_files({"job-report.json"});

    // A missing input is an I/O error, not a status.
    remove_files({"job-in.pdf"});
    j = from_args({"--report=job-report.json", "job-in.pdf"});
    bool threw = false;
    try {
        j->run();
    } catch (std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!ScrubUtil::file_can_be_opened("job-report.json"));
}

static void
test_job_json_file()
{
    ScrubUtil::write_file_atomically("job-in.pdf", clean_pdf());
    ScrubUtil::write_file_atomically(
        "job-test.json", R"({"input": "job-in.pdf", "config": {"keep_document_id": true}})");
    auto j = from_args({"--job-json-file=job-test.json"});
    assert(j->getScrubConfig().keep_document_id);
    j->processData("job-in.pdf", ScrubUtil::read_file_into_string("job-in.pdf"));
    assert(j->getStatus() == ss_clean);

    // The input was given by the file, so a positional input is a second one.
    expect_usage(
        {"--job-json-file=job-test.json", "other.pdf"}, "input file has already been given");

    ScrubUtil::write_file_atomically("job-test.json", R"({"bogus": true})");
    {
        bool threw = false;
        try {
            from_args({"--job-json-file=job-test.json"});
        } catch (std::runtime_error& e) {
            threw = std::string(e.what()).find("error with job-json file job-test.json") !=
                std::string::npos;
        }
        assert(threw);
    }
    remove_files({"job-test.json", "job-in.pdf"});
}

int
main()
{
    test_argv();
    test_json();
    test_run();
    test_job_json_file();
    std::cout << "job tests done" << std::endl;
    return 0;
}
