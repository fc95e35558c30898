#include <pdfscrub/ScrubJob_private.hh>

#include <pdfscrub/Pl_OStream.hh>
#include <pdfscrub/Pl_SHA2.hh>
#include <pdfscrub/ScrubCleaner.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubScanner.hh>
#include <pdfscrub/ScrubUsage.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubVerifier.hh>
#include <pdfscrub/ScrubWriter.hh>

using namespace std::literals;

namespace
{
    // Identity recorded when the caller doesn't supply one
    char const* const default_identity = "pdfscrub";

    std::string
    plural(size_t n, char const* what)
    {
        return std::to_string(n) + " " + what + (n == 1 ? "" : "s");
    }
} // namespace

ScrubJob::Members::Members() :
    log(ScrubLogger::defaultLogger()),
    chain_store(ScrubChainStore::memory())
{
}

ScrubJob::ScrubJob() :
    m(new Members())
{
}

void
ScrubJob::setMessagePrefix(std::string const& message_prefix)
{
    m->message_prefix = message_prefix;
}

std::string
ScrubJob::getMessagePrefix() const
{
    return m->message_prefix;
}

std::shared_ptr<ScrubLogger>
ScrubJob::getLogger()
{
    return m->log;
}

void
ScrubJob::setLogger(std::shared_ptr<ScrubLogger> l)
{
    m->log = l ? l : ScrubLogger::defaultLogger();
}

void
ScrubJob::setChainStore(std::shared_ptr<ScrubChainStore> store)
{
    if (!store) {
        throw std::logic_error("ScrubJob::setChainStore called with a null store");
    }
    m->chain_store = store;
}

std::shared_ptr<ScrubChainStore>
ScrubJob::getChainStore()
{
    return m->chain_store;
}

void
ScrubJob::setRunContext(ScrubRunContext const& context)
{
    m->context = context;
}

void
ScrubJob::setScrubConfig(ScrubConfig const& config)
{
    m->scrub_config = config;
}

ScrubConfig const&
ScrubJob::getScrubConfig() const
{
    return m->scrub_config;
}

void
ScrubJob::doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn)
{
    if (m->verbose) {
        fn(*m->log->getInfo(), m->message_prefix);
    }
}

std::shared_ptr<ScrubJob::Config>
ScrubJob::config()
{
    return std::shared_ptr<Config>(new Config(*this));
}

void
ScrubJob::checkConfiguration()
{
    if (m->help_shown) {
        return;
    }
    if (m->infilename.empty()) {
        throw ScrubUsage("an input file name is required");
    }
    if (m->infilename == m->outfilename) {
        throw ScrubUsage("input file and output file are the same; the input is never overwritten");
    }
    if (!m->report_filename.empty() &&
        (m->report_filename == m->infilename || m->report_filename == m->outfilename)) {
        throw ScrubUsage("the report file must differ from the input and output files");
    }
}

bool
ScrubJob::helpShown() const
{
    return m->help_shown;
}

int
ScrubJob::getExitCode() const
{
    if (!m->ran) {
        return EXIT_CLEAN;
    }
    switch (m->report.getStatus()) {
    case ss_clean:
        return EXIT_CLEAN;
    case ss_rejected:
        return EXIT_REJECTED;
    case ss_cancelled:
        return EXIT_CANCELLED;
    case ss_unrecoverable:
        return EXIT_UNRECOVERABLE;
    }
    return EXIT_ERROR;
}

scrub_status_e
ScrubJob::getStatus() const
{
    return m->report.getStatus();
}

ScrubReport const&
ScrubJob::getReport() const
{
    return m->report;
}

std::string const&
ScrubJob::getOutput() const
{
    return m->output;
}

void
ScrubJob::openEvents()
{
    if (m->events_filename.empty()) {
        return;
    }
    m->events_file = std::make_unique<std::ofstream>(
        m->events_filename, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (!m->events_file->good()) {
        m->events_file = nullptr;
        throw std::runtime_error("unable to open " + m->events_filename + " for writing");
    }
    m->events_pipeline = std::make_shared<Pl_OStream>("events", *m->events_file);
    m->log->setEvents(m->events_pipeline);
}

void
ScrubJob::closeEvents()
{
    if (!m->events_pipeline) {
        return;
    }
    m->log->setEvents(nullptr);
    m->events_pipeline->finish();
    m->events_pipeline = nullptr;
    m->events_file->close();
    m->events_file = nullptr;
}

void
ScrubJob::run()
{
    checkConfiguration();
    if (m->help_shown) {
        return;
    }
    if (!m->chain_dir.empty()) {
        m->chain_store = ScrubChainStore::directory(m->chain_dir);
    }
    auto data = ScrubUtil::read_file_into_string(m->infilename.c_str());
    openEvents();
    try {
        processData(m->infilename, data);
    } catch (std::exception&) {
        closeEvents();
        throw;
    }
    closeEvents();

    if (m->report.getStatus() == ss_clean && !m->outfilename.empty()) {
        ScrubUtil::write_file_atomically(m->outfilename, m->output);
        doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": wrote " << m->outfilename << "\n";
        });
    }
    writeReport();
    if (m->report.getStatus() != ss_clean) {
        m->log->error(
            m->message_prefix + ": " + m->infilename + ": " +
            ScrubFinding::statusName(m->report.getStatus()) +
            (m->report.getError().empty() ? "" : ": " + m->report.getError()) + "\n");
    }
}

void
ScrubJob::writeReport()
{
    auto text = m->report.unparse();
    if (m->report_filename.empty()) {
        m->log->saveToStandardOutput(true);
        auto save = m->log->getSave();
        save->writeString(text);
        save->finish();
    } else {
        ScrubUtil::write_file_atomically(m->report_filename, text);
        doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": wrote report " << m->report_filename << "\n";
        });
    }
}

void
ScrubJob::processData(std::string const& description, std::string_view data)
{
    auto const& cfg = m->scrub_config;
    if (m->verbose) {
        m->log->setVerbose(true, m->message_prefix);
    }
    m->ran = true;
    m->report = ScrubReport();
    m->output.clear();

    // Fill in whatever the caller left out of the context. There is no other source of time,
    // identity or cancellation for the run.
    ScrubRunContext context = m->context;
    auto pre_hash = Pl_SHA2::hexDigest(data);
    if (context.timestamp.empty()) {
        context.timestamp = ScrubUtil::now_iso8601();
    }
    if (context.identity.empty()) {
        context.identity = default_identity;
    }
    if (context.lineage.empty()) {
        context.lineage = pre_hash;
    }
    if (!context.cancel) {
        context.cancel = ScrubCancel::withTimeout(cfg.timeout_seconds);
    } else if (cfg.timeout_seconds > 0) {
        context.cancel->setDeadline(
            std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(cfg.timeout_seconds)));
    }

    auto& r = m->report;
    r.setInput(description, ScrubIntC::to_offset(data.size()), pre_hash);
    r.setContext(context);
    auto history = m->chain_store->load(context.lineage);
    r.setHistory(history.size(), history.empty() ? "" : history.back().chain_link);

    try {
        runPipeline(description, data, context);
    } catch (ScrubExc& e) {
        m->output.clear();
        switch (e.getErrorCode()) {
        case scrub_e_cancelled:
            // Partial results are never reported as if they were results.
            r.discardResults();
            r.setStatus(ss_cancelled);
            break;
        case scrub_e_rebuild:
        case scrub_e_verification:
            r.setFinalHash("");
            r.setStatus(ss_rejected);
            break;
        case scrub_e_unrecoverable:
        case scrub_e_damaged_pdf:
        case scrub_e_unsupported:
            r.setStatus(ss_unrecoverable);
            break;
        default:
            throw;
        }
        r.setError(e.what());
        m->log->event(
            "report", ScrubFinding::statusName(r.getStatus()), JSON::makeString(e.what()));
    }
}

void
ScrubJob::runPipeline(
    std::string const& description, std::string_view data, ScrubRunContext const& context)
{
    auto const& cfg = m->scrub_config;
    auto& r = m->report;
    auto cancel = context.cancel;

    if (cfg.max_input_size > 0 && data.size() > cfg.max_input_size) {
        throw ScrubExc(
            scrub_e_unrecoverable,
            description,
            "",
            0,
            "input is " + std::to_string(data.size()) + " bytes; the limit is " +
                std::to_string(cfg.max_input_size));
    }

    // Parse
    cancel->check("parse");
    m->log->event("parse", "start");
    ScrubObjectGraph graph;
    graph.setMaxDecodedSize(cfg.max_decoded_size);
    graph.processMemory(description, data, cancel);
    for (auto const& w: graph.getWarnings()) {
        m->log->warn("WARNING: "s + w.what() + "\n");
        r.addWarning(w.what());
    }
    auto details = JSON::makeDictionary();
    details.addDictionaryMember(
        "objects", JSON::makeInt(ScrubIntC::to_longlong(graph.getObjectCount())));
    details.addDictionaryMember(
        "revisions", JSON::makeInt(ScrubIntC::to_longlong(graph.getRevisions().size())));
    details.addDictionaryMember("recovered", JSON::makeBool(graph.isRecovered()));
    m->log->event("parse", "finish", details);

    // Scan
    cancel->check("scan");
    ScrubScanner scanner(cfg, m->log, cancel);
    auto [waived, findings] = scanner.scan(graph).partition(cfg.effectiveWaivers());
    r.setFindings(findings, waived);

    // Clean and verify, with one retry and optional force removal
    auto record = cleanAndVerify(graph, findings, context, 1);
    if (!record.passed()) {
        doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": " << plural(record.residual_count, "finding")
              << " left after cleaning; cleaning again\n";
        });
        record = cleanAndVerify(graph, record.residual, context, 2);
    }
    if (!record.passed() && cfg.force_remove) {
        doIfVerbose([&](Pipeline& v, std::string const& prefix) {
            v << prefix << ": " << plural(record.residual_count, "finding")
              << " left after retry; removing by force\n";
        });
        record = cleanAndVerify(graph, record.residual, context, 3);
    }
    if (graph.isEncrypted()) {
        // Strings and streams can't be examined, so nothing can be certified even when the
        // Encrypted finding is waived. The cleaner has recorded it as Ignored.
        r.setStatus(ss_rejected);
        r.setError("the document is encrypted; encrypted documents are not cleaned");
        m->log->event("report", "Rejected", JSON::makeString(r.getError()));
        return;
    }
    if (!record.passed()) {
        std::string msg = plural(record.residual_count, "finding") + " survived cleaning:";
        for (auto const& f: record.residual.getFindings()) {
            msg += " "s + ScrubFinding::kindName(f.getKind()) + " at " + f.describeLocation() + ";";
        }
        msg.pop_back();
        r.setStatus(ss_rejected);
        r.setError(msg);
        m->log->event("report", "Rejected", JSON::makeString(msg));
        return;
    }

    // Rebuild
    cancel->check("rebuild");
    auto output = rebuild(graph, context);
    if (cfg.verify_output) {
        verifyOutput(description, output, context);
    }
    cancel->check("report");

    m->output = std::move(output);
    r.setFinalHash(Pl_SHA2::hexDigest(m->output));
    r.setStatus(ss_clean);
    details = JSON::makeDictionary();
    details.addDictionaryMember("final_hash", JSON::makeString(r.getFinalHash()));
    details.addDictionaryMember(
        "actions", JSON::makeInt(ScrubIntC::to_longlong(r.getActions().getActions().size())));
    m->log->event("report", "Clean", details);
}

ScrubVerificationRecord
ScrubJob::cleanAndVerify(
    ScrubObjectGraph& graph,
    ScrubFindingSet const& findings,
    ScrubRunContext const& context,
    int pass)
{
    auto const& cfg = m->scrub_config;
    ScrubCleaner cleaner(cfg, m->log, context.cancel);
    m->report.addActions(
        pass == 3 ? cleaner.forceRemove(graph, findings, pass)
                  : cleaner.clean(graph, findings, pass));

    context.cancel->check("verify");
    ScrubVerifier verifier(cfg, m->log, context.cancel);
    auto record = verifier.verify(
        m->report.getPreHash(), graph, context, m->chain_store->lastLink(context.lineage), pass);
    m->chain_store->append(context.lineage, record);
    m->report.addVerification(record);
    return record;
}

std::string
ScrubJob::rebuild(ScrubObjectGraph const& graph, ScrubRunContext const&)
{
    auto const& cfg = m->scrub_config;
    m->log->event("rebuild", "start");
    ScrubWriter w(graph);
    w.setXrefMode(cfg.xref_mode);
    w.setCompressStreams(cfg.compress_streams);
    w.setKeepOriginalID1(cfg.keep_document_id);
    auto output = w.write();
    auto details = JSON::makeDictionary();
    details.addDictionaryMember("size", JSON::makeInt(ScrubIntC::to_longlong(output.size())));
    m->log->event("rebuild", "finish", details);
    return output;
}

void
ScrubJob::verifyOutput(
    std::string const& description, std::string const& output, ScrubRunContext const& context)
{
    auto const& cfg = m->scrub_config;
    m->log->event("rebuild", "checking output");
    ScrubObjectGraph check;
    check.setMaxDecodedSize(cfg.max_decoded_size);
    check.processMemory(description + " (rebuilt)", output, context.cancel);
    ScrubScanner scanner(cfg, m->log, context.cancel);
    auto rest = scanner.scan(check).partition(cfg.effectiveWaivers()).second;

    // Rebuilding moves every byte a /ByteRange refers to, so a waived signature may change
    // between DigitalSignature and PartialSignatureCoverage. Either one is still the waived
    // signature.
    bool signature_waived =
        cfg.isWaived(ak_digital_signature) || cfg.isWaived(ak_partial_signature_coverage);
    std::string unexpected;
    for (auto const& f: rest.getFindings()) {
        if (signature_waived && f.getDetector() == sd_signature) {
            continue;
        }
        unexpected += " "s + ScrubFinding::kindName(f.getKind()) + " at " + f.describeLocation() +
            " (" + f.getEvidence() + ");";
    }
    if (!unexpected.empty()) {
        unexpected.pop_back();
        throw ScrubExc(
            scrub_e_rebuild, description, "", 0, "rebuilt output has findings:" + unexpected);
    }
}
