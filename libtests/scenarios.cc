#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/ScrubChainStore.hh>
#include <pdfscrub/ScrubJob.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubReport.hh>
#include <pdfscrub/ScrubScanner.hh>
#include <pdfscrub/ScrubStream.hh>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <utility>

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
make_job(ScrubConfig const& config = ScrubConfig())
{
    auto j = std::make_shared<ScrubJob>();
    j->setLogger(quiet_logger());
    j->setScrubConfig(config);
    ScrubRunContext context;
    context.timestamp = "2026-01-15T10:00:00Z";
    context.identity = "libtests";
    context.lineage = "scenario";
    j->setRunContext(context);
    return j;
}

static ScrubFindingSet
scan(ScrubObjectGraph const& graph, ScrubConfig const& config = ScrubConfig())
{
    return ScrubScanner(config, quiet_logger()).scan(graph);
}

static bool
graph_contains_text(ScrubObjectGraph const& graph, std::string const& text)
{
    for (auto const& og: graph.getObjectKeys()) {
        if (graph.getObject(og).containsText(text)) {
            return true;
        }
        auto stream = graph.getStream(og);
        if (stream && stream->decode() == ScrubStream::ds_ok &&
            stream->getDecodedData().find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static std::string
confidential_in_old_revision()
{
    TestPDF pdf;
    add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (CONFIDENTIAL) Tj ET");
    pdf.finishRevision();
    // The update points the page tree at a new page. The old page and its content remain in the
    // file, reachable only from the first trailer.
    pdf.object(2, "<< /Type /Pages /Kids [5 0 R] /Count 1 >>");
    pdf.object(5, "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 6 0 R >>");
    pdf.stream(6, "", "BT /F1 12 Tf 72 700 Td (Public) Tj ET");
    pdf.finishRevision();
    return pdf.str();
}

static void
test_superseded_page()
{
    auto data = confidential_in_old_revision();
    ScrubObjectGraph graph;
    graph.processMemory("scenario A", data);
    assert(graph.getRevisions().size() == 2);
    assert(!graph.isRecovered());

    auto findings = scan(graph);
    assert(findings.count(ak_revision_history) == 3);
    assert(findings.count(ak_duplicate_object_id) == 1);
    assert(findings.size() == 4);
    bool old_page_flagged = false;
    for (auto const& f: findings.getFindings()) {
        if (f.getKind() == ak_revision_history && !f.isByteRange() &&
            f.getObjGen() == ScrubObjGen(4, 0)) {
            old_page_flagged = true;
        }
    }
    assert(old_page_flagged);

    auto job = make_job();
    job->processData("scenario A", data);
    assert(job->getStatus() == ss_clean);
    assert(job->getExitCode() == ScrubJob::EXIT_CLEAN);
    auto const& report = job->getReport();
    assert(report.getVerification().size() == 1);
    assert(report.getVerification().at(0).passed());
    assert(report.getActions().remedialCount() > 0);

    ScrubObjectGraph out;
    out.processMemory("rebuilt", job->getOutput());
    assert(out.getRevisions().size() == 1);
    assert(!graph_contains_text(out, "CONFIDENTIAL"));
    // The visible page survives.
    assert(graph_contains_text(out, "(Public) Tj"));
    assert(out.getPages().size() == 1);
    assert(scan(out).empty());
}

static void
test_trailing_data()
{
    TestPDF pdf;
    add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (Report) Tj ET");
    pdf.finishRevision();
    auto block = binary_block(500);
    pdf.append(block);
    auto data = pdf.str();

    ScrubObjectGraph graph;
    graph.processMemory("scenario B", data);
    assert(graph.hasTrailingData());
    assert(graph.getTrailingDataLength() == 500);
    assert(graph.getTrailingDataOffset() == static_cast<scrub_offset_t>(data.size() - 500));
    auto findings = scan(graph);
    assert(findings.size() == 1);
    auto const& f = findings.getFindings().at(0);
    assert(f.getKind() == ak_hidden_trailing_data);
    assert(f.isByteRange());
    assert(f.getLength() == 500);

    auto job = make_job();
    job->processData("scenario B", data);
    assert(job->getStatus() == ss_clean);
    auto const& output = job->getOutput();
    assert(output.find(block) == std::string::npos);
    assert(output.size() >= 6 && output.substr(output.size() - 6) == "%%EOF\n");
    ScrubObjectGraph out;
    out.processMemory("rebuilt", output);
    assert(!out.hasTrailingData());

    bool truncated = false;
    for (auto const& a: job->getReport().getActions().getActions()) {
        if (a.finding.getKind() == ak_hidden_trailing_data) {
            assert(a.action == sa_removed);
            assert(a.delta == -500);
            truncated = true;
        }
    }
    assert(truncated);
}

// A one-page document with an invisible signature field, signed over everything through its
// first %%EOF. With `update`, a later revision changes the page content without re-signing.
static std::string
signed_document(bool update)
{
    TestPDF pdf;
    pdf.object(1, "<< /Type /Catalog /Pages 2 0 R /AcroForm << /Fields [5 0 R] /SigFlags 3 >> >>");
    pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    pdf.object(
        3,
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R /Annots [5 0 R] >>");
    pdf.stream(4, "", "BT /F1 12 Tf 72 700 Td (Signed text) Tj ET");
    pdf.object(
        5,
        "<< /Type /Annot /Subtype /Widget /FT /Sig /T (Signature1) /Rect [0 0 0 0] /P 3 0 R "
        "/V 6 0 R >>");
    std::string placeholder = "[0 0000000000 0000000000 0000000000]";
    pdf.object(
        6,
        "<< /Type /Sig /Filter /Adobe.PPKLite /SubFilter /adbe.pkcs7.detached /Name (A. Signer) "
        "/ByteRange " +
            placeholder + " /Contents <" + std::string(64, '0') + "> >>");
    pdf.finishRevision();

    // Fill in the byte range now that the layout is known. The replacement has the same width.
    auto signed_end = pdf.size();
    auto& data = pdf.str();
    auto lt = data.find("/Contents <") + strlen("/Contents ");
    auto gt = data.find('>', lt) + 1;
    char range[40];
    snprintf(range, sizeof(range), "[0 %010zu %010zu %010zu]", lt, gt, signed_end - gt);
    data.replace(data.find(placeholder), placeholder.size(), range);

    if (update) {
        pdf.object(
            3,
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 7 0 R "
            "/Annots [5 0 R] >>");
        pdf.stream(7, "", "BT /F1 12 Tf 72 700 Td (Changed text) Tj ET");
        pdf.finishRevision();
    }
    return pdf.str();
}

static void
test_partial_signature()
{
    {
        ScrubObjectGraph graph;
        graph.processMemory("signed", signed_document(false));
        auto findings = scan(graph);
        assert(findings.size() == 1);
        assert(findings.count(ak_digital_signature) == 1);
    }

    auto data = signed_document(true);
    ScrubObjectGraph graph;
    graph.processMemory("scenario C", data);
    auto findings = scan(graph);
    assert(findings.count(ak_partial_signature_coverage) == 1);
    assert(findings.count(ak_digital_signature) == 0);

    // No safe remedy exists, so the document is rejected after the retry.
    auto job = make_job();
    job->processData("scenario C", data);
    assert(job->getStatus() == ss_rejected);
    assert(job->getExitCode() == ScrubJob::EXIT_REJECTED);
    assert(job->getOutput().empty());
    auto const& report = job->getReport();
    assert(report.getVerification().size() == 2);
    for (auto const& record: report.getVerification()) {
        assert(!record.passed());
        assert(record.residual.count(ak_partial_signature_coverage) == 1);
    }
    bool ignored = false;
    for (auto const& a: report.getActions().getActions()) {
        if (a.finding.getKind() == ak_partial_signature_coverage) {
            assert(a.action == sa_ignored);
            ignored = true;
        }
    }
    assert(ignored);
    assert(report.getError().find("PartialSignatureCoverage") != std::string::npos);

    // Waiving the category lets the rest of the document be cleaned.
    ScrubConfig config;
    config.waived.insert(ak_partial_signature_coverage);
    job = make_job(config);
    job->processData("scenario C", data);
    assert(job->getStatus() == ss_clean);
    assert(job->getReport().getWaived().count(ak_partial_signature_coverage) == 1);
    assert(!job->getOutput().empty());
}

static std::vector<std::pair<scrub_artifact_e, std::string>>
kinds_and_locations(ScrubFindingSet const& findings)
{
    std::vector<std::pair<scrub_artifact_e, std::string>> result;
    for (auto const& f: findings.getFindings()) {
        result.emplace_back(f.getKind(), f.describeLocation());
    }
    std::sort(result.begin(), result.end());
    return result;
}

static void
test_damaged_xref()
{
    TestPDF pdf;
    add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (Minutes) Tj ET");
    pdf.object(
        5, "<< /Author (J. Doe) /Producer (Editor 1.0) /CreationDate (D:20240101000000Z) >>");
    pdf.object(6, "<< /Note (left over) >>");
    pdf.finishRevision("/Root 1 0 R /Info 5 0 R");
    auto intact = pdf.str();
    auto damaged = intact;
    damaged.replace(damaged.rfind("xref\n0 1"), 4, "xrXf");

    ScrubObjectGraph g1;
    g1.processMemory("intact", intact);
    assert(!g1.isRecovered());
    ScrubObjectGraph g2;
    g2.processMemory("damaged", damaged);
    assert(g2.isRecovered());
    assert(g2.getObjectCount() == g1.getObjectCount());
    assert(!g2.getWarnings().empty());

    auto f1 = scan(g1);
    auto f2 = scan(g2);
    assert(f1.count(ak_info_metadata) == 2);
    assert(f1.count(ak_orphaned_object) == 1);
    assert(kinds_and_locations(f1) == kinds_and_locations(f2));

    auto job = make_job();
    job->processData("scenario D", damaged);
    assert(job->getStatus() == ss_clean);
    assert(!job->getReport().getWarnings().empty());
    ScrubObjectGraph out;
    out.processMemory("rebuilt", job->getOutput());
    assert(!out.isRecovered());
    assert(scan(out).empty());
    auto info = out.resolve(out.getTrailer().getKey("/Info"));
    assert(info.hasKey("/CreationDate"));
    assert(!info.hasKey("/Author"));
}

static void
test_encrypted()
{
    TestPDF pdf;
    add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (sealed) Tj ET");
    pdf.object(5, "<< /Filter /Standard /V 2 /R 3 /O (o) /U (u) /P -4 >>");
    pdf.finishRevision("/Root 1 0 R /Encrypt 5 0 R");
    auto data = pdf.str();

    auto job = make_job();
    job->processData("encrypted", data);
    assert(job->getStatus() == ss_rejected);
    assert(job->getExitCode() == ScrubJob::EXIT_REJECTED);
    assert(job->getOutput().empty());
    auto const& report = job->getReport();
    assert(report.getFindings().count(ak_encrypted) == 1);
    // The cleaner saw every finding, and the verifier recorded both attempts.
    for (auto const& f: report.getFindings().getFindings()) {
        assert(report.getActions().hasActionFor(f));
    }
    bool ignored = false;
    for (auto const& a: report.getActions().getActions()) {
        if (a.finding.getKind() == ak_encrypted) {
            assert(a.action == sa_ignored);
            ignored = true;
        }
    }
    assert(ignored);
    assert(report.getVerification().size() == 2);
    assert(!report.getVerification().back().passed());
    assert(report.getJSON().getDictItem("actions").isArray());

    // Waiving the finding doesn't make the document certifiable.
    ScrubConfig config;
    config.waived.insert(ak_encrypted);
    job = make_job(config);
    job->processData("encrypted", data);
    assert(job->getStatus() == ss_rejected);
    assert(job->getOutput().empty());
    assert(job->getReport().getError().find("encrypted") != std::string::npos);
}

static void
test_unrecoverable()
{
    auto job = make_job();
    job->processData("garbage", "this is not a PDF file at all\n");
    assert(job->getStatus() == ss_unrecoverable);
    assert(job->getExitCode() == ScrubJob::EXIT_UNRECOVERABLE);
    assert(job->getOutput().empty());
    assert(!job->getReport().getError().empty());
}

static void
test_cancelled()
{
    auto job = make_job();
    ScrubRunContext context;
    context.timestamp = "2026-01-15T10:00:00Z";
    context.cancel = ScrubCancel::create();
    context.cancel->cancel();
    job->setRunContext(context);
    job->processData("scenario A", confidential_in_old_revision());
    assert(job->getStatus() == ss_cancelled);
    assert(job->getExitCode() == ScrubJob::EXIT_CANCELLED);
    assert(job->getOutput().empty());
    assert(job->getReport().getFindings().empty());
    assert(job->getReport().getActions().getActions().empty());
}

int
main()
{
    test_superseded_page();
    test_trailing_data();
    test_partial_signature();
    test_damaged_xref();
    test_encrypted();
    test_unrecoverable();
    test_cancelled();
    std::cout << "scenario tests done" << std::endl;
    return 0;
}
