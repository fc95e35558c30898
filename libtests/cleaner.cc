#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/ScrubCleaner.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubScanner.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubVerifier.hh>

#include <iostream>
#include <map>

static std::shared_ptr<ScrubLogger>
quiet_logger()
{
    auto l = ScrubLogger::create();
    l->setInfo(l->discard());
    l->setWarn(l->discard());
    l->setError(l->discard());
    return l;
}

static std::map<std::string, std::string>
fixtures()
{
    std::map<std::string, std::string> result;

    {
        TestPDF pdf;
        add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (CONFIDENTIAL) Tj ET");
        pdf.finishRevision();
        pdf.object(2, "<< /Type /Pages /Kids [5 0 R] /Count 1 >>");
        pdf.object(5, "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 6 0 R >>");
        pdf.stream(6, "", "BT /F1 12 Tf 72 700 Td (Public) Tj ET");
        pdf.finishRevision();
        result["revisions"] = pdf.str();
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (text) Tj ET");
        pdf.finishRevision();
        pdf.append(binary_block(500));
        result["trailing"] = pdf.str();
    }
    {
        TestPDF pdf;
        pdf.object(1, "<< /Type /Catalog /Pages 2 0 R /Metadata 5 0 R >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(
            3,
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
            "/PieceInfo << /Editor << /Private (state) >> >> >>");
        pdf.stream(4, "", "BT 72 700 Td (text) Tj ET");
        pdf.stream(
            5,
            "/Type /Metadata /Subtype /XML",
            "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"><dc:creator>J. Doe</dc:creator></x:xmpmeta>");
        pdf.object(6, "<< /Author (J. Doe) /Title (Plans) /CreationDate (D:20240101000000Z) >>");
        pdf.finishRevision(
            "/Root 1 0 R /Info 6 0 R /ID [<00112233445566778899aabbccddeeff> "
            "<00112233445566778899aabbccddeeff>]");
        result["metadata"] = pdf.str();
    }
    {
        TestPDF pdf;
        pdf.object(
            1,
            "<< /Type /Catalog /Pages 2 0 R /OpenAction << /S /JavaScript /JS (app.alert\\(1\\)) "
            ">> /Names << /JavaScript << /Names [(init) 5 0 R] >> >> >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(
            3,
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
            "/Annots [<< /Type /Annot /Subtype /Link /Rect [0 0 0 0] /A << /S /Launch /F "
            "(cmd.exe) >> >>] >>");
        pdf.stream(4, "", "BT 72 700 Td (text) Tj ET");
        pdf.object(5, "<< /S /JavaScript /JS (this.print\\(\\)) >>");
        pdf.finishRevision();
        result["actions"] = pdf.str();
    }
    {
        TestPDF pdf;
        std::string visible = "BT 72 700 Td (text) Tj ET";
        pdf.object(1, "<< /Type /Catalog /Pages 2 0 R >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(3, "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R >>");
        // /Length stops short of the data.
        pdf.stream(4, "", visible + "\nSECRET PAYLOAD", static_cast<long long>(visible.size()));
        pdf.finishRevision();
        result["length"] = pdf.str();
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (text) Tj ET\n%" + std::string(400, 'A') + "\n");
        pdf.finishRevision();
        result["comments"] = pdf.str();
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (visible) Tj ET\nBT 72 5000 Td (out of sight) Tj ET");
        pdf.finishRevision();
        result["off-page"] = pdf.str();
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (text) Tj ET", "/Resources 9 0 R");
        pdf.object(5, "<< /Unused true /Next 6 0 R >>");
        pdf.object(6, "<< /Unused true >>");
        pdf.finishRevision();
        result["structure"] = pdf.str();
    }
    {
        TestPDF pdf;
        pdf.object(
            1,
            "<< /Type /Catalog /Pages 2 0 R /Names << /EmbeddedFiles << /Names [(f.bin) 5 0 R] "
            ">> >> >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(
            3,
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
            "/Resources << /XObject << /Im1 7 0 R >> >> >>");
        pdf.stream(4, "", "q 8 0 0 8 72 700 cm /Im1 Do Q");
        pdf.object(5, "<< /Type /Filespec /F (f.bin) /EF << /F 6 0 R >> >>");
        pdf.stream(6, "/Type /EmbeddedFile", binary_block(4096, 3));
        pdf.stream(
            7,
            "/Type /XObject /Subtype /Image /Width 8 /Height 8 /ColorSpace /DeviceGray "
            "/BitsPerComponent 8",
            std::string(64, '\x80') + "extra bytes beyond the samples");
        pdf.finishRevision();
        result["hidden"] = pdf.str();
    }
    {
        TestPDF pdf;
        pdf.object(
            1,
            "<< /Type /Catalog /Pages 2 0 R /OCProperties << /OCGs [5 0 R 6 0 R] /D << /OFF [6 0 "
            "R] >> >> >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(
            3,
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
            "/Resources << /Properties << /Print 5 0 R /Notes 6 0 R >> >> >>");
        pdf.stream(
            4,
            "",
            "/OC /Print BDC BT 72 700 Td (visible) Tj ET EMC\n"
            "/OC /Notes BDC BT 72 650 Td (reviewer notes) Tj ET EMC\n");
        pdf.object(5, "<< /Type /OCG /Name (Print) >>");
        pdf.object(6, "<< /Type /OCG /Name (Notes) >>");
        pdf.finishRevision();
        result["layers"] = pdf.str();
    }
    return result;
}

static ScrubFindingSet
scan(ScrubObjectGraph const& graph)
{
    return ScrubScanner(ScrubConfig(), quiet_logger()).scan(graph);
}

static void
test_fixture_findings()
{
    auto f = fixtures();
    auto check = [&f](std::string const& name, scrub_artifact_e kind, size_t count) {
        ScrubObjectGraph graph;
        graph.processMemory(name, f[name]);
        auto found = scan(graph).count(kind);
        if (found != count) {
            std::cout << name << ": " << ScrubFinding::kindName(kind) << " found " << found
                      << ", wanted " << count << std::endl;
        }
        assert(found == count);
    };
    check("revisions", ak_revision_history, 3);
    check("trailing", ak_hidden_trailing_data, 1);
    check("metadata", ak_info_metadata, 2);
    check("metadata", ak_xmp_metadata, 1);
    check("metadata", ak_document_id, 1);
    check("metadata", ak_private_app_data, 1);
    check("actions", ak_hidden_action, 3);
    check("length", ak_stream_length_mismatch, 1);
    check("comments", ak_anomalous_stream_size, 1);
    check("off-page", ak_off_page_content, 1);
    check("structure", ak_dangling_reference, 1);
    check("structure", ak_orphaned_object, 2);
    check("hidden", ak_high_entropy_payload, 1);
    check("hidden", ak_steganographic_padding, 1);
    check("layers", ak_hidden_optional_content, 1);
}

static void
test_completeness_and_idempotence()
{
    for (auto const& [name, data]: fixtures()) {
        ScrubObjectGraph graph;
        graph.processMemory(name, data);
        auto findings = scan(graph);
        assert(!findings.empty());

        ScrubCleaner cleaner(ScrubConfig(), quiet_logger());
        auto report = cleaner.clean(graph, findings);
        assert(report.getActions().size() == findings.size());
        for (auto const& f: findings.getFindings()) {
            assert(report.hasActionFor(f));
        }

        // Nothing is left for a second scan to find.
        auto residual = scan(graph);
        if (!residual.empty()) {
            std::cout << name << ": " << residual.getJSON().unparse() << std::endl;
        }
        assert(residual.empty());

        // Cleaning the cleaned graph changes nothing.
        auto hash = ScrubVerifier::canonicalHash(graph);
        auto again = cleaner.clean(graph, residual, 2);
        assert(again.getActions().empty());
        assert(ScrubVerifier::canonicalHash(graph) == hash);
    }
}

static void
test_remedies()
{
    auto f = fixtures();
    {
        ScrubObjectGraph graph;
        graph.processMemory("off-page", f["off-page"]);
        ScrubCleaner(ScrubConfig(), quiet_logger()).clean(graph, scan(graph));
        auto page = graph.getPages().at(0);
        auto stream = graph.resolveStream(graph.getObject(page).getKey("/Contents"));
        assert(stream && stream->decode() == ScrubStream::ds_ok);
        auto const& text = stream->getDecodedData();
        assert(text.find("(visible)") != std::string::npos);
        assert(text.find("out of sight") == std::string::npos);
    }
    {
        ScrubObjectGraph graph;
        graph.processMemory("length", f["length"]);
        auto report = ScrubCleaner(ScrubConfig(), quiet_logger()).clean(graph, scan(graph));
        assert(report.getActions().at(0).action == sa_removed);
        assert(report.getActions().at(0).delta == -15);
        auto stream = graph.resolveStream(graph.getObject(graph.getPages().at(0)).getKey("/Contents"));
        assert(stream->getExcessData().empty());
        assert(stream->getRawData() == "BT 72 700 Td (text) Tj ET");
    }
    {
        ScrubObjectGraph graph;
        graph.processMemory("metadata", f["metadata"]);
        auto report = ScrubCleaner(ScrubConfig(), quiet_logger()).clean(graph, scan(graph));
        auto info = graph.resolve(graph.getTrailer().getKey("/Info"));
        assert(info.hasKey("/CreationDate"));
        assert(!info.hasKey("/Author") && !info.hasKey("/Title"));
        assert(!graph.getTrailer().hasKey("/ID"));
        assert(!graph.getRoot().hasKey("/Metadata"));
        size_t redacted = 0;
        for (auto const& a: report.getActions()) {
            if (a.action == sa_redacted) {
                ++redacted;
            }
        }
        assert(redacted == 2);
    }
    {
        // Unreachable objects go. Reachable ones are left alone.
        ScrubObjectGraph graph;
        graph.processMemory("structure", f["structure"]);
        auto before = graph.getObjectCount();
        ScrubCleaner(ScrubConfig(), quiet_logger()).clean(graph, scan(graph));
        assert(graph.getObjectCount() == before - 2);
        assert(graph.getObject(graph.getPages().at(0)).getKey("/Resources").isNull());
    }
}

static void
test_hidden_layers()
{
    auto f = fixtures();
    ScrubObjectGraph graph;
    graph.processMemory("layers", f["layers"]);
    auto findings = scan(graph);
    assert(findings.size() == 1);
    auto report = ScrubCleaner(ScrubConfig(), quiet_logger()).clean(graph, findings);
    assert(report.getActions().at(0).action == sa_removed);
    assert(report.getActions().at(0).delta < 0);
    auto page = graph.getPages().at(0);
    auto stream = graph.resolveStream(graph.getObject(page).getKey("/Contents"));
    assert(stream && stream->decode() == ScrubStream::ds_ok);
    auto const& text = stream->getDecodedData();
    assert(text.find("(visible) Tj") != std::string::npos);
    assert(text.find("/Print") != std::string::npos);
    assert(text.find("reviewer notes") == std::string::npos);
    // The group itself stays; nothing is drawn in it any more.
    assert(graph.getRoot().hasKey("/OCProperties"));
    assert(scan(graph).empty());
}

static void
test_partial_signature_ignored()
{
    TestPDF pdf;
    pdf.object(1, "<< /Type /Catalog /Pages 2 0 R /AcroForm << /Fields [5 0 R] >> >>");
    pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    pdf.object(3, "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R >>");
    pdf.stream(4, "", "BT 72 700 Td (text) Tj ET");
    pdf.object(
        5, "<< /FT /Sig /T (S) /V << /Type /Sig /ByteRange [0 10 20 30] /Contents <00> >> >>");
    pdf.finishRevision();

    ScrubObjectGraph graph;
    graph.processMemory("signed", pdf.str());
    auto findings = scan(graph);
    assert(findings.size() == 1);
    assert(findings.count(ak_partial_signature_coverage) == 1);
    assert(findings.getFindings().at(0).getKey() == "/V");

    ScrubCleaner cleaner(ScrubConfig(), quiet_logger());
    auto report = cleaner.clean(graph, findings);
    assert(report.getActions().at(0).action == sa_ignored);
    assert(report.remedialCount() == 0);
    assert(scan(graph).size() == 1);

    // Force removal takes the entry out of the field.
    auto forced = cleaner.forceRemove(graph, scan(graph), 3);
    assert(forced.getActions().at(0).action == sa_removed);
    assert(scan(graph).empty());
}

static void
test_stale_findings()
{
    auto f = fixtures();
    ScrubObjectGraph graph;
    graph.processMemory("metadata", f["metadata"]);
    auto findings = scan(graph);
    ScrubCleaner cleaner(ScrubConfig(), quiet_logger());
    auto first = cleaner.clean(graph, findings);
    assert(first.remedialCount() > 0);
    auto hash = ScrubVerifier::canonicalHash(graph);

    // Replaying the same findings finds nothing left to remove. Every finding still gets an
    // action, but none of them counts as a remedy.
    auto replay = cleaner.clean(graph, findings, 2);
    assert(replay.getActions().size() == findings.size());
    for (auto const& a: replay.getActions()) {
        assert(a.stale);
        assert(a.action == sa_removed);
        assert(a.delta == 0);
        assert(a.reason == "already resolved");
    }
    assert(replay.remedialCount() == 0);
    assert(ScrubVerifier::canonicalHash(graph) == hash);

    auto forced = cleaner.forceRemove(graph, findings, 3);
    assert(forced.getActions().size() == findings.size());
    assert(forced.remedialCount() == 0);
    assert(ScrubVerifier::canonicalHash(graph) == hash);
}

int
main()
{
    test_fixture_findings();
    test_completeness_and_idempotence();
    test_remedies();
    test_hidden_layers();
    test_partial_signature_ignored();
    test_stale_findings();
    std::cout << "cleaner tests done" << std::endl;
    return 0;
}
