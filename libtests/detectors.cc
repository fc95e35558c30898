#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/Pl_MD5.hh>
#include <pdfscrub/ScrubDCT.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubScanner.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <iostream>

static std::shared_ptr<ScrubLogger>
quiet_logger()
{
    auto l = ScrubLogger::create();
    l->setInfo(l->discard());
    l->setWarn(l->discard());
    l->setError(l->discard());
    return l;
}

static std::vector<ScrubFinding>
run(scrub_detector_e detector,
    std::string const& data,
    ScrubConfig const& config = ScrubConfig())
{
    ScrubObjectGraph graph;
    graph.processMemory("detector test", data);
    auto findings = ScrubScanner(config, quiet_logger()).runDetector(detector, graph);
    for (auto const& f: findings) {
        assert(f.getDetector() == detector);
    }
    return findings;
}

static size_t
count(std::vector<ScrubFinding> const& findings, scrub_artifact_e kind)
{
    size_t n = 0;
    for (auto const& f: findings) {
        if (f.getKind() == kind) {
            ++n;
        }
    }
    return n;
}

static ScrubFinding const&
first(std::vector<ScrubFinding> const& findings, scrub_artifact_e kind)
{
    for (auto const& f: findings) {
        if (f.getKind() == kind) {
            return f;
        }
    }
    throw std::logic_error(std::string("no finding of kind ") + ScrubFinding::kindName(kind));
}

// Objects 1 through 4 with extra entries in the catalog and the page
static void
page_doc(
    TestPDF& pdf,
    std::string const& content,
    std::string const& catalog_extra = "",
    std::string const& page_extra = "")
{
    pdf.object(1, "<< /Type /Catalog /Pages 2 0 R " + catalog_extra + " >>");
    pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    pdf.object(
        3,
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R " + page_extra +
            " >>");
    pdf.stream(4, "", content);
}

static void
test_structural()
{
    {
        TestPDF pdf;
        pdf.object(1, "<< /Type /Catalog /Pages 2 0 R >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(3, "<< /Type /Page /Parent 2 0 R /Contents 4 0 R /Resources 9 0 R >>");
        pdf.stream(4, "/Filter /FlateDecode", "this is not zlib data");
        pdf.object(5, "<< /Orphan true >>");
        pdf.finishRevision();
        auto findings = run(sd_structural, pdf.str());
        assert(findings.size() == 3);
        assert(first(findings, ak_orphaned_object).getObjGen() == ScrubObjGen(5, 0));
        assert(first(findings, ak_orphaned_object).getSeverity() == sev_low);
        auto const& dangling = first(findings, ak_dangling_reference);
        assert(dangling.getObjGen() == ScrubObjGen(3, 0));
        assert(dangling.getEvidence().find("9 0") != std::string::npos);
        auto const& malformed = first(findings, ak_malformed);
        assert(malformed.getObjGen() == ScrubObjGen(4, 0));
        assert(malformed.getEvidence().starts_with("stream data: "));
    }
    {
        // Two revisions: the first is history, and its old page is reachable only from there.
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (old) Tj ET");
        pdf.finishRevision();
        pdf.object(2, "<< /Type /Pages /Kids [5 0 R] /Count 1 >>");
        pdf.object(5, "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 6 0 R >>");
        pdf.stream(6, "", "BT 72 700 Td (new) Tj ET");
        pdf.finishRevision();
        auto findings = run(sd_structural, pdf.str());
        size_t ranges = 0;
        ScrubObjGen::set history;
        for (auto const& f: findings) {
            if (f.getKind() == ak_revision_history) {
                if (f.isByteRange()) {
                    ++ranges;
                    assert(f.getOffset() == 0);
                } else {
                    history.insert(f.getObjGen());
                }
            }
        }
        assert(ranges == 1);
        assert(history.contains(ScrubObjGen(3, 0)));
        assert(history.contains(ScrubObjGen(4, 0)));
        assert(count(findings, ak_duplicate_object_id) == 1);
        assert(first(findings, ak_duplicate_object_id).getObjGen() == ScrubObjGen(2, 0));
        assert(count(findings, ak_orphaned_object) == 0);
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT ET");
        pdf.object(5, "<< /Filter /Standard /V 1 /R 2 /O (o) /U (u) /P -4 >>");
        pdf.finishRevision("/Root 1 0 R /Encrypt 5 0 R");
        auto findings = run(sd_structural, pdf.str());
        assert(count(findings, ak_encrypted) == 1);
        assert(first(findings, ak_encrypted).describeLocation() == "trailer /Encrypt");
    }
}

static void
test_metadata()
{
    TestPDF pdf;
    page_doc(
        pdf,
        "BT 72 700 Td (text) Tj ET",
        "/Metadata 6 0 R",
        "/PieceInfo << /Illustrator << /Private 7 >> >>");
    pdf.object(5, "<< /Author (A. Writer) /CreationDate (D:20240101) >>");
    pdf.stream(
        6,
        "/Type /Metadata /Subtype /XML",
        "<x:xmpmeta><xmp:CreatorTool>Writer 9</xmp:CreatorTool></x:xmpmeta>");
    // An identifier derived from the content says nothing about the document's origin.
    auto content_id = ScrubUtil::hex_encode(Pl_MD5::rawDigest(pdf.str()));
    pdf.finishRevision(
        "/Root 1 0 R /Info 5 0 R /ID [<" + content_id + "> <" + content_id + ">]");
    auto findings = run(sd_metadata, pdf.str());
    assert(findings.size() == 3);
    auto const& info = first(findings, ak_info_metadata);
    assert(info.getObjGen() == ScrubObjGen(5, 0));
    assert(info.getKey() == "/Author");
    assert(info.getEvidence() == "A. Writer");
    auto const& xmp = first(findings, ak_xmp_metadata);
    assert(xmp.getObjGen() == ScrubObjGen(1, 0));
    assert(xmp.getKey() == "/Metadata");
    assert(xmp.getEvidence().find("xmp:CreatorTool Writer 9") != std::string::npos);
    auto const& piece = first(findings, ak_private_app_data);
    assert(piece.getObjGen() == ScrubObjGen(3, 0));
    assert(piece.getEvidence() == "application data /Illustrator");
    assert(count(findings, ak_document_id) == 0);

    ScrubConfig config;
    config.allowed_metadata_fields = {"Author", "CreationDate"};
    assert(count(run(sd_metadata, pdf.str(), config), ak_info_metadata) == 0);

    TestPDF other;
    add_one_page(other, "BT ET");
    other.finishRevision("/Root 1 0 R /ID [<00ff> <00ff>]");
    findings = run(sd_metadata, other.str());
    assert(findings.size() == 1);
    assert(first(findings, ak_document_id).getEvidence() == "<00ff> <00ff>");
}

static void
test_signature()
{
    auto signed_doc = [](std::string const& byte_range, bool with_contents) {
        TestPDF pdf;
        page_doc(pdf, "BT ET", "/AcroForm << /Fields [5 0 R] /SigFlags 3 >>");
        pdf.object(5, "<< /FT /Sig /T (Signature1) /V 6 0 R >>");
        pdf.object(
            6,
            std::string("<< /Type /Sig /Filter /Adobe.PPKLite /SubFilter /adbe.pkcs7.detached") +
                " /Name (Alice) /ByteRange " + byte_range +
                (with_contents ? " /Contents <3082>" : "") + " >>");
        pdf.finishRevision();
        return pdf.str();
    };

    auto findings = run(sd_signature, signed_doc("[0 0 0 99999]", true));
    assert(findings.size() == 1);
    assert(first(findings, ak_digital_signature).getObjGen() == ScrubObjGen(6, 0));
    assert(
        first(findings, ak_digital_signature).getEvidence() ==
        "digital signature (Alice, /adbe.pkcs7.detached)");

    findings = run(sd_signature, signed_doc("[0 10 20 30]", true));
    assert(findings.size() == 1);
    auto const& partial = first(findings, ak_partial_signature_coverage);
    assert(partial.getObjGen() == ScrubObjGen(6, 0));
    assert(partial.getEvidence().starts_with("signature covers 50 of "));

    // A cleared signature value identifies no one.
    assert(run(sd_signature, signed_doc("[0 10 20 30]", false)).empty());

    // Ranges that can't be part of the file say nothing about what was signed.
    for (auto const& bad:
         {"[0 1 9223372036854775807 9223372036854775807]",
          "[0 10 -20 30]",
          "[0 10 /Twenty 30]",
          "[99999 0 0 10]"}) {
        findings = run(sd_signature, signed_doc(bad, true));
        assert(findings.size() == 1);
        assert(count(findings, ak_digital_signature) == 0);
        auto const& invalid = first(findings, ak_partial_signature_coverage);
        assert(invalid.getSeverity() == sev_high);
        assert(invalid.getEvidence().find("coverage is unknown") != std::string::npos);
    }

    // A signature dictionary stored directly in the field
    TestPDF pdf;
    page_doc(pdf, "BT ET", "/AcroForm << /Fields [5 0 R] >>");
    pdf.object(5, "<< /FT /Sig /V << /Type /Sig /ByteRange [0 1 2 99999] /Contents <00> >> >>");
    pdf.finishRevision();
    findings = run(sd_signature, pdf.str());
    assert(findings.size() == 1);
    assert(findings.at(0).getObjGen() == ScrubObjGen(5, 0));
    assert(findings.at(0).getKey() == "/V");
}

static void
test_stream()
{
    {
        TestPDF pdf;
        pdf.object(1, "<< /Type /Catalog /Pages 2 0 R >>");
        pdf.object(2, "<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
        pdf.object(
            3,
            "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents [4 0 R 5 0 R] >>");
        pdf.stream(4, "", "BT 72 700 Td (shown) Tj ET\nSECRET", 26);
        pdf.stream(5, "", "q Q  \n ", 3);
        pdf.finishRevision();
        auto findings = run(sd_stream, pdf.str());
        // Trailing white space after the declared length is harmless.
        assert(findings.size() == 1);
        auto const& f = first(findings, ak_stream_length_mismatch);
        assert(f.getObjGen() == ScrubObjGen(4, 0));
        assert(f.getEvidence().starts_with("7 bytes of data after the declared /Length of 26"));
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (x) Tj ET\n%" + std::string(400, 'a') + "\n");
        pdf.finishRevision();
        auto findings = run(sd_stream, pdf.str());
        assert(findings.size() == 1);
        assert(first(findings, ak_anomalous_stream_size).getObjGen() == ScrubObjGen(4, 0));
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT /F1 1 Tf 72 700 Td (shown) Tj ET BT 72 5000 Td (far away) Tj ET");
        pdf.finishRevision();
        auto findings = run(sd_stream, pdf.str());
        assert(findings.size() == 1);
        auto const& f = first(findings, ak_off_page_content);
        assert(f.getObjGen() == ScrubObjGen(3, 0));
        assert(f.getKey() == "/Contents");
        assert(f.getEvidence().starts_with("1 text object(s) off the page"));
    }
    {
        TestPDF pdf;
        add_one_page(pdf, "BT 72 700 Td (normal) Tj ET");
        pdf.finishRevision();
        assert(run(sd_stream, pdf.str()).empty());
    }
}

static std::string
image_doc(std::string const& image_entries, std::string const& samples)
{
    TestPDF pdf;
    page_doc(pdf, "q 64 0 0 64 0 0 cm /Im1 Do Q", "", "/Resources << /XObject << /Im1 5 0 R >> >>");
    pdf.stream(5, "/Type /XObject /Subtype /Image " + image_entries, samples);
    pdf.finishRevision();
    return pdf.str();
}

static void
test_hidden_data()
{
    std::string gray = "/Width 64 /Height 64 /ColorSpace /DeviceGray /BitsPerComponent 8";

    // Sample values whose pairs are equally common look like an LSB embedding.
    std::string uniform;
    std::string even;
    for (size_t i = 0; i < 64 * 64; ++i) {
        uniform += static_cast<char>(i % 256);
        even += static_cast<char>((i % 128) * 2);
    }
    auto findings = run(sd_hidden_data, image_doc(gray, uniform));
    assert(findings.size() == 1);
    assert(first(findings, ak_lsb_payload).getObjGen() == ScrubObjGen(5, 0));
    assert(run(sd_hidden_data, image_doc(gray, even)).empty());

    ScrubConfig strict;
    strict.stego_threshold = 1.0;
    assert(run(sd_hidden_data, image_doc(gray, uniform), strict).empty());

    findings = run(sd_hidden_data, image_doc(gray, even + std::string(30, 'x')));
    assert(findings.size() == 1);
    assert(
        first(findings, ak_steganographic_padding).getEvidence() ==
        "30 bytes beyond the 4096 bytes of image samples");

    std::string small(64, '\x80');
    auto jpeg = ScrubDCT::compress(small, 8, 8, 1, 75);
    findings = run(
        sd_hidden_data,
        image_doc(
            "/Width 8 /Height 8 /ColorSpace /DeviceGray /BitsPerComponent 8 /Filter /DCTDecode",
            jpeg + "PAYLOAD"));
    assert(count(findings, ak_steganographic_padding) == 1);
    assert(
        first(findings, ak_steganographic_padding).getEvidence() ==
        "7 bytes after the JPEG end-of-image marker");

    // Embedded files
    auto attachment = [](std::string const& contents) {
        TestPDF pdf;
        page_doc(pdf, "BT ET", "/Names << /EmbeddedFiles << /Names [(a.bin) 5 0 R] >> >>");
        pdf.object(5, "<< /Type /Filespec /F (a.bin) /EF << /F 6 0 R >> >>");
        pdf.stream(6, "/Type /EmbeddedFile", contents);
        pdf.finishRevision();
        return pdf.str();
    };
    findings = run(sd_hidden_data, attachment(binary_block(4096, 3)));
    assert(findings.size() == 1);
    assert(first(findings, ak_high_entropy_payload).getObjGen() == ScrubObjGen(6, 0));
    assert(run(sd_hidden_data, attachment(std::string(4096, 'a'))).empty());
    // Too short to judge
    assert(run(sd_hidden_data, attachment(binary_block(512, 3))).empty());

    // Trailing data
    TestPDF pdf;
    add_one_page(pdf, "BT ET");
    pdf.finishRevision();
    auto eof = pdf.size();
    pdf.append("after the end");
    findings = run(sd_hidden_data, pdf.str());
    assert(findings.size() == 1);
    auto const& trailing = first(findings, ak_hidden_trailing_data);
    assert(trailing.isByteRange());
    assert(trailing.getOffset() == static_cast<scrub_offset_t>(eof));
    assert(trailing.getLength() == 13);
}

static void
test_actions()
{
    {
        TestPDF pdf;
        page_doc(
            pdf,
            "BT ET",
            "/OpenAction << /S /GoTo /D [3 0 R /Fit] /Next << /S /Launch /F (calc.exe) >> >>");
        pdf.finishRevision();
        auto findings = run(sd_hidden_data, pdf.str());
        assert(findings.size() == 1);
        assert(findings.at(0).getKind() == ak_hidden_action);
        assert(findings.at(0).getObjGen() == ScrubObjGen(1, 0));
        assert(findings.at(0).getKey() == "/OpenAction/Next");
        assert(findings.at(0).getEvidence() == "Launch: calc.exe");
    }
    {
        TestPDF pdf;
        page_doc(pdf, "BT ET", "", "/Annots [5 0 R 6 0 R]");
        // Visible link: the user sees what they click
        pdf.object(
            5, "<< /Type /Annot /Subtype /Link /Rect [10 10 100 30] /A << /S /Launch /F (a) >> >>");
        // Hidden link
        pdf.object(
            6,
            "<< /Type /Annot /Subtype /Link /F 2 /Rect [10 10 100 30]"
            " /A << /S /JavaScript /JS (this.submitForm\\(\\)) >> >>");
        pdf.finishRevision();
        auto findings = run(sd_hidden_data, pdf.str());
        assert(findings.size() == 1);
        assert(findings.at(0).getObjGen() == ScrubObjGen(6, 0));
        assert(findings.at(0).getKey() == "/A");
        assert(findings.at(0).getEvidence() == "JavaScript: this.submitForm()");
    }
}

static void
test_optional_content()
{
    auto layered = [](std::string const& oc_properties, std::string const& properties) {
        TestPDF pdf;
        page_doc(
            pdf,
            "/OC /Shown BDC BT 72 700 Td (visible) Tj ET EMC\n"
            "/OC /Draft BDC BT 72 650 Td (draft) Tj /OC /Shown BDC (nested) Tj EMC ET EMC\n"
            "/Span << /ActualText (x) >> BDC BT 72 600 Td (plain) Tj ET EMC",
            "/OCProperties << /OCGs [5 0 R 6 0 R] " + oc_properties + " >>",
            "/Resources << /Properties << " + properties + " >> >>");
        pdf.object(5, "<< /Type /OCG /Name (Shown) >>");
        pdf.object(6, "<< /Type /OCG /Name (Draft) >>");
        pdf.object(7, "<< /Type /OCMD /OCGs [5 0 R 6 0 R] /P /AllOn >>");
        pdf.finishRevision();
        return pdf.str();
    };

    // A group the default configuration turns off
    auto findings =
        run(sd_hidden_data, layered("/D << /OFF [6 0 R] >>", "/Shown 5 0 R /Draft 6 0 R"));
    assert(findings.size() == 1);
    auto const& hidden = first(findings, ak_hidden_optional_content);
    assert(hidden.getObjGen() == ScrubObjGen(3, 0));
    assert(hidden.getKey() == "/Contents");
    assert(hidden.getSeverity() == sev_high);
    assert(hidden.getEvidence().starts_with("1 marked-content sequence(s)"));
    assert(hidden.getEvidence().ends_with(": /Draft"));

    // Everything is visible.
    assert(run(sd_hidden_data, layered("/D << >>", "/Shown 5 0 R /Draft 6 0 R")).empty());
    assert(run(sd_hidden_data, layered("", "/Shown 5 0 R /Draft 6 0 R")).empty());

    // With /BaseState /OFF, only the groups listed in /ON are shown.
    findings = run(
        sd_hidden_data,
        layered("/D << /BaseState /OFF /ON [5 0 R] >>", "/Shown 5 0 R /Draft 6 0 R"));
    assert(findings.size() == 1);
    assert(first(findings, ak_hidden_optional_content).getEvidence().ends_with(": /Draft"));
    findings = run(sd_hidden_data, layered("/D << /BaseState /OFF >>", "/Shown 5 0 R /Draft 6 0 R"));
    assert(findings.size() == 1);
    assert(first(findings, ak_hidden_optional_content).getEvidence().starts_with("2 "));

    // A membership dictionary that needs every group on is hidden when one of them is off.
    findings = run(sd_hidden_data, layered("/D << /OFF [6 0 R] >>", "/Shown 7 0 R /Draft 5 0 R"));
    assert(findings.size() == 1);
    assert(first(findings, ak_hidden_optional_content).getEvidence().ends_with(": /Shown"));
}

static void
test_scanner()
{
    TestPDF pdf;
    add_one_page(pdf, "BT ET");
    pdf.object(5, "<< /Orphan true >>");
    pdf.finishRevision();
    pdf.append("junk");
    ScrubObjectGraph graph;
    graph.processMemory("scanner", pdf.str());

    auto all = ScrubScanner(ScrubConfig(), quiet_logger()).scan(graph);
    assert(all.size() == 2);
    assert(all.count(ak_orphaned_object) == 1);
    assert(all.count(ak_hidden_trailing_data) == 1);
    assert(all.getFindings().at(0).getId() == "F1");
    assert(all.getFindings().at(1).getId() == "F2");

    ScrubConfig config;
    config.disabled_detectors = {sd_hidden_data};
    auto some = ScrubScanner(config, quiet_logger()).scan(graph);
    assert(some.size() == 1);
    assert(some.count(ak_orphaned_object) == 1);

    // Cancellation is not a detector fault.
    auto cancel = ScrubCancel::create();
    cancel->cancel();
    ScrubScanner cancelled(ScrubConfig(), quiet_logger(), cancel);
    try {
        cancelled.runDetector(sd_hidden_data, graph);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_cancelled);
    }
    try {
        cancelled.scan(graph);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_cancelled);
    }
}

int
main()
{
    test_structural();
    test_metadata();
    test_signature();
    test_stream();
    test_hidden_data();
    test_actions();
    test_optional_content();
    test_scanner();
    std::cout << "detector tests done" << std::endl;
    return 0;
}
