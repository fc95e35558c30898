#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/Pl_MD5.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubRunContext.hh>

#include <iostream>

static std::string
simple()
{
    TestPDF pdf("1.5");
    add_one_page(pdf, "BT 72 700 Td (one) Tj ET");
    pdf.finishRevision();
    return pdf.str();
}

static void
test_single_revision()
{
    auto data = simple();
    ScrubObjectGraph graph;
    graph.processMemory("simple", data);
    assert(graph.getPDFVersion() == "1.5");
    assert(graph.getInputSize() == static_cast<scrub_offset_t>(data.size()));
    assert(graph.getObjectCount() == 4);
    assert(!graph.isRecovered());
    assert(!graph.isEncrypted());
    assert(graph.getWarnings().empty());
    assert(graph.getRevisions().size() == 1);
    auto const& rev = graph.getRevisions().at(0);
    assert(rev.start == 0);
    assert(rev.xref_end == static_cast<scrub_offset_t>(data.size()));
    assert(!rev.is_stream);
    assert(graph.getSupersededBodies().empty());
    assert(graph.getUnindexedBodies().empty());
    assert(!graph.hasTrailingData());
    assert(graph.reachable().size() == 4);
    assert(graph.dangling().empty());

    auto xref = static_cast<size_t>(rev.xref_offset);
    assert(data.substr(xref, 4) == "xref");
    assert(graph.getContentId() == Pl_MD5::rawDigest(std::string_view(data).substr(0, xref)));

    auto pages = graph.getPages();
    assert(pages.size() == 1);
    assert(pages.at(0) == ScrubObjGen(3, 0));
    assert(graph.getObjectOffset(ScrubObjGen(1, 0)) == static_cast<scrub_offset_t>(data.find("1 0 obj")));
    auto stream = graph.getStream(ScrubObjGen(4, 0));
    assert(stream);
    assert(stream->getRawData() == "BT 72 700 Td (one) Tj ET");
    assert(graph.getRoot().isDictionaryOfType("/Catalog"));
}

static void
test_incremental_updates()
{
    TestPDF pdf;
    add_one_page(pdf, "BT 72 700 Td (first) Tj ET");
    pdf.object(5, "<< /Note (scratch) >>");
    pdf.finishRevision();
    auto first_end = pdf.size();
    pdf.object(1, "<< /Type /Catalog /Pages 2 0 R /Lang (en) >>");
    pdf.remove(5);
    pdf.finishRevision();
    auto data = pdf.str();

    ScrubObjectGraph graph;
    graph.processMemory("updated", data);
    auto const& revisions = graph.getRevisions();
    assert(revisions.size() == 2);
    assert(revisions.at(0).start == 0);
    assert(revisions.at(0).xref_end == static_cast<scrub_offset_t>(first_end));
    assert(revisions.at(1).start == static_cast<scrub_offset_t>(first_end));
    assert(revisions.at(1).xref_end == static_cast<scrub_offset_t>(data.size()));
    assert(revisions.at(1).freed.size() == 1);
    assert(revisions.at(1).trailer.getKey("/Prev").isInteger());
    // The merged trailer is the newest one, without /Prev.
    assert(!graph.getTrailer().hasKey("/Prev"));

    assert(graph.getRoot().hasKey("/Lang"));
    assert(!graph.hasObject(ScrubObjGen(5, 0)));
    auto const& superseded = graph.getSupersededBodies();
    assert(superseded.size() == 2);
    bool old_catalog = false;
    bool deleted = false;
    for (auto const& body: superseded) {
        assert(body.revision == 0);
        if (body.og == ScrubObjGen(1, 0)) {
            old_catalog = !body.value.hasKey("/Lang");
        } else if (body.og == ScrubObjGen(5, 0)) {
            deleted = true;
        }
    }
    assert(old_catalog && deleted);

    // The first trailer still reaches the old catalog's page tree and the deleted object isn't
    // referenced by anything.
    auto old_view = graph.reachableFromRevision(0);
    assert(old_view.contains(ScrubObjGen(1, 0)));
    assert(old_view.contains(ScrubObjGen(4, 0)));
    assert(!old_view.contains(ScrubObjGen(5, 0)));
    assert(graph.reachableFromRevision(7).empty());

    assert(graph.dropBodies(ScrubObjGen(5, 0)) == 1);
    assert(graph.getSupersededBodies().size() == 1);
    graph.collapseRevisions();
    assert(graph.getRevisions().size() == 1);
    assert(graph.getSupersededBodies().empty());
    assert(graph.getRevisions().at(0).start == 0);
}

static void
test_unindexed_and_trailing()
{
    TestPDF pdf;
    add_one_page(pdf, "BT 72 700 Td (page) Tj ET");
    pdf.append("9 0 obj\n<< /Hidden (not in any xref) >>\nendobj\n");
    pdf.append("3 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 10 10] >>\nendobj\n");
    pdf.finishRevision();
    pdf.append("\r\n  \n");
    {
        ScrubObjectGraph graph;
        graph.processMemory("unindexed", pdf.str());
        auto const& unindexed = graph.getUnindexedBodies();
        assert(unindexed.size() == 2);
        assert(unindexed.at(0).og == ScrubObjGen(9, 0));
        assert(unindexed.at(0).value.getKey("/Hidden").getUTF8Value() == "not in any xref");
        assert(unindexed.at(1).og == ScrubObjGen(3, 0));
        // White space after %%EOF is not hidden data.
        assert(!graph.hasTrailingData());
    }

    pdf.append("hidden words");
    ScrubObjectGraph graph;
    graph.processMemory("trailing", pdf.str());
    assert(graph.hasTrailingData());
    auto eof = pdf.str().rfind("%%EOF") + 6;
    assert(graph.getTrailingDataOffset() == static_cast<scrub_offset_t>(eof));
    assert(graph.getTrailingDataLength() == static_cast<scrub_offset_t>(pdf.size() - eof));
    graph.clearTrailingData();
    assert(!graph.hasTrailingData());
}

static void
test_recovery()
{
    // /Prev pointing back at the same table
    TestPDF pdf;
    add_one_page(pdf, "BT 72 700 Td (loop) Tj ET");
    auto at = pdf.size();
    pdf.finishRevision("/Root 1 0 R /Prev " + std::to_string(at));
    {
        ScrubObjectGraph graph;
        graph.processMemory("loop", pdf.str());
        assert(graph.isRecovered());
        assert(graph.getObjectCount() == 4);
        assert(graph.getRoot().isDictionaryOfType("/Catalog"));
        assert(!graph.getWarnings().empty());
    }

    // Offsets that point at the wrong place
    auto data = simple();
    auto entry = data.find(" 00000 n");
    data.replace(entry - 10, 10, "0000000001");
    {
        ScrubObjectGraph graph;
        graph.processMemory("bad offset", data);
        assert(graph.isRecovered());
        assert(graph.getObjectCount() == 4);
        assert(graph.getPages().size() == 1);
    }

    // No startxref at all
    data = simple();
    data.erase(data.rfind("startxref"));
    {
        ScrubObjectGraph graph;
        graph.processMemory("truncated", data);
        assert(graph.isRecovered());
        assert(graph.getObjectCount() == 4);
    }

    // Nothing to recover
    try {
        ScrubObjectGraph graph;
        graph.processMemory("empty", "%PDF-1.4\n%%EOF\n");
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_unrecoverable);
    }
}

static void
test_stream_length()
{
    TestPDF pdf;
    pdf.object(1, "<< /Type /Catalog /Pages 2 0 R >>");
    pdf.object(2, "<< /Type /Pages /Kids [] /Count 0 >>");
    pdf.stream(3, "", "0123456789extra", 10);
    pdf.stream(4, "", "short", 500);
    pdf.finishRevision();
    ScrubObjectGraph graph;
    graph.processMemory("lengths", pdf.str());
    assert(!graph.isRecovered());
    auto s3 = graph.getStream(ScrubObjGen(3, 0));
    assert(s3->getRawData() == "0123456789");
    assert(s3->getExcessData() == "extra");
    // A /Length past the end of the object is recovered from the endstream keyword.
    auto s4 = graph.getStream(ScrubObjGen(4, 0));
    assert(s4->getRawData() == "short");
    assert(s4->getExcessData().empty());
    assert(!graph.getWarnings().empty());
}

static void
test_encrypted()
{
    TestPDF pdf;
    add_one_page(pdf, "BT 72 700 Td (secret) Tj ET");
    pdf.object(5, "<< /Filter /Standard /V 2 /R 3 /O (x) /U (y) /P -4 >>");
    pdf.finishRevision("/Root 1 0 R /Encrypt 5 0 R");
    ScrubObjectGraph graph;
    graph.processMemory("encrypted", pdf.str());
    assert(graph.isEncrypted());
    // Encrypted streams are not decoded.
    assert(graph.getStream(ScrubObjGen(4, 0))->decode() == ScrubStream::ds_unsupported);
}

static void
test_cancel()
{
    auto cancel = ScrubCancel::create();
    cancel->cancel();
    try {
        ScrubObjectGraph graph;
        graph.processMemory("cancelled", simple(), cancel);
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_cancelled);
    }
}

static void
test_editing()
{
    ScrubObjectGraph graph;
    graph.processMemory("simple", simple());
    auto page = ScrubObjGen(3, 0);
    assert(graph.getPath(page, "/MediaBox[2]").getIntValue() == 612);
    assert(graph.getPath(page, "/MediaBox[9]").isNull());
    assert(graph.getPath(page, "/Missing").isNull());
    assert(graph.replacePath(page, "/MediaBox[3]", ScrubObject::newInteger(100)));
    assert(graph.getPath(page, "/MediaBox[3]").getIntValue() == 100);
    assert(graph.removePath(page, "/MediaBox[0]"));
    assert(graph.getPath(page, "/MediaBox").getArrayNItems() == 3);
    assert(!graph.removePath(page, "/Nothing/Here"));
    assert(graph.getPath(ScrubObjGen(), "/Root").isReference());

    auto extra = graph.addObject(ScrubObject::newDictionary({{"/Ref", ScrubObject::newReference(page)}}));
    assert(extra == ScrubObjGen(5, 0));
    graph.getRoot().replaceKey("/Extra", ScrubObject::newReference(extra));
    assert(graph.reachable().contains(extra));

    // Removing an object nulls every reference to it.
    assert(graph.removeObject(ScrubObjGen(4, 0)));
    assert(!graph.removeObject(ScrubObjGen(4, 0)));
    assert(graph.getObject(page).getKey("/Contents").isNull());
    assert(graph.dangling().empty());

    // Compaction renumbers densely and rewrites references.
    auto mapping = graph.compact();
    assert(mapping.at(extra) == ScrubObjGen(4, 0));
    assert(graph.getObjectCount() == 4);
    assert(graph.getTrailer().getKey("/Size").getIntValue() == 5);
    assert(graph.getRoot().getKey("/Extra").getObjGen() == ScrubObjGen(4, 0));
    assert(graph.getObject(ScrubObjGen(4, 0)).getKey("/Ref").getObjGen() == page);

    try {
        graph.replaceObject(ScrubObjGen(), ScrubObject::newNull());
        assert(false);
    } catch (std::logic_error&) {
    }
}

int
main()
{
    test_single_revision();
    test_incremental_updates();
    test_unindexed_and_trailing();
    test_recovery();
    test_stream_length();
    test_encrypted();
    test_cancel();
    test_editing();
    std::cout << "object graph tests done" << std::endl;
    return 0;
}
