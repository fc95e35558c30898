#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/Pl_MD5.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubWriter.hh>

#include <iostream>

static std::string
source()
{
    TestPDF pdf("1.4");
    add_one_page(pdf, "BT /F1 12 Tf 72 700 Td (rebuilt) Tj ET");
    pdf.object(5, "<< /CreationDate (D:20250101000000Z) >>");
    pdf.finishRevision("/Root 1 0 R /Info 5 0 R /ID [<0102> <0304>]");
    return pdf.str();
}

static void
check_offsets(ScrubWriter const& w, std::string const& out)
{
    assert(!w.getWrittenOffsets().empty());
    for (auto const& [og, offset]: w.getWrittenOffsets()) {
        auto expected = og.unparse(' ') + " obj\n";
        assert(out.compare(static_cast<size_t>(offset), expected.size(), expected) == 0);
    }
}

static void
test_classic()
{
    ScrubObjectGraph graph;
    graph.processMemory("source", source());
    ScrubWriter w(graph);
    w.setCompressStreams(false);
    auto out = w.write();
    check_offsets(w, out);
    assert(out.starts_with("%PDF-1.4\n"));
    assert(out.ends_with("%%EOF\n"));
    assert(out.find("(rebuilt) Tj") != std::string::npos);
    assert(out.find("trailer <<") != std::string::npos);
    assert(out.find("/Info 5 0 R") != std::string::npos);

    ScrubObjectGraph again;
    again.processMemory("rebuilt", out);
    assert(!again.isRecovered());
    assert(again.getWarnings().empty());
    assert(again.getObjectCount() == 5);
    assert(again.getRevisions().size() == 1);
    assert(!again.getRevisions().at(0).is_stream);
    assert(again.getPages().size() == 1);
    assert(!again.hasTrailingData());

    // Both identifiers are the digest of everything before the cross-reference table.
    auto id = again.getTrailer().getKey("/ID");
    assert(id.getArrayNItems() == 2);
    assert(id.getArrayItem(0).getStringValue() == again.getContentId());
    assert(id.getArrayItem(1).getStringValue() == again.getContentId());
    auto xref = static_cast<size_t>(again.getRevisions().at(0).xref_offset);
    assert(again.getContentId() == Pl_MD5::rawDigest(std::string_view(out).substr(0, xref)));

    // Writing the same graph twice gives the same bytes.
    assert(ScrubWriter(graph).write() == ScrubWriter(graph).write());
}

static void
test_xref_stream()
{
    ScrubObjectGraph graph;
    graph.processMemory("source", source());
    ScrubWriter w(graph);
    w.setXrefMode(scrub_xref_stream);
    auto out = w.write();
    check_offsets(w, out);
    // Cross-reference streams need at least PDF 1.5.
    assert(out.starts_with("%PDF-1.5\n"));
    assert(out.find("/Type /XRef") != std::string::npos);
    assert(out.find("(rebuilt) Tj") == std::string::npos);

    ScrubObjectGraph again;
    again.processMemory("rebuilt", out);
    assert(!again.isRecovered());
    assert(again.getRevisions().size() == 1);
    assert(again.getRevisions().at(0).is_stream);
    // The cross-reference stream itself is not part of the document's objects.
    assert(again.getObjectCount() == 5);
    assert(!again.getTrailer().hasKey("/W"));
    auto content = again.getStream(ScrubObjGen(4, 0));
    assert(content->getFilters() == std::vector<std::string>{"/FlateDecode"});
    assert(content->decode() == ScrubStream::ds_ok);
    assert(content->getDecodedData() == "BT /F1 12 Tf 72 700 Td (rebuilt) Tj ET");
}

static void
test_keep_id1()
{
    ScrubObjectGraph graph;
    graph.processMemory("source", source());
    ScrubWriter w(graph);
    w.setKeepOriginalID1(true);
    auto out = w.write();
    ScrubObjectGraph again;
    again.processMemory("rebuilt", out);
    auto id = again.getTrailer().getKey("/ID");
    assert(id.getArrayItem(0).getStringValue() == std::string("\x01\x02"));
    assert(id.getArrayItem(1).getStringValue() == again.getContentId());
}

static void
test_invariants()
{
    {
        ScrubObjectGraph graph;
        graph.processMemory("source", source());
        graph.getObject(ScrubObjGen(3, 0))
            .replaceKey("/Resources", ScrubObject::newReference(ScrubObjGen(40, 0)));
        try {
            ScrubWriter(graph).write();
            assert(false);
        } catch (ScrubExc& e) {
            assert(e.getErrorCode() == scrub_e_rebuild);
            assert(std::string(e.what()).find("40 0") != std::string::npos);
        }
    }
    {
        ScrubObjectGraph graph;
        graph.processMemory("source", source());
        auto trailer = graph.getTrailer().shallowCopy();
        trailer.removeKey("/Root");
        graph.setTrailer(trailer);
        try {
            ScrubWriter(graph).write();
            assert(false);
        } catch (ScrubExc& e) {
            assert(e.getErrorCode() == scrub_e_rebuild);
        }
    }
}

int
main()
{
    test_classic();
    test_xref_stream();
    test_keep_id1();
    test_invariants();
    std::cout << "writer tests done" << std::endl;
    return 0;
}
