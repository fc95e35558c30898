#include <pdfscrub/ScrubDetectors.hh>

#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStream.hh>

using namespace pdfscrub::impl;

void
StructuralDetector::scan(ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    auto const& revisions = graph.getRevisions();

    // Objects that some superseded trailer can still reach
    ScrubObjGen::set history;
    for (size_t k = 0; k + 1 < revisions.size(); ++k) {
        if (context.cancel) {
            context.cancel->check("scan");
        }
        auto seen = graph.reachableFromRevision(k);
        history.insert(seen.begin(), seen.end());
        auto const& rev = revisions.at(k);
        findings.push_back(ScrubFinding::atRange(
            ak_revision_history,
            sev_medium,
            rev.start,
            rev.xref_end - rev.start,
            "revision " + std::to_string(k + 1) + " of " + std::to_string(revisions.size()) +
                " with cross-reference section at offset " + std::to_string(rev.xref_offset)));
    }

    for (auto const& og: graph.getObjectKeys()) {
        if (context.reachable.contains(og)) {
            continue;
        }
        if (history.contains(og)) {
            findings.push_back(ScrubFinding::atObject(
                ak_revision_history,
                sev_medium,
                og,
                "",
                "object is reachable only from superseded trailers"));
        } else {
            findings.push_back(ScrubFinding::atObject(
                ak_orphaned_object,
                sev_low,
                og,
                "",
                "object is not reachable from the trailer (" +
                    std::string(graph.getObject(og).getTypeName()) + ")"));
        }
    }

    for (auto const& body: graph.getSupersededBodies()) {
        if (graph.hasObject(body.og)) {
            findings.push_back(ScrubFinding::atObject(
                ak_duplicate_object_id,
                sev_medium,
                body.og,
                "",
                "superseded body at offset " + std::to_string(body.offset)));
        } else {
            findings.push_back(ScrubFinding::atObject(
                ak_revision_history,
                sev_medium,
                body.og,
                "",
                "body of a deleted object at offset " + std::to_string(body.offset)));
        }
    }
    for (auto const& body: graph.getUnindexedBodies()) {
        if (graph.hasObject(body.og)) {
            findings.push_back(ScrubFinding::atObject(
                ak_duplicate_object_id,
                sev_high,
                body.og,
                "",
                "body at offset " + std::to_string(body.offset) +
                    " is not indexed by any cross-reference section"));
        } else {
            findings.push_back(ScrubFinding::atObject(
                ak_orphaned_object,
                sev_high,
                body.og,
                "",
                "object at offset " + std::to_string(body.offset) +
                    " is not indexed by any cross-reference section"));
        }
    }

    for (auto const& d: graph.dangling()) {
        findings.push_back(ScrubFinding::atObject(
            ak_dangling_reference,
            sev_low,
            d.referrer,
            "",
            "reference to missing object " + d.target.unparse(' ')));
    }

    for (auto const& m: graph.getMalformed()) {
        findings.push_back(ScrubFinding::atObject(ak_malformed, sev_medium, m.og, "", m.message));
    }
    for (auto const& og: context.reachable) {
        auto stream = graph.getStream(og);
        if (stream && stream->decode() == ScrubStream::ds_failed) {
            findings.push_back(ScrubFinding::atObject(
                ak_malformed, sev_medium, og, "", "stream data: " + stream->getDecodeError()));
        }
    }

    if (graph.getTrailer().hasKey("/Encrypt")) {
        findings.push_back(ScrubFinding::atObject(
            ak_encrypted,
            sev_high,
            ScrubObjGen(),
            "/Encrypt",
            "document is encrypted; its strings and streams can't be inspected"));
    }
}
