#include <pdfscrub/ScrubCleaner.hh>

#include <pdfscrub/ScrubContent.hh>
#include <pdfscrub/ScrubDCT.hh>
#include <pdfscrub/ScrubDetectors.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStream.hh>

#include <algorithm>

using namespace pdfscrub;
using namespace pdfscrub::impl;

namespace
{
    struct Outcome
    {
        scrub_action_e action{sa_ignored};
        long long delta{0};
        std::string reason;
        bool stale{false};
    };

    // Nothing left to do: an earlier remedy already removed what the finding points at.
    Outcome
    resolved()
    {
        return {sa_removed, 0, "already resolved", true};
    }

    // The remedy for each kind of finding. A remedy either changes the graph and returns what it
    // did, or returns Ignored with the reason it could not act.
    class Remedies
    {
      public:
        Remedies(ScrubObjectGraph& graph, ScrubObjGen::set const& reachable) :
            graph(graph),
            reachable(reachable)
        {
        }

        bool isStale(ScrubFinding const& f) const;
        Outcome apply(ScrubFinding const& f);
        Outcome forceRemove(ScrubFinding const& f);

        long long size(ScrubObjGen og) const;

      private:
        long long bodiesSize(ScrubObjGen og) const;
        bool hasBody(ScrubObjGen og) const;
        Outcome remove(ScrubObjGen og, std::string const& reason);
        Outcome removeKey(
            ScrubObjGen og, std::string const& path, scrub_action_e action, std::string const& reason);
        Outcome collapse();
        Outcome dangling(ScrubObjGen og);
        Outcome malformed(ScrubObjGen og);
        Outcome normalizeContent(ScrubObjGen og);
        Outcome cutOffPageText(ScrubObjGen page);
        Outcome cutHiddenContent(ScrubObjGen page);
        Outcome trimImage(ScrubObjGen og);
        Outcome clearLowBits(ScrubObjGen og);
        Outcome hiddenAction(ScrubObjGen og, std::string const& path);

        ScrubObjectGraph& graph;
        ScrubObjGen::set const& reachable;
    };

    long long
    Remedies::size(ScrubObjGen og) const
    {
        if (!og.isIndirect()) {
            return static_cast<long long>(graph.getTrailer().unparse().size() + 9);
        }
        if (!graph.hasObject(og)) {
            return 0;
        }
        // n g obj\n ... \nendobj\n
        auto result = og.unparse(' ').size() + 13 + graph.getObject(og).unparse().size();
        if (auto stream = graph.getStream(og)) {
            // \nstream\n ... \nendstream
            result += stream->getRawData().size() + 18;
        }
        return static_cast<long long>(result);
    }

    long long
    Remedies::bodiesSize(ScrubObjGen og) const
    {
        long long result = 0;
        for (auto const* bodies: {&graph.getSupersededBodies(), &graph.getUnindexedBodies()}) {
            for (auto const& body: *bodies) {
                if (body.og == og) {
                    result += body.length;
                }
            }
        }
        return result;
    }

    bool
    Remedies::hasBody(ScrubObjGen og) const
    {
        for (auto const* bodies: {&graph.getSupersededBodies(), &graph.getUnindexedBodies()}) {
            for (auto const& body: *bodies) {
                if (body.og == og) {
                    return true;
                }
            }
        }
        return false;
    }

    bool
    Remedies::isStale(ScrubFinding const& f) const
    {
        if (f.isByteRange()) {
            if (f.getKind() == ak_hidden_trailing_data) {
                return !graph.hasTrailingData();
            }
            if (f.getKind() == ak_revision_history) {
                auto const& revisions = graph.getRevisions();
                for (size_t k = 0; k + 1 < revisions.size(); ++k) {
                    if (revisions.at(k).start == f.getOffset()) {
                        return false;
                    }
                }
                return true;
            }
            return false;
        }
        auto og = f.getObjGen();
        switch (f.getKind()) {
        case ak_orphaned_object:
        case ak_duplicate_object_id:
        case ak_revision_history:
        case ak_malformed:
            return !graph.hasObject(og) && !hasBody(og);
        case ak_encrypted:
        case ak_detector_fault:
        case ak_partial_signature_coverage:
            return false;
        default:
            break;
        }
        if (og.isIndirect() && !graph.hasObject(og)) {
            return true;
        }
        return !f.getKey().empty() && graph.getPath(og, f.getKey()).isNull();
    }

    Outcome
    Remedies::remove(ScrubObjGen og, std::string const& reason)
    {
        auto before = size(og) + bodiesSize(og);
        graph.removeObject(og);
        graph.dropBodies(og);
        return {sa_removed, -before, reason};
    }

    Outcome
    Remedies::removeKey(
        ScrubObjGen og, std::string const& path, scrub_action_e action, std::string const& reason)
    {
        auto before = size(og);
        if (!graph.removePath(og, path)) {
            return resolved();
        }
        return {action, size(og) - before, reason};
    }

    Outcome
    Remedies::collapse()
    {
        long long before = 0;
        auto const& revisions = graph.getRevisions();
        for (size_t k = 0; k + 1 < revisions.size(); ++k) {
            before += revisions.at(k).xref_end - revisions.at(k).xref_offset;
        }
        for (auto const& body: graph.getSupersededBodies()) {
            before += body.length;
        }
        graph.collapseRevisions();
        return {sa_removed, -before, "earlier revisions and their cross-reference sections dropped"};
    }

    Outcome
    Remedies::dangling(ScrubObjGen og)
    {
        auto before = size(og);
        auto holder = og.isIndirect() ? graph.getObject(og) : graph.getTrailer();
        int count = holder.rewriteReferences([this](ScrubObjGen target) {
            return graph.hasObject(target) ? ScrubObject() : ScrubObject::newNull();
        });
        if (count == 0) {
            return resolved();
        }
        return {
            sa_rewritten,
            size(og) - before,
            std::to_string(count) + " reference(s) to missing objects replaced with null"};
    }

    Outcome
    Remedies::malformed(ScrubObjGen og)
    {
        graph.clearMalformed(og);
        if (!graph.hasObject(og)) {
            auto before = bodiesSize(og);
            graph.dropBodies(og);
            return {sa_removed, -before, "damaged body dropped"};
        }
        auto stream = graph.getStream(og);
        if (stream && stream->decode() == ScrubStream::ds_failed) {
            auto before = size(og);
            stream->replaceData("");
            return {sa_rewritten, size(og) - before, "undecodable stream data emptied"};
        }
        if (graph.getObject(og).isNull()) {
            return remove(og, "object could not be parsed");
        }
        return {sa_rewritten, 0, "recovered object will be written in normal form"};
    }

    Outcome
    Remedies::normalizeContent(ScrubObjGen og)
    {
        auto stream = graph.getStream(og);
        if (!stream || stream->decode() != ScrubStream::ds_ok) {
            return {sa_ignored, 0, "content stream can't be decoded"};
        }
        auto before = size(og);
        auto analysis = content::analyze(stream->getDecodedData());
        stream->replaceData(content::unparse(analysis.operations));
        return {sa_rewritten, size(og) - before, "comments and trailing bytes removed from content"};
    }

    Outcome
    Remedies::cutOffPageText(ScrubObjGen page)
    {
        std::string data;
        content::Box box;
        auto streams = page_content_streams(graph, page);
        if (streams.empty() || !page_box(graph, page, box) || !page_content(graph, page, data)) {
            return {sa_ignored, 0, "page content can't be decoded"};
        }
        auto analysis = content::analyze(data);
        auto off_page = content::off_page_text(analysis.operations, box, 1.0, nullptr);
        if (off_page.empty()) {
            return resolved();
        }
        long long before = size(page);
        for (auto const& og: streams) {
            before += size(og);
        }
        auto first = streams.front();
        analysis.operations = content::remove_text_objects(analysis.operations, off_page);
        graph.getStream(first)->replaceData(content::unparse(analysis.operations));
        if (streams.size() > 1 || !graph.getObject(page).getKey("/Contents").isReference()) {
            graph.replacePath(page, "/Contents", ScrubObject::newReference(first));
        }
        // The other content streams are left to the sweep.
        return {
            sa_rewritten,
            size(page) + size(first) - before,
            std::to_string(off_page.size()) + " text object(s) outside the page box cut"};
    }

    Outcome
    Remedies::cutHiddenContent(ScrubObjGen page)
    {
        std::string data;
        auto streams = page_content_streams(graph, page);
        if (streams.empty() || !page_content(graph, page, data)) {
            return {sa_ignored, 0, "page content can't be decoded"};
        }
        auto properties = hidden_properties(graph, page, hidden_ocgs(graph));
        auto analysis = content::analyze(data);
        auto marked = content::optional_content(analysis.operations, properties);
        if (marked.empty()) {
            return resolved();
        }
        long long before = size(page);
        for (auto const& og: streams) {
            before += size(og);
        }
        auto first = streams.front();
        analysis.operations = content::remove_marked_content(analysis.operations, marked);
        graph.getStream(first)->replaceData(content::unparse(analysis.operations));
        if (streams.size() > 1 || !graph.getObject(page).getKey("/Contents").isReference()) {
            graph.replacePath(page, "/Contents", ScrubObject::newReference(first));
        }
        return {
            sa_removed,
            size(page) + size(first) - before,
            std::to_string(marked.size()) + " marked-content sequence(s) of hidden optional " +
                "content cut"};
    }

    Outcome
    Remedies::trimImage(ScrubObjGen og)
    {
        auto stream = graph.getStream(og);
        if (!stream) {
            return {sa_ignored, 0, "not a stream"};
        }
        auto before = size(og);
        if (is_plain_jpeg(*stream)) {
            auto const& raw = stream->getRawData();
            auto eoi = raw.rfind("\xff\xd9");
            if (eoi == std::string::npos || eoi + 2 >= raw.size()) {
                return resolved();
            }
            stream->replaceRawData(raw.substr(0, eoi + 2));
            return {sa_removed, size(og) - before, "data after the JPEG end-of-image marker removed"};
        }
        size_t expected = 0;
        int bits = 0;
        if (stream->decode() != ScrubStream::ds_ok ||
            !image_data_size(graph, stream->getDict(), expected, bits)) {
            return {sa_ignored, 0, "image data can't be decoded"};
        }
        auto const& data = stream->getDecodedData();
        if (data.size() <= expected) {
            return resolved();
        }
        stream->replaceData(data.substr(0, expected));
        return {sa_removed, size(og) - before, "image data trimmed to its declared size"};
    }

    Outcome
    Remedies::clearLowBits(ScrubObjGen og)
    {
        auto stream = graph.getStream(og);
        if (!stream) {
            return {sa_ignored, 0, "not a stream"};
        }
        auto before = size(og);
        if (is_plain_jpeg(*stream)) {
            size_t changed = 0;
            auto jpeg = ScrubDCT::clearACLowBits(stream->getRawData(), changed);
            stream->replaceRawData(jpeg);
            return {
                sa_rewritten,
                size(og) - before,
                "low bit cleared in " + std::to_string(changed) + " DCT coefficients"};
        }
        size_t expected = 0;
        int bits = 0;
        if (stream->decode() != ScrubStream::ds_ok ||
            !image_data_size(graph, stream->getDict(), expected, bits) || bits != 8) {
            return {sa_ignored, 0, "image samples can't be decoded"};
        }
        auto data = stream->getDecodedData();
        size_t changed = 0;
        for (size_t i = 0; i < std::min(expected, data.size()); ++i) {
            if (data[i] & 1) {
                data[i] = static_cast<char>(data[i] & ~1);
                ++changed;
            }
        }
        stream->replaceData(data);
        return {
            sa_rewritten,
            size(og) - before,
            "low bit cleared in " + std::to_string(changed) + " samples"};
    }

    Outcome
    Remedies::hiddenAction(ScrubObjGen og, std::string const& path)
    {
        if (path.empty()) {
            return remove(og, "action removed");
        }
        auto value = graph.getPath(og, path);
        if (value.isReference() && graph.hasObject(value.getObjGen())) {
            auto target = value.getObjGen();
            auto before = size(og) + size(target);
            graph.removeObject(target);
            return {sa_removed, size(og) - before, "action removed"};
        }
        auto before = size(og);
        if (path.back() == ']') {
            graph.replacePath(og, path, ScrubObject::newNull());
        } else {
            graph.removePath(og, path);
        }
        return {sa_removed, size(og) - before, "action removed"};
    }

    Outcome
    Remedies::apply(ScrubFinding const& f)
    {
        auto og = f.getObjGen();
        auto const& key = f.getKey();
        switch (f.getKind()) {
        case ak_orphaned_object:
            if (graph.hasObject(og) && reachable.contains(og)) {
                auto before = bodiesSize(og);
                graph.dropBodies(og);
                return {sa_removed, -before, "unindexed body dropped"};
            }
            return remove(og, "unreachable object removed");

        case ak_duplicate_object_id:
            {
                auto before = bodiesSize(og);
                graph.dropBodies(og);
                return {sa_removed, -before, "older bodies of the object dropped"};
            }

        case ak_revision_history:
            if (f.isByteRange()) {
                return collapse();
            }
            if (graph.hasObject(og)) {
                return remove(og, "object of an earlier revision removed");
            }
            {
                auto before = bodiesSize(og);
                graph.dropBodies(og);
                return {sa_removed, -before, "body of a deleted object dropped"};
            }

        case ak_dangling_reference:
            return dangling(og);

        case ak_malformed:
            return malformed(og);

        case ak_encrypted:
            return {sa_ignored, 0, "encrypted documents are not decrypted"};

        case ak_info_metadata:
            return removeKey(og, key, sa_redacted, "document information field removed");

        case ak_xmp_metadata:
            return removeKey(og, "/Metadata", sa_removed, "XMP metadata stream removed");

        case ak_document_id:
            return removeKey(
                og, "/ID", sa_removed, "identifier removed; a content-derived one is written");

        case ak_private_app_data:
            return removeKey(og, "/PieceInfo", sa_removed, "application data removed");

        case ak_digital_signature:
            {
                auto before = size(og);
                graph.removePath(og, key + "/Cert");
                if (!graph.removePath(og, key + "/Contents")) {
                    return resolved();
                }
                return {sa_redacted, size(og) - before, "signature value removed"};
            }

        case ak_partial_signature_coverage:
            return {
                sa_ignored,
                0,
                "no safe remedy: the signature does not cover later changes to the document"};

        case ak_stream_length_mismatch:
            {
                auto stream = graph.getStream(og);
                if (!stream) {
                    return resolved();
                }
                auto excess = static_cast<long long>(stream->getExcessData().size());
                stream->clearExcessData();
                return {sa_removed, -excess, "data after the declared /Length removed"};
            }

        case ak_anomalous_stream_size:
            return normalizeContent(og);

        case ak_off_page_content:
            return cutOffPageText(og);

        case ak_hidden_trailing_data:
            {
                auto length = graph.getTrailingDataLength();
                graph.clearTrailingData();
                return {sa_removed, -length, "data after the final %%EOF removed"};
            }

        case ak_steganographic_padding:
            return trimImage(og);

        case ak_lsb_payload:
            return clearLowBits(og);

        case ak_high_entropy_payload:
            return remove(og, "embedded file removed");

        case ak_hidden_action:
            return hiddenAction(og, key);

        case ak_hidden_optional_content:
            return cutHiddenContent(og);

        case ak_detector_fault:
            return {sa_ignored, 0, "detector failed: " + f.getEvidence()};
        }
        return {sa_ignored, 0, "no remedy for this kind of finding"};
    }

    Outcome
    Remedies::forceRemove(ScrubFinding const& f)
    {
        auto og = f.getObjGen();
        if (f.isByteRange() || !og.isIndirect()) {
            return {sa_ignored, 0, "findings on byte ranges or the trailer can't be force-removed"};
        }
        if (!f.getKey().empty() && graph.hasObject(og)) {
            auto before = size(og);
            if (graph.removePath(og, f.getKey())) {
                return {sa_removed, size(og) - before, "entry force-removed"};
            }
        }
        return remove(og, "object force-removed");
    }
} // namespace

class ScrubCleaner::Members
{
    friend class ScrubCleaner;

  public:
    Members(ScrubConfig const& config, std::shared_ptr<ScrubLogger> logger, std::shared_ptr<ScrubCancel> cancel) :
        config(config),
        logger(logger ? logger : ScrubLogger::defaultLogger()),
        cancel(cancel)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    void
    checkCancel() const
    {
        if (cancel) {
            cancel->check("clean");
        }
    }

    ScrubConfig config;
    std::shared_ptr<ScrubLogger> logger;
    std::shared_ptr<ScrubCancel> cancel;
};

JSON
ScrubCleanAction::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("finding", JSON::makeString(finding.getId()));
    j.addDictionaryMember("category", JSON::makeString(ScrubFinding::kindName(finding.getKind())));
    j.addDictionaryMember("location", JSON::makeString(finding.describeLocation()));
    j.addDictionaryMember("pass", JSON::makeInt(pass));
    j.addDictionaryMember("action", JSON::makeString(ScrubFinding::actionName(action)));
    j.addDictionaryMember("delta", JSON::makeInt(delta));
    j.addDictionaryMember("reason", JSON::makeString(reason));
    return j;
}

std::vector<ScrubCleanAction> const&
ScrubCleanReport::getActions() const
{
    return actions;
}

void
ScrubCleanReport::add(ScrubCleanAction const& action)
{
    actions.emplace_back(action);
}

void
ScrubCleanReport::append(ScrubCleanReport const& other)
{
    actions.insert(actions.end(), other.actions.begin(), other.actions.end());
}

size_t
ScrubCleanReport::remedialCount() const
{
    return static_cast<size_t>(std::count_if(actions.begin(), actions.end(), [](auto const& a) {
        return a.action != sa_ignored && !a.stale;
    }));
}

bool
ScrubCleanReport::hasActionFor(ScrubFinding const& f) const
{
    for (auto const& a: actions) {
        if (a.finding.getId() == f.getId() && a.finding.sameArtifact(f)) {
            return true;
        }
    }
    return false;
}

JSON
ScrubCleanReport::getJSON() const
{
    auto j = JSON::makeArray();
    for (auto const& a: actions) {
        j.addArrayElement(a.getJSON());
    }
    return j;
}

ScrubCleaner::ScrubCleaner(
    ScrubConfig const& config, std::shared_ptr<ScrubLogger> logger, std::shared_ptr<ScrubCancel> cancel) :
    m(new Members(config, logger, cancel))
{
}

ScrubCleanReport
ScrubCleaner::clean(ScrubObjectGraph& graph, ScrubFindingSet const& findings, int pass)
{
    m->checkCancel();
    auto details = JSON::makeDictionary();
    details.addDictionaryMember("pass", JSON::makeInt(pass));
    details.addDictionaryMember("findings", JSON::makeInt(static_cast<long long>(findings.size())));
    m->logger->event("clean", "start", details);

    ScrubCleanReport report;
    auto reachable = graph.reachable();
    Remedies remedies(graph, reachable);

    // The finding set is ordered by detector, so structural remedies run before the others and
    // content findings about objects they removed are found stale.
    for (auto const& f: findings.getFindings()) {
        m->checkCancel();
        ScrubCleanAction action{f, pass};
        if (remedies.isStale(f)) {
            auto outcome = resolved();
            action.action = outcome.action;
            action.reason = outcome.reason;
            action.stale = true;
            report.add(action);
            continue;
        }
        Outcome outcome;
        try {
            outcome = remedies.apply(f);
        } catch (ScrubExc& e) {
            if (e.getErrorCode() == scrub_e_cancelled) {
                throw;
            }
            outcome = {sa_ignored, 0, std::string("remedy failed: ") + e.what()};
        } catch (std::exception& e) {
            outcome = {sa_ignored, 0, std::string("remedy failed: ") + e.what()};
        }
        if (outcome.reason.starts_with("remedy failed")) {
            m->logger->warn(
                "WARNING: " + f.getId() + " (" + f.describeLocation() + "): " + outcome.reason + "\n");
        }
        action.action = outcome.action;
        action.delta = outcome.delta;
        action.reason = outcome.reason;
        action.stale = outcome.stale;

        if (outcome.action != sa_ignored && !outcome.stale) {
            // Objects that only this remedy's target referred to go with it.
            auto now = graph.reachable();
            size_t swept = 0;
            for (auto const& og: reachable) {
                if (!now.contains(og) && graph.hasObject(og)) {
                    action.delta -= remedies.size(og);
                    graph.removeObject(og);
                    ++swept;
                }
            }
            if (swept) {
                action.reason += "; " + std::to_string(swept) + " object(s) no longer referenced removed";
            }
            reachable = now;
        }
        report.add(action);
    }

    graph.compact();
    details = JSON::makeDictionary();
    details.addDictionaryMember("pass", JSON::makeInt(pass));
    details.addDictionaryMember("actions", JSON::makeInt(static_cast<long long>(report.getActions().size())));
    details.addDictionaryMember(
        "remedial", JSON::makeInt(static_cast<long long>(report.remedialCount())));
    m->logger->event("clean", "finish", details);
    return report;
}

ScrubCleanReport
ScrubCleaner::forceRemove(ScrubObjectGraph& graph, ScrubFindingSet const& findings, int pass)
{
    m->checkCancel();
    m->logger->event("clean", "force removal");
    ScrubCleanReport report;
    auto reachable = graph.reachable();
    Remedies remedies(graph, reachable);
    for (auto const& f: findings.getFindings()) {
        m->checkCancel();
        ScrubCleanAction action{f, pass};
        auto outcome = remedies.isStale(f) ? resolved() : remedies.forceRemove(f);
        action.action = outcome.action;
        action.delta = outcome.delta;
        action.reason = outcome.reason;
        action.stale = outcome.stale;
        report.add(action);
    }
    graph.compact();
    return report;
}
