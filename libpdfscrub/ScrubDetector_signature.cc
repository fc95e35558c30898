#include <pdfscrub/ScrubDetectors.hh>

#include <pdfscrub/ScrubRunContext.hh>

#include <algorithm>
#include <utility>

using namespace pdfscrub::impl;

namespace
{
    struct Signature
    {
        ScrubObjGen og;
        // Path of the signature dictionary inside og when it is a direct object
        std::string path;
        ScrubObject dict;
    };

    // Return the end of the second signed segment and whether /ByteRange is usable. The values
    // come straight from the file: each must be a non-negative integer and each segment must start
    // inside the file. A segment that runs past the end is cut at the end. The end is -1 when there
    // is no /ByteRange at all.
    std::pair<long long, bool>
    signedEnd(ScrubObject range, scrub_offset_t input_size)
    {
        if (!(range.isArray() && range.getArrayNItems() == 4)) {
            return {-1, true};
        }
        long long v[4];
        for (int i = 0; i < 4; ++i) {
            auto item = range.getArrayItem(i);
            if (!item.isInteger() || item.getIntValue() < 0) {
                return {-1, false};
            }
            v[i] = item.getIntValue();
        }
        long long size = input_size;
        if (v[0] > size || v[2] > size) {
            return {-1, false};
        }
        // v[2] <= size, so size - v[2] can't overflow.
        return {v[2] + std::min(v[3], size - v[2]), true};
    }
} // namespace

void
SignatureDetector::scan(ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    std::vector<Signature> signatures;
    ScrubObjGen::set seen;
    size_t n = 0;
    for (auto const& og: context.reachable) {
        if (context.cancel && (++n % 256) == 0) {
            context.cancel->check("scan");
        }
        auto obj = graph.getObject(og);
        if (obj.isDictionaryOfType("/Sig") && !seen.contains(og)) {
            seen.insert(og);
            signatures.push_back({og, "", obj});
        } else if (obj.getKey("/FT").isNameAndEquals("/Sig")) {
            // Signature field; its value is the signature dictionary.
            auto v = obj.getKey("/V");
            if (v.isReference()) {
                auto target = graph.getObject(v.getObjGen());
                if (target.isDictionary() && !seen.contains(v.getObjGen())) {
                    seen.insert(v.getObjGen());
                    signatures.push_back({v.getObjGen(), "", target});
                }
            } else if (v.isDictionary()) {
                signatures.push_back({og, "/V", v});
            }
        }
    }

    // A signature covers the revision it was applied to. Anything after that was appended
    // without being signed.
    auto const& revisions = graph.getRevisions();
    scrub_offset_t final_end = revisions.empty() ? graph.getInputSize() : revisions.back().xref_end;
    for (auto const& sig: signatures) {
        // Only a signature that still carries its value reveals the signer.
        if (!sig.dict.hasKey("/Contents")) {
            continue;
        }
        auto range = sig.dict.getKey("/ByteRange");
        std::string subfilter = sig.dict.getKey("/SubFilter").getName();
        std::string signer = sig.dict.getKey("/Name").getUTF8Value();
        std::string who = (signer.empty() ? "" : signer + ", ") + (subfilter.empty() ? "" : subfilter);
        auto [covered, valid] = signedEnd(range, graph.getInputSize());
        if (!valid) {
            findings.push_back(ScrubFinding::atObject(
                ak_partial_signature_coverage,
                sev_high,
                sig.og,
                sig.path,
                "signature /ByteRange " + range.unparse() +
                    " does not describe a part of the file; its coverage is unknown" +
                    (who.empty() ? "" : " (" + who + ")")));
            continue;
        }
        // The signed revision's %%EOF may be followed by an end-of-line marker that the signature
        // doesn't include.
        if (covered >= 0 && covered + 2 < final_end) {
            findings.push_back(ScrubFinding::atObject(
                ak_partial_signature_coverage,
                sev_high,
                sig.og,
                sig.path,
                "signature covers " + std::to_string(covered) + " of " + std::to_string(final_end) +
                    " bytes; later updates are unsigned" + (who.empty() ? "" : " (" + who + ")")));
        } else {
            findings.push_back(ScrubFinding::atObject(
                ak_digital_signature,
                sev_medium,
                sig.og,
                sig.path,
                "digital signature" + (who.empty() ? "" : " (" + who + ")")));
        }
    }
}
