#include <pdfscrub/ScrubFinding.hh>

#include <pdfscrub/ScrubUtil.hh>

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace
{
    struct KindInfo
    {
        scrub_artifact_e kind;
        char const* name;
        scrub_detector_e detector;
    };

    // Indexed by scrub_artifact_e
    KindInfo const kinds[] = {
        {ak_orphaned_object, "OrphanedObject", sd_structural},
        {ak_duplicate_object_id, "DuplicateObjectId", sd_structural},
        {ak_revision_history, "RevisionHistory", sd_structural},
        {ak_dangling_reference, "DanglingReference", sd_structural},
        {ak_malformed, "Malformed", sd_structural},
        {ak_encrypted, "Encrypted", sd_structural},
        {ak_info_metadata, "InfoMetadata", sd_metadata},
        {ak_xmp_metadata, "XmpMetadata", sd_metadata},
        {ak_document_id, "DocumentId", sd_metadata},
        {ak_private_app_data, "PrivateAppData", sd_metadata},
        {ak_digital_signature, "DigitalSignature", sd_signature},
        {ak_partial_signature_coverage, "PartialSignatureCoverage", sd_signature},
        {ak_stream_length_mismatch, "StreamLengthMismatch", sd_stream},
        {ak_anomalous_stream_size, "AnomalousStreamSize", sd_stream},
        {ak_off_page_content, "OffPageContent", sd_stream},
        {ak_hidden_trailing_data, "HiddenTrailingData", sd_hidden_data},
        {ak_steganographic_padding, "SteganographicPadding", sd_hidden_data},
        {ak_lsb_payload, "LsbPayload", sd_hidden_data},
        {ak_high_entropy_payload, "HighEntropyPayload", sd_hidden_data},
        {ak_hidden_action, "HiddenAction", sd_hidden_data},
        {ak_hidden_optional_content, "HiddenOptionalContent", sd_hidden_data},
        // A fault can come from any detector; it is filed under the structural detector only for
        // ordering.
        {ak_detector_fault, "DetectorFault", sd_structural},
    };

    char const* const detector_names[] = {
        "structural",
        "metadata",
        "signature",
        "stream",
        "hidden-data",
    };

    KindInfo const&
    kind_info(scrub_artifact_e kind)
    {
        auto i = static_cast<size_t>(kind);
        if (i >= sizeof(kinds) / sizeof(kinds[0])) {
            throw std::logic_error("ScrubFinding: invalid artifact kind");
        }
        return kinds[i];
    }

    auto
    sort_key(ScrubFinding const& f)
    {
        return std::make_tuple(
            f.getKind() == ak_detector_fault ? 1 : 0,
            f.getDetector(),
            f.getKind(),
            f.isByteRange(),
            f.getObjGen(),
            f.getOffset(),
            f.getLength(),
            f.getKey(),
            f.getEvidence());
    }
} // namespace

ScrubFinding
ScrubFinding::atObject(
    scrub_artifact_e kind,
    scrub_severity_e severity,
    ScrubObjGen og,
    std::string const& key,
    std::string const& evidence)
{
    ScrubFinding f;
    f.kind = kind;
    f.severity = severity;
    f.og = og;
    f.key = key;
    f.evidence = evidence;
    return f;
}

ScrubFinding
ScrubFinding::atRange(
    scrub_artifact_e kind,
    scrub_severity_e severity,
    scrub_offset_t offset,
    scrub_offset_t length,
    std::string const& evidence)
{
    ScrubFinding f;
    f.kind = kind;
    f.severity = severity;
    f.byte_range = true;
    f.offset = offset;
    f.length = length;
    f.evidence = evidence;
    return f;
}

std::string const&
ScrubFinding::getId() const
{
    return id;
}

scrub_artifact_e
ScrubFinding::getKind() const
{
    return kind;
}

scrub_detector_e
ScrubFinding::getDetector() const
{
    return detectorOf(kind);
}

scrub_severity_e
ScrubFinding::getSeverity() const
{
    return severity;
}

bool
ScrubFinding::isByteRange() const
{
    return byte_range;
}

ScrubObjGen
ScrubFinding::getObjGen() const
{
    return og;
}

std::string const&
ScrubFinding::getKey() const
{
    return key;
}

scrub_offset_t
ScrubFinding::getOffset() const
{
    return offset;
}

scrub_offset_t
ScrubFinding::getLength() const
{
    return length;
}

std::string const&
ScrubFinding::getEvidence() const
{
    return evidence;
}

bool
ScrubFinding::sameArtifact(ScrubFinding const& other) const
{
    if (kind != other.kind || byte_range != other.byte_range) {
        return false;
    }
    if (byte_range) {
        return offset == other.offset && length == other.length;
    }
    return og == other.og && key == other.key;
}

std::string
ScrubFinding::describeLocation() const
{
    if (byte_range) {
        return std::to_string(offset) + "+" + std::to_string(length);
    }
    auto result = og.isIndirect() ? og.unparse(' ') : "trailer";
    if (!key.empty()) {
        result += " " + key;
    }
    return result;
}

JSON
ScrubFinding::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("id", JSON::makeString(id));
    j.addDictionaryMember("category", JSON::makeString(kindName(kind)));
    j.addDictionaryMember("detector", JSON::makeString(detectorName(getDetector())));
    j.addDictionaryMember("severity", JSON::makeString(severityName(severity)));
    auto location = JSON::makeDictionary();
    if (byte_range) {
        location.addDictionaryMember("offset", JSON::makeInt(offset));
        location.addDictionaryMember("length", JSON::makeInt(length));
    } else {
        location.addDictionaryMember("object", JSON::makeString(og.unparse(' ')));
    }
    j.addDictionaryMember("location", location);
    j.addDictionaryMember("key", JSON::makeString(key));
    // Evidence may be taken from binary data.
    j.addDictionaryMember(
        "evidence",
        JSON::makeString(
            ScrubUtil::is_printable_text(evidence) ? evidence : ScrubUtil::hex_encode(evidence)));
    return j;
}

char const*
ScrubFinding::kindName(scrub_artifact_e kind)
{
    return kind_info(kind).name;
}

bool
ScrubFinding::kindFromName(std::string const& name, scrub_artifact_e& kind)
{
    for (auto const& info: kinds) {
        if (name == info.name) {
            kind = info.kind;
            return true;
        }
    }
    return false;
}

scrub_detector_e
ScrubFinding::detectorOf(scrub_artifact_e kind)
{
    return kind_info(kind).detector;
}

char const*
ScrubFinding::detectorName(scrub_detector_e detector)
{
    auto i = static_cast<size_t>(detector);
    if (i >= sizeof(detector_names) / sizeof(detector_names[0])) {
        throw std::logic_error("ScrubFinding: invalid detector");
    }
    return detector_names[i];
}

bool
ScrubFinding::detectorFromName(std::string const& name, scrub_detector_e& detector)
{
    for (auto d: allDetectors()) {
        if (name == detectorName(d)) {
            detector = d;
            return true;
        }
    }
    return false;
}

char const*
ScrubFinding::severityName(scrub_severity_e severity)
{
    switch (severity) {
    case sev_low:
        return "low";
    case sev_medium:
        return "medium";
    case sev_high:
        return "high";
    }
    return "unknown";
}

char const*
ScrubFinding::actionName(scrub_action_e action)
{
    switch (action) {
    case sa_redacted:
        return "Redacted";
    case sa_removed:
        return "Removed";
    case sa_rewritten:
        return "Rewritten";
    case sa_ignored:
        return "Ignored";
    }
    return "unknown";
}

char const*
ScrubFinding::statusName(scrub_status_e status)
{
    switch (status) {
    case ss_clean:
        return "Clean";
    case ss_rejected:
        return "Rejected";
    case ss_cancelled:
        return "CancellationError";
    case ss_unrecoverable:
        return "Unrecoverable";
    }
    return "unknown";
}

std::vector<scrub_artifact_e> const&
ScrubFinding::allKinds()
{
    static std::vector<scrub_artifact_e> const result = []() {
        std::vector<scrub_artifact_e> v;
        for (auto const& info: kinds) {
            v.push_back(info.kind);
        }
        return v;
    }();
    return result;
}

std::vector<scrub_detector_e> const&
ScrubFinding::allDetectors()
{
    static std::vector<scrub_detector_e> const result = {
        sd_structural, sd_metadata, sd_signature, sd_stream, sd_hidden_data};
    return result;
}

ScrubFindingSet::ScrubFindingSet(std::vector<ScrubFinding> in) :
    findings(std::move(in))
{
    std::stable_sort(
        findings.begin(), findings.end(), [](ScrubFinding const& a, ScrubFinding const& b) {
            return sort_key(a) < sort_key(b);
        });
    // Detectors may report the same artifact twice through different paths.
    findings.erase(
        std::unique(
            findings.begin(),
            findings.end(),
            [](ScrubFinding const& a, ScrubFinding const& b) { return a.sameArtifact(b); }),
        findings.end());
    size_t n = 0;
    for (auto& f: findings) {
        f.id = "F" + std::to_string(++n);
    }
}

std::vector<ScrubFinding> const&
ScrubFindingSet::getFindings() const
{
    return findings;
}

bool
ScrubFindingSet::empty() const
{
    return findings.empty();
}

size_t
ScrubFindingSet::size() const
{
    return findings.size();
}

size_t
ScrubFindingSet::count(scrub_artifact_e kind) const
{
    return static_cast<size_t>(std::count_if(
        findings.begin(), findings.end(), [kind](auto const& f) { return f.getKind() == kind; }));
}

bool
ScrubFindingSet::contains(ScrubFinding const& other) const
{
    for (auto const& f: findings) {
        if (f.sameArtifact(other)) {
            return true;
        }
    }
    return false;
}

std::pair<ScrubFindingSet, ScrubFindingSet>
ScrubFindingSet::partition(std::set<scrub_artifact_e> const& waived) const
{
    std::vector<ScrubFinding> w;
    std::vector<ScrubFinding> rest;
    for (auto const& f: findings) {
        (waived.contains(f.getKind()) ? w : rest).push_back(f);
    }
    // Keep the identifiers assigned by the scan.
    ScrubFindingSet waived_set;
    ScrubFindingSet rest_set;
    waived_set.findings = std::move(w);
    rest_set.findings = std::move(rest);
    return {waived_set, rest_set};
}

JSON
ScrubFindingSet::getJSON() const
{
    auto j = JSON::makeArray();
    for (auto const& f: findings) {
        j.addArrayElement(f.getJSON());
    }
    return j;
}
