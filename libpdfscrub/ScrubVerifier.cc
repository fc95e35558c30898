#include <pdfscrub/ScrubVerifier.hh>

#include <pdfscrub/Pl_SHA2.hh>
#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubScanner.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <stdexcept>

namespace
{
    std::string
    get_string(JSON const& j, std::string const& key)
    {
        std::string result;
        if (!j.getDictItem(key).getString(result)) {
            throw std::runtime_error("verification record: missing or invalid \"" + key + "\"");
        }
        return result;
    }

    long long
    get_int(JSON const& j, std::string const& key)
    {
        std::string result;
        if (!j.getDictItem(key).getNumber(result)) {
            throw std::runtime_error("verification record: missing or invalid \"" + key + "\"");
        }
        return ScrubUtil::string_to_ll(result.c_str());
    }
} // namespace

std::string
ScrubVerificationRecord::computeLink() const
{
    Pl_SHA2 sha;
    auto field = [&sha](std::string const& value) {
        sha << ScrubUtil::uint_to_string(value.size()) << ":" << value << ";";
    };
    field(previous_link);
    field(lineage);
    field(ScrubUtil::int_to_string(attempt));
    field(timestamp);
    field(identity);
    field(pre_hash);
    field(post_hash);
    field(ScrubUtil::uint_to_string(residual_count));
    field(ScrubUtil::uint_to_string(waived_count));
    field(residual_findings.unparseCompact());
    sha.finish();
    return sha.getHexDigest();
}

JSON
ScrubVerificationRecord::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("attempt", JSON::makeInt(attempt));
    j.addDictionaryMember("lineage", JSON::makeString(lineage));
    j.addDictionaryMember("timestamp", JSON::makeString(timestamp));
    j.addDictionaryMember("identity", JSON::makeString(identity));
    j.addDictionaryMember("pre_hash", JSON::makeString(pre_hash));
    j.addDictionaryMember("post_hash", JSON::makeString(post_hash));
    j.addDictionaryMember("residual_count", JSON::makeInt(ScrubIntC::to_longlong(residual_count)));
    j.addDictionaryMember("waived_count", JSON::makeInt(ScrubIntC::to_longlong(waived_count)));
    j.addDictionaryMember("residual_findings", residual_findings);
    j.addDictionaryMember("previous_link", JSON::makeString(previous_link));
    j.addDictionaryMember("chain_link", JSON::makeString(chain_link));
    return j;
}

ScrubVerificationRecord
ScrubVerificationRecord::fromJSON(JSON const& j)
{
    if (!j.isDictionary()) {
        throw std::runtime_error("verification record: not a JSON object");
    }
    ScrubVerificationRecord r;
    r.attempt = ScrubIntC::to_int(get_int(j, "attempt"));
    r.lineage = get_string(j, "lineage");
    r.timestamp = get_string(j, "timestamp");
    r.identity = get_string(j, "identity");
    r.pre_hash = get_string(j, "pre_hash");
    r.post_hash = get_string(j, "post_hash");
    r.residual_count = ScrubIntC::to_size(get_int(j, "residual_count"));
    r.waived_count = ScrubIntC::to_size(get_int(j, "waived_count"));
    r.residual_findings = j.getDictItem("residual_findings");
    if (!r.residual_findings.isArray()) {
        throw std::runtime_error("verification record: missing or invalid \"residual_findings\"");
    }
    r.previous_link = get_string(j, "previous_link");
    r.chain_link = get_string(j, "chain_link");
    return r;
}

ScrubVerifier::ScrubVerifier(
    ScrubConfig const& config, std::shared_ptr<ScrubLogger> logger, std::shared_ptr<ScrubCancel> cancel) :
    config(config),
    logger(logger ? logger : ScrubLogger::defaultLogger()),
    cancel(cancel)
{
}

std::string
ScrubVerifier::canonicalHash(ScrubObjectGraph const& graph)
{
    Pl_SHA2 sha;
    for (auto const& og: graph.getObjectKeys()) {
        sha << og.unparse(' ') << " obj\n" << graph.getObject(og).unparse();
        if (auto stream = graph.getStream(og)) {
            sha << "\nstream\n" << stream->getRawData() << "\nendstream";
        }
        sha << "\nendobj\n";
    }
    sha << "trailer\n" << graph.getTrailer().unparse();
    sha.finish();
    return sha.getHexDigest();
}

ScrubVerificationRecord
ScrubVerifier::verify(
    std::string const& pre_hash,
    ScrubObjectGraph const& graph,
    ScrubRunContext const& context,
    std::string const& previous_link,
    int attempt)
{
    auto details = JSON::makeDictionary();
    details.addDictionaryMember("attempt", JSON::makeInt(attempt));
    logger->event("verify", "start", details);

    ScrubScanner scanner(config, logger, cancel);
    auto [waived, residual] = scanner.scan(graph).partition(config.effectiveWaivers());

    ScrubVerificationRecord record;
    record.attempt = attempt;
    record.lineage = context.lineage;
    record.timestamp = context.timestamp;
    record.identity = context.identity;
    record.pre_hash = pre_hash;
    record.post_hash = canonicalHash(graph);
    record.residual_count = residual.size();
    record.waived_count = waived.size();
    record.residual = residual;
    record.residual_findings = residual.getJSON();
    record.previous_link = previous_link;
    record.chain_link = record.computeLink();

    details = JSON::makeDictionary();
    details.addDictionaryMember("attempt", JSON::makeInt(attempt));
    details.addDictionaryMember("residual", JSON::makeInt(ScrubIntC::to_longlong(residual.size())));
    details.addDictionaryMember("chain_link", JSON::makeString(record.chain_link));
    logger->event("verify", record.passed() ? "passed" : "failed", details);
    return record;
}
