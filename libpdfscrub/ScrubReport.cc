#include <pdfscrub/ScrubReport.hh>

#include <pdfscrub/ScrubIntC.hh>

void
ScrubReport::setStatus(scrub_status_e s)
{
    status = s;
}

scrub_status_e
ScrubReport::getStatus() const
{
    return status;
}

void
ScrubReport::setInput(std::string const& name, scrub_offset_t size, std::string const& hash)
{
    input_name = name;
    input_size = size;
    pre_hash = hash;
}

std::string const&
ScrubReport::getPreHash() const
{
    return pre_hash;
}

void
ScrubReport::setContext(ScrubRunContext const& ctx)
{
    context = ctx;
    // The token belongs to the run, not to the audit trail.
    context.cancel = nullptr;
}

void
ScrubReport::setFindings(ScrubFindingSet const& f, ScrubFindingSet const& w)
{
    findings = f;
    waived = w;
}

ScrubFindingSet const&
ScrubReport::getFindings() const
{
    return findings;
}

ScrubFindingSet const&
ScrubReport::getWaived() const
{
    return waived;
}

void
ScrubReport::addActions(ScrubCleanReport const& r)
{
    actions.append(r);
}

ScrubCleanReport const&
ScrubReport::getActions() const
{
    return actions;
}

void
ScrubReport::addVerification(ScrubVerificationRecord const& r)
{
    verification.push_back(r);
}

std::vector<ScrubVerificationRecord> const&
ScrubReport::getVerification() const
{
    return verification;
}

void
ScrubReport::setHistory(size_t count, std::string const& last_link)
{
    history_count = count;
    history_last_link = last_link;
}

void
ScrubReport::addWarning(std::string const& w)
{
    warnings.push_back(w);
}

std::vector<std::string> const&
ScrubReport::getWarnings() const
{
    return warnings;
}

void
ScrubReport::setFinalHash(std::string const& h)
{
    final_hash = h;
}

std::string const&
ScrubReport::getFinalHash() const
{
    return final_hash;
}

void
ScrubReport::setError(std::string const& e)
{
    error = e;
}

std::string const&
ScrubReport::getError() const
{
    return error;
}

void
ScrubReport::discardResults()
{
    findings = ScrubFindingSet();
    waived = ScrubFindingSet();
    actions = ScrubCleanReport();
    verification.clear();
    warnings.clear();
    final_hash.clear();
}

JSON
ScrubReport::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("version", JSON::makeInt(LATEST_REPORT_VERSION));
    j.addDictionaryMember("status", JSON::makeString(ScrubFinding::statusName(status)));

    auto j_input = JSON::makeDictionary();
    j_input.addDictionaryMember("name", JSON::makeString(input_name));
    j_input.addDictionaryMember("size", JSON::makeInt(input_size));
    j_input.addDictionaryMember("pre_hash", JSON::makeString(pre_hash));
    j.addDictionaryMember("input", j_input);

    auto j_context = JSON::makeDictionary();
    j_context.addDictionaryMember("timestamp", JSON::makeString(context.timestamp));
    j_context.addDictionaryMember("identity", JSON::makeString(context.identity));
    j_context.addDictionaryMember("lineage", JSON::makeString(context.lineage));
    j.addDictionaryMember("context", j_context);

    j.addDictionaryMember("findings", findings.getJSON());
    j.addDictionaryMember("waived", waived.getJSON());
    j.addDictionaryMember("actions", actions.getJSON());

    auto j_verification = JSON::makeDictionary();
    auto j_records = JSON::makeArray();
    for (auto const& r: verification) {
        j_records.addArrayElement(r.getJSON());
    }
    j_verification.addDictionaryMember("records", j_records);
    auto j_history = JSON::makeDictionary();
    j_history.addDictionaryMember("count", JSON::makeInt(ScrubIntC::to_longlong(history_count)));
    j_history.addDictionaryMember("last_link", JSON::makeString(history_last_link));
    j_verification.addDictionaryMember("history", j_history);
    j.addDictionaryMember("verification", j_verification);

    auto j_warnings = JSON::makeArray();
    for (auto const& w: warnings) {
        j_warnings.addArrayElement(JSON::makeString(w));
    }
    j.addDictionaryMember("warnings", j_warnings);
    j.addDictionaryMember("final_hash", JSON::makeString(final_hash));
    if (!error.empty()) {
        j.addDictionaryMember("error", JSON::makeString(error));
    }
    return j;
}

std::string
ScrubReport::unparse() const
{
    return getJSON().unparse() + "\n";
}
