#include <pdfscrub/ScrubConfig.hh>

#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <cstdlib>
#include <list>
#include <stdexcept>

using namespace std::literals;

namespace
{
    char const* const config_schema = R"json({
  "keep_document_id": "(boolean)",
  "allowed_metadata_fields": ["(string)"],
  "waived": ["(string)"],
  "disabled_detectors": ["(string)"],
  "force_remove": "(boolean)",
  "xref_mode": "(string): classic or stream",
  "compress_streams": "(boolean)",
  "timeout_seconds": "(number)",
  "max_input_size": "(number)",
  "decode_threads": "(number)",
  "decode_pool_threshold": "(number)",
  "max_decoded_size": "(number)",
  "stego_threshold": "(number)",
  "entropy_threshold": "(number)",
  "verify_output": "(boolean)"
})json";

    std::set<std::string>
    get_strings(JSON j)
    {
        // The schema allows a single string in place of an array.
        std::set<std::string> result;
        std::string s;
        if (j.getString(s)) {
            result.insert(s);
        }
        j.forEachArrayItem([&result](JSON item) {
            std::string v;
            if (item.getString(v)) {
                result.insert(v);
            }
        });
        return result;
    }

    double
    get_number(JSON j)
    {
        std::string s;
        j.getNumber(s);
        return std::strtod(s.c_str(), nullptr);
    }
} // namespace

ScrubConfig::ScrubConfig() :
    allowed_metadata_fields({"CreationDate"})
{
}

bool
ScrubConfig::isDetectorEnabled(scrub_detector_e detector) const
{
    return !disabled_detectors.contains(detector);
}

bool
ScrubConfig::isWaived(scrub_artifact_e kind) const
{
    return effectiveWaivers().contains(kind);
}

std::set<scrub_artifact_e>
ScrubConfig::effectiveWaivers() const
{
    auto result = waived;
    if (keep_document_id) {
        result.insert(ak_document_id);
    }
    return result;
}

JSON
ScrubConfig::schema()
{
    return JSON::parse(config_schema);
}

void
ScrubConfig::updateFromJSON(std::string const& json)
{
    JSON j;
    try {
        j = JSON::parse(json);
    } catch (std::runtime_error& e) {
        throw std::runtime_error("configuration is not valid JSON: "s + e.what());
    }
    updateFromJSON(j);
}

void
ScrubConfig::updateFromJSON(JSON j)
{
    std::list<std::string> errors;
    if (!j.checkSchema(schema(), JSON::f_optional, errors)) {
        std::string msg = "configuration has errors:";
        for (auto const& e: errors) {
            msg += "\n  " + e;
        }
        throw std::runtime_error(msg);
    }

    // Validate everything before changing anything.
    auto copy = *this;
    std::list<std::string> problems;
    j.forEachDictItem([&copy, &problems](std::string const& key, JSON value) {
        bool b = false;
        if (key == "keep_document_id" && value.getBool(b)) {
            copy.keep_document_id = b;
        } else if (key == "force_remove" && value.getBool(b)) {
            copy.force_remove = b;
        } else if (key == "compress_streams" && value.getBool(b)) {
            copy.compress_streams = b;
        } else if (key == "verify_output" && value.getBool(b)) {
            copy.verify_output = b;
        } else if (key == "allowed_metadata_fields") {
            copy.allowed_metadata_fields.clear();
            for (auto const& field: get_strings(value)) {
                copy.allowed_metadata_fields.insert(field.starts_with("/") ? field.substr(1) : field);
            }
        } else if (key == "waived") {
            copy.waived.clear();
            for (auto const& name: get_strings(value)) {
                scrub_artifact_e kind;
                if (ScrubFinding::kindFromName(name, kind)) {
                    copy.waived.insert(kind);
                } else {
                    problems.emplace_back("unknown artifact category \"" + name + "\"");
                }
            }
        } else if (key == "disabled_detectors") {
            copy.disabled_detectors.clear();
            for (auto const& name: get_strings(value)) {
                scrub_detector_e detector;
                if (ScrubFinding::detectorFromName(name, detector)) {
                    copy.disabled_detectors.insert(detector);
                } else {
                    problems.emplace_back("unknown detector \"" + name + "\"");
                }
            }
        } else if (key == "xref_mode") {
            std::string mode;
            value.getString(mode);
            if (mode == "classic") {
                copy.xref_mode = scrub_xref_classic;
            } else if (mode == "stream") {
                copy.xref_mode = scrub_xref_stream;
            } else {
                problems.emplace_back("xref_mode must be \"classic\" or \"stream\"");
            }
        } else {
            auto n = get_number(value);
            if (n < 0) {
                problems.emplace_back(key + " may not be negative");
            } else if (key == "timeout_seconds") {
                copy.timeout_seconds = n;
            } else if (key == "max_input_size") {
                copy.max_input_size = static_cast<unsigned long long>(n);
            } else if (key == "decode_threads") {
                if (n < 1 || n > 64) {
                    problems.emplace_back("decode_threads must be between 1 and 64");
                } else {
                    copy.decode_threads = static_cast<int>(n);
                }
            } else if (key == "decode_pool_threshold") {
                copy.decode_pool_threshold = static_cast<unsigned long long>(n);
            } else if (key == "max_decoded_size") {
                copy.max_decoded_size = static_cast<unsigned long long>(n);
            } else if (key == "stego_threshold") {
                if (n > 1) {
                    problems.emplace_back("stego_threshold must be between 0 and 1");
                } else {
                    copy.stego_threshold = n;
                }
            } else if (key == "entropy_threshold") {
                if (n > 8) {
                    problems.emplace_back("entropy_threshold must be between 0 and 8");
                } else {
                    copy.entropy_threshold = n;
                }
            }
        }
    });
    if (!problems.empty()) {
        std::string msg = "configuration has errors:";
        for (auto const& e: problems) {
            msg += "\n  " + e;
        }
        throw std::runtime_error(msg);
    }
    *this = copy;
}

JSON
ScrubConfig::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("keep_document_id", JSON::makeBool(keep_document_id));
    auto fields = j.addDictionaryMember("allowed_metadata_fields", JSON::makeArray());
    for (auto const& f: allowed_metadata_fields) {
        fields.addArrayElement(JSON::makeString(f));
    }
    auto w = j.addDictionaryMember("waived", JSON::makeArray());
    for (auto kind: waived) {
        w.addArrayElement(JSON::makeString(ScrubFinding::kindName(kind)));
    }
    auto d = j.addDictionaryMember("disabled_detectors", JSON::makeArray());
    for (auto detector: disabled_detectors) {
        d.addArrayElement(JSON::makeString(ScrubFinding::detectorName(detector)));
    }
    j.addDictionaryMember("force_remove", JSON::makeBool(force_remove));
    j.addDictionaryMember(
        "xref_mode", JSON::makeString(xref_mode == scrub_xref_stream ? "stream" : "classic"));
    j.addDictionaryMember("compress_streams", JSON::makeBool(compress_streams));
    j.addDictionaryMember("timeout_seconds", JSON::makeReal(timeout_seconds));
    j.addDictionaryMember(
        "max_input_size", JSON::makeInt(static_cast<long long>(max_input_size)));
    j.addDictionaryMember("decode_threads", JSON::makeInt(decode_threads));
    j.addDictionaryMember(
        "decode_pool_threshold", JSON::makeInt(static_cast<long long>(decode_pool_threshold)));
    j.addDictionaryMember(
        "max_decoded_size", JSON::makeInt(static_cast<long long>(max_decoded_size)));
    j.addDictionaryMember("stego_threshold", JSON::makeReal(stego_threshold));
    j.addDictionaryMember("entropy_threshold", JSON::makeReal(entropy_threshold));
    j.addDictionaryMember("verify_output", JSON::makeBool(verify_output));
    return j;
}
