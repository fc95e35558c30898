#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubConfig.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubRunContext.hh>

#include <chrono>
#include <iostream>
#include <thread>

static void
expect_error(std::string const& json, std::string const& fragment)
{
    ScrubConfig c;
    c.force_remove = true;
    try {
        c.updateFromJSON(json);
        assert(false);
    } catch (std::runtime_error& e) {
        if (std::string(e.what()).find(fragment) == std::string::npos) {
            std::cout << "unexpected message: " << e.what() << std::endl;
            assert(false);
        }
    }
    // A failed update changes nothing.
    assert(c.force_remove);
    assert(c.waived.empty());
}

static void
test_defaults()
{
    ScrubConfig c;
    assert(!c.keep_document_id);
    assert(c.allowed_metadata_fields == std::set<std::string>{"CreationDate"});
    assert(c.waived.empty());
    assert(c.effectiveWaivers().empty());
    for (auto d: ScrubFinding::allDetectors()) {
        assert(c.isDetectorEnabled(d));
    }
    assert(!c.force_remove);
    assert(c.xref_mode == scrub_xref_classic);
    assert(c.compress_streams);
    assert(c.verify_output);

    c.keep_document_id = true;
    assert(c.isWaived(ak_document_id));
    assert(c.waived.empty());
}

static void
test_json()
{
    ScrubConfig c;
    c.updateFromJSON(R"({
  "keep_document_id": true,
  "allowed_metadata_fields": ["/Title", "CreationDate"],
  "waived": "PartialSignatureCoverage",
  "disabled_detectors": ["hidden-data"],
  "xref_mode": "stream",
  "timeout_seconds": 2.5,
  "decode_threads": 2,
  "stego_threshold": 0.99
})");
    assert(c.keep_document_id);
    assert((c.allowed_metadata_fields == std::set<std::string>{"CreationDate", "Title"}));
    assert(c.waived == std::set<scrub_artifact_e>{ak_partial_signature_coverage});
    assert((c.effectiveWaivers() ==
            std::set<scrub_artifact_e>{ak_document_id, ak_partial_signature_coverage}));
    assert(!c.isDetectorEnabled(sd_hidden_data));
    assert(c.isDetectorEnabled(sd_stream));
    assert(c.xref_mode == scrub_xref_stream);
    assert(c.timeout_seconds == 2.5);
    assert(c.decode_threads == 2);
    assert(c.stego_threshold == 0.99);
    // Keys that weren't mentioned keep their values.
    assert(c.compress_streams);

    // getJSON gives back something updateFromJSON accepts.
    ScrubConfig d;
    d.updateFromJSON(c.getJSON());
    assert(d.getJSON().unparse() == c.getJSON().unparse());

    expect_error("{\"waived\": [\"Sparkles\"]}", "unknown artifact category \"Sparkles\"");
    expect_error("{\"disabled_detectors\": \"everything\"}", "unknown detector");
    expect_error("{\"xref_mode\": \"fancy\"}", "xref_mode");
    expect_error("{\"decode_threads\": 0}", "decode_threads must be between 1 and 64");
    expect_error("{\"stego_threshold\": 1.5}", "stego_threshold");
    expect_error("{\"timeout_seconds\": -1}", "may not be negative");
    expect_error("{\"force_remove\": \"yes\"}", "force_remove");
    expect_error("{\"colour\": true}", "colour");
    expect_error("{\"waived\": [}", "not valid JSON");
}

static void
test_names()
{
    // Every kind round-trips through its name, and the names are the ones reports use.
    for (auto kind: ScrubFinding::allKinds()) {
        scrub_artifact_e k;
        assert(ScrubFinding::kindFromName(ScrubFinding::kindName(kind), k));
        assert(k == kind);
    }
    assert(ScrubFinding::allKinds().size() == 22);
    assert(std::string(ScrubFinding::kindName(ak_lsb_payload)) == "LsbPayload");
    scrub_artifact_e k;
    assert(!ScrubFinding::kindFromName("lsbpayload", k));

    for (auto d: ScrubFinding::allDetectors()) {
        scrub_detector_e out;
        assert(ScrubFinding::detectorFromName(ScrubFinding::detectorName(d), out));
        assert(out == d);
    }
    assert(std::string(ScrubFinding::detectorName(sd_hidden_data)) == "hidden-data");
    assert(ScrubFinding::detectorOf(ak_hidden_action) == sd_hidden_data);
    assert(ScrubFinding::detectorOf(ak_hidden_optional_content) == sd_hidden_data);
    assert(ScrubFinding::detectorOf(ak_document_id) == sd_metadata);
    assert(ScrubFinding::detectorOf(ak_off_page_content) == sd_stream);

    assert(std::string(ScrubFinding::actionName(sa_rewritten)) == "Rewritten");
    assert(std::string(ScrubFinding::statusName(ss_cancelled)) == "CancellationError");
    assert(std::string(ScrubFinding::severityName(sev_high)) == "high");
}

static void
test_finding_set()
{
    std::vector<ScrubFinding> raw = {
        ScrubFinding::atRange(ak_hidden_trailing_data, sev_high, 900, 12, "junk"),
        ScrubFinding::atObject(ak_info_metadata, sev_medium, ScrubObjGen(7, 0), "/Author", "Bo"),
        ScrubFinding::atObject(ak_detector_fault, sev_high, ScrubObjGen(), "stream", "boom"),
        ScrubFinding::atRange(ak_revision_history, sev_medium, 0, 400, "revision 1 of 2"),
        ScrubFinding::atObject(ak_revision_history, sev_medium, ScrubObjGen(3, 0), "", "old"),
        ScrubFinding::atObject(ak_orphaned_object, sev_low, ScrubObjGen(9, 0), "", "orphan"),
        // Same artifact reported twice
        ScrubFinding::atObject(ak_info_metadata, sev_medium, ScrubObjGen(7, 0), "/Author", "Bo"),
    };
    ScrubFindingSet set(raw);
    assert(set.size() == 6);
    auto const& f = set.getFindings();
    // Detector order, then kind, object findings before byte ranges, and faults last
    assert(f.at(0).getKind() == ak_orphaned_object);
    assert(f.at(1).getKind() == ak_revision_history && !f.at(1).isByteRange());
    assert(f.at(2).getKind() == ak_revision_history && f.at(2).isByteRange());
    assert(f.at(3).getKind() == ak_info_metadata);
    assert(f.at(4).getKind() == ak_hidden_trailing_data);
    assert(f.at(5).getKind() == ak_detector_fault);
    for (size_t i = 0; i < f.size(); ++i) {
        assert(f.at(i).getId() == "F" + std::to_string(i + 1));
    }

    // Order of input doesn't matter.
    std::vector<ScrubFinding> reversed(raw.rbegin(), raw.rend());
    ScrubFindingSet other(reversed);
    assert(other.getJSON().unparse() == set.getJSON().unparse());

    assert(f.at(2).describeLocation() == "0+400");
    assert(f.at(3).describeLocation() == "7 0 /Author");
    assert(f.at(5).describeLocation() == "trailer stream");
    assert(set.contains(ScrubFinding::atObject(ak_orphaned_object, sev_high, ScrubObjGen(9, 0), "", "")));
    assert(!set.contains(ScrubFinding::atObject(ak_orphaned_object, sev_low, ScrubObjGen(8, 0), "", "")));

    auto [waived, rest] = set.partition({ak_revision_history, ak_encrypted});
    assert(waived.size() == 2);
    assert(rest.size() == 4);
    assert(waived.count(ak_revision_history) == 2);

    auto j = f.at(4).getJSON();
    std::string s;
    assert(j.getDictItem("category").getString(s) && s == "HiddenTrailingData");
    assert(j.getDictItem("detector").getString(s) && s == "hidden-data");
    assert(j.getDictItem("location").getDictItem("offset").getNumber(s) && s == "900");
    // Binary evidence is shown in hex.
    auto binary = ScrubFinding::atObject(
        ak_steganographic_padding, sev_high, ScrubObjGen(4, 0), "", std::string("\x01\xff", 2));
    assert(binary.getJSON().getDictItem("evidence").getString(s) && s == "01ff");
}

static void
test_cancel()
{
    auto c = ScrubCancel::create();
    assert(!c->isCancelled());
    c->check("anywhere");
    c->cancel();
    assert(c->isCancelled());
    try {
        c->check("scan");
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_cancelled);
        assert(e.getObject() == "scan");
    }

    auto none = ScrubCancel::withTimeout(0);
    none->check("parse");
    auto t = ScrubCancel::withTimeout(0.01);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(t->isCancelled());
    try {
        t->check("clean");
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getMessageDetail() == "timeout expired");
    }
}

int
main()
{
    test_defaults();
    test_json();
    test_names();
    test_finding_set();
    test_cancel();
    std::cout << "config tests done" << std::endl;
    return 0;
}
