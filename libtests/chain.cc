#include <pdfscrub/assert_test.h>

#include "scrub_test_pdf.hh"

#include <pdfscrub/ScrubChainStore.hh>
#include <pdfscrub/ScrubJob.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/ScrubVerifier.hh>

#include <filesystem>
#include <functional>
#include <iostream>

static std::shared_ptr<ScrubLogger>
quiet_logger()
{
    auto l = ScrubLogger::create();
    l->setInfo(l->discard());
    l->setWarn(l->discard());
    l->setError(l->discard());
    return l;
}

static ScrubRunContext
context(std::string const& timestamp)
{
    ScrubRunContext c;
    c.timestamp = timestamp;
    c.identity = "chain tests";
    c.lineage = "doc-1";
    return c;
}

static std::string
document(std::string const& text, bool with_orphan)
{
    TestPDF pdf;
    add_one_page(pdf, "BT 72 700 Td (" + text + ") Tj ET");
    if (with_orphan) {
        pdf.object(5, "<< /Orphan true >>");
    }
    pdf.finishRevision();
    return pdf.str();
}

static void
test_verifier()
{
    ScrubObjectGraph clean;
    clean.processMemory("clean", document("fine", false));
    ScrubVerifier verifier(ScrubConfig(), quiet_logger());
    auto r = verifier.verify("pre", clean, context("2026-02-01T00:00:00Z"), "");
    assert(r.passed());
    assert(r.attempt == 1);
    assert(r.lineage == "doc-1");
    assert(r.identity == "chain tests");
    assert(r.post_hash == ScrubVerifier::canonicalHash(clean));
    assert(r.post_hash.size() == 64);
    assert(r.previous_link.empty());
    assert(r.chain_link.size() == 64);
    assert(r.chain_link == r.computeLink());

    ScrubObjectGraph dirty;
    dirty.processMemory("dirty", document("fine", true));
    auto failed = verifier.verify("pre", dirty, context("2026-02-01T00:00:01Z"), r.chain_link, 2);
    assert(!failed.passed());
    assert(failed.attempt == 2);
    assert(failed.residual_count == 1);
    assert(failed.residual.count(ak_orphaned_object) == 1);
    assert(failed.residual_findings.unparse() == failed.residual.getJSON().unparse());
    assert(failed.previous_link == r.chain_link);
    // The orphan is part of the canonical form.
    assert(failed.post_hash != r.post_hash);

    ScrubConfig config;
    config.waived = {ak_orphaned_object};
    auto waived = ScrubVerifier(config, quiet_logger())
                      .verify("pre", dirty, context("2026-02-01T00:00:02Z"), "");
    assert(waived.passed());
    assert(waived.waived_count == 1);

    // The canonical hash depends only on objects and trailer.
    ScrubObjectGraph again;
    again.processMemory("again", document("fine", false));
    assert(ScrubVerifier::canonicalHash(again) == ScrubVerifier::canonicalHash(clean));
    again.getRoot().replaceKey("/Lang", ScrubObject::newString("en"));
    assert(ScrubVerifier::canonicalHash(again) != ScrubVerifier::canonicalHash(clean));
}

static void
test_link_fields()
{
    ScrubVerificationRecord r;
    r.lineage = "doc-1";
    r.timestamp = "2026-02-01T00:00:00Z";
    r.identity = "chain tests";
    r.pre_hash = "pre";
    r.post_hash = "post";
    r.residual_count = 10;
    auto base = r.computeLink();

    // Bytes moved from one value into its neighbor still change the link.
    auto shifted = r;
    shifted.timestamp += "1";
    shifted.residual_count = 0;
    assert(shifted.computeLink() != base);
    shifted = r;
    shifted.pre_hash = "prep";
    shifted.post_hash = "ost";
    assert(shifted.computeLink() != base);

    // Every recorded value is covered.
    std::vector<std::function<void(ScrubVerificationRecord&)>> edits = {
        [](ScrubVerificationRecord& x) { x.previous_link = "abc"; },
        [](ScrubVerificationRecord& x) { x.lineage = "doc-2"; },
        [](ScrubVerificationRecord& x) { x.attempt = 2; },
        [](ScrubVerificationRecord& x) { x.timestamp = "2026-02-01T00:00:01Z"; },
        [](ScrubVerificationRecord& x) { x.identity = "someone else"; },
        [](ScrubVerificationRecord& x) { x.pre_hash = "pre2"; },
        [](ScrubVerificationRecord& x) { x.post_hash = "post2"; },
        [](ScrubVerificationRecord& x) { x.residual_count = 11; },
        [](ScrubVerificationRecord& x) { x.waived_count = 1; },
        [](ScrubVerificationRecord& x) {
            x.residual_findings = JSON::makeArray();
            x.residual_findings.addArrayElement(JSON::makeString("f-1"));
        },
    };
    for (auto const& edit: edits) {
        auto x = r;
        edit(x);
        assert(x.computeLink() != base);
    }
}

static std::shared_ptr<ScrubJob>
job(std::shared_ptr<ScrubChainStore> store, std::string const& timestamp)
{
    auto j = std::make_shared<ScrubJob>();
    j->setLogger(quiet_logger());
    j->setChainStore(store);
    j->setRunContext(context(timestamp));
    return j;
}

static void
test_linked_runs()
{
    auto store = ScrubChainStore::memory();
    assert(store->lastLink("doc-1").empty());
    assert(store->load("doc-1").empty());

    auto first = job(store, "2026-03-01T08:00:00Z");
    first->processData("first", document("one", true));
    assert(first->getStatus() == ss_clean);
    auto records = store->load("doc-1");
    assert(records.size() == 1);
    assert(records.at(0).previous_link.empty());

    auto second = job(store, "2026-03-01T09:00:00Z");
    second->processData("second", document("two", false));
    assert(second->getStatus() == ss_clean);
    records = store->load("doc-1");
    assert(records.size() == 2);
    assert(records.at(1).previous_link == records.at(0).chain_link);
    assert(store->lastLink("doc-1") == records.at(1).chain_link);
    assert(ScrubChainStore::verifyChain(records) == -1);
    assert(store->load("doc-2").empty());

    // Changing any recorded value breaks that record's link.
    auto tampered = records;
    tampered.at(1).residual_count = 3;
    assert(ScrubChainStore::verifyChain(tampered) == 1);
    tampered = records;
    tampered.at(1).identity = "someone else";
    assert(ScrubChainStore::verifyChain(tampered) == 1);
    tampered = records;
    tampered.at(1).lineage = "doc-2";
    assert(ScrubChainStore::verifyChain(tampered) == 1);
    tampered = records;
    tampered.at(1).attempt = 2;
    assert(ScrubChainStore::verifyChain(tampered) == 1);
    tampered = records;
    tampered.at(0).waived_count = 4;
    assert(ScrubChainStore::verifyChain(tampered) == 0);
    tampered = records;
    tampered.at(0).residual_findings = JSON::parse(R"([{"id": "f-0001"}])");
    assert(ScrubChainStore::verifyChain(tampered) == 0);
    tampered = records;
    tampered.at(0).timestamp = "2026-03-01T07:00:00Z";
    assert(ScrubChainStore::verifyChain(tampered) == 0);
    // Rewriting a link to match its record breaks the next one.
    tampered.at(0).chain_link = tampered.at(0).computeLink();
    assert(ScrubChainStore::verifyChain(tampered) == 1);
    // Dropping a record breaks the one after it.
    tampered = records;
    tampered.erase(tampered.begin());
    assert(ScrubChainStore::verifyChain(tampered) == 0);
    assert(ScrubChainStore::verifyChain({}) == -1);
}

static void
test_directory_store()
{
    std::string dir = "chain-test-store";
    std::filesystem::remove_all(dir);
    {
        auto store = ScrubChainStore::directory(dir);
        for (auto const& ts: {"2026-04-01T00:00:00Z", "2026-04-02T00:00:00Z"}) {
            auto j = job(store, ts);
            j->processData("doc", document(ts, true));
            assert(j->getStatus() == ss_clean);
        }
        // Lineage keys are not file names.
        auto odd = ScrubChainStore::directory(dir);
        ScrubVerificationRecord r;
        r.lineage = "../outside";
        r.timestamp = "2026-04-03T00:00:00Z";
        r.pre_hash = "p";
        r.post_hash = "q";
        r.chain_link = r.computeLink();
        odd->append("../outside", r);
        assert(odd->load("../outside").size() == 1);
        assert(!std::filesystem::exists("outside.jsonl"));
    }

    // A new store over the same directory sees the same chain.
    auto store = ScrubChainStore::directory(dir);
    auto records = store->load("doc-1");
    assert(records.size() == 2);
    assert(records.at(0).timestamp == "2026-04-01T00:00:00Z");
    assert(records.at(1).identity == "chain tests");
    assert(ScrubChainStore::verifyChain(records) == -1);

    // Edit the stored file the way someone covering their tracks would.
    auto filename = (std::filesystem::path(dir) / "doc-1.jsonl").string();
    auto text = ScrubUtil::read_file_into_string(filename.c_str());
    auto pos = text.find("2026-04-02T00:00:00Z");
    assert(pos != std::string::npos);
    text.replace(pos, 10, "2026-03-30");
    {
        FILE* f = ScrubUtil::safe_fopen(filename.c_str(), "wb");
        ScrubUtil::FileCloser fc(f);
        assert(fwrite(text.data(), 1, text.size(), f) == text.size());
    }
    records = store->load("doc-1");
    assert(records.size() == 2);
    assert(ScrubChainStore::verifyChain(records) == 1);

    // The same goes for the identity of whoever ran the first one.
    text = ScrubUtil::read_file_into_string(filename.c_str());
    pos = text.find("chain tests");
    assert(pos != std::string::npos);
    text.replace(pos, 11, "chain-tests");
    {
        FILE* f = ScrubUtil::safe_fopen(filename.c_str(), "wb");
        ScrubUtil::FileCloser fc(f);
        assert(fwrite(text.data(), 1, text.size(), f) == text.size());
    }
    records = store->load("doc-1");
    assert(ScrubChainStore::verifyChain(records) == 0);

    // A record round-trips through JSON.
    auto copy = ScrubVerificationRecord::fromJSON(records.at(0).getJSON());
    assert(copy.chain_link == records.at(0).chain_link);
    assert(copy.computeLink() == copy.chain_link);
    try {
        ScrubVerificationRecord::fromJSON(JSON::parse(R"({"attempt": 1})"));
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()).find("lineage") != std::string::npos);
    }
    std::filesystem::remove_all(dir);
}

int
main()
{
    test_verifier();
    test_link_fields();
    test_linked_runs();
    test_directory_store();
    std::cout << "chain tests done" << std::endl;
    return 0;
}
