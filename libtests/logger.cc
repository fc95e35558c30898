#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubLogger.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

static std::shared_ptr<Pipeline>
collect(std::string& into)
{
    return std::make_shared<Pl_String>("collect", nullptr, into);
}

static void
test_defaults()
{
    auto l = ScrubLogger::defaultLogger();
    assert(l == ScrubLogger::defaultLogger());
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
    assert(l->getWarn() == l->getError());
    assert(l->getSave(true) == nullptr);
    assert(l->getEvents(true) == nullptr);

    bool threw = false;
    try {
        l->getSave();
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);

    l->info("defaults: a line of info on standard output\n");
    l->warn("defaults: a warning on standard error\n");

    // Standard output has been written, so it can no longer take the saved PDF.
    threw = false;
    try {
        l->saveToStandardOutput(true);
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(l->getSave(true) == nullptr);

    l->setWarn(l->discard());
    l->warn("defaults: this warning is dropped\n");
    l->setWarn(nullptr);
    assert(l->getWarn() == l->standardError());
}

static void
test_save_to_stdout()
{
    auto l = ScrubLogger::create();
    l->saveToStandardOutput(true);
    assert(l->getSave() == l->standardOutput());
    assert(l->getInfo() == l->standardError());
    l->info(std::string("save: info moved to standard error\n"));

    // A second request that only applies when unset changes nothing.
    std::string other;
    l->setSave(collect(other), true);
    assert(l->getSave() == l->standardOutput());

    // Restoring info keeps it away from the saved output.
    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardError());

    l->setSave(nullptr, false);
    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardOutput());
}

static void
test_warn_follows_error()
{
    auto l = ScrubLogger::create();

    std::string first_errors;
    l->setError(collect(first_errors));
    l->warn("W1\n");
    l->error("E1\n");
    assert(first_errors == "W1\nE1\n");

    std::string warnings;
    l->setWarn(collect(warnings));
    l->warn("W2\n");
    l->error(std::string("E2\n"));
    assert(warnings == "W2\n");
    assert(first_errors == "W1\nE1\nE2\n");

    // Replacing error leaves an explicit warn destination alone.
    std::string second_errors;
    l->setError(collect(second_errors));
    l->warn(std::string("W3\n"));
    l->error("E3\n");
    assert(warnings == "W2\nW3\n");
    assert(second_errors == "E3\n");

    // Once reset, warn follows whatever error is.
    l->setWarn(nullptr);
    l->warn("W4\n");
    assert(warnings == "W2\nW3\n");
    assert(second_errors == "E3\nW4\n");

    l->setError(nullptr);
    assert(l->getWarn() == l->standardError());
    assert(first_errors == "W1\nE1\nE2\n");
}

static void
test_events()
{
    auto l = ScrubLogger::create();
    std::string info;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));

    // Without an events pipeline, events go nowhere.
    assert(l->getEvents(true) == nullptr);
    l->event("parse", "start");
    assert(info.empty());

    std::string events;
    l->setEvents(std::make_shared<Pl_String>("events", nullptr, events));
    auto details = JSON::makeDictionary();
    details.addDictionaryMember("objects", JSON::makeInt(4));
    l->event("parse", "finish", details);
    l->event("scan", "start");
    assert(
        events ==
        "{\"details\":{\"objects\":4},\"message\":\"finish\",\"stage\":\"parse\"}\n"
        "{\"details\":{},\"message\":\"start\",\"stage\":\"scan\"}\n");
    assert(info.empty());

    l->setVerbose(true, "scrubber");
    l->event("clean", "3 actions");
    assert(info == "scrubber: clean: 3 actions\n");

    // Concurrent detectors log through the same logger; lines stay whole.
    events.clear();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([l, t]() {
            for (int i = 0; i < 50; ++i) {
                l->event("scan", "thread " + std::to_string(t));
            }
        });
    }
    for (auto& t: threads) {
        t.join();
    }
    size_t lines = 0;
    size_t pos = 0;
    while ((pos = events.find('\n', pos)) != std::string::npos) {
        ++lines;
        ++pos;
    }
    assert(lines == 200);
    auto first_line = events.substr(0, events.find('\n'));
    assert(JSON::parse(first_line).isDictionary());

    auto size = events.size();
    l->setEvents(nullptr);
    l->setVerbose(false);
    l->event("rebuild", "not recorded");
    assert(events.size() == size);
}

static void
test_streams()
{
    auto l = ScrubLogger::create();
    std::ostringstream out;
    std::ostringstream err;
    l->setOutputStreams(&out, &err);
    l->info("to out\n");
    l->warn("to err\n");
    l->error("also to err\n");
    l->getInfo()->finish();
    l->getError()->finish();
    assert(out.str() == "to out\n");
    assert(err.str() == "to err\nalso to err\n");
    assert(l->getWarn() == l->getError());

    // The standard streams select the logger's own pipelines.
    l->setOutputStreams(&std::cout, &std::cerr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
}

int
main()
{
    test_defaults();
    test_save_to_stdout();
    test_warn_follows_error();
    test_events();
    test_streams();
    std::cout << "logger tests done" << std::endl;
    return 0;
}
