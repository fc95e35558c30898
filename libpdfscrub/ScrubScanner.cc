#include <pdfscrub/ScrubScanner.hh>

#include <pdfscrub/ScrubDetectors.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStatistics.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubWorkerPool.hh>

#include <algorithm>
#include <future>

using namespace pdfscrub;
using namespace pdfscrub::impl;

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
ScrubDetector::~ScrubDetector() = default;

std::unique_ptr<ScrubDetector>
ScrubDetector::create(scrub_detector_e detector)
{
    switch (detector) {
    case sd_structural:
        return std::make_unique<StructuralDetector>();
    case sd_metadata:
        return std::make_unique<MetadataDetector>();
    case sd_signature:
        return std::make_unique<SignatureDetector>();
    case sd_stream:
        return std::make_unique<StreamDetector>();
    case sd_hidden_data:
        return std::make_unique<HiddenDataDetector>();
    }
    throw std::logic_error("ScrubDetector::create: unknown detector");
}

ScrubScanner::ScrubScanner(
    ScrubConfig const& config, std::shared_ptr<ScrubLogger> logger, std::shared_ptr<ScrubCancel> cancel) :
    config(config),
    logger(logger ? logger : ScrubLogger::defaultLogger()),
    cancel(cancel)
{
}

std::vector<ScrubFinding>
ScrubScanner::runDetector(scrub_detector_e detector, ScrubScanContext const& context)
{
    std::vector<ScrubFinding> findings;
    try {
        ScrubDetector::create(detector)->scan(context, findings);
    } catch (ScrubExc& e) {
        if (e.getErrorCode() == scrub_e_cancelled) {
            throw;
        }
        findings.clear();
        findings.push_back(ScrubFinding::atObject(
            ak_detector_fault, sev_high, ScrubObjGen(), ScrubFinding::detectorName(detector), e.what()));
    } catch (std::exception& e) {
        // A detector fault is data, not an error of the scan.
        findings.clear();
        findings.push_back(ScrubFinding::atObject(
            ak_detector_fault, sev_high, ScrubObjGen(), ScrubFinding::detectorName(detector), e.what()));
    }
    return findings;
}

std::vector<ScrubFinding>
ScrubScanner::runDetector(scrub_detector_e detector, ScrubObjectGraph const& graph)
{
    auto reachable = graph.reachable();
    ScrubScanContext context{graph, config, reachable, cancel.get()};
    return runDetector(detector, context);
}

void
ScrubScanner::predecode(ScrubObjectGraph const& graph, ScrubObjGen::set const& reachable)
{
    std::vector<std::shared_ptr<ScrubStream>> large;
    for (auto const& og: reachable) {
        auto stream = graph.getStream(og);
        if (stream && !stream->isDecoded() &&
            stream->getRawData().size() >= config.decode_pool_threshold &&
            (is_image(stream->getDict()) || is_embedded_file(stream->getDict()))) {
            large.push_back(stream);
        }
    }
    if (large.empty()) {
        return;
    }
    auto details = JSON::makeDictionary();
    details.addDictionaryMember("streams", JSON::makeInt(static_cast<long long>(large.size())));
    logger->event("scan", "decoding large streams", details);
    ScrubWorkerPool pool(static_cast<size_t>(std::max(1, config.decode_threads)));
    for (auto const& stream: large) {
        // A failure is recorded in the stream's status and reported by the detectors.
        pool.submit([stream]() { stream->decode(); });
    }
    pool.join();
}

ScrubFindingSet
ScrubScanner::scan(ScrubObjectGraph const& graph)
{
    if (cancel) {
        cancel->check("scan");
    }
    logger->event("scan", "start");
    auto reachable = graph.reachable();
    predecode(graph, reachable);

    ScrubScanContext context{graph, config, reachable, cancel.get()};
    std::vector<std::pair<scrub_detector_e, std::future<std::vector<ScrubFinding>>>> tasks;
    for (auto detector: ScrubFinding::allDetectors()) {
        if (!config.isDetectorEnabled(detector)) {
            continue;
        }
        tasks.emplace_back(
            detector,
            std::async(std::launch::async, [this, detector, &context]() {
                return runDetector(detector, context);
            }));
    }

    // Join every task before anything is rethrown; they all refer to the context.
    std::vector<ScrubFinding> all;
    std::exception_ptr error;
    for (auto& [detector, task]: tasks) {
        try {
            auto findings = task.get();
            all.insert(all.end(), findings.begin(), findings.end());
        } catch (std::exception&) {
            if (!error) {
                error = std::current_exception();
            }
        }
    }
    if (error) {
        std::rethrow_exception(error);
    }
    ScrubFindingSet result(all);
    auto details = JSON::makeDictionary();
    details.addDictionaryMember("findings", JSON::makeInt(static_cast<long long>(result.size())));
    logger->event("scan", "finish", details);
    return result;
}
