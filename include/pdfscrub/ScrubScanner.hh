// Copyright (c) 2026 pdfscrub authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef SCRUBSCANNER_HH
#define SCRUBSCANNER_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubConfig.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubObjGen.hh>

#include <memory>
#include <vector>

class ScrubCancel;
class ScrubLogger;
class ScrubObjectGraph;

// What every detector sees: the graph, read only, and facts about it computed once per scan.
struct ScrubScanContext
{
    ScrubObjectGraph const& graph;
    ScrubConfig const& config;
    // Objects reachable from the current trailer
    ScrubObjGen::set const& reachable;
    // May be null
    ScrubCancel const* cancel;
};

// A detector examines the graph and appends the findings it owns. Detectors never modify the
// graph and share no mutable state, so they can run concurrently. Detectors are a closed set; see
// create().
class PDFSCRUB_DLL_CLASS ScrubDetector
{
  public:
    PDFSCRUB_DLL
    virtual ~ScrubDetector();

    virtual scrub_detector_e getDetector() const = 0;
    virtual void scan(ScrubScanContext const&, std::vector<ScrubFinding>& findings) = 0;

    PDFSCRUB_DLL
    static std::unique_ptr<ScrubDetector> create(scrub_detector_e);

  protected:
    PDFSCRUB_DLL
    ScrubDetector() = default;
};

// The scanner suite. scan() runs every enabled detector as a separate task and merges their
// results into one finding set. The same scanner is used for the first scan and for verification.
//
// A detector that throws does not stop the scan. Its failure becomes a DetectorFault finding.
// Cancellation is the exception: it is propagated after all tasks have finished.
class ScrubScanner
{
  public:
    PDFSCRUB_DLL
    ScrubScanner(
        ScrubConfig const& config,
        std::shared_ptr<ScrubLogger> logger = nullptr,
        std::shared_ptr<ScrubCancel> cancel = nullptr);

    PDFSCRUB_DLL
    ScrubFindingSet scan(ScrubObjectGraph const& graph);

    // Run one detector on the calling thread. Faults are reported as for scan().
    PDFSCRUB_DLL
    std::vector<ScrubFinding> runDetector(scrub_detector_e, ScrubObjectGraph const& graph);

  private:
    // Decode large image and embedded-file streams in a bounded worker pool.
    void predecode(ScrubObjectGraph const& graph, ScrubObjGen::set const& reachable);
    std::vector<ScrubFinding> runDetector(scrub_detector_e, ScrubScanContext const&);

    ScrubConfig config;
    std::shared_ptr<ScrubLogger> logger;
    std::shared_ptr<ScrubCancel> cancel;
};

#endif // SCRUBSCANNER_HH
