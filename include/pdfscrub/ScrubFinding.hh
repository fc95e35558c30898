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


#ifndef SCRUBFINDING_HH
#define SCRUBFINDING_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/JSON.hh>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/Types.h>

#include <set>
#include <string>
#include <utility>
#include <vector>

// A forensic artifact found by one detector. A finding is located either at an object (with an
// optional path inside it, see ScrubObjectGraph::getPath) or at a byte range of the input. Object
// 0 0 stands for the trailer. Findings are immutable; a scan produces a new ScrubFindingSet each
// time it runs.
class ScrubFinding
{
  public:
    PDFSCRUB_DLL
    static ScrubFinding atObject(
        scrub_artifact_e kind,
        scrub_severity_e severity,
        ScrubObjGen og,
        std::string const& key,
        std::string const& evidence);
    PDFSCRUB_DLL
    static ScrubFinding atRange(
        scrub_artifact_e kind,
        scrub_severity_e severity,
        scrub_offset_t offset,
        scrub_offset_t length,
        std::string const& evidence);

    // Identifier within its finding set, such as F3. Empty until the finding is added to a set.
    PDFSCRUB_DLL
    std::string const& getId() const;
    PDFSCRUB_DLL
    scrub_artifact_e getKind() const;
    // The detector that owns getKind()
    PDFSCRUB_DLL
    scrub_detector_e getDetector() const;
    PDFSCRUB_DLL
    scrub_severity_e getSeverity() const;
    PDFSCRUB_DLL
    bool isByteRange() const;
    PDFSCRUB_DLL
    ScrubObjGen getObjGen() const;
    PDFSCRUB_DLL
    std::string const& getKey() const;
    PDFSCRUB_DLL
    scrub_offset_t getOffset() const;
    PDFSCRUB_DLL
    scrub_offset_t getLength() const;
    PDFSCRUB_DLL
    std::string const& getEvidence() const;

    // Same kind at the same location. Evidence and id are not compared.
    PDFSCRUB_DLL
    bool sameArtifact(ScrubFinding const&) const;
    // "n g", "n g /Key", or "offset+length"
    PDFSCRUB_DLL
    std::string describeLocation() const;

    PDFSCRUB_DLL
    JSON getJSON() const;

    // Names used in reports, configuration, and on the command line
    PDFSCRUB_DLL
    static char const* kindName(scrub_artifact_e);
    // Returns false if the name is unknown.
    PDFSCRUB_DLL
    static bool kindFromName(std::string const& name, scrub_artifact_e& kind);
    PDFSCRUB_DLL
    static scrub_detector_e detectorOf(scrub_artifact_e);
    PDFSCRUB_DLL
    static char const* detectorName(scrub_detector_e);
    PDFSCRUB_DLL
    static bool detectorFromName(std::string const& name, scrub_detector_e& detector);
    PDFSCRUB_DLL
    static char const* severityName(scrub_severity_e);
    PDFSCRUB_DLL
    static char const* actionName(scrub_action_e);
    PDFSCRUB_DLL
    static char const* statusName(scrub_status_e);

    // All kinds and detectors in numeric order
    PDFSCRUB_DLL
    static std::vector<scrub_artifact_e> const& allKinds();
    PDFSCRUB_DLL
    static std::vector<scrub_detector_e> const& allDetectors();

  private:
    friend class ScrubFindingSet;

    ScrubFinding() = default;

    std::string id;
    scrub_artifact_e kind{ak_detector_fault};
    scrub_severity_e severity{sev_low};
    bool byte_range{false};
    ScrubObjGen og;
    std::string key;
    scrub_offset_t offset{0};
    scrub_offset_t length{0};
    std::string evidence;
};

// The result of one scan pass. Findings are put in a deterministic order (detector, kind, location,
// key) and numbered F1, F2, ... in that order, so two scans of equivalent graphs produce the same
// set.
class ScrubFindingSet
{
  public:
    PDFSCRUB_DLL
    ScrubFindingSet() = default;
    PDFSCRUB_DLL
    explicit ScrubFindingSet(std::vector<ScrubFinding> findings);

    PDFSCRUB_DLL
    std::vector<ScrubFinding> const& getFindings() const;
    PDFSCRUB_DLL
    bool empty() const;
    PDFSCRUB_DLL
    size_t size() const;
    PDFSCRUB_DLL
    size_t count(scrub_artifact_e kind) const;
    PDFSCRUB_DLL
    bool contains(ScrubFinding const& f) const;

    // Split into findings of the waived kinds and the rest.
    PDFSCRUB_DLL
    std::pair<ScrubFindingSet, ScrubFindingSet>
    partition(std::set<scrub_artifact_e> const& waived) const;

    PDFSCRUB_DLL
    JSON getJSON() const;

  private:
    std::vector<ScrubFinding> findings;
};

#endif // SCRUBFINDING_HH
