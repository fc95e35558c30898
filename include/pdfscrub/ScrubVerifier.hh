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


#ifndef SCRUBVERIFIER_HH
#define SCRUBVERIFIER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/JSON.hh>
#include <pdfscrub/ScrubConfig.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubRunContext.hh>

#include <memory>
#include <string>

class ScrubLogger;
class ScrubObjectGraph;

// One verification of a cleaned graph. Records of the same lineage form a hash chain: each
// record's chain_link covers the previous record's link, so changing any recorded value breaks
// the link of that record and of every record after it.
struct ScrubVerificationRecord
{
    // 1 for the first verification of a run, 2 after the retry, 3 after force removal
    int attempt{1};
    std::string lineage;
    std::string timestamp;
    std::string identity;
    // SHA-256 of the input bytes
    std::string pre_hash;
    // SHA-256 of the canonical serialization of the cleaned graph
    std::string post_hash;
    size_t residual_count{0};
    size_t waived_count{0};
    // The residual findings themselves. Only available in the run that made the record; records
    // loaded from a chain store carry their JSON form in residual_findings.
    ScrubFindingSet residual;
    // The residual findings as written to the report and the chain store
    JSON residual_findings{JSON::makeArray()};
    std::string previous_link;
    std::string chain_link;

    bool
    passed() const
    {
        return residual_count == 0;
    }

    // SHA-256 over every other member as written by getJSON(). Each value is preceded by its
    // length, so moving bytes from one value to the next changes the link.
    PDFSCRUB_DLL
    std::string computeLink() const;

    PDFSCRUB_DLL
    JSON getJSON() const;
    // Throws std::runtime_error if a member is missing or has the wrong type.
    PDFSCRUB_DLL
    static ScrubVerificationRecord fromJSON(JSON const&);
};

// The verifier runs the scanner suite, the same one used for the first scan, over a cleaned graph
// and certifies the result with a linked record. Waived kinds don't count as residual findings.
class ScrubVerifier
{
  public:
    PDFSCRUB_DLL
    ScrubVerifier(
        ScrubConfig const& config,
        std::shared_ptr<ScrubLogger> logger = nullptr,
        std::shared_ptr<ScrubCancel> cancel = nullptr);

    PDFSCRUB_DLL
    ScrubVerificationRecord verify(
        std::string const& pre_hash,
        ScrubObjectGraph const& graph,
        ScrubRunContext const& context,
        std::string const& previous_link,
        int attempt = 1);

    // SHA-256 of the graph's objects in ascending order followed by its trailer. Two graphs with
    // the same objects and trailer have the same hash however they were produced.
    PDFSCRUB_DLL
    static std::string canonicalHash(ScrubObjectGraph const& graph);

  private:
    ScrubConfig config;
    std::shared_ptr<ScrubLogger> logger;
    std::shared_ptr<ScrubCancel> cancel;
};

#endif // SCRUBVERIFIER_HH
