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


#ifndef SCRUBCLEANER_HH
#define SCRUBCLEANER_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/JSON.hh>
#include <pdfscrub/ScrubConfig.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubObjGen.hh>

#include <memory>
#include <string>
#include <vector>

class ScrubCancel;
class ScrubLogger;
class ScrubObjectGraph;

// What the cleaner did about one finding
struct ScrubCleanAction
{
    ScrubFinding finding;
    // 1 for the first clean, 2 for the retry, 3 for force removal
    int pass{1};
    scrub_action_e action{sa_ignored};
    // Serialized size after the action minus the size before it
    long long delta{0};
    std::string reason;
    // An earlier remedy already removed the artifact, so this action changed nothing
    bool stale{false};

    PDFSCRUB_DLL
    JSON getJSON() const;
};

class ScrubCleanReport
{
  public:
    PDFSCRUB_DLL
    std::vector<ScrubCleanAction> const& getActions() const;
    PDFSCRUB_DLL
    void add(ScrubCleanAction const&);
    PDFSCRUB_DLL
    void append(ScrubCleanReport const&);

    // Number of actions that changed the graph: neither Ignored nor stale. Cleaning an already clean
    // graph gives 0.
    PDFSCRUB_DLL
    size_t remedialCount() const;
    PDFSCRUB_DLL
    bool hasActionFor(ScrubFinding const&) const;

    PDFSCRUB_DLL
    JSON getJSON() const;

  private:
    std::vector<ScrubCleanAction> actions;
};

// The cleaner suite. clean() applies the remedy for every finding, in the order of the finding
// set (structural findings first), then sweeps objects that the remedies disconnected and finally
// compacts the graph. Every finding gets exactly one action. A remedy that fails is recorded as
// Ignored with the failure as reason, and cleaning continues.
//
// The cleaner runs on one thread; the order of remedies matters.
class ScrubCleaner
{
  public:
    PDFSCRUB_DLL
    ScrubCleaner(
        ScrubConfig const& config,
        std::shared_ptr<ScrubLogger> logger = nullptr,
        std::shared_ptr<ScrubCancel> cancel = nullptr);

    PDFSCRUB_DLL
    ScrubCleanReport clean(ScrubObjectGraph& graph, ScrubFindingSet const& findings, int pass = 1);

    // Delete whatever holds each finding: the dictionary entry when the finding has a key, the
    // object otherwise. Findings on byte ranges or on the trailer are Ignored. The graph is
    // compacted afterwards.
    PDFSCRUB_DLL
    ScrubCleanReport
    forceRemove(ScrubObjectGraph& graph, ScrubFindingSet const& findings, int pass);

  private:
    ScrubCleaner(ScrubCleaner const&) = delete;
    ScrubCleaner& operator=(ScrubCleaner const&) = delete;

    class Members;
    std::shared_ptr<Members> m;
};

#endif // SCRUBCLEANER_HH
