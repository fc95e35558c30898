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


#ifndef SCRUBREPORT_HH
#define SCRUBREPORT_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/JSON.hh>
#include <pdfscrub/ScrubCleaner.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubVerifier.hh>
#include <pdfscrub/Types.h>

#include <string>
#include <vector>

// The audit document for one run. ScrubJob fills it in as the pipeline advances; nothing in the
// report feeds back into the pipeline. getJSON() gives the document that the command-line program
// writes:
//
//   {
//     "version": 1,
//     "status": "Clean",
//     "input": {"name": ..., "size": ..., "pre_hash": ...},
//     "context": {"timestamp": ..., "identity": ..., "lineage": ...},
//     "findings": [...],
//     "waived": [...],
//     "actions": [...],
//     "verification": {"records": [...], "history": {"count": ..., "last_link": ...}},
//     "warnings": [...],
//     "final_hash": ...,
//     "error": ...
//   }
//
// "error" is present only when the run ended with an error message.
class ScrubReport
{
  public:
    static int constexpr LATEST_REPORT_VERSION = 1;

    PDFSCRUB_DLL
    ScrubReport() = default;

    PDFSCRUB_DLL
    void setStatus(scrub_status_e);
    PDFSCRUB_DLL
    scrub_status_e getStatus() const;

    PDFSCRUB_DLL
    void setInput(std::string const& name, scrub_offset_t size, std::string const& pre_hash);
    PDFSCRUB_DLL
    std::string const& getPreHash() const;
    PDFSCRUB_DLL
    void setContext(ScrubRunContext const&);

    // The initial scan, split into findings that go to the cleaner and findings of waived kinds
    PDFSCRUB_DLL
    void setFindings(ScrubFindingSet const& findings, ScrubFindingSet const& waived);
    PDFSCRUB_DLL
    ScrubFindingSet const& getFindings() const;
    PDFSCRUB_DLL
    ScrubFindingSet const& getWaived() const;

    PDFSCRUB_DLL
    void addActions(ScrubCleanReport const&);
    PDFSCRUB_DLL
    ScrubCleanReport const& getActions() const;

    PDFSCRUB_DLL
    void addVerification(ScrubVerificationRecord const&);
    PDFSCRUB_DLL
    std::vector<ScrubVerificationRecord> const& getVerification() const;
    // Records of the lineage that were in the chain store before this run
    PDFSCRUB_DLL
    void setHistory(size_t count, std::string const& last_link);

    PDFSCRUB_DLL
    void addWarning(std::string const&);
    PDFSCRUB_DLL
    std::vector<std::string> const& getWarnings() const;

    // SHA-256 of the emitted output. Empty when nothing was emitted.
    PDFSCRUB_DLL
    void setFinalHash(std::string const&);
    PDFSCRUB_DLL
    std::string const& getFinalHash() const;

    PDFSCRUB_DLL
    void setError(std::string const&);
    PDFSCRUB_DLL
    std::string const& getError() const;

    // Forget everything but the input and context. Used when a run is cancelled.
    PDFSCRUB_DLL
    void discardResults();

    PDFSCRUB_DLL
    JSON getJSON() const;
    PDFSCRUB_DLL
    std::string unparse() const;

  private:
    scrub_status_e status{ss_unrecoverable};
    std::string input_name;
    scrub_offset_t input_size{0};
    std::string pre_hash;
    ScrubRunContext context;
    ScrubFindingSet findings;
    ScrubFindingSet waived;
    ScrubCleanReport actions;
    std::vector<ScrubVerificationRecord> verification;
    size_t history_count{0};
    std::string history_last_link;
    std::vector<std::string> warnings;
    std::string final_hash;
    std::string error;
};

#endif // SCRUBREPORT_HH
