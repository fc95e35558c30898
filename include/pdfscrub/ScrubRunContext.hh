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


#ifndef SCRUBRUNCONTEXT_HH
#define SCRUBRUNCONTEXT_HH

#include <pdfscrub/DLL.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

// Cooperative cancellation for one run. cancel() may be called from any thread. Pipeline stages
// call check() at their iteration points; once the token is cancelled or its deadline has passed,
// check() throws ScrubExc with error code scrub_e_cancelled.
class ScrubCancel
{
  public:
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubCancel> create();

    // A token whose deadline is `seconds` from now. 0 means no deadline.
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubCancel> withTimeout(double seconds);

    PDFSCRUB_DLL
    void cancel();

    PDFSCRUB_DLL
    bool isCancelled() const;

    PDFSCRUB_DLL
    void setDeadline(std::chrono::steady_clock::time_point);

    // `where` names the stage for the error message.
    PDFSCRUB_DLL
    void check(char const* where) const;

  private:
    ScrubCancel() = default;

    std::atomic<bool> cancelled{false};
    bool has_deadline{false};
    std::chrono::steady_clock::time_point deadline;
};

// Everything a run needs to know about its caller. There is no process-wide notion of the current
// time or user; callers fill this in, and ScrubJob fills in defaults for whatever was left empty.
struct ScrubRunContext
{
    // ISO 8601 timestamp recorded in verification records
    std::string timestamp;
    // Who requested the run
    std::string identity;
    // Verification records with the same lineage form one hash chain
    std::string lineage;
    std::shared_ptr<ScrubCancel> cancel;
};

#endif // SCRUBRUNCONTEXT_HH
