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

#ifndef SCRUBEXC_HH
#define SCRUBEXC_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/Types.h>

#include <stdexcept>
#include <string>

// A problem with an input document. The parser and the detectors record ScrubExc warnings and
// keep going; only problems that leave nothing usable are thrown. The error code tells the job
// which status to report.
//
// what() reads "file (object, offset N): message", leaving out any part that is unknown. An offset
// of 0 means "unknown" unless zero_offset_valid is given.
class PDFSCRUB_DLL_CLASS ScrubExc: public std::runtime_error
{
  public:
    PDFSCRUB_DLL
    ScrubExc(
        scrub_error_code_e error_code,
        std::string const& filename,
        std::string const& object,
        scrub_offset_t offset,
        std::string const& message,
        bool zero_offset_valid = false);

    PDFSCRUB_DLL
    ~ScrubExc() noexcept override = default;

    PDFSCRUB_DLL
    scrub_error_code_e getErrorCode() const;
    // The object or stage the problem was found in, possibly empty
    PDFSCRUB_DLL
    std::string const& getObject() const;
    // 0 when unknown
    PDFSCRUB_DLL
    scrub_offset_t getFilePosition() const;
    // The message without its location
    PDFSCRUB_DLL
    std::string const& getMessageDetail() const;

  private:
    scrub_error_code_e error_code;
    std::string object;
    scrub_offset_t offset;
    std::string message;
};

#endif // SCRUBEXC_HH
