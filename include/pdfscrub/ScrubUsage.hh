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


#ifndef SCRUBUSAGE_HH
#define SCRUBUSAGE_HH

#include <pdfscrub/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for errors in how pdfscrub was invoked: bad command-line arguments, contradictory job
// settings, or an invalid job JSON file.
class PDFSCRUB_DLL_CLASS ScrubUsage: public std::runtime_error
{
  public:
    PDFSCRUB_DLL
    ScrubUsage(std::string const& msg);
    PDFSCRUB_DLL
    ~ScrubUsage() noexcept override = default;
};

#endif // SCRUBUSAGE_HH
