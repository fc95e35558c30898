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

#ifndef PL_COUNT_HH
#define PL_COUNT_HH

#include <pdfscrub/Pipeline.hh>
#include <pdfscrub/Types.h>

// Passes data through unchanged while keeping a running byte count. ScrubWriter reads the count
// to learn the offset of each object it writes.
class PDFSCRUB_DLL_CLASS Pl_Count: public Pipeline
{
  public:
    PDFSCRUB_DLL
    Pl_Count(char const* identifier, Pipeline* next);
    PDFSCRUB_DLL
    ~Pl_Count() override;
    PDFSCRUB_DLL
    void write(unsigned char const*, size_t) override;
    PDFSCRUB_DLL
    void finish() override;
    // Bytes written so far. finish() does not reset it.
    PDFSCRUB_DLL
    scrub_offset_t getCount() const;

  private:
    scrub_offset_t count{0};
};

#endif // PL_COUNT_HH
