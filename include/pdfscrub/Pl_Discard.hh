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

#ifndef PL_DISCARD_HH
#define PL_DISCARD_HH

#include <pdfscrub/Pipeline.hh>

// This pipeline discards its output. It is an end-of-line pipeline (with no next).
class PDFSCRUB_DLL_CLASS Pl_Discard: public Pipeline
{
  public:
    PDFSCRUB_DLL
    Pl_Discard();
    PDFSCRUB_DLL
    ~Pl_Discard() override;
    PDFSCRUB_DLL
    void write(unsigned char const*, size_t) override;
    PDFSCRUB_DLL
    void finish() override;
};

#endif // PL_DISCARD_HH
