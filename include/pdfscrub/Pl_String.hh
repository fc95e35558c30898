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

#ifndef PL_STRING_HH
#define PL_STRING_HH

#include <pdfscrub/Pipeline.hh>

#include <string>

// Collects everything written into a caller-owned string and passes it on to `next`, if given.
// finish() leaves the string alone, so one Pl_String can collect several runs.
class PDFSCRUB_DLL_CLASS Pl_String: public Pipeline
{
  public:
    PDFSCRUB_DLL
    Pl_String(char const* identifier, Pipeline* next, std::string& s);
    PDFSCRUB_DLL
    ~Pl_String() override;

    PDFSCRUB_DLL
    void write(unsigned char const* buf, size_t len) override;
    PDFSCRUB_DLL
    void finish() override;

  private:
    std::string& out;
};

#endif // PL_STRING_HH
