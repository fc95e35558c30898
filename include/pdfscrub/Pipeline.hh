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

// A Pipeline receives bytes through write() and passes its output to the next pipeline, if it has
// one. Pipelines are named Pl_Something. A chain is built from its end: each pipeline is given the
// one that follows it. Whoever creates a pipeline destroys it; a pipeline never owns its successor.
//
// finish() must be called after the last write(), or buffered data is lost. Destructors don't
// throw when finish() was never called.
//
// pdfscrub decodes streams, compresses output, computes digests and writes log channels through
// pipelines.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <pdfscrub/DLL.h>

#include <memory>
#include <string>
#include <string_view>

// Remember to use PDFSCRUB_DLL_CLASS on anything derived from Pipeline so it will work with
// dynamic_cast across the shared object boundary.
class PDFSCRUB_DLL_CLASS Pipeline
{
  public:
    PDFSCRUB_DLL
    Pipeline(char const* identifier, Pipeline* next);

    PDFSCRUB_DLL
    virtual ~Pipeline() = default;

    // A pipeline that is not the end of its chain forwards to next() from both of these.
    PDFSCRUB_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    PDFSCRUB_DLL
    virtual void finish() = 0;

    PDFSCRUB_DLL
    void write(char const* data, size_t len);
    PDFSCRUB_DLL
    void writeCStr(char const* cstr);
    PDFSCRUB_DLL
    void writeString(std::string const&);
    PDFSCRUB_DLL
    void writeView(std::string_view);

    // Lets code write `*p << "offset " << n`. Integers are written in decimal. This is not a
    // general replacement for an ostream.
    PDFSCRUB_DLL
    Pipeline& operator<<(char const* cstr);
    PDFSCRUB_DLL
    Pipeline& operator<<(std::string const&);
    PDFSCRUB_DLL
    Pipeline& operator<<(int);
    PDFSCRUB_DLL
    Pipeline& operator<<(long);
    PDFSCRUB_DLL
    Pipeline& operator<<(long long);
    PDFSCRUB_DLL
    Pipeline& operator<<(unsigned int);
    PDFSCRUB_DLL
    Pipeline& operator<<(unsigned long);
    PDFSCRUB_DLL
    Pipeline& operator<<(unsigned long long);

  protected:
    Pipeline*
    next() const noexcept
    {
        return next_;
    }

    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // PIPELINE_HH
