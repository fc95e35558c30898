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

#ifndef PL_FLATE_HH
#define PL_FLATE_HH

#include <pdfscrub/Pipeline.hh>

#include <functional>
#include <memory>
#include <vector>

struct z_stream_s;

// zlib as a pipeline. Inflating decodes /FlateDecode streams and xref streams. Deflating
// compresses streams and xref streams on output.
class PDFSCRUB_DLL_CLASS Pl_Flate: public Pipeline
{
  public:
    static unsigned int const def_bufsize = 65536;

    enum action_e { a_inflate, a_deflate };

    PDFSCRUB_DLL
    Pl_Flate(
        char const* identifier,
        Pipeline* next,
        action_e action,
        unsigned int out_bufsize = def_bufsize);
    PDFSCRUB_DLL
    ~Pl_Flate() override;

    // Inflating more than `limit` bytes throws std::runtime_error. 0 means no limit.
    PDFSCRUB_DLL
    void setMemoryLimit(unsigned long long limit);

    // Receives problems that don't stop decoding, such as a stream that ends early.
    PDFSCRUB_DLL
    void setWarnCallback(std::function<void(char const*, int)> callback);

    PDFSCRUB_DLL
    void write(unsigned char const* data, size_t len) override;
    PDFSCRUB_DLL
    void finish() override;

  private:
    void start();
    void run(unsigned char const* data, size_t len, int flush);
    void emit(size_t len);
    [[noreturn]] void fail(char const* stage, int code);

    class PDFSCRUB_DLL_PRIVATE Members
    {
        friend class Pl_Flate;

      public:
        Members(action_e action, size_t out_bufsize);
        ~Members();

      private:
        Members(Members const&) = delete;

        action_e action;
        std::unique_ptr<z_stream_s> zs;
        std::vector<unsigned char> outbuf;
        bool started{false};
        bool finished{false};
        unsigned long long inflated{0};
        unsigned long long memory_limit{0};
        std::function<void(char const*, int)> warn;
    };

    std::unique_ptr<Members> m;
};

#endif // PL_FLATE_HH
