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


#ifndef SCRUBUTIL_HH
#define SCRUBUTIL_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/Types.h>

#include <cstdio>
#include <string>
#include <string_view>

namespace ScrubUtil
{
    // A positive length pads on the left with zeroes, a negative one on the right with spaces.
    PDFSCRUB_DLL
    std::string int_to_string(long long, int length = 0);
    PDFSCRUB_DLL
    std::string uint_to_string(unsigned long long, int length = 0);

    // Fixed notation in the classic locale, six decimal places when decimal_places <= 0.
    PDFSCRUB_DLL
    std::string
    double_to_string(double, int decimal_places = 0, bool trim_trailing_zeroes = true);

    // Out-of-range values throw std::range_error.
    PDFSCRUB_DLL
    long long string_to_ll(char const* str);
    PDFSCRUB_DLL
    int string_to_int(char const* str);

    // Lower case
    PDFSCRUB_DLL
    std::string hex_encode(std::string const&);

    // Throws std::runtime_error with "description: " followed by the text for errno.
    PDFSCRUB_DLL
    void throw_system_error(std::string const& description);

    PDFSCRUB_DLL
    bool file_can_be_opened(char const* filename);

    // Throws a system error for "open <filename>" on failure.
    PDFSCRUB_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    class FileCloser
    {
      public:
        FileCloser(FILE* f) :
            f(f)
        {
        }

        void
        close()
        {
            if (f) {
                fclose(f);
                f = nullptr;
            }
        }

        ~FileCloser()
        {
            close();
        }

      private:
        FileCloser(FileCloser const&) = delete;
        FileCloser& operator=(FileCloser const&) = delete;

        FILE* f;
    };

    PDFSCRUB_DLL
    std::string read_file_into_string(char const* filename);
    PDFSCRUB_DLL
    std::string read_file_into_string(FILE* f, std::string_view filename = "");

    // The data goes to "<filename>.pdfscrub-tmp", which is renamed over filename once complete.
    // On failure neither file is left behind.
    PDFSCRUB_DLL
    void write_file_atomically(std::string const& filename, std::string_view data);

    // Program name for messages: the last path component of argv0 without ".exe"
    PDFSCRUB_DLL
    std::string getWhoami(std::string_view argv0);

    PDFSCRUB_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    // UTC, for example 2026-01-31T12:00:00Z
    PDFSCRUB_DLL
    std::string now_iso8601();

    PDFSCRUB_DLL
    std::string toUTF8(unsigned long uval);

    // True when every byte is printable ASCII, tab, CR or LF.
    PDFSCRUB_DLL
    bool is_printable_text(std::string_view);
} // namespace ScrubUtil

#endif // SCRUBUTIL_HH
