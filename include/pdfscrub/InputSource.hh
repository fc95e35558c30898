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


#ifndef PDFSCRUB_INPUTSOURCE_HH
#define PDFSCRUB_INPUTSOURCE_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/Types.h>

#include <cstdio>
#include <memory>
#include <string>

// A seekable source of bytes for the parser. Subclasses need PDFSCRUB_DLL_CLASS so dynamic_cast
// works across the shared library boundary.
class PDFSCRUB_DLL_CLASS InputSource
{
  public:
    InputSource() = default;

    virtual ~InputSource() = default;

    class PDFSCRUB_DLL_CLASS Finder
    {
      public:
        PDFSCRUB_DLL
        Finder() = default;
        PDFSCRUB_DLL
        virtual ~Finder() = default;
        virtual bool check() = 0;
    };

    PDFSCRUB_DLL
    void setLastOffset(scrub_offset_t);
    PDFSCRUB_DLL
    scrub_offset_t getLastOffset() const;
    PDFSCRUB_DLL
    std::string readLine(size_t max_line_length);

    // Find first or last occurrence of a sequence of characters starting within the range defined
    // by offset and len such that, when the input source is positioned at the beginning of that
    // sequence, finder.check() returns true. If len is 0, the search proceeds until EOF. If a
    // qualifying pattern is found, these methods return true and leave the input source positioned
    // wherever check() left it at the end of the matching pattern.
    PDFSCRUB_DLL
    bool findFirst(char const* start_chars, scrub_offset_t offset, size_t len, Finder& finder);
    PDFSCRUB_DLL
    bool findLast(char const* start_chars, scrub_offset_t offset, size_t len, Finder& finder);

    virtual scrub_offset_t findAndSkipNextEOL() = 0;
    virtual std::string const& getName() const = 0;
    virtual scrub_offset_t tell() = 0;
    virtual void seek(scrub_offset_t offset, int whence) = 0;
    virtual void rewind() = 0;
    virtual size_t read(char* buffer, size_t length) = 0;

    // Steps back over the character just read. Only one character can be given back.
    virtual void unreadCh(char ch) = 0;

    // Internal to pdfscrub; defined in InputSource_private.hh.
    inline size_t read(std::string& str, size_t count, scrub_offset_t at = -1);
    inline std::string read(size_t count, scrub_offset_t at = -1);
    inline scrub_offset_t fastTell();
    inline bool fastRead(char&);
    inline void fastUnread(bool);
    inline void loadBuffer();

  protected:
    scrub_offset_t last_offset{0};

  private:
    // Window used by the fast* methods
    static constexpr size_t chunk_size = 128;
    char chunk[chunk_size];
    scrub_offset_t chunk_start{0};
    scrub_offset_t chunk_len{0};
    scrub_offset_t chunk_pos{0};
};

#endif // PDFSCRUB_INPUTSOURCE_HH
