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


#ifndef PDFSCRUB_BUFFERINPUTSOURCE_HH
#define PDFSCRUB_BUFFERINPUTSOURCE_HH

#include <pdfscrub/InputSource.hh>

#include <string_view>

// An input source over bytes in memory. The whole input document is read into memory before
// parsing, so this is the only input source pdfscrub uses.
class PDFSCRUB_DLL_CLASS BufferInputSource: public InputSource
{
  public:
    // The caller must keep the viewed data alive for the lifetime of the input source.
    PDFSCRUB_DLL
    BufferInputSource(std::string const& description, std::string_view data);

    // NB This overload copies the string contents.
    PDFSCRUB_DLL
    BufferInputSource(std::string const& description, std::string const& contents);

    PDFSCRUB_DLL
    ~BufferInputSource() override;
    PDFSCRUB_DLL
    scrub_offset_t findAndSkipNextEOL() override;
    PDFSCRUB_DLL
    std::string const& getName() const override;
    PDFSCRUB_DLL
    scrub_offset_t tell() override;
    PDFSCRUB_DLL
    void seek(scrub_offset_t offset, int whence) override;
    PDFSCRUB_DLL
    void rewind() override;
    using InputSource::read;
    PDFSCRUB_DLL
    size_t read(char* buffer, size_t length) override;
    PDFSCRUB_DLL
    void unreadCh(char ch) override;

    // Direct access to the underlying bytes.
    PDFSCRUB_DLL
    std::string_view view() const;

  private:
    BufferInputSource(BufferInputSource const&) = delete;
    BufferInputSource& operator=(BufferInputSource const&) = delete;

    std::string description;
    std::string content;
    std::string_view data;
    scrub_offset_t cur_offset{0};
    scrub_offset_t max_offset{0};
};

#endif // PDFSCRUB_BUFFERINPUTSOURCE_HH
