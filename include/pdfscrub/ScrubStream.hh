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


#ifndef SCRUBSTREAM_HH
#define SCRUBSTREAM_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/Types.h>

#include <memory>
#include <string>
#include <vector>

// A stream body: its dictionary, the raw (still filtered) bytes between "stream" and the declared
// end, and any bytes that appeared between the declared end and "endstream".
//
// Decoding is lazy. The first call to decode() runs the data through the filter pipeline and caches
// the result; later calls return the cached status. decode() may be called from several threads
// at once. Changing the data through replaceRawData or replaceData discards the cache and must not
// race with decoding.
class ScrubStream
{
  public:
    enum decode_status_e { ds_ok, ds_unsupported, ds_failed };

    PDFSCRUB_DLL
    ScrubStream(
        ScrubObject dict,
        std::string raw_data,
        std::string excess_data = "",
        scrub_offset_t offset = 0);

    PDFSCRUB_DLL
    ScrubObject getDict() const;

    PDFSCRUB_DLL
    std::string const& getRawData() const;

    // Bytes found after the declared /Length but before "endstream"
    PDFSCRUB_DLL
    std::string const& getExcessData() const;

    PDFSCRUB_DLL
    void clearExcessData();

    // Offset of the first byte of stream data in the input, or 0 for streams that were not read
    // from a file.
    PDFSCRUB_DLL
    scrub_offset_t getOffset() const;

    // Filters in the order in which they are applied for decoding
    PDFSCRUB_DLL
    std::vector<std::string> getFilters() const;

    // Streams of an encrypted document are never decoded.
    PDFSCRUB_DLL
    void setEncrypted(bool);

    // Upper limit on the size of decoded data. 0 means no limit.
    PDFSCRUB_DLL
    void setMaxDecodedSize(unsigned long long);

    PDFSCRUB_DLL
    decode_status_e decode();

    PDFSCRUB_DLL
    bool isDecoded() const;

    // Only valid after decode() returned ds_ok; throws std::logic_error otherwise.
    PDFSCRUB_DLL
    std::string const& getDecodedData();

    PDFSCRUB_DLL
    std::string getDecodeError() const;

    // Replace the raw data keeping the filters. /Length is updated.
    PDFSCRUB_DLL
    void replaceRawData(std::string data);

    // Replace the stream contents with unfiltered data. /Filter and /DecodeParms are removed and
    // /Length is updated.
    PDFSCRUB_DLL
    void replaceData(std::string data);

    // A deep copy sharing nothing with this stream
    PDFSCRUB_DLL
    std::shared_ptr<ScrubStream> copy() const;

  private:
    ScrubStream(ScrubStream const&) = delete;
    ScrubStream& operator=(ScrubStream const&) = delete;

    void decodeInternal();

    class Members;
    std::shared_ptr<Members> m;
};

#endif // SCRUBSTREAM_HH
