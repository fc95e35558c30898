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


#ifndef SCRUBWRITER_HH
#define SCRUBWRITER_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/Types.h>

#include <map>
#include <memory>
#include <string>

class ScrubObjectGraph;
class Pipeline;
class Pl_Count;

// ScrubWriter serializes an object graph as a single-revision PDF: header, binary comment, objects
// in ascending order, one cross-reference section, the trailer, and %%EOF.
//
// The trailer gets /Size, /Root, /Info when the graph has it, and a fresh /ID whose second element
// is the MD5 digest of every byte written before the cross-reference section. The first element
// is the same unless setKeepOriginalID1 is in effect.
//
// The writer checks that the root exists and that no reference dangles before writing anything.
// A violation, or any other failure while writing, raises ScrubExc with scrub_e_rebuild, and no
// output is produced.
class ScrubWriter
{
  public:
    PDFSCRUB_DLL
    ScrubWriter(ScrubObjectGraph const& graph);
    PDFSCRUB_DLL
    ~ScrubWriter();

    PDFSCRUB_DLL
    void setXrefMode(scrub_xref_mode_e);
    // Streams that have no filter are written with /FlateDecode.
    PDFSCRUB_DLL
    void setCompressStreams(bool);
    // Keep the first element of the graph's original /ID, if it has one.
    PDFSCRUB_DLL
    void setKeepOriginalID1(bool);

    PDFSCRUB_DLL
    std::string write();

    // Offsets of the objects in the last output
    PDFSCRUB_DLL
    std::map<ScrubObjGen, scrub_offset_t> const& getWrittenOffsets() const;

  private:
    ScrubWriter(ScrubWriter const&) = delete;
    ScrubWriter& operator=(ScrubWriter const&) = delete;

    void checkInvariants();
    std::string getFinalVersion() const;
    void writeHeader();
    void writeObject(ScrubObjGen og);
    std::string generateID(scrub_offset_t xref_offset) const;
    void writeTrailerKeys(int size, std::string const& id);
    void writeXRefTable(int size, std::string const& id);
    void writeXRefStream(int xref_id, scrub_offset_t xref_offset, std::string const& id);
    void writeBinary(std::string& out, unsigned long long val, unsigned int bytes);
    ScrubWriter& write(std::string const& str);
    ScrubWriter& write(long long);

    class Members;
    std::unique_ptr<Members> m;
};

#endif // SCRUBWRITER_HH
