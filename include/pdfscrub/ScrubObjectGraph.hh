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


#ifndef SCRUBOBJECTGRAPH_HH
#define SCRUBOBJECTGRAPH_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/Types.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class InputSource;
class ScrubTokenizer;

// ScrubObjectGraph owns every indirect object of one document. It is built once by
// processMemory, mutated by the cleaner, and serialized by ScrubWriter.
//
// Besides the live objects (the newest body of every key in the current cross-reference view), the
// graph keeps what a normal PDF reader discards: the bodies of older incremental updates
// (superseded bodies), bodies that no cross-reference section indexes (unindexed bodies), every
// revision's trailer and byte span, and any data after the final %%EOF. The input bytes themselves
// are not retained.
//
// Objects refer to each other only through ScrubObject references, which are looked up here.
// Reference cycles are therefore harmless.
class ScrubObjectGraph
{
  public:
    // An object body and, for streams, its stream. For a stream, `value` is the stream dictionary,
    // the same handle as stream->getDict().
    struct Body
    {
        ScrubObjGen og;
        ScrubObject value;
        std::shared_ptr<ScrubStream> stream;
        // Offset of "n g obj" in the input, or 0 for objects that were not read from a file
        scrub_offset_t offset{0};
        // Number of bytes through "endobj"
        scrub_offset_t length{0};
        // Index into getRevisions() of the revision that indexed this body, or -1 if none did
        int revision{-1};
    };

    struct Revision
    {
        // Offset of the "xref" keyword or the cross-reference stream object
        scrub_offset_t xref_offset{0};
        // Span of the cross-reference section and trailer through the end of its %%EOF line
        scrub_offset_t xref_end{0};
        // Start of the revision: 0 for the first, else the end of the previous revision
        scrub_offset_t start{0};
        bool is_stream{false};
        ScrubObject trailer;
        // Keys freed by this revision's cross-reference section
        std::vector<ScrubObjGen> freed;
    };

    struct Malformed
    {
        ScrubObjGen og;
        scrub_offset_t offset{0};
        std::string message;
    };

    struct Dangling
    {
        // The object holding the reference, or 0 0 for the trailer
        ScrubObjGen referrer;
        ScrubObjGen target;
    };

    PDFSCRUB_DLL
    ScrubObjectGraph();
    PDFSCRUB_DLL
    ~ScrubObjectGraph();

    // Parse a whole document. Recoverable damage is recorded as warnings; a document with no
    // usable trailer or no objects raises ScrubExc with scrub_e_unrecoverable. If cancel is given,
    // it is checked periodically and cancellation raises ScrubExc with scrub_e_cancelled.
    PDFSCRUB_DLL
    void processMemory(
        std::string const& description,
        std::string_view data,
        std::shared_ptr<ScrubCancel> cancel = nullptr);

    // Limit on the decoded size of any one stream, applied to streams created by processMemory
    PDFSCRUB_DLL
    void setMaxDecodedSize(unsigned long long);

    PDFSCRUB_DLL
    std::string const& getFilename() const;
    PDFSCRUB_DLL
    std::string const& getPDFVersion() const;
    PDFSCRUB_DLL
    scrub_offset_t getInputSize() const;

    // Warnings. Recovery gives up after this many.
    static size_t const max_warnings = 1000;
    PDFSCRUB_DLL
    std::vector<ScrubExc> const& getWarnings() const;
    PDFSCRUB_DLL
    void warn(ScrubExc const&);

    // True if the cross-reference information was unusable and the graph was rebuilt from a linear
    // scan of the input
    PDFSCRUB_DLL
    bool isRecovered() const;
    PDFSCRUB_DLL
    bool isEncrypted() const;

    // Live objects
    PDFSCRUB_DLL
    bool hasObject(ScrubObjGen og) const;
    // Returns null if there is no such object.
    PDFSCRUB_DLL
    ScrubObject getObject(ScrubObjGen og) const;
    // Returns nullptr unless the object is a stream.
    PDFSCRUB_DLL
    std::shared_ptr<ScrubStream> getStream(ScrubObjGen og) const;
    PDFSCRUB_DLL
    scrub_offset_t getObjectOffset(ScrubObjGen og) const;
    PDFSCRUB_DLL
    std::vector<ScrubObjGen> getObjectKeys() const;
    PDFSCRUB_DLL
    size_t getObjectCount() const;
    // Follow references until a direct object is reached. A dangling reference gives null.
    PDFSCRUB_DLL
    ScrubObject resolve(ScrubObject obj) const;
    // If obj is a reference to a stream, return that stream.
    PDFSCRUB_DLL
    std::shared_ptr<ScrubStream> resolveStream(ScrubObject obj) const;

    PDFSCRUB_DLL
    void replaceObject(ScrubObjGen og, ScrubObject value, std::shared_ptr<ScrubStream> = nullptr);
    // Add an object with the next unused object number and return its key.
    PDFSCRUB_DLL
    ScrubObjGen addObject(ScrubObject value, std::shared_ptr<ScrubStream> = nullptr);
    // Delete a live object. Every reference to it becomes null; references inside dictionaries
    // are removed together with their keys. Returns false if there was no such object.
    PDFSCRUB_DLL
    bool removeObject(ScrubObjGen og);

    PDFSCRUB_DLL
    ScrubObject getTrailer() const;
    PDFSCRUB_DLL
    void setTrailer(ScrubObject);
    PDFSCRUB_DLL
    ScrubObject getRoot() const;
    // Page objects in page tree order. Loops and missing nodes are skipped.
    PDFSCRUB_DLL
    std::vector<ScrubObjGen> getPages() const;

    // History
    PDFSCRUB_DLL
    std::vector<Revision> const& getRevisions() const;
    PDFSCRUB_DLL
    std::vector<Body> const& getSupersededBodies() const;
    PDFSCRUB_DLL
    std::vector<Body> const& getUnindexedBodies() const;
    // Drop superseded and unindexed bodies with this key. Returns the number dropped.
    PDFSCRUB_DLL
    size_t dropBodies(ScrubObjGen og);
    // Forget all revisions but the current one, together with all superseded bodies.
    PDFSCRUB_DLL
    void collapseRevisions();

    // Objects reachable from the current trailer
    PDFSCRUB_DLL
    ScrubObjGen::set reachable() const;
    // Objects reachable from a superseded revision's trailer in the view of objects that revision
    // had. Keys of objects that no longer exist are included.
    PDFSCRUB_DLL
    ScrubObjGen::set reachableFromRevision(size_t revision) const;
    PDFSCRUB_DLL
    std::vector<Dangling> dangling() const;

    // Problems with individual object bodies found during parsing
    PDFSCRUB_DLL
    std::vector<Malformed> const& getMalformed() const;
    PDFSCRUB_DLL
    void clearMalformed(ScrubObjGen og);

    // Data after the final %%EOF. The range is empty if there was none.
    PDFSCRUB_DLL
    bool hasTrailingData() const;
    PDFSCRUB_DLL
    scrub_offset_t getTrailingDataOffset() const;
    PDFSCRUB_DLL
    scrub_offset_t getTrailingDataLength() const;
    PDFSCRUB_DLL
    void clearTrailingData();

    // MD5 of the input bytes preceding the final cross-reference section
    PDFSCRUB_DLL
    std::string const& getContentId() const;

    // Paths address a value inside a live object (or, with og 0 0, inside the trailer). A path is
    // a sequence of dictionary keys and array indexes such as "/AA/O" or "/Kids[3]". Direct
    // values only: a path never follows a reference. An empty path is the object itself.
    PDFSCRUB_DLL
    ScrubObject getPath(ScrubObjGen og, std::string const& path) const;
    PDFSCRUB_DLL
    bool removePath(ScrubObjGen og, std::string const& path);
    PDFSCRUB_DLL
    bool replacePath(ScrubObjGen og, std::string const& path, ScrubObject value);

    // Renumber live objects as 1..n with generation 0 in ascending order of their old keys and
    // rewrite every reference. History is collapsed. Returns the old to new mapping.
    PDFSCRUB_DLL
    std::map<ScrubObjGen, ScrubObjGen> compact();

  private:
    ScrubObjectGraph(ScrubObjectGraph const&) = delete;
    ScrubObjectGraph& operator=(ScrubObjectGraph const&) = delete;

    struct XrefEntry
    {
        // 0 = free, 1 = at offset, 2 = in object stream
        int type{0};
        long long f1{0};
        int f2{0};
    };
    // One cross-reference section as read, newest first while reading
    struct XrefSection
    {
        scrub_offset_t offset{0};
        bool is_stream{false};
        ScrubObject trailer;
        std::map<ScrubObjGen, XrefEntry> entries;
    };

    // Parsing, in ScrubObjectGraph_read.cc
    void parse();
    void findHeader();
    bool readXrefChain(scrub_offset_t xref_offset, std::vector<XrefSection>& sections);
    scrub_offset_t readXrefTable(scrub_offset_t offset, XrefSection& section);
    scrub_offset_t readXrefStream(scrub_offset_t offset, XrefSection& section);
    bool readXrefEntry(long long& f1, int& f2, char& type);
    void processXrefStreamData(Body const& xref, XrefSection& section);
    bool loadFromSections(std::vector<XrefSection>& sections);
    void reconstruct(std::string const& reason);
    void scanUnindexed();
    void findTrailingData();
    void computeContentId(scrub_offset_t final_xref);
    bool readObjectAt(scrub_offset_t offset, Body& body, ScrubObjGen expected);
    ScrubObject readObjectBody(ScrubObjGen og, scrub_offset_t offset, Body& body);
    void readStream(Body& body, scrub_offset_t obj_offset);
    size_t recoverStreamLength(scrub_offset_t stream_offset);
    long long resolveLength(ScrubObject length_obj);
    std::vector<Body> expandObjectStream(Body const& container, int revision);
    void checkCancel(char const* where) const;
    void checkWarnings() const;
    void damaged(scrub_offset_t offset, std::string const& msg);
    void setLive(Body body);
    void finishStreams();

    bool findPath(
        ScrubObjGen og,
        std::string const& path,
        ScrubObject& container,
        std::string& last_key,
        int& last_index) const;
    void reachableFrom(
        ScrubObject start, ScrubObjGen::set& seen, std::function<ScrubObject(ScrubObjGen)> lookup)
        const;

    class Members;
    std::unique_ptr<Members> m;
};

#endif // SCRUBOBJECTGRAPH_HH
