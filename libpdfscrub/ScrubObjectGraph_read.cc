// Reading a document into a ScrubObjectGraph: header, cross-reference chain, object bodies, object
// streams, and the recovery scan used when the cross-reference information can't be trusted.

#include <pdfscrub/ScrubObjectGraph_private.hh>

#include <pdfscrub/InputSource_private.hh>
#include <pdfscrub/Pl_MD5.hh>
#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/ScrubParser.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

#include <algorithm>
#include <array>
#include <climits>
#include <cstring>
#include <functional>
#include <set>
#include <tuple>

using namespace std::literals;
using namespace pdfscrub;
using pdfscrub::impl::ScrubParser;

namespace
{
    class PatternFinder final: public InputSource::Finder
    {
      public:
        PatternFinder(std::function<bool()> checker) :
            checker(std::move(checker))
        {
        }
        ~PatternFinder() final = default;
        bool
        check() final
        {
            return checker();
        }

      private:
        std::function<bool()> checker;
    };

    // Keys of a cross-reference stream dictionary that don't belong in a trailer
    void
    clean_trailer(ScrubObject& trailer)
    {
        for (auto const& key: {"/Type", "/W", "/Index", "/Filter", "/DecodeParms", "/Length",
                               "/Prev", "/XRefStm"}) {
            if (trailer.hasKey(key)) {
                trailer.removeKey(key);
            }
        }
    }

    bool
    is_container(ScrubObject const& value)
    {
        return value.isDictionaryOfType("/XRef") || value.isDictionaryOfType("/ObjStm");
    }
} // namespace

void
ScrubObjectGraph::processMemory(
    std::string const& description, std::string_view data, std::shared_ptr<ScrubCancel> cancel)
{
    m->filename = description;
    m->input_size = ScrubIntC::to_offset(data.size());
    m->cancel = cancel;
    m->file = std::make_unique<BufferInputSource>(description, data);
    m->tokenizer.allowEOF();
    try {
        parse();
    } catch (std::exception&) {
        m->file = nullptr;
        throw;
    }
    m->file = nullptr;
    m->xref_view.clear();
    m->read_spans.clear();
}

void
ScrubObjectGraph::checkCancel(char const* where) const
{
    if (m->cancel) {
        m->cancel->check(where);
    }
}

void
ScrubObjectGraph::checkWarnings() const
{
    if (m->warnings.size() > max_warnings) {
        throw ScrubExc(
            scrub_e_unrecoverable,
            m->filename,
            "",
            0,
            "too many errors while reconstructing cross-reference table");
    }
}

void
ScrubObjectGraph::damaged(scrub_offset_t offset, std::string const& msg)
{
    warn(ScrubExc(scrub_e_damaged_pdf, m->filename, m->last_object_description, offset, msg));
}

void
ScrubObjectGraph::parse()
{
    findHeader();

    // %%EOF must be within the last 1024 bytes; allow room for the startxref line.
    auto end_offset = m->input_size;
    scrub_offset_t start_offset = (end_offset > 1054 ? end_offset - 1054 : 0);
    PatternFinder sf([this]() {
        auto t1 = m->tokenizer.readToken(*m->file, "", true);
        if (t1.isWord("startxref") && m->tokenizer.readToken(*m->file, "", true).isInteger()) {
            // Position in front of offset token
            m->file->seek(m->file->getLastOffset(), SEEK_SET);
            return true;
        }
        return false;
    });
    scrub_offset_t xref_offset = 0;
    if (m->file->findLast("startxref", start_offset, 0, sf)) {
        xref_offset =
            ScrubUtil::string_to_ll(m->tokenizer.readToken(*m->file, "", true).getValue().c_str());
    }

    std::string failure;
    if (xref_offset <= 0 || xref_offset >= m->input_size) {
        failure = "can't find startxref";
    } else {
        std::vector<XrefSection> sections;
        try {
            readXrefChain(xref_offset, sections);
            if (!loadFromSections(sections)) {
                failure = "cross-reference table does not match object locations";
            }
        } catch (ScrubExc& e) {
            if (e.getErrorCode() == scrub_e_cancelled) {
                throw;
            }
            failure = e.what();
        } catch (std::runtime_error& e) {
            failure = "error reading xref: "s + e.what();
        }
    }
    if (failure.empty()) {
        scanUnindexed();
    } else {
        reconstruct(failure);
    }
    checkCancel("parse");

    if (m->trailer.hasKey("/Encrypt")) {
        m->encrypted = true;
        damaged(0, "document is encrypted; strings and streams are not decrypted");
    }
    finishStreams();
    findTrailingData();
    computeContentId(m->final_xref_offset);
}

void
ScrubObjectGraph::findHeader()
{
    PatternFinder hf([this]() {
        auto p = m->file->tell();
        auto header = m->file->read(20, p);
        // "%PDF-" followed by digit.digit
        if (header.size() < 8 || !util::is_digit(header.at(5)) || header.at(6) != '.' ||
            !util::is_digit(header.at(7))) {
            return false;
        }
        size_t end = 8;
        while (end < header.size() && util::is_digit(header.at(end))) {
            ++end;
        }
        m->pdf_version = header.substr(5, end - 5);
        return true;
    });
    if (!m->file->findFirst("%PDF-", 0, 1024, hf)) {
        damaged(0, "can't find PDF header");
        m->pdf_version = "1.2";
    }
}

bool
ScrubObjectGraph::readXrefChain(scrub_offset_t xref_offset, std::vector<XrefSection>& sections)
{
    std::set<scrub_offset_t> visited;
    while (xref_offset) {
        checkCancel("parse");
        if (xref_offset < 0 || xref_offset >= m->input_size) {
            throw ScrubExc(
                scrub_e_damaged_pdf, m->filename, "", xref_offset, "xref offset out of range");
        }
        visited.insert(xref_offset);
        m->file->seek(xref_offset, SEEK_SET);
        // Some files miss the mark a little with startxref; skipping whitespace is harmless.
        bool skipped_space = false;
        char ch;
        while (m->file->read(&ch, 1) == 1) {
            if (!util::is_space(ch)) {
                m->file->unreadCh(ch);
                break;
            }
            skipped_space = true;
        }
        auto start = m->file->tell();
        char buf[7];
        memset(buf, 0, sizeof(buf));
        m->file->read(buf, sizeof(buf) - 1);

        XrefSection section;
        section.offset = start;
        if ((strncmp(buf, "xref", 4) == 0) && util::is_space(buf[4])) {
            if (skipped_space) {
                damaged(xref_offset, "extraneous whitespace seen before xref");
            }
            int skip = 4;
            while (util::is_space(buf[skip])) {
                ++skip;
            }
            xref_offset = readXrefTable(start + skip, section);
        } else {
            section.is_stream = true;
            xref_offset = readXrefStream(start, section);
        }
        sections.emplace_back(std::move(section));
        if (visited.contains(xref_offset)) {
            throw ScrubExc(
                scrub_e_damaged_pdf, m->filename, "", 0, "loop detected following xref tables");
        }
    }
    return !sections.empty();
}

bool
ScrubObjectGraph::readXrefEntry(long long& f1, int& f2, char& type)
{
    // Optimistically read a well-formed 20-byte entry; fall back to a tolerant parse of the line.
    auto start = m->file->tell();
    std::array<char, 21> line{};
    if (m->file->read(line.data(), 20) == 20) {
        char const* p = line.data();
        int f1_len = 0;
        int f2_len = 0;
        f1 = 0;
        f2 = 0;
        while (util::is_digit(*p) && f1_len < 10) {
            f1 = f1 * 10 + (*p++ - '0');
            ++f1_len;
        }
        if (f1_len == 10 && *p++ == ' ') {
            while (util::is_digit(*p) && f2_len < 5) {
                f2 = f2 * 10 + (*p++ - '0');
                ++f2_len;
            }
            if (f2_len == 5 && *p++ == ' ' && (*p == 'f' || *p == 'n')) {
                type = *p++;
                if (util::is_space(*p) && util::is_space(*(p + 1))) {
                    return true;
                }
            }
        }
    }

    m->file->seek(start, SEEK_SET);
    auto text = m->file->readLine(30);
    char const* p = text.c_str();
    bool invalid = false;
    while (util::is_space(*p) && *p) {
        ++p;
        invalid = true;
    }
    std::string f1_str;
    while (util::is_digit(*p)) {
        f1_str.append(1, *p++);
    }
    if (f1_str.empty() || !util::is_space(*p)) {
        return false;
    }
    while (*p && util::is_space(*p)) {
        ++p;
    }
    std::string f2_str;
    while (util::is_digit(*p)) {
        f2_str.append(1, *p++);
    }
    if (f2_str.empty() || !util::is_space(*p)) {
        return false;
    }
    while (*p && util::is_space(*p)) {
        ++p;
    }
    if (*p != 'f' && *p != 'n') {
        return false;
    }
    type = *p;
    if (f1_str.length() != 10 || f2_str.length() != 5) {
        invalid = true;
    }
    if (invalid) {
        damaged(start, "accepting invalid xref table entry");
    }
    f1 = ScrubUtil::string_to_ll(f1_str.c_str());
    f2 = ScrubUtil::string_to_int(f2_str.c_str());
    return true;
}

scrub_offset_t
ScrubObjectGraph::readXrefTable(scrub_offset_t offset, XrefSection& section)
{
    m->last_object_description = "xref table";
    m->file->seek(offset, SEEK_SET);
    while (true) {
        // Subsection header: first object number and count
        auto t1 = m->tokenizer.readToken(*m->file, "xref table", true, 20);
        if (t1.isWord("trailer")) {
            break;
        }
        auto t2 = m->tokenizer.readToken(*m->file, "xref table", true, 20);
        if (!(t1.isInteger() && t2.isInteger())) {
            throw ScrubExc(
                scrub_e_damaged_pdf, m->filename, "xref table", offset, "xref syntax invalid");
        }
        auto first = ScrubUtil::string_to_ll(t1.getValue().c_str());
        auto count = ScrubUtil::string_to_ll(t2.getValue().c_str());
        if (first < 0 || count < 0 || first + count > INT_MAX ||
            count > m->input_size / 18 + 1) {
            throw ScrubExc(
                scrub_e_damaged_pdf,
                m->filename,
                "xref table",
                offset,
                "xref subsection has impossible bounds");
        }
        // Entries start after the end of line following the count.
        m->file->findAndSkipNextEOL();
        for (long long i = first; i < first + count; ++i) {
            long long f1 = 0;
            int f2 = 0;
            char type = '\0';
            if (!readXrefEntry(f1, f2, type)) {
                throw ScrubExc(
                    scrub_e_damaged_pdf,
                    m->filename,
                    "xref table",
                    m->file->tell(),
                    "invalid xref entry (obj=" + std::to_string(i) + ")");
            }
            if (i == 0) {
                continue;
            }
            ScrubObjGen og(static_cast<int>(i), type == 'f' ? 0 : f2);
            // Within one section the first entry for a key wins.
            if (type == 'f') {
                section.entries.insert({og, {0, 0, 0}});
            } else {
                section.entries.insert({og, {1, f1, f2}});
            }
        }
    }

    m->last_object_description = "trailer";
    ScrubTokenizer tokenizer;
    tokenizer.allowEOF();
    bool empty = false;
    auto trailer = ScrubParser(*m->file, "trailer", tokenizer, &m->warnings).parse(empty);
    if (!trailer.isDictionary()) {
        throw ScrubExc(
            scrub_e_damaged_pdf, m->filename, "trailer", offset, "expected trailer dictionary");
    }
    section.trailer = trailer;

    if (trailer.hasKey("/XRefStm")) {
        if (!trailer.getKey("/XRefStm").isInteger()) {
            throw ScrubExc(
                scrub_e_damaged_pdf, m->filename, "xref stream", offset, "invalid /XRefStm");
        }
        // Hybrid file: entries from the table take precedence over the stream's.
        XrefSection hybrid;
        readXrefStream(trailer.getKey("/XRefStm").getIntValue(), hybrid);
        std::set<int> in_table;
        for (auto const& iter: section.entries) {
            in_table.insert(iter.first.getObj());
        }
        for (auto const& [og, entry]: hybrid.entries) {
            if (!in_table.contains(og.getObj())) {
                section.entries.insert({og, entry});
            }
        }
    }

    if (trailer.hasKey("/Prev")) {
        if (!trailer.getKey("/Prev").isInteger()) {
            throw ScrubExc(
                scrub_e_damaged_pdf,
                m->filename,
                "trailer",
                offset,
                "/Prev key in trailer dictionary is not an integer");
        }
        return trailer.getKey("/Prev").getIntValue();
    }
    return 0;
}

scrub_offset_t
ScrubObjectGraph::readXrefStream(scrub_offset_t offset, XrefSection& section)
{
    Body body;
    m->last_object_description = "xref stream";
    if (!readObjectAt(offset, body, ScrubObjGen()) || !body.stream ||
        !body.value.isDictionaryOfType("/XRef")) {
        throw ScrubExc(scrub_e_damaged_pdf, m->filename, "", offset, "xref not found");
    }
    processXrefStreamData(body, section);
    section.trailer = body.value;

    auto prev = body.value.getKey("/Prev");
    if (body.value.hasKey("/Prev")) {
        if (!prev.isInteger()) {
            throw ScrubExc(
                scrub_e_damaged_pdf,
                m->filename,
                "xref stream",
                offset,
                "/Prev key in xref stream dictionary is not an integer");
        }
        return prev.getIntValue();
    }
    return 0;
}

void
ScrubObjectGraph::processXrefStreamData(Body const& xref, XrefSection& section)
{
    auto damaged_exc = [this, &xref](std::string const& msg) {
        return ScrubExc(scrub_e_damaged_pdf, m->filename, "xref stream", xref.offset, msg);
    };
    auto dict = xref.value;

    auto W_obj = dict.getKey("/W");
    if (!(W_obj.isArray() && (W_obj.getArrayNItems() >= 3) && W_obj.getArrayItem(0).isInteger() &&
          W_obj.getArrayItem(1).isInteger() && W_obj.getArrayItem(2).isInteger())) {
        throw damaged_exc("Cross-reference stream does not have a proper /W key");
    }
    std::array<int, 3> W{};
    size_t entry_size = 0;
    for (size_t i = 0; i < 3; ++i) {
        W[i] = W_obj.getArrayItem(static_cast<int>(i)).getIntValueAsInt();
        if (W[i] < 0 || W[i] > 8) {
            throw damaged_exc("Cross-reference stream's /W contains impossible values");
        }
        entry_size += static_cast<size_t>(W[i]);
    }
    if (entry_size == 0) {
        throw damaged_exc("Cross-reference stream's /W indicates entry size of 0");
    }

    auto size = dict.getKey("/Size").getIntValue();
    if (!dict.getKey("/Size").isInteger() || size < 0 || size > INT_MAX) {
        throw damaged_exc("Cross-reference stream does not have a proper /Size key");
    }
    std::vector<std::pair<int, int>> index;
    size_t num_entries = 0;
    auto Index_obj = dict.getKey("/Index");
    if (Index_obj.isArray()) {
        auto n = Index_obj.getArrayNItems();
        if (n < 2 || n % 2) {
            throw damaged_exc("Cross-reference stream's /Index has an invalid number of values");
        }
        for (int i = 0; i < n; i += 2) {
            auto first = Index_obj.getArrayItem(i);
            auto count = Index_obj.getArrayItem(i + 1);
            if (!first.isInteger() || !count.isInteger() || first.getIntValue() < 0 ||
                count.getIntValue() < 0 || first.getIntValue() + count.getIntValue() > INT_MAX) {
                throw damaged_exc("Cross-reference stream's /Index contains invalid values");
            }
            index.emplace_back(first.getIntValueAsInt(), count.getIntValueAsInt());
            num_entries += static_cast<size_t>(count.getIntValue());
        }
    } else if (Index_obj.isNull()) {
        index.emplace_back(0, static_cast<int>(size));
        num_entries = static_cast<size_t>(size);
    } else {
        throw damaged_exc("Cross-reference stream does not have a proper /Index key");
    }

    if (xref.stream->decode() != ScrubStream::ds_ok) {
        throw damaged_exc(
            "unable to decode cross-reference stream: " + xref.stream->getDecodeError());
    }
    auto const& data = xref.stream->getDecodedData();
    if (num_entries > data.size() / entry_size + 1 || data.size() < entry_size * num_entries) {
        throw damaged_exc(
            "Cross-reference stream data has the wrong size; expected = " +
            std::to_string(entry_size * num_entries) + "; actual = " + std::to_string(data.size()));
    } else if (data.size() != entry_size * num_entries) {
        damaged(xref.offset, "Cross-reference stream data has the wrong size");
    }

    auto p = reinterpret_cast<unsigned char const*>(data.data());
    for (auto [obj, count]: index) {
        for (int i = 0; i < count; ++i, ++obj) {
            std::array<long long, 3> fields{};
            if (W[0] == 0) {
                fields[0] = 1;
            }
            for (size_t j = 0; j < 3; ++j) {
                for (int k = 0; k < W[j]; ++k) {
                    fields[j] <<= 8;
                    fields[j] |= *p++;
                }
            }
            if (obj == 0) {
                continue;
            }
            if (fields[0] == 0) {
                section.entries.insert({ScrubObjGen(obj, 0), {0, 0, 0}});
            } else if (fields[0] == 1) {
                section.entries.insert(
                    {ScrubObjGen(obj, static_cast<int>(fields[2])),
                     {1, fields[1], static_cast<int>(fields[2])}});
            } else if (fields[0] == 2) {
                section.entries.insert(
                    {ScrubObjGen(obj, 0), {2, fields[1], static_cast<int>(fields[2])}});
            }
            // Other types are reserved and treated as null references.
        }
    }
}

void
ScrubObjectGraph::setLive(Body body)
{
    auto it = m->objects.find(body.og);
    if (it != m->objects.end()) {
        if (it->second.offset == body.offset && it->second.offset != 0 &&
            it->second.stream == body.stream && it->second.value.isEqualTo(body.value)) {
            // Same body listed again by a later section
            return;
        }
        m->superseded.emplace_back(it->second);
        it->second = std::move(body);
    } else {
        m->objects.insert({body.og, std::move(body)});
    }
}

bool
ScrubObjectGraph::loadFromSections(std::vector<XrefSection>& sections)
{
    // Sections were read newest first; revisions are kept oldest first.
    std::reverse(sections.begin(), sections.end());
    m->final_xref_offset = sections.back().offset;
    m->revisions.clear();
    m->encrypted = sections.back().trailer.hasKey("/Encrypt");

    std::map<scrub_offset_t, Body> by_offset;
    std::map<scrub_offset_t, std::vector<Body>> expanded;

    for (size_t k = 0; k < sections.size(); ++k) {
        checkCancel("parse");
        auto& section = sections.at(k);
        int rev = static_cast<int>(k);
        Revision revision;
        revision.xref_offset = section.offset;
        revision.is_stream = section.is_stream;
        revision.trailer = section.trailer;
        for (auto const& [og, entry]: section.entries) {
            if (entry.type == 0) {
                revision.freed.emplace_back(og);
            } else if (entry.type == 1) {
                m->xref_view[og] = entry.f1;
            }
        }
        m->revisions.emplace_back(revision);

        // Uncompressed objects
        for (auto const& [og, entry]: section.entries) {
            if (entry.type != 1) {
                continue;
            }
            auto cached = by_offset.find(entry.f1);
            if (cached == by_offset.end()) {
                Body body;
                if (!readObjectAt(entry.f1, body, og)) {
                    return false;
                }
                body.revision = rev;
                cached = by_offset.insert({entry.f1, body}).first;
            }
            if (!is_container(cached->second.value)) {
                setLive(cached->second);
            }
            checkWarnings();
        }

        // Compressed objects
        for (auto const& [og, entry]: section.entries) {
            if (entry.type != 2) {
                continue;
            }
            ScrubObjGen container_og(static_cast<int>(entry.f1), 0);
            auto off = m->xref_view.find(container_og);
            if (off == m->xref_view.end()) {
                damaged(
                    0,
                    "object stream " + container_og.unparse(' ') + " for object " +
                        og.unparse(' ') + " is missing");
                continue;
            }
            auto container = by_offset.find(off->second);
            if (container == by_offset.end()) {
                Body body;
                if (!readObjectAt(off->second, body, container_og)) {
                    return false;
                }
                body.revision = rev;
                container = by_offset.insert({off->second, body}).first;
            }
            auto exp = expanded.find(off->second);
            if (exp == expanded.end()) {
                exp = expanded.insert({off->second, expandObjectStream(container->second, rev)})
                          .first;
            }
            bool found = false;
            for (auto const& body: exp->second) {
                if (body.og == og) {
                    auto b = body;
                    b.revision = rev;
                    setLive(b);
                    found = true;
                    break;
                }
            }
            if (!found) {
                damaged(0, "object " + og.unparse(' ') + " not found in its object stream");
            }
        }

        // Freed objects
        for (auto const& og: m->revisions.back().freed) {
            auto it = m->objects.find(og);
            if (it == m->objects.end()) {
                // A free entry may name the generation that will be reused; match by number.
                for (auto i = m->objects.begin(); i != m->objects.end(); ++i) {
                    if (i->first.getObj() == og.getObj() && i->second.revision < rev) {
                        it = i;
                        break;
                    }
                }
            }
            if (it != m->objects.end() && it->second.revision < rev) {
                m->superseded.emplace_back(it->second);
                m->objects.erase(it);
            }
        }
    }

    // Revision spans run through the end of each %%EOF line.
    scrub_offset_t prev_end = 0;
    auto view = m->file->view();
    for (auto& rev: m->revisions) {
        rev.start = prev_end;
        auto eof = view.find("%%EOF", static_cast<size_t>(rev.xref_offset));
        scrub_offset_t end = m->input_size;
        if (eof != std::string_view::npos) {
            auto e = eof + 5;
            if (e < view.size() && view.at(e) == '\r') {
                ++e;
            }
            if (e < view.size() && view.at(e) == '\n') {
                ++e;
            }
            end = ScrubIntC::to_offset(e);
        }
        rev.xref_end = end;
        prev_end = end;
    }

    m->trailer = sections.back().trailer.shallowCopy();
    clean_trailer(m->trailer);
    if (!m->trailer.hasKey("/Size") || !m->trailer.getKey("/Size").isInteger()) {
        damaged(0, "trailer dictionary lacks a valid /Size key");
    }
    return true;
}

bool
ScrubObjectGraph::readObjectAt(scrub_offset_t offset, Body& body, ScrubObjGen expected)
{
    if (offset <= 0 || offset >= m->input_size) {
        return false;
    }
    m->file->seek(offset, SEEK_SET);
    auto t1 = m->tokenizer.readToken(*m->file, "", true, 20);
    auto t2 = m->tokenizer.readToken(*m->file, "", true, 20);
    auto t3 = m->tokenizer.readToken(*m->file, "", true, 20);
    if (!(t1.isInteger() && t2.isInteger() && t3.isWord("obj"))) {
        return false;
    }
    auto obj = ScrubUtil::string_to_ll(t1.getValue().c_str());
    auto gen = ScrubUtil::string_to_ll(t2.getValue().c_str());
    if (obj < 1 || obj > INT_MAX || gen < 0 || gen > 65535) {
        return false;
    }
    ScrubObjGen og(static_cast<int>(obj), static_cast<int>(gen));
    if (expected.isIndirect() && og != expected) {
        return false;
    }
    body.og = og;
    body.offset = offset;
    body.stream = nullptr;
    body.value = readObjectBody(og, offset, body);
    body.length = m->file->tell() - offset;
    m->read_spans[offset] = m->file->tell();
    return true;
}

ScrubObject
ScrubObjectGraph::readObjectBody(ScrubObjGen og, scrub_offset_t offset, Body& body)
{
    m->last_object_description = "object " + og.unparse(' ');
    auto warnings_before = m->warnings.size();
    bool empty = false;
    auto object =
        ScrubParser(*m->file, m->last_object_description, m->tokenizer, &m->warnings).parse(empty);
    if (empty) {
        damaged(m->file->getLastOffset(), "empty object treated as null");
    }
    auto parse_failed = m->warnings.size() > warnings_before;
    auto token = m->tokenizer.readToken(*m->file, m->last_object_description, true, 20);
    if (object.isDictionary() && token.isWord("stream")) {
        body.value = object;
        readStream(body, offset);
        token = m->tokenizer.readToken(*m->file, m->last_object_description, true, 20);
    }
    if (!token.isWord("endobj")) {
        damaged(m->file->getLastOffset(), "expected endobj");
        m->file->seek(m->file->getLastOffset(), SEEK_SET);
    }
    if (parse_failed) {
        m->malformed.push_back({og, offset, m->warnings.at(warnings_before).getMessageDetail()});
    }
    return object;
}

long long
ScrubObjectGraph::resolveLength(ScrubObject length_obj)
{
    if (length_obj.isInteger()) {
        return length_obj.getIntValue();
    }
    if (!length_obj.isReference()) {
        return -1;
    }
    auto it = m->xref_view.find(length_obj.getObjGen());
    if (it == m->xref_view.end()) {
        return -1;
    }
    // Read the length object without disturbing the current position or description.
    auto pos = m->file->tell();
    auto description = m->last_object_description;
    Body length_body;
    long long result = -1;
    if (readObjectAt(it->second, length_body, length_obj.getObjGen()) &&
        length_body.value.isInteger()) {
        result = length_body.value.getIntValue();
    }
    m->file->seek(pos, SEEK_SET);
    m->last_object_description = description;
    return result;
}

void
ScrubObjectGraph::readStream(Body& body, scrub_offset_t obj_offset)
{
    // "stream" should be followed by CRLF or LF. Accept CR alone and extra whitespace with a
    // warning.
    while (true) {
        char ch;
        if (m->file->read(&ch, 1) == 0) {
            break;
        }
        if (ch == '\n') {
            break;
        }
        if (ch == '\r') {
            if (m->file->read(&ch, 1) != 0 && ch != '\n') {
                m->file->unreadCh(ch);
                damaged(m->file->tell(), "stream keyword followed by carriage return only");
            }
            break;
        }
        if (!util::is_space(ch)) {
            m->file->unreadCh(ch);
            damaged(m->file->tell(), "stream keyword not followed by proper line terminator");
            break;
        }
        damaged(m->file->tell(), "stream keyword followed by extraneous whitespace");
    }

    auto stream_offset = m->file->tell();
    auto view = m->file->view();
    auto length = resolveLength(body.value.getKey("/Length"));
    std::string excess;
    bool ok = false;
    if (length >= 0 && stream_offset + length <= m->input_size) {
        m->file->seek(stream_offset + length, SEEK_SET);
        if (m->tokenizer.readToken(*m->file, "", true, 20).isWord("endstream")) {
            ok = true;
        } else {
            // Data continuing past /Length: keep what lies between the declared end and
            // endstream, provided endstream comes before the end of this object.
            auto declared_end = static_cast<size_t>(stream_offset + length);
            auto es = view.find("endstream", declared_end);
            auto eo = view.find("endobj", declared_end);
            if (es != std::string_view::npos && (eo == std::string_view::npos || es < eo)) {
                auto e = es;
                if (e > declared_end && view.at(e - 1) == '\n') {
                    --e;
                }
                if (e > declared_end && view.at(e - 1) == '\r') {
                    --e;
                }
                excess = std::string(view.substr(declared_end, e - declared_end));
                m->file->seek(ScrubIntC::to_offset(es), SEEK_SET);
                m->tokenizer.readToken(*m->file, "", true, 20);
                damaged(stream_offset, "stream data continues past declared /Length");
                ok = true;
            }
        }
    }
    if (!ok) {
        damaged(stream_offset, "attempting to recover stream length");
        length = ScrubIntC::to_longlong(recoverStreamLength(stream_offset));
        if (length == 0) {
            damaged(stream_offset, "unable to recover stream data; treating stream as empty");
            m->malformed.push_back({body.og, obj_offset, "unable to recover stream data"});
        } else {
            damaged(stream_offset, "recovered stream length: " + std::to_string(length));
        }
        m->file->seek(stream_offset + length, SEEK_SET);
        auto t = m->tokenizer.readToken(*m->file, "", true, 20);
        if (!t.isWord("endstream")) {
            m->file->seek(m->file->getLastOffset(), SEEK_SET);
        }
    }
    body.stream = std::make_shared<ScrubStream>(
        body.value,
        std::string(view.substr(static_cast<size_t>(stream_offset), static_cast<size_t>(length))),
        excess,
        stream_offset);
}

size_t
ScrubObjectGraph::recoverStreamLength(scrub_offset_t stream_offset)
{
    // Look for endstream or endobj and position the input at it.
    PatternFinder ef([this]() {
        auto t = m->tokenizer.readToken(*m->file, "", true, 20);
        if (t.isWord("endobj") || t.isWord("endstream")) {
            m->file->seek(m->file->getLastOffset(), SEEK_SET);
            return true;
        }
        return false;
    });
    if (!m->file->findFirst("end", stream_offset, 0, ef)) {
        return 0;
    }
    auto end = m->file->tell();
    auto view = m->file->view();
    // The end-of-line before endstream is not part of the data.
    if (end > stream_offset && view.at(static_cast<size_t>(end - 1)) == '\n') {
        --end;
    }
    if (end > stream_offset && view.at(static_cast<size_t>(end - 1)) == '\r') {
        --end;
    }
    return ScrubIntC::to_size(end - stream_offset);
}

std::vector<ScrubObjectGraph::Body>
ScrubObjectGraph::expandObjectStream(Body const& container, int revision)
{
    std::vector<Body> result;
    auto description = "object stream " + container.og.unparse(' ');
    if (!container.stream || !container.value.isDictionaryOfType("/ObjStm")) {
        damaged(container.offset, description + " is not an object stream");
        return result;
    }
    if (m->encrypted) {
        damaged(container.offset, description + " can't be read in an encrypted document");
        return result;
    }
    if (container.stream->decode() != ScrubStream::ds_ok) {
        damaged(container.offset, description + ": " + container.stream->getDecodeError());
        m->malformed.push_back({container.og, container.offset, container.stream->getDecodeError()});
        return result;
    }
    auto n = container.value.getKey("/N").getIntValue();
    auto first = container.value.getKey("/First").getIntValue();
    auto const& data = container.stream->getDecodedData();
    if (n < 0 || first < 0 || static_cast<size_t>(first) > data.size()) {
        damaged(container.offset, description + " has invalid /N or /First");
        return result;
    }

    BufferInputSource input(description, data);
    ScrubTokenizer tokenizer;
    tokenizer.allowEOF();
    std::vector<std::pair<int, long long>> offsets;
    for (long long i = 0; i < n; ++i) {
        auto tnum = tokenizer.readToken(input, description, true);
        auto toff = tokenizer.readToken(input, description, true);
        if (!(tnum.isInteger() && toff.isInteger())) {
            damaged(container.offset, description + " has a damaged object index");
            break;
        }
        offsets.emplace_back(
            ScrubUtil::string_to_int(tnum.getValue().c_str()),
            ScrubUtil::string_to_ll(toff.getValue().c_str()));
    }
    for (auto const& [num, off]: offsets) {
        if (num < 1 || off < 0 || first + off >= ScrubIntC::to_offset(data.size())) {
            damaged(container.offset, description + " has an invalid object offset");
            continue;
        }
        input.seek(first + off, SEEK_SET);
        auto warnings_before = m->warnings.size();
        bool empty = false;
        Body body;
        body.og = ScrubObjGen(num, 0);
        body.value = ScrubParser(input, description + " object " + std::to_string(num), tokenizer, &m->warnings)
                         .parse(empty);
        body.offset = container.offset;
        body.revision = revision;
        if (m->warnings.size() > warnings_before) {
            m->malformed.push_back(
                {body.og, container.offset, m->warnings.at(warnings_before).getMessageDetail()});
        }
        result.emplace_back(body);
    }
    return result;
}

void
ScrubObjectGraph::scanUnindexed()
{
    // Find "n g obj" at the start of any line that isn't inside a body already read.
    std::vector<scrub_offset_t> found;
    m->file->seek(0, SEEK_SET);
    size_t lines = 0;
    while (m->file->tell() < m->input_size) {
        if (++lines % 256 == 0) {
            checkCancel("parse");
        }
        auto t1 = m->tokenizer.readToken(*m->file, "", true, 10);
        auto token_start = m->file->getLastOffset();
        if (t1.isInteger()) {
            auto pos = m->file->tell();
            auto t2 = m->tokenizer.readToken(*m->file, "", true, 10);
            if (t2.isInteger() && m->tokenizer.readToken(*m->file, "", true, 10).isWord("obj")) {
                found.emplace_back(token_start);
            }
            m->file->seek(pos, SEEK_SET);
        }
        m->file->findAndSkipNextEOL();
    }

    auto inside_read = [this](scrub_offset_t pos) {
        auto it = m->read_spans.upper_bound(pos);
        if (it == m->read_spans.begin()) {
            return false;
        }
        --it;
        return pos < it->second;
    };
    for (auto offset: found) {
        if (inside_read(offset)) {
            continue;
        }
        Body body;
        m->last_object_description = "unindexed object";
        if (readObjectAt(offset, body, ScrubObjGen()) && !is_container(body.value)) {
            body.revision = -1;
            m->unindexed.emplace_back(body);
        }
        checkWarnings();
    }
}

void
ScrubObjectGraph::reconstruct(std::string const& reason)
{
    if (m->recovered) {
        throw ScrubExc(scrub_e_unrecoverable, m->filename, "", 0, reason);
    }
    m->recovered = true;
    damaged(0, "file is damaged");
    damaged(0, reason);
    damaged(0, "Attempting to reconstruct cross-reference table");

    m->objects.clear();
    m->superseded.clear();
    m->unindexed.clear();
    m->revisions.clear();
    m->malformed.clear();
    m->read_spans.clear();
    m->xref_view.clear();
    m->trailer = ScrubObject::newDictionary();

    std::vector<std::tuple<int, int, scrub_offset_t>> found_objects;
    std::vector<scrub_offset_t> trailers;
    scrub_offset_t last_xref = 0;

    m->file->seek(0, SEEK_SET);
    size_t lines = 0;
    // Don't allow very long tokens here during recovery. All the interesting tokens are covered.
    static size_t const MAX_LEN = 10;
    while (m->file->tell() < m->input_size) {
        if (++lines % 256 == 0) {
            checkCancel("parse");
        }
        auto t1 = m->tokenizer.readToken(*m->file, "", true, MAX_LEN);
        auto token_start = m->file->getLastOffset();
        if (t1.isInteger()) {
            auto pos = m->file->tell();
            auto t2 = m->tokenizer.readToken(*m->file, "", true, MAX_LEN);
            if (t2.isInteger() &&
                m->tokenizer.readToken(*m->file, "", true, MAX_LEN).isWord("obj")) {
                auto obj = ScrubUtil::string_to_ll(t1.getValue().c_str());
                auto gen = ScrubUtil::string_to_ll(t2.getValue().c_str());
                if (obj > 0 && obj <= m->input_size / 3 && gen >= 0 && gen <= 65535) {
                    found_objects.emplace_back(
                        static_cast<int>(obj), static_cast<int>(gen), token_start);
                } else {
                    damaged(0, "ignoring object with impossible id " + std::to_string(obj));
                }
            }
            m->file->seek(pos, SEEK_SET);
        } else if (t1.isWord("trailer")) {
            trailers.emplace_back(m->file->tell());
        } else if (t1.isWord("xref")) {
            last_xref = token_start;
        }
        checkWarnings();
        m->file->findAndSkipNextEOL();
    }
    m->final_xref_offset = last_xref ? last_xref : m->input_size;

    for (auto const& [obj, gen, offset]: found_objects) {
        m->xref_view[ScrubObjGen(obj, gen)] = offset;
    }

    // Last body in file order wins.
    std::vector<Body> xref_streams;
    std::vector<Body> containers;
    auto inside_read = [this](scrub_offset_t pos) {
        auto it = m->read_spans.upper_bound(pos);
        if (it == m->read_spans.begin()) {
            return false;
        }
        --it;
        return pos < it->second;
    };
    for (auto const& [obj, gen, offset]: found_objects) {
        if (inside_read(offset)) {
            continue;
        }
        Body body;
        if (!readObjectAt(offset, body, ScrubObjGen(obj, gen))) {
            continue;
        }
        body.revision = 0;
        if (body.value.isDictionaryOfType("/XRef")) {
            xref_streams.emplace_back(body);
        } else if (body.value.isDictionaryOfType("/ObjStm")) {
            containers.emplace_back(body);
        } else {
            setLive(body);
        }
        checkWarnings();
    }
    ScrubObject trailer;
    for (auto it = trailers.rbegin(); it != trailers.rend() && !trailer.isInitialized(); ++it) {
        m->file->seek(*it, SEEK_SET);
        ScrubTokenizer tokenizer;
        tokenizer.allowEOF();
        bool empty = false;
        auto t = ScrubParser(*m->file, "trailer", tokenizer, &m->warnings).parse(empty);
        if (t.isDictionary() && t.hasKey("/Root")) {
            trailer = t;
        } else if (t.isDictionary()) {
            damaged(*it, "recovered trailer has no /Root entry");
        }
    }
    for (auto it = xref_streams.rbegin(); it != xref_streams.rend() && !trailer.isInitialized();
         ++it) {
        if (it->value.hasKey("/Root")) {
            trailer = it->value.shallowCopy();
        }
    }
    m->encrypted = trailer.isInitialized() && trailer.hasKey("/Encrypt");
    for (auto const& container: containers) {
        for (auto& body: expandObjectStream(container, 0)) {
            if (!m->objects.contains(body.og)) {
                m->objects.insert({body.og, body});
            }
        }
    }

    if (!trailer.isInitialized() || !getObject(trailer.getKey("/Root").getObjGen()).isDictionary()) {
        ScrubObject root;
        for (auto const& [og, body]: m->objects) {
            if (body.value.isDictionaryOfType("/Catalog")) {
                root = ScrubObject::newReference(og);
            }
        }
        if (root.isInitialized()) {
            if (!trailer.isInitialized()) {
                damaged(0, "unable to find trailer dictionary while recovering damaged file");
                trailer = ScrubObject::newDictionary();
            }
            trailer.replaceKey("/Root", root);
        }
    }
    if (m->objects.empty()) {
        throw ScrubExc(
            scrub_e_unrecoverable,
            m->filename,
            "",
            0,
            "unable to find objects while recovering damaged file");
    }
    if (!trailer.isInitialized() || !trailer.getKey("/Root").isReference()) {
        throw ScrubExc(
            scrub_e_unrecoverable,
            m->filename,
            "",
            0,
            "unable to find trailer dictionary while recovering damaged file");
    }
    m->trailer = trailer.shallowCopy();
    clean_trailer(m->trailer);
    m->trailer.replaceKey(
        "/Size", ScrubObject::newInteger(m->objects.rbegin()->first.getObj() + 1));

    Revision revision;
    revision.xref_offset = m->final_xref_offset;
    revision.xref_end = m->input_size;
    revision.trailer = m->trailer;
    m->revisions.emplace_back(revision);
    checkWarnings();
}

void
ScrubObjectGraph::finishStreams()
{
    auto setup = [this](Body& body) {
        if (body.stream) {
            body.stream->setEncrypted(m->encrypted);
            body.stream->setMaxDecodedSize(m->max_decoded_size);
        }
    };
    for (auto& iter: m->objects) {
        setup(iter.second);
    }
    for (auto& body: m->superseded) {
        setup(body);
    }
    for (auto& body: m->unindexed) {
        setup(body);
    }
}

void
ScrubObjectGraph::findTrailingData()
{
    auto view = m->file->view();
    auto eof = view.rfind("%%EOF");
    if (eof == std::string_view::npos) {
        return;
    }
    auto start = eof + 5;
    if (start < view.size() && view.at(start) == '\r') {
        ++start;
    }
    if (start < view.size() && view.at(start) == '\n') {
        ++start;
    }
    for (auto i = start; i < view.size(); ++i) {
        if (!util::is_space(view.at(i))) {
            m->trailing_offset = ScrubIntC::to_offset(start);
            m->trailing_length = ScrubIntC::to_offset(view.size() - start);
            return;
        }
    }
}

void
ScrubObjectGraph::computeContentId(scrub_offset_t final_xref)
{
    auto view = m->file->view();
    auto len = std::min(static_cast<size_t>(std::max<scrub_offset_t>(final_xref, 0)), view.size());
    m->content_id = Pl_MD5::rawDigest(view.substr(0, len));
}
