#include <pdfscrub/ScrubWriter.hh>

#include <pdfscrub/Pl_Count.hh>
#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/Pl_MD5.hh>
#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/ScrubObjectGraph.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <algorithm>
#include <stdexcept>

class ScrubWriter::Members
{
    friend class ScrubWriter;

  public:
    Members(ScrubObjectGraph const& graph) :
        graph(graph)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    ScrubObjectGraph const& graph;
    scrub_xref_mode_e xref_mode{scrub_xref_classic};
    bool compress_streams{true};
    bool keep_original_id1{false};

    std::string output;
    std::unique_ptr<Pl_String> pl_string;
    std::unique_ptr<Pl_Count> pipeline;
    std::map<ScrubObjGen, scrub_offset_t> offsets;
    int max_id{0};
};

namespace
{
    unsigned int
    bytes_needed(long long n)
    {
        unsigned int bytes = 0;
        while (n) {
            ++bytes;
            n >>= 8;
        }
        return std::max(bytes, 1U);
    }

    std::string
    deflate(std::string const& data)
    {
        std::string result;
        Pl_String out("deflated", nullptr, result);
        Pl_Flate flate("deflate", &out, Pl_Flate::a_deflate);
        flate.writeString(data);
        flate.finish();
        return result;
    }

    // Object number to generation and offset
    std::map<int, std::pair<int, scrub_offset_t>>
    xref_entries(std::map<ScrubObjGen, scrub_offset_t> const& offsets)
    {
        std::map<int, std::pair<int, scrub_offset_t>> result;
        for (auto const& [og, offset]: offsets) {
            result[og.getObj()] = {og.getGen(), offset};
        }
        return result;
    }
} // namespace

ScrubWriter::ScrubWriter(ScrubObjectGraph const& graph) :
    m(new Members(graph))
{
}

ScrubWriter::~ScrubWriter() = default;

void
ScrubWriter::setXrefMode(scrub_xref_mode_e mode)
{
    m->xref_mode = mode;
}

void
ScrubWriter::setCompressStreams(bool val)
{
    m->compress_streams = val;
}

void
ScrubWriter::setKeepOriginalID1(bool val)
{
    m->keep_original_id1 = val;
}

std::map<ScrubObjGen, scrub_offset_t> const&
ScrubWriter::getWrittenOffsets() const
{
    return m->offsets;
}

ScrubWriter&
ScrubWriter::write(std::string const& str)
{
    m->pipeline->writeString(str);
    return *this;
}

ScrubWriter&
ScrubWriter::write(long long val)
{
    m->pipeline->writeString(std::to_string(val));
    return *this;
}

void
ScrubWriter::writeBinary(std::string& out, unsigned long long val, unsigned int bytes)
{
    if (bytes > sizeof(unsigned long long)) {
        throw std::logic_error("ScrubWriter::writeBinary called with too many bytes");
    }
    char data[sizeof(unsigned long long)];
    for (unsigned int i = 0; i < bytes; ++i) {
        data[bytes - i - 1] = static_cast<char>(val & 0xff);
        val >>= 8;
    }
    out.append(data, bytes);
}

void
ScrubWriter::checkInvariants()
{
    auto root = m->graph.getTrailer().getKey("/Root");
    if (!root.isReference() || !m->graph.getObject(root.getObjGen()).isDictionary()) {
        throw ScrubExc(
            scrub_e_rebuild, m->graph.getFilename(), "trailer", 0, "the document has no root");
    }
    auto dangling = m->graph.dangling();
    if (!dangling.empty()) {
        auto const& d = dangling.front();
        throw ScrubExc(
            scrub_e_rebuild,
            m->graph.getFilename(),
            d.referrer.isIndirect() ? "object " + d.referrer.unparse(' ') : "trailer",
            0,
            "reference to missing object " + d.target.unparse(' ') + " (" +
                std::to_string(dangling.size()) + " dangling reference(s) in total)");
    }
}

std::string
ScrubWriter::getFinalVersion() const
{
    auto version = m->graph.getPDFVersion();
    if (version.size() != 3 || version.at(1) != '.') {
        version = "1.4";
    }
    if (m->xref_mode == scrub_xref_stream && version < "1.5") {
        version = "1.5";
    }
    return version;
}

void
ScrubWriter::writeHeader()
{
    write("%PDF-").write(getFinalVersion());
    // This string of binary characters would not be valid UTF-8, so it really should be treated
    // as binary.
    write("\n%\xbf\xf7\xa2\xfe\n");
}

void
ScrubWriter::writeObject(ScrubObjGen og)
{
    m->offsets[og] = m->pipeline->getCount();
    write(og.unparse(' ')).write(" obj\n");
    auto stream = m->graph.getStream(og);
    if (!stream) {
        write(m->graph.getObject(og).unparse()).write("\nendobj\n");
        return;
    }
    auto dict = stream->getDict().shallowCopy();
    std::string data = stream->getRawData();
    if (m->compress_streams && !dict.hasKey("/Filter") && !data.empty()) {
        data = deflate(data);
        dict.replaceKey("/Filter", ScrubObject::newName("/FlateDecode"));
        dict.removeKey("/DecodeParms");
    }
    dict.replaceKey("/Length", ScrubObject::newInteger(ScrubIntC::to_longlong(data.size())));
    write(dict.unparse()).write("\nstream\n").write(data).write("\nendstream\nendobj\n");
}

std::string
ScrubWriter::generateID(scrub_offset_t xref_offset) const
{
    auto digest = Pl_MD5::rawDigest(std::string_view(m->output).substr(0, ScrubIntC::to_size(xref_offset)));
    std::string id1 = digest;
    if (m->keep_original_id1) {
        auto original = m->graph.getTrailer().getKey("/ID");
        if (original.getArrayNItems() == 2 && original.getArrayItem(0).isString()) {
            id1 = original.getArrayItem(0).getStringValue();
        }
    }
    return "[<" + ScrubUtil::hex_encode(id1) + "> <" + ScrubUtil::hex_encode(digest) + ">]";
}

void
ScrubWriter::writeTrailerKeys(int size, std::string const& id)
{
    auto trailer = m->graph.getTrailer();
    write(" /Size ").write(size);
    write(" /Root ").write(trailer.getKey("/Root").unparse());
    auto info = trailer.getKey("/Info");
    if (info.isReference() && m->graph.hasObject(info.getObjGen())) {
        write(" /Info ").write(info.unparse());
    }
    write(" /ID ").write(id);
}

void
ScrubWriter::writeXRefTable(int size, std::string const& id)
{
    auto entries = xref_entries(m->offsets);
    write("xref\n0 ").write(size).write("\n");
    write("0000000000 65535 f \n");
    for (int i = 1; i < size; ++i) {
        auto it = entries.find(i);
        if (it == entries.end()) {
            write("0000000000 00001 f \n");
        } else {
            write(ScrubUtil::int_to_string(it->second.second, 10))
                .write(" ")
                .write(ScrubUtil::int_to_string(it->second.first, 5))
                .write(" n \n");
        }
    }
    write("trailer <<");
    writeTrailerKeys(size, id);
    write(" >>\n");
}

void
ScrubWriter::writeXRefStream(int xref_id, scrub_offset_t xref_offset, std::string const& id)
{
    int size = xref_id + 1;
    unsigned int f1_size = std::max(bytes_needed(xref_offset), bytes_needed(xref_id));
    unsigned int f2_size = 2;
    for (auto const& [og, offset]: m->offsets) {
        f2_size = std::max(f2_size, bytes_needed(og.getGen()));
    }

    auto entries = xref_entries(m->offsets);
    std::string xref_data;
    for (int i = 0; i < size; ++i) {
        auto it = entries.find(i);
        if (i == xref_id) {
            writeBinary(xref_data, 1, 1);
            writeBinary(xref_data, ScrubIntC::to_ulonglong(xref_offset), f1_size);
            writeBinary(xref_data, 0, f2_size);
        } else if (it == entries.end()) {
            writeBinary(xref_data, 0, 1);
            writeBinary(xref_data, 0, f1_size);
            writeBinary(xref_data, i == 0 ? 65535 : 1, f2_size);
        } else {
            writeBinary(xref_data, 1, 1);
            writeBinary(xref_data, ScrubIntC::to_ulonglong(it->second.second), f1_size);
            writeBinary(xref_data, ScrubIntC::to_ulonglong(it->second.first), f2_size);
        }
    }
    bool compressed = m->compress_streams;
    if (compressed) {
        xref_data = deflate(xref_data);
    }

    write(std::to_string(xref_id)).write(" 0 obj\n<< /Type /XRef");
    write(" /Length ").write(ScrubIntC::to_longlong(xref_data.size()));
    if (compressed) {
        write(" /Filter /FlateDecode");
    }
    write(" /W [ 1 ").write(f1_size).write(" ").write(f2_size).write(" ]");
    writeTrailerKeys(size, id);
    write(" >>\nstream\n").write(xref_data).write("\nendstream\nendobj\n");
}

std::string
ScrubWriter::write()
{
    checkInvariants();
    m->output.clear();
    m->offsets.clear();
    m->pl_string = std::make_unique<Pl_String>("rebuild", nullptr, m->output);
    m->pipeline = std::make_unique<Pl_Count>("rebuild count", m->pl_string.get());

    try {
        writeHeader();
        m->max_id = 0;
        for (auto const& og: m->graph.getObjectKeys()) {
            writeObject(og);
            m->max_id = std::max(m->max_id, og.getObj());
        }

        // Everything before the cross-reference section goes into the identifier.
        auto xref_offset = m->pipeline->getCount();
        auto id = generateID(xref_offset);
        if (m->xref_mode == scrub_xref_stream) {
            writeXRefStream(m->max_id + 1, xref_offset, id);
        } else {
            writeXRefTable(m->max_id + 1, id);
        }
        write("startxref\n").write(xref_offset).write("\n%%EOF\n");
        m->pipeline->finish();
    } catch (ScrubExc&) {
        m->output.clear();
        throw;
    } catch (std::exception& e) {
        m->output.clear();
        throw ScrubExc(scrub_e_rebuild, m->graph.getFilename(), "", 0, e.what());
    }
    std::string result;
    result.swap(m->output);
    return result;
}
