#include <pdfscrub/ScrubStream.hh>

#include <pdfscrub/Pl_ASCII85Decoder.hh>
#include <pdfscrub/Pl_ASCIIHexDecoder.hh>
#include <pdfscrub/Pl_Flate.hh>
#include <pdfscrub/Pl_PNGFilter.hh>
#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubIntC.hh>

#include <mutex>
#include <stdexcept>

class ScrubStream::Members
{
    friend class ScrubStream;

  public:
    Members(ScrubObject dict, std::string raw, std::string excess, scrub_offset_t offset) :
        dict(dict),
        raw(std::move(raw)),
        excess(std::move(excess)),
        offset(offset)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    ScrubObject dict;
    std::string raw;
    std::string excess;
    scrub_offset_t offset;
    bool encrypted{false};
    unsigned long long max_decoded_size{0};

    std::mutex lock;
    bool decoded{false};
    decode_status_e status{ds_failed};
    std::string data;
    std::string error;
};

namespace
{
    std::string
    expand_filter_name(std::string const& name)
    {
        if (name == "/Fl") {
            return "/FlateDecode";
        } else if (name == "/AHx") {
            return "/ASCIIHexDecode";
        } else if (name == "/A85") {
            return "/ASCII85Decode";
        } else if (name == "/DCT") {
            return "/DCTDecode";
        } else if (name == "/LZW") {
            return "/LZWDecode";
        } else if (name == "/RL") {
            return "/RunLengthDecode";
        } else if (name == "/CCF") {
            return "/CCITTFaxDecode";
        }
        return name;
    }
} // namespace

ScrubStream::ScrubStream(
    ScrubObject dict, std::string raw_data, std::string excess_data, scrub_offset_t offset) :
    m(std::make_shared<Members>(dict, std::move(raw_data), std::move(excess_data), offset))
{
    if (!dict.isDictionary()) {
        throw std::logic_error("ScrubStream created with a non-dictionary");
    }
}

ScrubObject
ScrubStream::getDict() const
{
    return m->dict;
}

std::string const&
ScrubStream::getRawData() const
{
    return m->raw;
}

std::string const&
ScrubStream::getExcessData() const
{
    return m->excess;
}

void
ScrubStream::clearExcessData()
{
    m->excess.clear();
}

scrub_offset_t
ScrubStream::getOffset() const
{
    return m->offset;
}

std::vector<std::string>
ScrubStream::getFilters() const
{
    std::vector<std::string> result;
    auto filter = m->dict.getKey("/Filter");
    if (filter.isName()) {
        result.emplace_back(expand_filter_name(filter.getName()));
    } else if (filter.isArray()) {
        for (auto const& item: filter.getArrayAsVector()) {
            // A non-name entry can't be decoded; keep it so decoding reports it.
            result.emplace_back(item.isName() ? expand_filter_name(item.getName()) : "");
        }
    }
    return result;
}

void
ScrubStream::setEncrypted(bool val)
{
    m->encrypted = val;
}

void
ScrubStream::setMaxDecodedSize(unsigned long long val)
{
    m->max_decoded_size = val;
}

ScrubStream::decode_status_e
ScrubStream::decode()
{
    std::lock_guard<std::mutex> guard(m->lock);
    if (!m->decoded) {
        decodeInternal();
        m->decoded = true;
    }
    return m->status;
}

bool
ScrubStream::isDecoded() const
{
    std::lock_guard<std::mutex> guard(m->lock);
    return m->decoded;
}

std::string const&
ScrubStream::getDecodedData()
{
    if (decode() != ds_ok) {
        throw std::logic_error("ScrubStream::getDecodedData called on a stream that did not decode");
    }
    return m->data;
}

std::string
ScrubStream::getDecodeError() const
{
    std::lock_guard<std::mutex> guard(m->lock);
    return m->error;
}

void
ScrubStream::decodeInternal()
{
    m->data.clear();
    m->error.clear();
    if (m->encrypted) {
        m->status = ds_unsupported;
        m->error = "stream data is encrypted";
        return;
    }
    auto filters = getFilters();
    auto parms_obj = m->dict.getKey("/DecodeParms");
    std::vector<ScrubObject> parms;
    for (size_t i = 0; i < filters.size(); ++i) {
        if (parms_obj.isArray()) {
            parms.emplace_back(parms_obj.getArrayItem(ScrubIntC::to_int(i)));
        } else if (i == 0) {
            parms.emplace_back(parms_obj);
        } else {
            parms.emplace_back(ScrubObject::newNull());
        }
    }

    for (size_t i = 0; i < filters.size(); ++i) {
        auto const& filter = filters.at(i);
        if (!(filter == "/FlateDecode" || filter == "/ASCIIHexDecode" ||
              filter == "/ASCII85Decode")) {
            m->status = ds_unsupported;
            m->error = "unsupported filter " + (filter.empty() ? std::string("(not a name)") : filter);
            return;
        }
        auto predictor = parms.at(i).getKey("/Predictor").getIntValue();
        if (predictor > 1 && (predictor < 10 || filter != "/FlateDecode")) {
            m->status = ds_unsupported;
            m->error = "unsupported predictor " + std::to_string(predictor);
            return;
        }
    }

    // Build the pipeline back to front so that data flows through filters in order.
    std::vector<std::unique_ptr<Pipeline>> to_delete;
    std::string result;
    Pl_String sink("decoded", nullptr, result);
    Pipeline* next = &sink;
    try {
        for (size_t i = filters.size(); i > 0; --i) {
            auto const& filter = filters.at(i - 1);
            auto const& p = parms.at(i - 1);
            if (filter == "/FlateDecode") {
                if (p.getKey("/Predictor").getIntValue() >= 10) {
                    auto columns = p.hasKey("/Columns") ? p.getKey("/Columns").getIntValueAsInt() : 1;
                    auto colors = p.hasKey("/Colors") ? p.getKey("/Colors").getIntValueAsInt() : 1;
                    auto bpc = p.hasKey("/BitsPerComponent")
                        ? p.getKey("/BitsPerComponent").getIntValueAsInt()
                        : 8;
                    if (columns < 1 || colors < 1 || bpc < 1) {
                        throw std::runtime_error("invalid predictor parameters");
                    }
                    to_delete.emplace_back(std::make_unique<Pl_PNGFilter>(
                        "png decode",
                        next,
                        ScrubIntC::to_uint(columns),
                        ScrubIntC::to_uint(colors),
                        ScrubIntC::to_uint(bpc)));
                    next = to_delete.back().get();
                }
                auto flate = std::make_unique<Pl_Flate>("inflate", next, Pl_Flate::a_inflate);
                if (m->max_decoded_size) {
                    flate->setMemoryLimit(m->max_decoded_size);
                }
                to_delete.emplace_back(std::move(flate));
            } else if (filter == "/ASCIIHexDecode") {
                to_delete.emplace_back(std::make_unique<Pl_ASCIIHexDecoder>("ahx decode", next));
            } else {
                to_delete.emplace_back(std::make_unique<Pl_ASCII85Decoder>("a85 decode", next));
            }
            next = to_delete.back().get();
        }
        next->writeString(m->raw);
        next->finish();
    } catch (std::runtime_error& e) {
        m->status = ds_failed;
        m->error = e.what();
        return;
    }
    if (m->max_decoded_size && result.size() > m->max_decoded_size) {
        m->status = ds_failed;
        m->error = "decoded data exceeds the size limit";
        return;
    }
    m->data = std::move(result);
    m->status = ds_ok;
}

void
ScrubStream::replaceRawData(std::string data)
{
    std::lock_guard<std::mutex> guard(m->lock);
    m->raw = std::move(data);
    m->dict.replaceKey("/Length", ScrubObject::newInteger(ScrubIntC::to_longlong(m->raw.size())));
    m->decoded = false;
    m->data.clear();
}

void
ScrubStream::replaceData(std::string data)
{
    std::lock_guard<std::mutex> guard(m->lock);
    m->raw = data;
    m->dict.removeKey("/Filter");
    m->dict.removeKey("/DecodeParms");
    m->dict.replaceKey("/Length", ScrubObject::newInteger(ScrubIntC::to_longlong(m->raw.size())));
    m->data = std::move(data);
    m->error.clear();
    m->status = ds_ok;
    m->decoded = !m->encrypted;
}

std::shared_ptr<ScrubStream>
ScrubStream::copy() const
{
    auto result = std::make_shared<ScrubStream>(m->dict.deepCopy(), m->raw, m->excess, m->offset);
    result->m->encrypted = m->encrypted;
    result->m->max_decoded_size = m->max_decoded_size;
    return result;
}
