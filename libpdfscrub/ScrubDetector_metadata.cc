#include <pdfscrub/ScrubDetectors.hh>

#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubUtil.hh>

using namespace pdfscrub::impl;

namespace
{
    // Pull the value of an XMP property out of the packet without a full XML parser. Both the
    // attribute form (xmp:CreatorTool="...") and the element form (<xmp:CreatorTool>...</...>) are
    // recognized.
    std::string
    xmp_property(std::string const& xmp, std::string const& name)
    {
        auto pos = xmp.find(name + "=\"");
        if (pos != std::string::npos) {
            auto start = pos + name.size() + 2;
            auto end = xmp.find('"', start);
            if (end != std::string::npos) {
                return xmp.substr(start, end - start);
            }
        }
        pos = xmp.find("<" + name + ">");
        if (pos != std::string::npos) {
            auto start = pos + name.size() + 2;
            auto end = xmp.find('<', start);
            if (end != std::string::npos) {
                return xmp.substr(start, end - start);
            }
        }
        return "";
    }

    std::string
    describe_xmp(std::shared_ptr<ScrubStream> stream)
    {
        if (stream->decode() != ScrubStream::ds_ok) {
            return "XMP packet of " + std::to_string(stream->getRawData().size()) +
                " bytes (not decoded)";
        }
        auto const& data = stream->getDecodedData();
        std::string result = "XMP packet of " + std::to_string(data.size()) + " bytes";
        for (auto const& name: {"xmp:CreatorTool", "pdf:Producer", "dc:creator"}) {
            auto value = xmp_property(data, name);
            if (!value.empty() && ScrubUtil::is_printable_text(value)) {
                result += "; " + std::string(name) + " " + value;
                break;
            }
        }
        return result;
    }
} // namespace

void
MetadataDetector::scan(ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    auto trailer = graph.getTrailer();

    // Document information dictionary
    auto info_ref = trailer.getKey("/Info");
    auto info = graph.resolve(info_ref);
    if (info.isDictionary()) {
        ScrubObjGen og = info_ref.isReference() ? info_ref.getObjGen() : ScrubObjGen();
        std::string prefix = info_ref.isReference() ? "" : "/Info";
        for (auto const& [key, value]: info.getDictAsMap()) {
            if (context.config.allowed_metadata_fields.contains(key.substr(1))) {
                continue;
            }
            auto v = graph.resolve(value);
            std::string evidence =
                v.isString() ? v.getUTF8Value() : (v.isInitialized() ? v.unparse() : "");
            findings.push_back(ScrubFinding::atObject(
                ak_info_metadata, sev_medium, og, prefix + key, evidence));
        }
    }

    // Document identifier. A content-derived identifier says nothing about where the document
    // came from.
    auto id = trailer.getKey("/ID");
    if (trailer.hasKey("/ID")) {
        auto const& content_id = graph.getContentId();
        bool derived = id.isArray() && id.getArrayNItems() == 2 &&
            id.getArrayItem(0).getStringValue() == content_id &&
            id.getArrayItem(1).getStringValue() == content_id;
        if (!derived) {
            std::string evidence;
            for (auto const& item: id.getArrayAsVector()) {
                if (!evidence.empty()) {
                    evidence += " ";
                }
                evidence += "<" + ScrubUtil::hex_encode(item.getStringValue()) + ">";
            }
            findings.push_back(
                ScrubFinding::atObject(ak_document_id, sev_low, ScrubObjGen(), "/ID", evidence));
        }
    }

    // XMP packets and application data anywhere in the document
    size_t n = 0;
    for (auto const& og: context.reachable) {
        if (context.cancel && (++n % 256) == 0) {
            context.cancel->check("scan");
        }
        auto obj = graph.getObject(og);
        if (!obj.isDictionary()) {
            continue;
        }
        auto metadata = graph.resolveStream(obj.getKey("/Metadata"));
        if (metadata) {
            findings.push_back(ScrubFinding::atObject(
                ak_xmp_metadata, sev_medium, og, "/Metadata", describe_xmp(metadata)));
        }
        if (obj.hasKey("/PieceInfo")) {
            auto piece_info = graph.resolve(obj.getKey("/PieceInfo"));
            std::string evidence;
            for (auto const& key: piece_info.getKeys()) {
                evidence += (evidence.empty() ? "" : " ") + key;
            }
            findings.push_back(ScrubFinding::atObject(
                ak_private_app_data, sev_low, og, "/PieceInfo", "application data " + evidence));
        }
    }
}
