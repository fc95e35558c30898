#include <pdfscrub/ScrubDetectors.hh>

#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStatistics.hh>
#include <pdfscrub/ScrubStream.hh>

#include <algorithm>

using namespace pdfscrub;

namespace
{
    int const max_inheritance_depth = 50;

    // Number of color components, or 0 if unknown
    int
    components(ScrubObjectGraph const& graph, ScrubObject cs)
    {
        cs = graph.resolve(cs);
        if (cs.isArray() && cs.getArrayNItems() > 0) {
            auto family = graph.resolve(cs.getArrayItem(0)).getName();
            if (family == "/Indexed" || family == "/Separation" || family == "/Pattern") {
                return 1;
            }
            if (family == "/ICCBased") {
                auto n = graph.resolve(cs.getArrayItem(1)).getKey("/N");
                return n.isInteger() ? n.getIntValueAsInt() : 0;
            }
            if (family == "/DeviceN") {
                return graph.resolve(cs.getArrayItem(1)).getArrayNItems();
            }
            if (family == "/CalRGB" || family == "/Lab") {
                return 3;
            }
            if (family == "/CalGray") {
                return 1;
            }
            cs = cs.getArrayItem(0);
        }
        auto name = cs.getName();
        if (name == "/DeviceGray" || name == "/G" || name == "/CalGray") {
            return 1;
        }
        if (name == "/DeviceRGB" || name == "/RGB" || name == "/CalRGB") {
            return 3;
        }
        if (name == "/DeviceCMYK" || name == "/CMYK") {
            return 4;
        }
        return 0;
    }

    // Look up a key on a page or its ancestors
    ScrubObject
    inherited(ScrubObjectGraph const& graph, ScrubObjGen page, std::string const& key)
    {
        auto node = graph.getObject(page);
        for (int depth = 0; depth < max_inheritance_depth && node.isDictionary(); ++depth) {
            if (node.hasKey(key)) {
                return graph.resolve(node.getKey(key));
            }
            node = graph.resolve(node.getKey("/Parent"));
        }
        return ScrubObject::newNull();
    }

    ScrubObjGen::set
    group_refs(ScrubObjectGraph const& graph, ScrubObject groups)
    {
        ScrubObjGen::set result;
        groups = groups.isReference() && graph.resolve(groups).isArray() ? graph.resolve(groups)
                                                                         : groups;
        if (groups.isReference()) {
            result.insert(groups.getObjGen());
        }
        for (auto const& item: groups.getArrayAsVector()) {
            if (item.isReference()) {
                result.insert(item.getObjGen());
            }
        }
        return result;
    }

    // A property list refers to either an optional content group or a membership dictionary whose
    // visibility policy combines several groups.
    bool
    is_hidden(ScrubObjectGraph const& graph, ScrubObject value, ScrubObjGen::set const& hidden)
    {
        if (value.isReference() && hidden.contains(value.getObjGen())) {
            return true;
        }
        value = graph.resolve(value);
        if (!value.getKey("/Type").isNameAndEquals("/OCMD")) {
            return false;
        }
        auto groups = group_refs(graph, value.getKey("/OCGs"));
        if (groups.empty()) {
            return false;
        }
        size_t off = 0;
        for (auto const& og: groups) {
            if (hidden.contains(og)) {
                ++off;
            }
        }
        auto policy = graph.resolve(value.getKey("/P")).getName();
        if (policy == "/AllOn") {
            return off > 0;
        }
        if (policy == "/AnyOff") {
            return off == 0;
        }
        if (policy == "/AllOff") {
            return off < groups.size();
        }
        // /AnyOn
        return off == groups.size();
    }
} // namespace

bool
impl::image_data_size(
    ScrubObjectGraph const& graph, ScrubObject const& dict, size_t& size, int& bits)
{
    auto width = graph.resolve(dict.getKey("/Width"));
    auto height = graph.resolve(dict.getKey("/Height"));
    if (!(width.isInteger() && height.isInteger() && width.getIntValue() > 0 &&
          height.getIntValue() > 0)) {
        return false;
    }
    int n = 0;
    if (graph.resolve(dict.getKey("/ImageMask")).getBoolValue()) {
        n = 1;
        bits = 1;
    } else {
        n = components(graph, dict.getKey("/ColorSpace"));
        auto bpc = graph.resolve(dict.getKey("/BitsPerComponent"));
        bits = bpc.isInteger() ? bpc.getIntValueAsInt() : 0;
    }
    if (n <= 0 || !(bits == 1 || bits == 2 || bits == 4 || bits == 8 || bits == 16)) {
        return false;
    }
    auto w = static_cast<unsigned long long>(width.getIntValue());
    auto h = static_cast<unsigned long long>(height.getIntValue());
    // Each row is padded to a whole byte.
    auto row = (w * ScrubIntC::to_ulonglong(n) * ScrubIntC::to_ulonglong(bits) + 7) / 8;
    if (h != 0 && row > (1ULL << 40) / h) {
        return false;
    }
    size = ScrubIntC::to_size(row * h);
    return true;
}

bool
impl::is_image(ScrubObject const& dict)
{
    return dict.getKey("/Subtype").isNameAndEquals("/Image");
}

bool
impl::is_embedded_file(ScrubObject const& dict)
{
    return dict.getKey("/Type").isNameAndEquals("/EmbeddedFile");
}

bool
impl::is_plain_jpeg(ScrubStream& stream)
{
    auto filters = stream.getFilters();
    return filters.size() == 1 && (filters.at(0) == "/DCTDecode" || filters.at(0) == "/DCT");
}

std::vector<ScrubObjGen>
impl::page_content_streams(ScrubObjectGraph const& graph, ScrubObjGen page)
{
    std::vector<ScrubObjGen> result;
    auto contents = graph.getObject(page).getKey("/Contents");
    if (contents.isReference() && graph.resolve(contents).isArray()) {
        contents = graph.resolve(contents);
    }
    if (contents.isReference()) {
        result.emplace_back(contents.getObjGen());
    } else {
        for (auto const& item: contents.getArrayAsVector()) {
            if (item.isReference()) {
                result.emplace_back(item.getObjGen());
            }
        }
    }
    return result;
}

bool
impl::page_content(ScrubObjectGraph const& graph, ScrubObjGen page, std::string& content)
{
    content.clear();
    for (auto const& og: page_content_streams(graph, page)) {
        auto stream = graph.getStream(og);
        if (!stream || stream->decode() != ScrubStream::ds_ok) {
            return false;
        }
        // Content streams are concatenated as if separated by white space.
        content += stream->getDecodedData();
        content += '\n';
    }
    return true;
}

bool
impl::page_box(ScrubObjectGraph const& graph, ScrubObjGen page, content::Box& box)
{
    for (auto const& key: {"/CropBox", "/MediaBox"}) {
        auto rect = inherited(graph, page, key);
        double llx = 0;
        double lly = 0;
        double urx = 0;
        double ury = 0;
        if (rect.getArrayAsRectangle(llx, lly, urx, ury)) {
            box.llx = std::min(llx, urx);
            box.lly = std::min(lly, ury);
            box.urx = std::max(llx, urx);
            box.ury = std::max(lly, ury);
            return true;
        }
    }
    return false;
}

ScrubObjGen::set
impl::hidden_ocgs(ScrubObjectGraph const& graph)
{
    auto properties = graph.resolve(graph.getRoot().getKey("/OCProperties"));
    auto config = graph.resolve(properties.getKey("/D"));
    if (!config.isDictionary()) {
        return {};
    }
    if (!graph.resolve(config.getKey("/BaseState")).isNameAndEquals("/OFF")) {
        return group_refs(graph, config.getKey("/OFF"));
    }
    // Everything starts off; /ON lists the exceptions.
    ScrubObjGen::set result;
    auto on = group_refs(graph, config.getKey("/ON"));
    for (auto const& og: group_refs(graph, properties.getKey("/OCGs"))) {
        if (!on.contains(og)) {
            result.insert(og);
        }
    }
    return result;
}

std::set<std::string>
impl::hidden_properties(
    ScrubObjectGraph const& graph, ScrubObjGen page, ScrubObjGen::set const& hidden)
{
    std::set<std::string> result;
    if (hidden.empty()) {
        return result;
    }
    auto properties = graph.resolve(inherited(graph, page, "/Resources").getKey("/Properties"));
    for (auto const& [name, value]: properties.getDictAsMap()) {
        if (is_hidden(graph, value, hidden)) {
            result.insert(name);
        }
    }
    return result;
}

std::map<long, size_t>
impl::sample_histogram(std::string const& samples, ScrubCancel const* cancel)
{
    auto counts = stats::byte_histogram(samples, cancel);
    std::map<long, size_t> result;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (counts[i]) {
            result[static_cast<long>(i)] = counts[i];
        }
    }
    return result;
}

std::map<long, size_t>
impl::coefficient_histogram(std::vector<int> const& coefficients, ScrubCancel const* cancel)
{
    // Zero and one carry no payload in JSteg-style embedding, which leaves their pairs incomplete.
    std::map<long, size_t> result;
    size_t n = 0;
    for (auto c: coefficients) {
        if (cancel && (++n % 4096) == 0) {
            cancel->check("scan");
        }
        if (c < -2 || c > 1) {
            ++result[c];
        }
    }
    return result;
}
