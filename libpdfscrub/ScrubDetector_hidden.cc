#include <pdfscrub/ScrubDetectors.hh>

#include <pdfscrub/ScrubDCT.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStatistics.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <set>

using namespace pdfscrub;
using namespace pdfscrub::impl;

namespace
{
    // Fewer observations than this don't support a statistical conclusion.
    size_t const min_observations = 1024;
    // Minimum probability that an embedded file's bytes are uniformly distributed
    double const min_uniformity = 0.001;
    int const max_action_depth = 50;

    std::set<std::string> const dangerous_actions = {
        "/JavaScript", "/Launch", "/ImportData", "/GoToE"};

    std::string
    snippet(std::string const& text)
    {
        std::string result;
        for (auto ch: text.substr(0, 80)) {
            result += (ch >= 32 && ch < 127) ? ch : ' ';
        }
        return result;
    }

    class ActionScanner
    {
      public:
        ActionScanner(ScrubScanContext const& context, std::vector<ScrubFinding>& findings) :
            context(context),
            findings(findings)
        {
        }

        // Check the action stored at `path` inside `og`, whose value is `value`.
        void
        check(ScrubObjGen og, std::string const& path, ScrubObject value, int depth = 0)
        {
            if (depth > max_action_depth) {
                return;
            }
            if (value.isReference()) {
                og = value.getObjGen();
                if (seen.contains(og)) {
                    return;
                }
                seen.insert(og);
                value = context.graph.getObject(og);
                check(og, "", value, depth + 1);
                return;
            }
            if (!value.isDictionary()) {
                return;
            }
            auto type = value.getKey("/S").getName();
            if (dangerous_actions.contains(type)) {
                findings.push_back(ScrubFinding::atObject(
                    ak_hidden_action, sev_high, og, path, type.substr(1) + describe(value)));
            }
            auto next = value.getKey("/Next");
            if (next.isArray()) {
                for (int i = 0; i < next.getArrayNItems(); ++i) {
                    check(og, path + "/Next[" + std::to_string(i) + "]", next.getArrayItem(i), depth + 1);
                }
            } else {
                check(og, path + "/Next", next, depth + 1);
            }
        }

        // Check every entry of an additional-actions dictionary.
        void
        checkAA(ScrubObjGen og, std::string const& path, ScrubObject aa)
        {
            if (aa.isReference()) {
                og = aa.getObjGen();
                aa = context.graph.getObject(og);
                for (auto const& [key, action]: aa.getDictAsMap()) {
                    check(og, key, action);
                }
                return;
            }
            for (auto const& [key, action]: aa.getDictAsMap()) {
                check(og, path + key, action);
            }
        }

        void
        checkNameTree(ScrubObjGen og, std::string const& path, ScrubObject node, int depth = 0)
        {
            if (depth > max_action_depth) {
                return;
            }
            std::string p = path;
            if (node.isReference()) {
                og = node.getObjGen();
                p = "";
                node = context.graph.getObject(og);
            }
            auto names = node.getKey("/Names");
            for (int i = 1; i < names.getArrayNItems(); i += 2) {
                check(og, p + "/Names[" + std::to_string(i) + "]", names.getArrayItem(i));
            }
            auto kids = node.getKey("/Kids");
            for (int i = 0; i < kids.getArrayNItems(); ++i) {
                checkNameTree(og, p + "/Kids[" + std::to_string(i) + "]", kids.getArrayItem(i), depth + 1);
            }
        }

      private:
        std::string
        describe(ScrubObject const& action)
        {
            auto js = action.getKey("/JS");
            if (js.isString()) {
                return ": " + snippet(js.getUTF8Value());
            }
            auto stream = context.graph.resolveStream(js);
            if (stream && stream->decode() == ScrubStream::ds_ok) {
                return ": " + snippet(stream->getDecodedData());
            }
            auto file = context.graph.resolve(action.getKey("/F"));
            if (file.isString()) {
                return ": " + snippet(file.getUTF8Value());
            }
            if (file.isDictionary()) {
                return ": " + snippet(file.getKey("/F").getUTF8Value());
            }
            return "";
        }

        ScrubScanContext const& context;
        std::vector<ScrubFinding>& findings;
        ScrubObjGen::set seen;
    };
} // namespace

void
HiddenDataDetector::scan(ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    if (graph.hasTrailingData()) {
        findings.push_back(ScrubFinding::atRange(
            ak_hidden_trailing_data,
            sev_high,
            graph.getTrailingDataOffset(),
            graph.getTrailingDataLength(),
            std::to_string(graph.getTrailingDataLength()) + " bytes after the final %%EOF"));
    }

    for (auto const& og: context.reachable) {
        if (context.cancel) {
            context.cancel->check("scan");
        }
        auto stream = graph.getStream(og);
        if (!stream) {
            continue;
        }
        if (is_image(stream->getDict())) {
            scanImage(context, og, stream, findings);
        } else if (is_embedded_file(stream->getDict())) {
            scanEmbeddedFile(context, og, stream, findings);
        }
    }

    scanActions(context, findings);
    scanOptionalContent(context, findings);
}

void
HiddenDataDetector::scanOptionalContent(
    ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    auto hidden = hidden_ocgs(graph);
    if (hidden.empty()) {
        return;
    }
    for (auto const& page: graph.getPages()) {
        if (context.cancel) {
            context.cancel->check("scan");
        }
        auto properties = hidden_properties(graph, page, hidden);
        std::string data;
        if (properties.empty() || !page_content(graph, page, data)) {
            continue;
        }
        auto operations = content::analyze(data).operations;
        auto marked = content::optional_content(operations, properties);
        if (marked.empty()) {
            continue;
        }
        std::set<std::string> used;
        for (auto i: marked) {
            used.insert(operations.at(i).operands.back());
        }
        std::string names;
        for (auto const& name: used) {
            names += " " + name;
        }
        findings.push_back(ScrubFinding::atObject(
            ak_hidden_optional_content,
            sev_high,
            page,
            "/Contents",
            std::to_string(marked.size()) +
                " marked-content sequence(s) in optional content that is off when the document "
                "opens:" +
                names));
    }
}

void
HiddenDataDetector::scanImage(
    ScrubScanContext const& context,
    ScrubObjGen og,
    std::shared_ptr<ScrubStream> stream,
    std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    if (is_plain_jpeg(*stream)) {
        auto const& raw = stream->getRawData();
        // Data after the end-of-image marker is ignored by every JPEG decoder.
        auto eoi = raw.rfind("\xff\xd9");
        if (eoi != std::string::npos && eoi + 2 < raw.size()) {
            findings.push_back(ScrubFinding::atObject(
                ak_steganographic_padding,
                sev_high,
                og,
                "",
                std::to_string(raw.size() - eoi - 2) + " bytes after the JPEG end-of-image marker"));
        }
        // Damaged JPEG data is left to the viewer.
        std::vector<int> coefficients;
        try {
            coefficients = ScrubDCT::readACCoefficients(raw);
        } catch (std::runtime_error&) {
            return;
        }
        auto histogram = coefficient_histogram(coefficients, context.cancel);
        size_t total = 0;
        for (auto const& [v, count]: histogram) {
            total += count;
        }
        if (total >= min_observations) {
            auto p = stats::pairs_of_values(histogram);
            if (p > context.config.stego_threshold) {
                findings.push_back(ScrubFinding::atObject(
                    ak_lsb_payload,
                    sev_high,
                    og,
                    "",
                    "DCT coefficient pairs give embedding probability " +
                        ScrubUtil::double_to_string(p, 4)));
            }
        }
        return;
    }

    if (stream->decode() != ScrubStream::ds_ok) {
        return;
    }
    auto const& data = stream->getDecodedData();
    size_t expected = 0;
    int bits = 0;
    if (!image_data_size(graph, stream->getDict(), expected, bits)) {
        return;
    }
    if (data.size() > expected) {
        findings.push_back(ScrubFinding::atObject(
            ak_steganographic_padding,
            sev_high,
            og,
            "",
            std::to_string(data.size() - expected) + " bytes beyond the " +
                std::to_string(expected) + " bytes of image samples"));
    }
    if (bits == 8 && expected >= min_observations) {
        auto histogram = sample_histogram(data.substr(0, expected), context.cancel);
        auto p = stats::pairs_of_values(histogram);
        if (p > context.config.stego_threshold) {
            findings.push_back(ScrubFinding::atObject(
                ak_lsb_payload,
                sev_high,
                og,
                "",
                "sample value pairs give embedding probability " +
                    ScrubUtil::double_to_string(p, 4)));
        }
    }
}

void
HiddenDataDetector::scanEmbeddedFile(
    ScrubScanContext const& context,
    ScrubObjGen og,
    std::shared_ptr<ScrubStream> stream,
    std::vector<ScrubFinding>& findings)
{
    if (stream->decode() != ScrubStream::ds_ok) {
        return;
    }
    auto const& data = stream->getDecodedData();
    if (data.size() < min_observations) {
        return;
    }
    auto counts = stats::byte_histogram(data, context.cancel);
    auto entropy = stats::entropy(counts);
    if (entropy > context.config.entropy_threshold && stats::uniformity(counts) > min_uniformity) {
        findings.push_back(ScrubFinding::atObject(
            ak_high_entropy_payload,
            sev_high,
            og,
            "",
            "embedded file of " + std::to_string(data.size()) + " bytes with entropy " +
                ScrubUtil::double_to_string(entropy, 3) + " bits per byte"));
    }
}

void
HiddenDataDetector::scanActions(ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;
    ActionScanner actions(context, findings);
    auto root_ref = graph.getTrailer().getKey("/Root");
    auto root = graph.getRoot();
    if (!root.isDictionary()) {
        return;
    }
    auto root_og = root_ref.isReference() ? root_ref.getObjGen() : ScrubObjGen();
    auto root_path = root_ref.isReference() ? "" : "/Root";

    // Triggered when the document opens or by document events, without any visible control
    actions.check(root_og, root_path + std::string("/OpenAction"), root.getKey("/OpenAction"));
    actions.checkAA(root_og, root_path + std::string("/AA"), root.getKey("/AA"));
    auto names = root.getKey("/Names");
    if (names.isReference()) {
        actions.checkNameTree(
            names.getObjGen(), "/JavaScript", graph.getObject(names.getObjGen()).getKey("/JavaScript"));
    } else if (names.isDictionary()) {
        actions.checkNameTree(root_og, root_path + std::string("/Names/JavaScript"), names.getKey("/JavaScript"));
    }

    for (auto const& page: graph.getPages()) {
        auto page_obj = graph.getObject(page);
        actions.checkAA(page, "/AA", page_obj.getKey("/AA"));

        // Annotations that can't be seen or clicked
        auto annots = graph.resolve(page_obj.getKey("/Annots"));
        for (int i = 0; i < annots.getArrayNItems(); ++i) {
            auto item = annots.getArrayItem(i);
            auto annot_og = item.isReference() ? item.getObjGen() : page;
            std::string annot_path =
                item.isReference() ? "" : "/Annots[" + std::to_string(i) + "]";
            auto annot = graph.resolve(item);
            if (!annot.isDictionary()) {
                continue;
            }
            auto flags = annot.getKey("/F").getIntValue();
            bool hidden = (flags & (an_invisible | an_hidden | an_no_view)) != 0;
            double llx = 0;
            double lly = 0;
            double urx = 0;
            double ury = 0;
            if (!graph.resolve(annot.getKey("/Rect")).getArrayAsRectangle(llx, lly, urx, ury) ||
                llx == urx || lly == ury) {
                hidden = true;
            }
            if (!hidden) {
                continue;
            }
            actions.check(annot_og, annot_path + "/A", annot.getKey("/A"));
            actions.checkAA(annot_og, annot_path + "/AA", annot.getKey("/AA"));
        }
    }
}
