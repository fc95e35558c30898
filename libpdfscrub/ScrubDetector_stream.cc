#include <pdfscrub/ScrubDetectors.hh>

#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStream.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

#include <algorithm>

using namespace pdfscrub;
using namespace pdfscrub::impl;

namespace
{
    // Hidden bytes must exceed both half the content and this many bytes.
    size_t const min_hidden_bytes = 256;
    double const off_page_tolerance = 1.0;

    bool
    all_blank(std::string const& s)
    {
        return std::all_of(s.begin(), s.end(), [](char c) { return util::is_space(c); });
    }
} // namespace

void
StreamDetector::scan(ScrubScanContext const& context, std::vector<ScrubFinding>& findings)
{
    auto const& graph = context.graph;

    size_t n = 0;
    for (auto const& og: context.reachable) {
        if (context.cancel && (++n % 256) == 0) {
            context.cancel->check("scan");
        }
        auto stream = graph.getStream(og);
        if (stream && !all_blank(stream->getExcessData())) {
            findings.push_back(ScrubFinding::atObject(
                ak_stream_length_mismatch,
                sev_high,
                og,
                "",
                std::to_string(stream->getExcessData().size()) +
                    " bytes of data after the declared /Length of " +
                    std::to_string(stream->getRawData().size())));
        }
    }

    for (auto const& page: graph.getPages()) {
        if (context.cancel) {
            context.cancel->check("scan");
        }
        // Each content stream on its own: comments and trailing junk
        for (auto const& og: page_content_streams(graph, page)) {
            auto stream = graph.getStream(og);
            if (!stream || stream->decode() != ScrubStream::ds_ok) {
                continue;
            }
            auto const& data = stream->getDecodedData();
            auto analysis = content::analyze(data);
            auto hidden = analysis.hiddenBytes();
            if (hidden > min_hidden_bytes && hidden * 2 > data.size()) {
                findings.push_back(ScrubFinding::atObject(
                    ak_anomalous_stream_size,
                    sev_medium,
                    og,
                    "",
                    std::to_string(hidden) + " of " + std::to_string(data.size()) +
                        " bytes are comments or follow the last operator"));
            }
        }

        // The whole page: text placed outside the visible area
        std::string data;
        content::Box box;
        if (!page_box(graph, page, box) || !page_content(graph, page, data)) {
            continue;
        }
        auto analysis = content::analyze(data);
        std::string evidence;
        auto off_page = content::off_page_text(analysis.operations, box, off_page_tolerance, &evidence);
        if (!off_page.empty()) {
            findings.push_back(ScrubFinding::atObject(
                ak_off_page_content,
                sev_medium,
                page,
                "/Contents",
                std::to_string(off_page.size()) + " text object(s) off the page; " + evidence));
        }
    }
}
