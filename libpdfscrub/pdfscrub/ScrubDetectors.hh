#ifndef SCRUBDETECTORS_HH
#define SCRUBDETECTORS_HH

#include <pdfscrub/ScrubScanner.hh>

#include <pdfscrub/ScrubContent.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubObjectGraph.hh>

#include <map>
#include <set>
#include <string>
#include <vector>

class ScrubStream;

namespace pdfscrub::impl
{
    class StructuralDetector final: public ScrubDetector
    {
      public:
        ~StructuralDetector() final = default;
        scrub_detector_e
        getDetector() const final
        {
            return sd_structural;
        }
        void scan(ScrubScanContext const&, std::vector<ScrubFinding>& findings) final;
    };

    class MetadataDetector final: public ScrubDetector
    {
      public:
        ~MetadataDetector() final = default;
        scrub_detector_e
        getDetector() const final
        {
            return sd_metadata;
        }
        void scan(ScrubScanContext const&, std::vector<ScrubFinding>& findings) final;
    };

    class SignatureDetector final: public ScrubDetector
    {
      public:
        ~SignatureDetector() final = default;
        scrub_detector_e
        getDetector() const final
        {
            return sd_signature;
        }
        void scan(ScrubScanContext const&, std::vector<ScrubFinding>& findings) final;
    };

    class StreamDetector final: public ScrubDetector
    {
      public:
        ~StreamDetector() final = default;
        scrub_detector_e
        getDetector() const final
        {
            return sd_stream;
        }
        void scan(ScrubScanContext const&, std::vector<ScrubFinding>& findings) final;
    };

    class HiddenDataDetector final: public ScrubDetector
    {
      public:
        ~HiddenDataDetector() final = default;
        scrub_detector_e
        getDetector() const final
        {
            return sd_hidden_data;
        }
        void scan(ScrubScanContext const&, std::vector<ScrubFinding>& findings) final;

      private:
        void scanImage(
            ScrubScanContext const&,
            ScrubObjGen og,
            std::shared_ptr<ScrubStream> stream,
            std::vector<ScrubFinding>& findings);
        void scanEmbeddedFile(
            ScrubScanContext const&,
            ScrubObjGen og,
            std::shared_ptr<ScrubStream> stream,
            std::vector<ScrubFinding>& findings);
        void scanActions(ScrubScanContext const&, std::vector<ScrubFinding>& findings);
        void scanOptionalContent(ScrubScanContext const&, std::vector<ScrubFinding>& findings);
    };

    // Helpers shared by detectors and the cleaner

    // Size in bytes of the samples an image dictionary calls for. Returns false if the color space
    // or geometry can't be determined.
    bool image_data_size(
        ScrubObjectGraph const& graph, ScrubObject const& dict, size_t& size, int& bits);

    bool is_image(ScrubObject const& dict);
    bool is_embedded_file(ScrubObject const& dict);
    // True if the only filter is /DCTDecode
    bool is_plain_jpeg(ScrubStream& stream);

    // Content stream keys of a page, in order
    std::vector<ScrubObjGen> page_content_streams(ScrubObjectGraph const& graph, ScrubObjGen page);
    // Decoded page content; false if any part failed to decode
    bool page_content(ScrubObjectGraph const& graph, ScrubObjGen page, std::string& content);
    // /CropBox, else /MediaBox, following inheritance
    bool page_box(ScrubObjectGraph const& graph, ScrubObjGen page, content::Box& box);

    // Optional content groups that the default configuration in /OCProperties turns off
    ScrubObjGen::set hidden_ocgs(ScrubObjectGraph const& graph);
    // Names in the page's /Resources /Properties whose optional content is hidden when the document
    // is opened. `hidden` is the result of hidden_ocgs.
    std::set<std::string> hidden_properties(
        ScrubObjectGraph const& graph, ScrubObjGen page, ScrubObjGen::set const& hidden);

    // Histograms for the pairs-of-values test. Coefficient values -2 through 1 are left out.
    std::map<long, size_t> sample_histogram(std::string const& samples, ScrubCancel const* cancel);
    std::map<long, size_t>
    coefficient_histogram(std::vector<int> const& coefficients, ScrubCancel const* cancel);
} // namespace pdfscrub::impl

#endif // SCRUBDETECTORS_HH
