#ifndef SCRUBOBJECTGRAPH_PRIVATE_HH
#define SCRUBOBJECTGRAPH_PRIVATE_HH

#include <pdfscrub/ScrubObjectGraph.hh>

#include <pdfscrub/BufferInputSource.hh>
#include <pdfscrub/ScrubTokenizer.hh>

class ScrubObjectGraph::Members
{
    friend class ScrubObjectGraph;

  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    std::string filename{"empty PDF"};
    std::string pdf_version;
    scrub_offset_t input_size{0};
    unsigned long long max_decoded_size{0};
    std::shared_ptr<ScrubCancel> cancel;

    // Only set while processMemory runs
    std::unique_ptr<BufferInputSource> file;
    ScrubTokenizer tokenizer;
    std::string last_object_description;
    // Offsets of uncompressed objects in the view being read, for resolving indirect /Length
    std::map<ScrubObjGen, scrub_offset_t> xref_view;
    // Spans of bodies already read, so the unindexed scan doesn't read them twice
    std::map<scrub_offset_t, scrub_offset_t> read_spans;
    scrub_offset_t final_xref_offset{0};

    std::map<ScrubObjGen, Body> objects;
    std::vector<Body> superseded;
    std::vector<Body> unindexed;
    std::vector<Revision> revisions;
    ScrubObject trailer;

    std::vector<ScrubExc> warnings;
    std::vector<Malformed> malformed;
    bool recovered{false};
    bool encrypted{false};
    scrub_offset_t trailing_offset{0};
    scrub_offset_t trailing_length{0};
    std::string content_id;
};

#endif // SCRUBOBJECTGRAPH_PRIVATE_HH
