#ifndef SCRUBCONTENT_HH
#define SCRUBCONTENT_HH

#include <cstddef>
#include <set>
#include <string>
#include <vector>

// Page content stream analysis shared by the stream detector and the cleaner.
namespace pdfscrub::content
{
    struct Operation
    {
        // Raw tokens preceding the operator
        std::vector<std::string> operands;
        std::string op;
        // Data of an inline image, for op == "ID"
        std::string inline_image;
    };

    struct Analysis
    {
        std::vector<Operation> operations;
        size_t size{0};
        size_t comment_bytes{0};
        // Non-blank bytes after the last complete operator
        size_t trailing_bytes{0};
        size_t bad_tokens{0};

        size_t
        hiddenBytes() const
        {
            return comment_bytes + trailing_bytes;
        }
    };

    Analysis analyze(std::string const& data);

    // Write operations in normal form, one per line, without comments.
    std::string unparse(std::vector<Operation> const& operations);

    struct Box
    {
        double llx{0};
        double lly{0};
        double urx{0};
        double ury{0};
    };

    // Follow the graphics and text state through the operations and return the index of the BT
    // operator of every text object that shows text whose origin lies outside `box` by more than
    // `tolerance`. If `evidence` is not null, it receives a description of the first such origin.
    std::vector<size_t> off_page_text(
        std::vector<Operation> const& operations,
        Box const& box,
        double tolerance,
        std::string* evidence = nullptr);

    // Drop the text objects starting at the given BT indexes, through their matching ET.
    std::vector<Operation>
    remove_text_objects(std::vector<Operation> const& operations, std::vector<size_t> const& bts);

    // Return the index of the BDC operator of every outermost marked-content sequence of the form
    // /OC /Name BDC ... EMC where /Name is one of `properties`. Sequences nested in one already
    // returned are not returned again.
    std::vector<size_t> optional_content(
        std::vector<Operation> const& operations, std::set<std::string> const& properties);

    // Drop the marked-content sequences starting at the given BDC indexes, through their matching
    // EMC. A sequence that is never closed runs to the end of the content.
    std::vector<Operation> remove_marked_content(
        std::vector<Operation> const& operations, std::vector<size_t> const& starts);
} // namespace pdfscrub::content

#endif // SCRUBCONTENT_HH
