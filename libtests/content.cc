#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubContent.hh>

#include <iostream>

using namespace pdfscrub;

static content::Box const letter{0, 0, 612, 792};

static void
test_analyze()
{
    auto a = content::analyze(
        "q 1 0 0 1 10 20 cm % note\n"
        "BT /F1 12 Tf 72 700 Td (Hi) Tj ET Q 5 6");
    std::vector<std::string> ops;
    for (auto const& o: a.operations) {
        ops.push_back(o.op);
    }
    assert((ops == std::vector<std::string>{"q", "cm", "BT", "Tf", "Td", "Tj", "ET", "Q"}));
    assert(a.operations.at(1).operands.size() == 6);
    assert((a.operations.at(3).operands == std::vector<std::string>{"/F1", "12"}));
    assert(a.operations.at(5).operands.at(0) == "(Hi)");
    assert(a.comment_bytes >= 6);
    assert(a.trailing_bytes == 2);
    assert(a.hiddenBytes() == a.comment_bytes + 2);
    assert(a.bad_tokens == 0);
    assert(a.size == 65);

    // Normal form drops the comment and the dangling operands.
    assert(
        content::unparse(a.operations) ==
        "q\n1 0 0 1 10 20 cm\nBT\n/F1 12 Tf\n72 700 Td\n(Hi) Tj\nET\nQ\n");

    auto inline_image =
        content::analyze(std::string("BI /W 2 /H 1 /BPC 8 /CS /G ID \x01\x02 EI Q", 37));
    ops.clear();
    for (auto const& o: inline_image.operations) {
        ops.push_back(o.op);
    }
    assert((ops == std::vector<std::string>{"BI", "ID", "EI", "Q"}));
    auto const& id = inline_image.operations.at(1);
    assert(id.operands.size() == 8);
    assert(id.inline_image.substr(0, 2) == "\x01\x02");
    assert(
        content::unparse(inline_image.operations) ==
        std::string("BI\n/W 2 /H 1 /BPC 8 /CS /G ID \x01\x02 EI\nQ\n", 38));

    auto empty = content::analyze("");
    assert(empty.operations.empty() && empty.hiddenBytes() == 0);
}

static void
test_off_page()
{
    auto ops = content::analyze("BT 72 700 Td (a) Tj ET "
                                "BT 72 5000 Td (b) Tj (b2) Tj ET "
                                "q 1 0 0 1 0 5000 cm BT 72 -4900 Td (c) Tj ET Q")
                   .operations;
    std::string evidence;
    auto off = content::off_page_text(ops, letter, 0, &evidence);
    // The text object is reported once even though it shows text twice.
    assert((off == std::vector<size_t>{4}));
    assert(evidence == "text origin (72, 5000) outside box [0 0 612 792]");
    assert(content::off_page_text(ops, letter, 5000).empty());

    auto kept = content::unparse(content::remove_text_objects(ops, off));
    assert(kept.find("(a) Tj") != std::string::npos);
    assert(kept.find("(b") == std::string::npos);
    assert(kept.find("(c) Tj") != std::string::npos);
    assert(kept.find("BT\n72 700 Td\n(a) Tj\nET\nq\n") == 0);
    // Indexes that aren't BT operators are ignored.
    assert(content::remove_text_objects(ops, {1, 2}).size() == ops.size());

    // Leading moves to the next line before showing.
    auto leading = content::analyze("BT 10 TL 72 5 Td T* (x) Tj ET").operations;
    assert(content::off_page_text(leading, letter, 0).size() == 1);
    assert(content::off_page_text(leading, letter, 10).empty());
    auto quote = content::analyze("BT 14 TL 72 10 Td (y) ' ET").operations;
    assert(content::off_page_text(quote, letter, 0).size() == 1);

    auto tm = content::analyze("BT 1 0 0 1 -50 100 Tm (z) Tj ET").operations;
    evidence.clear();
    assert(content::off_page_text(tm, letter, 0, &evidence).size() == 1);
    assert(evidence.find("(-50, 100)") != std::string::npos);

    // A rotated page moves text back into view.
    auto rotated = content::analyze("q 0 1 -1 0 612 0 cm BT 700 300 Td (r) Tj ET Q").operations;
    assert(content::off_page_text(rotated, letter, 0).empty());

    // Text that is never shown isn't reported.
    auto unshown = content::analyze("BT 72 5000 Td ET").operations;
    assert(content::off_page_text(unshown, letter, 0).empty());
}

static void
test_marked_content()
{
    auto ops = content::analyze("/OC /A BDC (a) Tj EMC "
                                "/P << /MCID 0 >> BDC /OC /B BDC (b) Tj /OC /A BDC (b2) Tj EMC EMC "
                                "(p) Tj EMC "
                                "/X BMC (x) Tj EMC "
                                "/OC /B BDC (open) Tj")
                   .operations;
    assert(ops.size() == 17);
    assert((content::optional_content(ops, {"/B"}) == std::vector<size_t>{4, 15}));
    // A sequence inside a reported one isn't reported again.
    assert((content::optional_content(ops, {"/A", "/B"}) == std::vector<size_t>{0, 4, 15}));
    assert(content::optional_content(ops, {"/X", "/MCID"}).empty());

    auto kept = content::remove_marked_content(ops, {4, 15});
    assert(kept.size() == 9);
    auto text = content::unparse(kept);
    assert(text.find("(a) Tj") != std::string::npos);
    assert(text.find("(p) Tj\nEMC\n") != std::string::npos);
    assert(text.find("(x) Tj") != std::string::npos);
    assert(text.find("(b") == std::string::npos);
    // The unclosed sequence runs to the end.
    assert(text.find("(open)") == std::string::npos);
    // Indexes that aren't BDC operators are ignored.
    assert(content::remove_marked_content(ops, {1, 12}).size() == ops.size());
}

int
main()
{
    test_analyze();
    test_off_page();
    test_marked_content();
    std::cout << "content tests done" << std::endl;
    return 0;
}
