#include <pdfscrub/assert_test.h>

// This program tests object handles, the object parser, and the tokenizer.

#include <pdfscrub/BufferInputSource.hh>
#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/ScrubParser.hh>
#include <pdfscrub/ScrubTokenizer.hh>

#include <climits>
#include <iostream>

using namespace pdfscrub::impl;

#define assert_compare_numbers(expected, expr) compare_numbers(#expr, expected, expr)

template <typename T1, typename T2>
static void
compare_numbers(char const* description, T1 const& expected, T2 const& actual)
{
    if (expected != actual) {
        std::cerr << description << ": expected = " << expected << "; actual = " << actual << '\n';
        assert(false);
    }
}

static ScrubObject
parse(std::string const& text)
{
    return ScrubParser::parse(text, "test object");
}

static void
test_tokenizer()
{
    BufferInputSource input(
        "tokens", std::string("<< /Name#41 (a\\(b\\)\\n) <4142> 12 -3.5 true null R >> [ ] %c\n"));
    ScrubTokenizer tokenizer;
    tokenizer.allowEOF();
    using T = ScrubTokenizer;
    std::vector<std::pair<T::token_type_e, std::string>> expected{
        {T::tt_dict_open, "<<"},
        {T::tt_name, "/NameA"},
        {T::tt_string, "a(b)\n"},
        {T::tt_string, "AB"},
        {T::tt_integer, "12"},
        {T::tt_real, "-3.5"},
        {T::tt_bool, "true"},
        {T::tt_null, "null"},
        {T::tt_word, "R"},
        {T::tt_dict_close, ">>"},
        {T::tt_array_open, "["},
        {T::tt_array_close, "]"},
        {T::tt_eof, ""},
    };
    for (auto const& [type, value]: expected) {
        auto token = tokenizer.readToken(input, "test");
        if (token.getType() != type || token.getValue() != value) {
            std::cout << "unexpected token " << token.getRawValue() << std::endl;
            assert(false);
        }
    }

    // Comments and spaces are visible when asked for.
    BufferInputSource commented("comments", std::string("1 %note\n2"));
    ScrubTokenizer ignorable;
    ignorable.allowEOF();
    ignorable.includeIgnorable();
    assert(ignorable.readToken(commented, "test").getType() == T::tt_integer);
    assert(ignorable.readToken(commented, "test").getType() == T::tt_space);
    auto comment = ignorable.readToken(commented, "test");
    assert(comment.getType() == T::tt_comment);
    assert(comment.getValue().starts_with("%note"));

    // Bad tokens throw unless allowed.
    BufferInputSource bad("bad", std::string(") x"));
    ScrubTokenizer strict;
    try {
        strict.readToken(bad, "test");
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_damaged_pdf);
    }
    bad.rewind();
    assert(strict.readToken(bad, "test", true).getType() == T::tt_bad);

    // Length limit
    BufferInputSource longname("long", std::string("/" + std::string(100, 'x') + " "));
    assert(strict.readToken(longname, "test", true, 20).getType() == T::tt_bad);
}

static void
test_parser()
{
    auto d = parse(
        "<< /Type /Page /Kids [1 0 R 2 0 R] /A#20B (x\\(y\\)) /Real -0.5 "
        "/Hex <48656C6C6F> /B true /Nested << /N [[1] [2 3]] >> >>");
    assert(d.isDictionaryOfType("/Page"));
    assert(!d.isDictionaryOfType("/Page", "/Form"));
    assert(d.getKey("/Kids").getArrayNItems() == 2);
    assert(d.getKey("/Kids").getArrayItem(1).getObjGen() == ScrubObjGen(2, 0));
    assert(d.getKey("/A B").getStringValue() == "x(y)");
    assert(d.getKey("/Real").getRealValue() == "-0.5");
    assert(d.getKey("/Real").getNumericValue() == -0.5);
    assert(d.getKey("/Hex").getStringValue() == "Hello");
    assert(d.getKey("/Nested").getKey("/N").getArrayItem(1).getArrayItem(0).getIntValue() == 2);
    assert(
        d.unparse() ==
        "<< /A#20B (x\\(y\\)) /B true /Hex (Hello) /Kids [1 0 R 2 0 R] "
        "/Nested << /N [[1] [2 3]] >> /Real -0.5 /Type /Page >>");
    // Unparsed text parses to the same object.
    assert(parse(d.unparse()).isEqualTo(d));

    assert(parse("  42 ").getIntValue() == 42);
    assert(parse("3 0 R").isReference());
    assert(parse("[3 0 R 4]").getArrayItem(1).getIntValue() == 4);
    assert(parse("<00ff>").unparse() == "<00ff>");

    for (auto const& bad: {"[1 2", "<< /A >>", "(unterminated", "}", "<< /A 1 ]"}) {
        try {
            parse(bad);
            std::cout << "parsed " << bad << std::endl;
            assert(false);
        } catch (ScrubExc& e) {
            assert(e.getErrorCode() == scrub_e_damaged_pdf);
        }
    }
    try {
        parse(std::string(600, '['));
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getMessageDetail().find("deeply nested") != std::string::npos);
        assert(e.getFilePosition() > 0 && e.getFilePosition() < 600);
    }

    // With a warnings vector, problems are recorded and the object is still read.
    BufferInputSource input("damaged", std::string("<< /A 1 /B >>"));
    ScrubTokenizer tokenizer;
    tokenizer.allowEOF();
    std::vector<ScrubExc> warnings;
    bool empty = false;
    auto repaired = ScrubParser(input, "object 4", tokenizer, &warnings).parse(empty);
    assert(!empty);
    assert(repaired.getKey("/A").getIntValue() == 1);
    assert(repaired.hasKey("/B") && repaired.getKey("/B").isNull());
    assert(warnings.size() == 1);
    assert(warnings.at(0).getObject() == "object 4");

    BufferInputSource nothing("empty", std::string("endobj"));
    ScrubTokenizer t2;
    ScrubParser(nothing, "object 5", t2, &warnings).parse(empty);
    assert(empty);
    assert(nothing.tell() == 0);
}

static void
test_handles()
{
    unsigned long long big = 3ULL * static_cast<unsigned long long>(INT_MAX);
    auto q1 = ScrubObject::newInteger(static_cast<long long>(big));
    assert_compare_numbers(static_cast<long long>(big), q1.getIntValue());
    assert_compare_numbers(INT_MAX, q1.getIntValueAsInt());
    assert_compare_numbers(INT_MIN, ScrubObject::newInteger(3LL * INT_MIN).getIntValueAsInt());

    // Accessors of the wrong type return defaults.
    auto name = ScrubObject::newName("/Author");
    assert_compare_numbers(0, name.getIntValue());
    assert(name.getStringValue().empty());
    assert(ScrubObject().isNull() && !ScrubObject().isInitialized());
    assert(ScrubObject().getKey("/X").isNull());
    assert(std::string(name.getTypeName()) == "name");
    try {
        name.replaceKey("/X", name);
        assert(false);
    } catch (std::logic_error&) {
    }

    // Handles share their value; copies don't.
    auto dict = parse("<< /A [1 2] /B (b) >>");
    auto alias = dict;
    auto shallow = dict.shallowCopy();
    auto deep = dict.deepCopy();
    alias.replaceKey("/C", ScrubObject::newBool(true));
    dict.getKey("/A").appendItem(ScrubObject::newInteger(3));
    assert(dict.hasKey("/C"));
    assert(!shallow.hasKey("/C"));
    assert(shallow.getKey("/A").getArrayNItems() == 3);
    assert(deep.getKey("/A").getArrayNItems() == 2);
    assert(!deep.isEqualTo(dict));
    dict.removeKey("/C");
    dict.getKey("/A").eraseItem(2);
    assert(deep.isEqualTo(dict));
    assert((dict.getKeys() == std::set<std::string>{"/A", "/B"}));

    auto rect = ScrubObject::newNumberArray({0, 0, 612.5, 792});
    assert(rect.unparse() == "[0 0 612.5 792]");
    double llx = 1;
    double lly = 1;
    double urx = 0;
    double ury = 0;
    assert(rect.getArrayAsRectangle(llx, lly, urx, ury));
    assert(llx == 0 && urx == 612.5 && ury == 792);
    assert(!parse("[0 0 /A 1]").getArrayAsRectangle(llx, lly, urx, ury));
    assert(llx == 0);

    // References
    auto refs = parse("<< /A 1 0 R /B [2 0 R << /C 3 0 R >>] /D 1 0 R >>");
    std::set<ScrubObjGen> found;
    refs.collectReferences(found);
    assert((found == std::set<ScrubObjGen>{{1, 0}, {2, 0}, {3, 0}}));
    auto count = refs.rewriteReferences([](ScrubObjGen og) {
        if (og.getObj() == 1) {
            return ScrubObject::newNull();
        } else if (og.getObj() == 2) {
            return ScrubObject::newInteger(5);
        }
        return ScrubObject();
    });
    assert(count == 3);
    assert(refs.unparse() == "<< /B [5 << /C 3 0 R >>] >>");
    assert(refs.containsText("/C") == false);
    assert(parse("[(visible secret)]").containsText("secret"));
    assert(parse("<< /S /JavaScript >>").containsText("JavaScript"));

    // Text strings
    assert(ScrubObject::newString("caf\xe9").getUTF8Value() == "caf\xc3\xa9");
    assert(
        ScrubObject::newString(std::string("\xfe\xff\x00\x41\xd8\x3d\xdd\x54", 8)).getUTF8Value() ==
        "A\xf0\x9f\x95\x94");
    assert(ScrubObject::newString("\xef\xbb\xbfok").getUTF8Value() == "ok");
    assert(ScrubObject::unparseString("a\tb(c)") == "(a\\tb\\(c\\))");
    assert(ScrubObject::unparseString(std::string("\0\x01", 2)) == "<0001>");
    assert(ScrubObject::unparseName("/A/B#") == "/A#2fB#23");
}

static void
test_objgen()
{
    assert(ScrubObjGen(3, 1) < ScrubObjGen(4, 0));
    assert(ScrubObjGen(4, 0) < ScrubObjGen(4, 2));
    assert(ScrubObjGen(4, 2) != ScrubObjGen(4, 0));
    assert(ScrubObjGen(12, 3).unparse(',') == "12,3");

    ScrubObjGen::set seen;
    assert(seen.add(ScrubObjGen(7, 0)));
    assert(!seen.add(ScrubObjGen(7, 0)));
    // The trailer key is never stored, so it never looks like a loop.
    assert(seen.add(ScrubObjGen()));
    assert(seen.add(ScrubObjGen()));
    assert(seen.size() == 1);
    seen.erase(ScrubObjGen(7, 0));
    assert(seen.empty());
}

int
main()
{
    test_objgen();
    test_tokenizer();
    test_parser();
    test_handles();
    std::cout << "object tests done" << std::endl;
    return 0;
}
