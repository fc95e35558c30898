#include <pdfscrub/assert_test.h>

#include <pdfscrub/BufferInputSource.hh>
#include <pdfscrub/InputSource_private.hh>
#include <pdfscrub/ScrubTokenizer.hh>

#include <cstring>
#include <iostream>

static std::string
get_buffer()
{
    size_t size = 3172;
    std::string b(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        b[i] = static_cast<char>(i & 0xff);
    }
    return b;
}

class Finder: public InputSource::Finder
{
  public:
    Finder(InputSource& is, std::string const& after) :
        is(is),
        after(after)
    {
    }
    ~Finder() override = default;
    bool check() override;

  private:
    InputSource& is;
    std::string after;
};

bool
Finder::check()
{
    ScrubTokenizer tokenizer;
    auto t = tokenizer.readToken(is, "finder", true);
    if (t.isWord("potato")) {
        t = tokenizer.readToken(is, "finder", true);
        return t.isWord(after);
    }
    return false;
}

static void
check(char const* description, bool expected, bool actual)
{
    if (actual != expected) {
        std::cout << description << ": FAIL" << std::endl;
        assert(false);
    }
}

static void
test_find()
{
    std::string b = get_buffer();
    // Straddle block boundaries
    memcpy(b.data() + 1022, "potato", 6);
    // Overlap so that the first check() would advance past the start of the next match
    memcpy(b.data() + 2037, "potato potato salad ", 20);
    BufferInputSource is("test buffer input source", std::string_view(b));
    Finder f1(is, "salad");
    check("find potato salad", true, is.findFirst("potato", 0, 0, f1));
    check("barely find potato salad", true, is.findFirst("potato", 1100, 945, f1));
    check("barely find potato salad", true, is.findFirst("potato", 2000, 45, f1));
    check("potato salad is too late", false, is.findFirst("potato", 1100, 944, f1));
    check("potato salad is too late", false, is.findFirst("potato", 2000, 44, f1));
    check("potato salad not found", false, is.findFirst("potato", 2045, 0, f1));
    check("potato salad not found", false, is.findFirst("potato", 0, 1, f1));

    // Put one more right at EOF
    memcpy(b.data() + b.size() - 12, "potato salad", 12);
    check("potato salad at EOF", true, is.findFirst("potato", 3000, 0, f1));

    is.findFirst("potato", 0, 0, f1);
    check("findFirst found first", true, is.tell() == 2056);
    check("findLast found potato salad", true, is.findLast("potato", 0, 0, f1));
    check("findLast found at EOF", true, is.tell() == 3172);

    // Make check() bump into EOF
    memcpy(b.data() + b.size() - 6, "potato", 6);
    check("potato but not salad salad at EOF", false, is.findFirst("potato", 3000, 0, f1));
    check("findLast found potato salad", true, is.findLast("potato", 0, 0, f1));
    check("findLast found first one", true, is.tell() == 2056);
}

static void
test_lines()
{
    BufferInputSource is("lines", std::string("%PDF-1.7\r\n%\xe2\xe3\r\n1 0 obj\n\n<< >>"));
    assert(is.readLine(100) == "%PDF-1.7");
    assert(is.getLastOffset() == 0);
    assert(is.tell() == 10);
    // Longer than the limit: the rest of the line is skipped.
    assert(is.readLine(2) == "%\xe2");
    assert(is.tell() == 15);
    // Runs of EOL characters are consumed together.
    assert(is.readLine(100) == "1 0 obj");
    assert(is.tell() == 24);
    assert(is.readLine(100) == "<< >>");
    assert(is.tell() == 29);
    assert(is.readLine(100).empty());

    is.seek(-5, SEEK_END);
    char ch = '\0';
    assert(is.read(&ch, 1) == 1 && ch == '<');
    is.unreadCh(ch);
    assert(is.tell() == 24);
    assert(is.read(2, 15) == "1 ");
    is.seek(2, SEEK_CUR);
    assert(is.read(3) == "obj");
    is.rewind();
    assert(is.read(4) == "%PDF");
    try {
        is.seek(-1, SEEK_SET);
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()).find("lines: seek before beginning") == 0);
    }
    // The failed seek did not move the position.
    assert(is.tell() == 4);
    is.seek(10, SEEK_END);
    assert(is.read(4).empty());
    assert(is.getLastOffset() == 29);
    assert(is.getName() == "lines");
    assert(is.view().size() == 29);
}

int
main()
{
    test_find();
    test_lines();
    std::cout << "input source tests done" << std::endl;
    return 0;
}
