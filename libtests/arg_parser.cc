#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubArgParser.hh>
#include <pdfscrub/ScrubUsage.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <cstdio>
#include <iostream>
#include <vector>

class ArgParser
{
  public:
    ArgParser(int argc, char const* const argv[]);
    void parseArgs();

    std::vector<std::string> output;
    std::vector<std::string> positional;
    bool potato{false};
    bool checked{false};

  private:
    void handlePotato();
    void handleSalad(std::string const& p);
    void handleOink(std::string const& p);
    void handlePositional(std::string const& p);
    void finalChecks();

    void initOptions();

    ScrubArgParser ap;
};

ArgParser::ArgParser(int argc, char const* const argv[]) :
    ap(argc, argv)
{
    initOptions();
}

void
ArgParser::initOptions()
{
    auto b = [this](void (ArgParser::*f)()) { return ScrubArgParser::bindBare(f, this); };
    auto p = [this](void (ArgParser::*f)(std::string const&)) {
        return ScrubArgParser::bindParam(f, this);
    };

    ap.addBare("potato", b(&ArgParser::handlePotato));
    ap.addRequiredParameter("salad", p(&ArgParser::handleSalad), "tossed");
    char const* choices[] = {"pig", "boar", "sow", nullptr};
    ap.addChoices("oink", p(&ArgParser::handleOink), true, choices);
    ap.addPositional(p(&ArgParser::handlePositional));
    ap.addHelpOption("version", [this]() { output.emplace_back("3.14159"); });
    ap.addFinalCheck(b(&ArgParser::finalChecks));

    ap.addHelpFooter("For more help, read the manual.\n");
    ap.addHelpTopic("barnyard", "barnyard animals", "Options for animals.\n");
    ap.addHelpTopic("garden", "garden vegetables", "");
    ap.addOptionHelp("--oink", "barnyard", "make a pig noise", "--oink={pig|boar|sow}\n");
    ap.addOptionHelp("--potato", "garden", "potato", "");
}

void
ArgParser::handlePotato()
{
    potato = true;
}

void
ArgParser::handleSalad(std::string const& p)
{
    output.emplace_back("salad " + p);
}

void
ArgParser::handleOink(std::string const& p)
{
    output.emplace_back("oink " + p);
}

void
ArgParser::handlePositional(std::string const& p)
{
    if (p == "bad") {
        ap.usage("bad positional argument");
    }
    positional.emplace_back(p);
}

void
ArgParser::finalChecks()
{
    checked = true;
}

void
ArgParser::parseArgs()
{
    ap.parseArgs();
}

static std::shared_ptr<ArgParser>
parse(std::vector<char const*> args)
{
    args.insert(args.begin(), "/usr/bin/test-parser");
    auto result = std::make_shared<ArgParser>(static_cast<int>(args.size()), args.data());
    result->parseArgs();
    return result;
}

static void
expect_usage(std::vector<char const*> const& args, std::string const& message)
{
    try {
        parse(args);
        assert(false);
    } catch (ScrubUsage& e) {
        if (std::string(e.what()) != message) {
            std::cerr << "unexpected usage message: " << e.what() << std::endl;
            assert(false);
        }
    }
}

static void
test_options()
{
    auto ap = parse({"--potato", "-salad=green", "one", "--oink=boar", "two"});
    assert(ap->potato);
    assert(ap->checked);
    assert((ap->output == std::vector<std::string>{"salad green", "oink boar"}));
    assert((ap->positional == std::vector<std::string>{"one", "two"}));

    // An empty parameter is still a parameter.
    ap = parse({"--salad="});
    assert((ap->output == std::vector<std::string>{"salad "}));

    // A lone dash is positional.
    ap = parse({"-"});
    assert((ap->positional == std::vector<std::string>{"-"}));

    expect_usage({"--carrot"}, "unrecognized argument --carrot");
    expect_usage({"---potato"}, "unrecognized argument ---potato");
    expect_usage({"--=x"}, "unrecognized argument --=x");
    expect_usage({"--salad"}, "--salad must be given as --salad=tossed");
    expect_usage({"--oink=cow"}, "--oink must be given as --oink={boar,pig,sow}");
    expect_usage({"--potato=mashed"}, "--potato does not take a parameter, but \"mashed\" was given");
    expect_usage({"bad"}, "bad positional argument");
    // Help options are only recognized by themselves.
    expect_usage({"--version", "one"}, "unrecognized argument --version");
}

static void
test_help()
{
    auto ap = parse({"--version"});
    assert((ap->output == std::vector<std::string>{"3.14159"}));
    // Final checks don't run when help was shown.
    assert(!ap->checked);

    char const* argv[] = {"/usr/bin/test-parser", nullptr};
    ScrubArgParser p(1, argv);
    assert(p.getProgname() == "test-parser");
    p.addHelpTopic("topic", "a topic", "Long text.\n");
    p.addHelpTopic("other", "another topic", "");
    p.addOptionHelp("--opt", "topic", "an option", "--opt\n\nDo it.\n");
    p.addHelpFooter("Footer.\n");

    auto top = p.getHelp("");
    assert(top.find("Run \"test-parser --help=topic\"") != std::string::npos);
    assert(top.find("  other: another topic\n  topic: a topic\n") != std::string::npos);
    assert(top.ends_with("\nFooter.\n"));
    auto topic = p.getHelp("topic");
    assert(topic.starts_with("Long text.\n\nRelated options:\n  --opt: an option\n"));
    // A topic with no long text shows its short text.
    assert(p.getHelp("other").starts_with("another topic\n"));
    assert(p.getHelp("--opt").starts_with("--opt\n\nDo it.\n"));
    auto all = p.getHelp("all");
    assert(all.find("== topic (a topic) ==") != std::string::npos);
    assert(all.find("== --opt (an option) ==") != std::string::npos);
    // Unknown topics fall back to the top-level help.
    assert(p.getHelp("nothing") == top);

    bool threw = false;
    try {
        p.addHelpTopic("all", "x", "");
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        p.addOptionHelp("--x", "missing", "x", "");
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        p.addBare("dup", []() {});
        p.addBare("dup", []() {});
    } catch (std::logic_error&) {
        threw = true;
    }
    assert(threw);
}

static void
test_arg_file()
{
    ScrubUtil::write_file_atomically("arg-parser-test.args", "--potato\r\n--salad=tuna\nthree\n");
    auto ap = parse({"one", "@arg-parser-test.args", "two"});
    assert(ap->potato);
    assert((ap->output == std::vector<std::string>{"salad tuna"}));
    assert((ap->positional == std::vector<std::string>{"one", "three", "two"}));
    remove("arg-parser-test.args");

    // @ naming a file that doesn't exist is an ordinary argument.
    ap = parse({"@arg-parser-missing"});
    assert((ap->positional == std::vector<std::string>{"@arg-parser-missing"}));
}

int
main()
{
    test_options();
    test_help();
    test_arg_file();
    std::cout << "arg parser tests done" << std::endl;
    return 0;
}
