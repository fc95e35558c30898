#ifndef SCRUBARGPARSER_HH
#define SCRUBARGPARSER_HH

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Command-line parsing for pdfscrub. An option is written --name or --name=value; a single leading
// dash is accepted as well. Anything else, including a lone "-", is positional. An argument @file
// after the program name stands for the lines of file, and @- for the lines of standard input.
//
// Help comes from topics and per-option text registered with addHelpTopic and addOptionHelp. It is
// shown for --help, --help=topic, --help=--option and --help=all, which, like options registered
// with addHelpOption, are only recognized as the sole argument.
//
// Handlers reject bad values by calling usage(), which throws ScrubUsage.
class ScrubArgParser
{
  public:
    ScrubArgParser(int argc, char const* const argv[]);

    // Runs the handler for each argument in order and then the final check. When a help option is
    // given, only its handler runs and helpShown() becomes true.
    void parseArgs();
    bool helpShown() const;

    // The base name of argv[0]
    std::string getProgname();

    typedef std::function<void()> bare_arg_handler_t;
    typedef std::function<void(std::string const&)> param_arg_handler_t;

    void addPositional(param_arg_handler_t);
    void addBare(std::string const& arg, bare_arg_handler_t);
    void
    addRequiredParameter(std::string const& arg, param_arg_handler_t, char const* parameter_name);
    // choices ends with a null pointer. When required is false, the option may also be given
    // without a value.
    void
    addChoices(std::string const& arg, param_arg_handler_t, bool required, char const** choices);
    void addFinalCheck(bare_arg_handler_t);
    void addHelpOption(std::string const& arg, bare_arg_handler_t);

    void addHelpFooter(std::string const&);
    void addHelpTopic(
        std::string const& topic, std::string const& short_text, std::string const& long_text);
    void addOptionHelp(
        std::string const& option_name,
        std::string const& topic,
        std::string const& short_text,
        std::string const& long_text);
    // "" is the overview; a name that is neither a topic nor an option also gets the overview.
    std::string getHelp(std::string const& topic_or_option);

    template <class T>
    static bare_arg_handler_t
    bindBare(void (T::*f)(), T* o)
    {
        return [f, o]() { (o->*f)(); };
    }
    template <class T>
    static param_arg_handler_t
    bindParam(void (T::*f)(std::string const&), T* o)
    {
        return [f, o](std::string const& value) { (o->*f)(value); };
    }

    [[noreturn]] void usage(std::string const& message);

  private:
    struct Option
    {
        bool value_required{false};
        std::string value_name;
        std::set<std::string> allowed;
        bare_arg_handler_t on_flag;
        param_arg_handler_t on_value;
    };

    struct HelpEntry
    {
        std::string summary;
        std::string text;
        std::set<std::string> options;
    };

    Option& newOption(std::string const& name);
    void showHelp(std::string const&);
    void expandArgFiles();
    void appendLines(std::string const& data);
    void dispatch(std::string const& name, Option&, std::optional<std::string> const& value);
    std::string valueSyntax(std::string const& name, Option const&) const;
    std::string overview() const;
    std::string describe(HelpEntry const&) const;

    class Members
    {
        friend class ScrubArgParser;

      public:
        ~Members() = default;

      private:
        Members() = default;
        Members(Members const&) = delete;

        std::vector<std::string> args;
        std::string whoami;
        bool help_shown{false};
        std::map<std::string, Option> options;
        std::map<std::string, Option> help_options;
        bare_arg_handler_t final_check;
        std::map<std::string, HelpEntry> topics;
        std::map<std::string, HelpEntry> option_docs;
        std::string footer;
    };
    std::shared_ptr<Members> m;
};

#endif // SCRUBARGPARSER_HH
