#include <pdfscrub/ScrubArgParser.hh>

#include <pdfscrub/ScrubLogger.hh>
#include <pdfscrub/ScrubUsage.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <iostream>
#include <iterator>
#include <stdexcept>

ScrubArgParser::ScrubArgParser(int argc, char const* const argv[]) :
    m(new Members())
{
    m->args.assign(argv, argv + argc);
    m->whoami = ScrubUtil::getWhoami(m->args.empty() ? "pdfscrub" : m->args.front());

    // Topics and options registered later become further choices of --help.
    auto& help = m->help_options["help"];
    help.on_value = bindParam(&ScrubArgParser::showHelp, this);
    help.allowed.insert("all");
}

ScrubArgParser::Option&
ScrubArgParser::newOption(std::string const& name)
{
    auto [it, inserted] = m->options.try_emplace(name);
    if (!inserted) {
        throw std::logic_error("ScrubArgParser: option " + name + " is registered twice");
    }
    return it->second;
}

void
ScrubArgParser::addPositional(param_arg_handler_t handler)
{
    newOption("").on_value = handler;
}

void
ScrubArgParser::addBare(std::string const& arg, bare_arg_handler_t handler)
{
    newOption(arg).on_flag = handler;
}

void
ScrubArgParser::addRequiredParameter(
    std::string const& arg, param_arg_handler_t handler, char const* parameter_name)
{
    auto& option = newOption(arg);
    option.value_required = true;
    option.value_name = parameter_name;
    option.on_value = handler;
}

void
ScrubArgParser::addChoices(
    std::string const& arg, param_arg_handler_t handler, bool required, char const** choices)
{
    auto& option = newOption(arg);
    option.value_required = required;
    option.on_value = handler;
    for (; *choices; ++choices) {
        option.allowed.insert(*choices);
    }
}

void
ScrubArgParser::addHelpOption(std::string const& arg, bare_arg_handler_t handler)
{
    if (!m->help_options.try_emplace(arg).second) {
        throw std::logic_error("ScrubArgParser: help option " + arg + " is registered twice");
    }
    m->help_options[arg].on_flag = handler;
}

void
ScrubArgParser::addFinalCheck(bare_arg_handler_t handler)
{
    m->final_check = handler;
}

bool
ScrubArgParser::helpShown() const
{
    return m->help_shown;
}

std::string
ScrubArgParser::getProgname()
{
    return m->whoami;
}

void
ScrubArgParser::usage(std::string const& message)
{
    throw ScrubUsage(message);
}

void
ScrubArgParser::showHelp(std::string const& topic)
{
    ScrubLogger::defaultLogger()->info(getHelp(topic));
}

// Each line becomes one argument. A trailing carriage return is dropped.
void
ScrubArgParser::appendLines(std::string const& data)
{
    size_t begin = 0;
    while (begin < data.size()) {
        auto end = data.find('\n', begin);
        if (end == std::string::npos) {
            end = data.size();
        }
        auto line = data.substr(begin, end - begin);
        if (line.ends_with('\r')) {
            line.pop_back();
        }
        m->args.push_back(std::move(line));
        begin = end + 1;
    }
}

void
ScrubArgParser::expandArgFiles()
{
    std::vector<std::string> given;
    given.swap(m->args);
    for (size_t i = 0; i < given.size(); ++i) {
        auto const& arg = given[i];
        bool arg_file = i > 0 && arg.size() > 1 && arg[0] == '@';
        if (arg_file && arg == "@-") {
            appendLines(std::string(
                std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()));
        } else if (arg_file && ScrubUtil::file_can_be_opened(arg.c_str() + 1)) {
            appendLines(ScrubUtil::read_file_into_string(arg.c_str() + 1));
        } else {
            m->args.push_back(arg);
        }
    }
}

std::string
ScrubArgParser::valueSyntax(std::string const& name, Option const& option) const
{
    std::string result = "--" + name + " must be given as --" + name + "=";
    if (option.allowed.empty()) {
        return result + option.value_name;
    }
    std::string sep = "{";
    for (auto const& choice: option.allowed) {
        result += sep + choice;
        sep = ",";
    }
    return result + "}";
}

void
ScrubArgParser::dispatch(
    std::string const& name, Option& option, std::optional<std::string> const& value)
{
    bool missing = option.value_required && !value;
    bool not_allowed = value && !option.allowed.empty() && !option.allowed.contains(*value);
    if (missing || not_allowed) {
        usage(valueSyntax(name, option));
    }
    if (option.on_flag) {
        if (value) {
            usage("--" + name + " does not take a parameter, but \"" + *value + "\" was given");
        }
        option.on_flag();
    } else if (option.on_value) {
        option.on_value(value.value_or(""));
    }
}

void
ScrubArgParser::parseArgs()
{
    expandArgFiles();
    bool alone = m->args.size() == 2;
    for (size_t i = 1; i < m->args.size(); ++i) {
        std::string const arg = m->args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            auto positional = m->options.find("");
            if (positional == m->options.end()) {
                usage("unrecognized argument " + arg);
            }
            dispatch("", positional->second, arg);
            continue;
        }

        std::string name = arg.substr(arg.starts_with("--") ? 2 : 1);
        std::optional<std::string> value;
        // An = in the first position is part of the name, so --=x is never an empty option.
        auto eq = name.empty() ? std::string::npos : name.find('=', 1);
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.erase(eq);
        }

        if (alone) {
            auto help = m->help_options.find(name);
            if (help != m->help_options.end()) {
                dispatch(name, help->second, value);
                m->help_shown = true;
                return;
            }
        }
        auto option = m->options.end();
        if (!name.empty() && name[0] != '-') {
            option = m->options.find(name);
        }
        if (option == m->options.end()) {
            usage("unrecognized argument " + arg);
        }
        dispatch(name, option->second, value);
    }
    if (m->final_check) {
        m->final_check();
    }
}

void
ScrubArgParser::addHelpFooter(std::string const& text)
{
    m->footer = "\n" + text;
}

void
ScrubArgParser::addHelpTopic(
    std::string const& topic, std::string const& short_text, std::string const& long_text)
{
    if (topic == "all" || topic.empty() || topic[0] == '-') {
        throw std::logic_error("ScrubArgParser: \"" + topic + "\" can't be a help topic");
    }
    if (!m->topics.try_emplace(topic, HelpEntry{short_text, long_text, {}}).second) {
        throw std::logic_error("ScrubArgParser: help topic " + topic + " is registered twice");
    }
    m->help_options["help"].allowed.insert(topic);
}

void
ScrubArgParser::addOptionHelp(
    std::string const& option_name,
    std::string const& topic,
    std::string const& short_text,
    std::string const& long_text)
{
    if (option_name.size() < 3 || !option_name.starts_with("--")) {
        throw std::logic_error("ScrubArgParser: help for " + option_name + " must name a --option");
    }
    auto owner = m->topics.find(topic);
    if (owner == m->topics.end()) {
        throw std::logic_error(
            "ScrubArgParser: help for " + option_name + " names unknown topic " + topic);
    }
    if (!m->option_docs.try_emplace(option_name, HelpEntry{short_text, long_text, {}}).second) {
        throw std::logic_error("ScrubArgParser: help for " + option_name + " is given twice");
    }
    owner->second.options.insert(option_name);
    m->help_options["help"].allowed.insert(option_name);
}

std::string
ScrubArgParser::overview() const
{
    auto const& w = m->whoami;
    std::string result = "Run \"" + w + " --help=topic\" for help on a topic.\n" + "Run \"" + w +
        " --help=--option\" for help on an option.\n" + "Run \"" + w +
        " --help=all\" to see all available help.\n\nTopics:\n";
    for (auto const& [name, entry]: m->topics) {
        result += "  " + name + ": " + entry.summary + "\n";
    }
    return result;
}

std::string
ScrubArgParser::describe(HelpEntry const& entry) const
{
    std::string result = entry.text.empty() ? entry.summary + "\n" : entry.text;
    if (!entry.options.empty()) {
        result += "\nRelated options:\n";
        for (auto const& option: entry.options) {
            result += "  " + option + ": " + m->option_docs.at(option).summary + "\n";
        }
    }
    return result;
}

std::string
ScrubArgParser::getHelp(std::string const& arg)
{
    std::string result;
    if (arg == "all") {
        result = overview();
        for (auto const* table: {&m->topics, &m->option_docs}) {
            for (auto const& [name, entry]: *table) {
                result += "\n== " + name + " (" + entry.summary + ") ==\n\n" + describe(entry);
            }
        }
        result += "\n====\n";
    } else if (auto option = m->option_docs.find(arg); option != m->option_docs.end()) {
        result = describe(option->second);
    } else if (auto topic = m->topics.find(arg); topic != m->topics.end()) {
        result = describe(topic->second);
    } else {
        result = overview();
    }
    return result + m->footer;
}
