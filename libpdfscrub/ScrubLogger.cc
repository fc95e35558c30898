#include <pdfscrub/ScrubLogger.hh>

#include <pdfscrub/Pl_Discard.hh>
#include <pdfscrub/Pl_OStream.hh>

#include <iostream>
#include <stdexcept>

namespace
{
    // Passes data through to standard output and notes that it has been written to, so the save
    // destination can't be moved there afterwards.
    class Pl_StdoutGate final: public Pipeline
    {
      public:
        Pl_StdoutGate(Pipeline* sink, bool& written) :
            Pipeline("standard output gate", sink),
            written(written)
        {
        }

        void
        write(unsigned char const* data, size_t len) final
        {
            written = true;
            next()->write(data, len);
        }

        void
        finish() final
        {
            next()->finish();
        }

      private:
        bool& written;
    };
} // namespace

ScrubLogger::Members::Members() :
    to_nowhere(std::make_shared<Pl_Discard>()),
    cout_sink(std::make_shared<Pl_OStream>("standard output", std::cout)),
    to_stderr(std::make_shared<Pl_OStream>("standard error", std::cerr))
{
    to_stdout = std::make_shared<Pl_StdoutGate>(cout_sink.get(), stdout_written);
    info = to_stdout;
    error = to_stderr;
}

ScrubLogger::Members::~Members()
{
    to_stdout->finish();
    to_stderr->finish();
}

ScrubLogger::ScrubLogger() :
    m(new Members())
{
}

std::shared_ptr<ScrubLogger>
ScrubLogger::create()
{
    return std::shared_ptr<ScrubLogger>(new ScrubLogger());
}

std::shared_ptr<ScrubLogger>
ScrubLogger::defaultLogger()
{
    static std::shared_ptr<ScrubLogger> shared = create();
    return shared;
}

std::shared_ptr<Pipeline>
ScrubLogger::required(std::shared_ptr<Pipeline> const& p, bool null_okay, char const* what)
{
    if (!p && !null_okay) {
        throw std::logic_error(std::string("ScrubLogger: no ") + what + " pipeline has been set");
    }
    return p;
}

std::shared_ptr<Pipeline>
ScrubLogger::infoDefault() const
{
    return m->save == m->to_stdout ? m->to_stderr : m->to_stdout;
}

void
ScrubLogger::info(char const* s)
{
    *getInfo() << s;
}

void
ScrubLogger::info(std::string const& s)
{
    *getInfo() << s;
}

void
ScrubLogger::warn(char const* s)
{
    *getWarn() << s;
}

void
ScrubLogger::warn(std::string const& s)
{
    *getWarn() << s;
}

void
ScrubLogger::error(char const* s)
{
    *getError() << s;
}

void
ScrubLogger::error(std::string const& s)
{
    *getError() << s;
}

std::shared_ptr<Pipeline>
ScrubLogger::getInfo(bool null_okay)
{
    return required(m->info, null_okay, "info");
}

std::shared_ptr<Pipeline>
ScrubLogger::getWarn(bool null_okay)
{
    return m->warn ? m->warn : getError(null_okay);
}

std::shared_ptr<Pipeline>
ScrubLogger::getError(bool null_okay)
{
    return required(m->error, null_okay, "error");
}

std::shared_ptr<Pipeline>
ScrubLogger::getSave(bool null_okay)
{
    return required(m->save, null_okay, "save");
}

std::shared_ptr<Pipeline>
ScrubLogger::getEvents(bool null_okay)
{
    std::lock_guard<std::mutex> lock(m->event_lock);
    return required(m->events, null_okay, "events");
}

void
ScrubLogger::event(std::string const& stage, std::string const& message, JSON details)
{
    std::lock_guard<std::mutex> lock(m->event_lock);
    if (m->events) {
        auto line = JSON::makeDictionary();
        line.addDictionaryMember("stage", JSON::makeString(stage));
        line.addDictionaryMember("message", JSON::makeString(message));
        if (!details.isDictionary()) {
            details = JSON::makeDictionary();
        }
        line.addDictionaryMember("details", details);
        line.writeCompact(m->events.get());
        *m->events << "\n";
    }
    if (m->verbose) {
        *getInfo() << m->prefix << ": " << stage << ": " << message << "\n";
    }
}

std::shared_ptr<Pipeline>
ScrubLogger::standardOutput()
{
    return m->to_stdout;
}

std::shared_ptr<Pipeline>
ScrubLogger::standardError()
{
    return m->to_stderr;
}

std::shared_ptr<Pipeline>
ScrubLogger::discard()
{
    return m->to_nowhere;
}

void
ScrubLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    m->info = p ? p : infoDefault();
}

void
ScrubLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    m->warn = p;
}

void
ScrubLogger::setError(std::shared_ptr<Pipeline> p)
{
    m->error = p ? p : m->to_stderr;
}

void
ScrubLogger::setEvents(std::shared_ptr<Pipeline> p)
{
    std::lock_guard<std::mutex> lock(m->event_lock);
    m->events = p;
}

void
ScrubLogger::setSave(std::shared_ptr<Pipeline> p, bool only_if_not_set)
{
    if ((only_if_not_set && m->save) || p == m->save) {
        return;
    }
    if (p && p == m->to_stdout) {
        if (m->stdout_written) {
            throw std::logic_error(
                "ScrubLogger: standard output can't take saved output once something else has "
                "been written to it");
        }
        if (m->info == m->to_stdout) {
            m->info = m->to_stderr;
        }
    }
    m->save = p;
}

void
ScrubLogger::saveToStandardOutput(bool only_if_not_set)
{
    setSave(m->to_stdout, only_if_not_set);
}

void
ScrubLogger::setVerbose(bool verbose, std::string const& prefix)
{
    m->verbose = verbose;
    m->prefix = prefix;
}

void
ScrubLogger::setOutputStreams(std::ostream* out_stream, std::ostream* err_stream)
{
    if (out_stream && out_stream != &std::cout) {
        m->info = std::make_shared<Pl_OStream>("output", *out_stream);
    } else {
        m->info = infoDefault();
    }
    if (err_stream && err_stream != &std::cerr) {
        m->error = std::make_shared<Pl_OStream>("error output", *err_stream);
    } else {
        m->error = m->to_stderr;
    }
    m->warn = nullptr;
}
