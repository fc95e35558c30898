// Copyright (c) 2026 pdfscrub authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef SCRUBLOGGER_HH
#define SCRUBLOGGER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/JSON.hh>
#include <pdfscrub/Pipeline.hh>

#include <iostream>
#include <memory>
#include <mutex>

// Routes the messages of a scrub run. There are five destinations:
//
//   info    progress and verbose output; standard output, or standard error once standard
//           output carries the rebuilt PDF or the report
//   warn    warnings; shares the error destination until given its own
//   error   errors; standard error
//   save    the rebuilt PDF or the report when written to standard output; unset by default
//   events  structured stage events, one compact JSON object per line; unset by default
//
// A null pipeline given to a setter restores that destination's default. Pipelines supplied by the
// caller are never finished by the logger. Standard output and standard error are finished when
// the logger goes away.
class ScrubLogger
{
  public:
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubLogger> create();

    // Shared by everything that is not given a logger. Concurrent jobs whose output must stay
    // separate each need their own from create().
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubLogger> defaultLogger();

    PDFSCRUB_DLL
    void info(char const*);
    PDFSCRUB_DLL
    void info(std::string const&);
    PDFSCRUB_DLL
    void warn(char const*);
    PDFSCRUB_DLL
    void warn(std::string const&);
    PDFSCRUB_DLL
    void error(char const*);
    PDFSCRUB_DLL
    void error(std::string const&);

    // The getters throw std::logic_error for an unset destination unless null_okay is true.
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> getSave(bool null_okay = false);
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> getEvents(bool null_okay = false);

    // Records one stage event. With an events pipeline, writes
    // {"details":...,"message":...,"stage":...} and a newline to it. With verbose on, also writes
    // "<prefix>: <stage>: <message>" to info. Callable from detector threads.
    PDFSCRUB_DLL
    void event(std::string const& stage, std::string const& message, JSON details = JSON());

    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> standardOutput();
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> standardError();
    PDFSCRUB_DLL
    std::shared_ptr<Pipeline> discard();

    PDFSCRUB_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    PDFSCRUB_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    PDFSCRUB_DLL
    void setError(std::shared_ptr<Pipeline>);
    PDFSCRUB_DLL
    void setEvents(std::shared_ptr<Pipeline>);

    // Saving to standard output is only possible before anything else has been written there, and
    // moves info to standard error. A std::logic_error is thrown otherwise. With only_if_not_set,
    // an existing save destination is kept.
    PDFSCRUB_DLL
    void setSave(std::shared_ptr<Pipeline>, bool only_if_not_set);
    PDFSCRUB_DLL
    void saveToStandardOutput(bool only_if_not_set);

    PDFSCRUB_DLL
    void setVerbose(bool, std::string const& prefix = "pdfscrub");

    // Points info at out_stream and error at err_stream, and lets warn follow error again.
    // std::cout and std::cerr select the logger's own standard pipelines.
    PDFSCRUB_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

  private:
    ScrubLogger();

    std::shared_ptr<Pipeline> infoDefault() const;
    static std::shared_ptr<Pipeline>
    required(std::shared_ptr<Pipeline> const&, bool null_okay, char const* what);

    class Members
    {
        friend class ScrubLogger;

      public:
        PDFSCRUB_DLL
        ~Members();

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<Pipeline> to_nowhere;
        std::shared_ptr<Pipeline> cout_sink;
        std::shared_ptr<Pipeline> to_stdout;
        std::shared_ptr<Pipeline> to_stderr;
        std::shared_ptr<Pipeline> info;
        std::shared_ptr<Pipeline> warn;
        std::shared_ptr<Pipeline> error;
        std::shared_ptr<Pipeline> save;
        std::shared_ptr<Pipeline> events;
        bool stdout_written{false};
        bool verbose{false};
        std::string prefix{"pdfscrub"};
        std::mutex event_lock;
    };
    std::shared_ptr<Members> m;
};

#endif // SCRUBLOGGER_HH
