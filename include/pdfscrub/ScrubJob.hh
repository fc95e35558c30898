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


#ifndef SCRUBJOB_HH
#define SCRUBJOB_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubConfig.hh>
#include <pdfscrub/ScrubReport.hh>
#include <pdfscrub/ScrubRunContext.hh>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

class Pipeline;
class ScrubChainStore;
class ScrubLogger;
class ScrubObjectGraph;

// ScrubJob runs the whole sanitizing pipeline for one document: parse, scan, clean, verify (with a
// single retry), rebuild, and report. It is what the pdfscrub command-line program uses, and it can
// be driven from code in the same way:
//
//   ScrubJob j;
//   j.config()->inputFile("in.pdf")->outputFile("out.pdf")->waive("PartialSignatureCoverage");
//   j.run();
//   return j.getExitCode();
//
// or, without any files:
//
//   ScrubJob j;
//   j.setRunContext(ctx);
//   j.processData("upload", bytes);
//   if (j.getStatus() == ss_clean) { send(j.getOutput()); }
//
// Output is only ever released for a run whose status is Clean. The report is available in every
// case.
class ScrubJob
{
  public:
    static int constexpr LATEST_JOB_JSON = 1;

    // Exit codes -- returned by getExitCode() after calling run() or processData()
    static int constexpr EXIT_CLEAN = scrub_exit_clean;
    static int constexpr EXIT_ERROR = scrub_exit_error;
    static int constexpr EXIT_REJECTED = scrub_exit_rejected;
    static int constexpr EXIT_UNRECOVERABLE = scrub_exit_unrecoverable;
    static int constexpr EXIT_CANCELLED = scrub_exit_cancelled;

    // ScrubUsage is thrown if there are any usage-like errors when calling Config methods.
    PDFSCRUB_DLL
    ScrubJob();

    // SETUP FUNCTIONS

    // Initialize from argv, which must be a null-terminated array of null-terminated strings. If
    // there are any command-line errors, ScrubUsage is thrown. If a help option was given, the
    // help has been written to the logger's info channel and run() does nothing.
    PDFSCRUB_DLL
    void initializeFromArgv(char const* const argv[]);

    // Initialize from a job JSON document:
    //
    //   {
    //     "input": "in.pdf", "output": "out.pdf", "report": "report.json",
    //     "chain_dir": "chains", "lineage": "...", "identity": "...", "timestamp": "...",
    //     "events": "events.jsonl", "verbose": false,
    //     "config": { ...see ScrubConfig... }
    //   }
    //
    // Every key is optional. With partial = false, checkConfiguration() is called afterwards.
    // Errors are reported with ScrubUsage.
    PDFSCRUB_DLL
    void initializeFromJson(std::string const& json, bool partial = false);

    // Set the name that prefixes messages the job writes. Defaults to "pdfscrub".
    PDFSCRUB_DLL
    void setMessagePrefix(std::string const&);
    PDFSCRUB_DLL
    std::string getMessagePrefix() const;

    // By default the job uses the default logger. Give each job its own logger when several jobs
    // run concurrently.
    PDFSCRUB_DLL
    std::shared_ptr<ScrubLogger> getLogger();
    PDFSCRUB_DLL
    void setLogger(std::shared_ptr<ScrubLogger>);

    // Where verification records are appended. The default is an in-memory store private to this
    // job; --chain-dir selects a directory store.
    PDFSCRUB_DLL
    void setChainStore(std::shared_ptr<ScrubChainStore>);
    PDFSCRUB_DLL
    std::shared_ptr<ScrubChainStore> getChainStore();

    // Fields left empty get defaults when the pipeline starts: the current time, the identity
    // "pdfscrub", the input's SHA-256 as lineage, and a cancellation token whose deadline comes
    // from the configured timeout.
    PDFSCRUB_DLL
    void setRunContext(ScrubRunContext const&);

    PDFSCRUB_DLL
    void setScrubConfig(ScrubConfig const&);
    PDFSCRUB_DLL
    ScrubConfig const& getScrubConfig() const;

    // Check for contradictory or missing options. Called by initializeFromArgv, by
    // initializeFromJson unless partial, and by run(). Throws ScrubUsage.
    PDFSCRUB_DLL
    void checkConfiguration();

    // CONFIGURATION
    //
    // Each Config method corresponds to a command-line option with the same name converted from
    // camel case: keepDocumentId() is --keep-document-id. Methods return the Config so calls can be
    // chained. Errors are reported with ScrubUsage.
    class Config
    {
        friend class ScrubJob;

      public:
        // Proxy to ScrubJob::checkConfiguration()
        PDFSCRUB_DLL
        void checkConfiguration();

        PDFSCRUB_DLL
        Config* inputFile(std::string const& filename);
        PDFSCRUB_DLL
        Config* outputFile(std::string const& filename);
        PDFSCRUB_DLL
        Config* report(std::string const& filename);
        PDFSCRUB_DLL
        Config* chainDir(std::string const& path);
        PDFSCRUB_DLL
        Config* lineage(std::string const& key);
        PDFSCRUB_DLL
        Config* identity(std::string const& name);
        PDFSCRUB_DLL
        Config* timestamp(std::string const& iso8601);
        PDFSCRUB_DLL
        Config* keepDocumentId();
        PDFSCRUB_DLL
        Config* allowMetadata(std::string const& field);
        PDFSCRUB_DLL
        Config* waive(std::string const& category);
        PDFSCRUB_DLL
        Config* disableDetector(std::string const& name);
        PDFSCRUB_DLL
        Config* forceRemove();
        PDFSCRUB_DLL
        Config* xrefStream();
        PDFSCRUB_DLL
        Config* noCompress();
        PDFSCRUB_DLL
        Config* noVerifyOutput();
        PDFSCRUB_DLL
        Config* timeout(std::string const& seconds);
        PDFSCRUB_DLL
        Config* jobJsonFile(std::string const& filename);
        PDFSCRUB_DLL
        Config* events(std::string const& filename);
        PDFSCRUB_DLL
        Config* verbose();

      private:
        Config() = delete;
        Config(Config const&) = delete;
        Config(ScrubJob& job) :
            o(job)
        {
        }
        ScrubJob& o;
    };

    PDFSCRUB_DLL
    std::shared_ptr<Config> config();

    // Execute the job: read the input file, run the pipeline, write the output file if the status
    // is Clean, and write the report. I/O errors are thrown as std::runtime_error.
    PDFSCRUB_DLL
    void run();

    // Run the pipeline on data already in memory. Nothing is read or written; use getOutput() and
    // getReport() afterwards.
    PDFSCRUB_DLL
    void processData(std::string const& description, std::string_view data);

    // CHECK STATUS -- these methods provide information known after run() or processData()

    PDFSCRUB_DLL
    int getExitCode() const;
    PDFSCRUB_DLL
    scrub_status_e getStatus() const;
    PDFSCRUB_DLL
    ScrubReport const& getReport() const;
    // The rebuilt PDF. Empty unless the status is Clean.
    PDFSCRUB_DLL
    std::string const& getOutput() const;
    PDFSCRUB_DLL
    bool helpShown() const;

    // The JSON schema for initializeFromJson
    PDFSCRUB_DLL
    static std::string job_json_schema();

  private:
    static void usage(std::string const& msg);
    void runPipeline(
        std::string const& description, std::string_view data, ScrubRunContext const& context);
    // Clean, verify, and record; returns the verification record.
    ScrubVerificationRecord cleanAndVerify(
        ScrubObjectGraph& graph,
        ScrubFindingSet const& findings,
        ScrubRunContext const& context,
        int pass);
    std::string rebuild(ScrubObjectGraph const& graph, ScrubRunContext const& context);
    // Parse and scan the rebuilt bytes. Throws a RebuildError if anything unwaived is found.
    void verifyOutput(
        std::string const& description, std::string const& output, ScrubRunContext const& context);
    void writeReport();
    void openEvents();
    void closeEvents();
    void doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn);

    class Members;
    std::shared_ptr<Members> m;
};

#endif // SCRUBJOB_HH
