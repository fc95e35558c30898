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


#ifndef SCRUBCONFIG_HH
#define SCRUBCONFIG_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/JSON.hh>

#include <set>
#include <string>

// Settings for one run of the sanitizing pipeline. All members have usable defaults, so a
// default-constructed ScrubConfig gives the standard behavior: every detector enabled, nothing
// waived, metadata stripped except /CreationDate, a new content-derived document ID, and a classic
// cross-reference table with compressed streams.
//
// A configuration can also be read from a JSON document whose keys are the member names, e.g.
//
//   {"keep_document_id": true, "waived": ["PartialSignatureCoverage"], "timeout_seconds": 10}
//
// Every key is optional. Unknown keys and values of the wrong type are errors.
class ScrubConfig
{
  public:
    PDFSCRUB_DLL
    ScrubConfig();

    // Keep the first element of the original /ID and waive DocumentId findings.
    bool keep_document_id{false};
    // Keys of the document information dictionary, without the leading slash, that are kept
    std::set<std::string> allowed_metadata_fields;
    std::set<scrub_artifact_e> waived;
    std::set<scrub_detector_e> disabled_detectors;
    // After the bounded retry, remove whatever objects or dictionary entries still carry
    // findings instead of rejecting the document.
    bool force_remove{false};
    scrub_xref_mode_e xref_mode{scrub_xref_classic};
    // Give unfiltered streams /FlateDecode on output.
    bool compress_streams{true};
    // 0 means no limit.
    double timeout_seconds{30};
    unsigned long long max_input_size{100ULL << 20};
    // Streams whose raw size is at least decode_pool_threshold are decoded in a pool of
    // decode_threads threads before the detectors run.
    int decode_threads{4};
    unsigned long long decode_pool_threshold{64ULL << 10};
    unsigned long long max_decoded_size{256ULL << 20};
    // Embedding probability above which an image is reported as carrying an LSB payload
    double stego_threshold{0.95};
    // Bits per byte above which an embedded file is considered random
    double entropy_threshold{7.5};
    // Parse and scan the rebuilt output before releasing it.
    bool verify_output{true};

    PDFSCRUB_DLL
    bool isDetectorEnabled(scrub_detector_e) const;
    PDFSCRUB_DLL
    bool isWaived(scrub_artifact_e) const;
    // Waivers in effect, including DocumentId when keep_document_id is set
    PDFSCRUB_DLL
    std::set<scrub_artifact_e> effectiveWaivers() const;

    // Replace the settings named in the JSON document. Throws std::runtime_error describing every
    // problem found.
    PDFSCRUB_DLL
    void updateFromJSON(std::string const& json);
    PDFSCRUB_DLL
    void updateFromJSON(JSON json);

    PDFSCRUB_DLL
    JSON getJSON() const;

    PDFSCRUB_DLL
    static JSON schema();
};

#endif // SCRUBCONFIG_HH
