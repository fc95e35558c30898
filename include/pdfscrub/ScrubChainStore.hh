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


#ifndef SCRUBCHAINSTORE_HH
#define SCRUBCHAINSTORE_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubVerifier.hh>

#include <memory>
#include <string>
#include <vector>

// Append-only storage of verification records, one chain per lineage. Records are never changed
// or removed once appended.
class PDFSCRUB_DLL_CLASS ScrubChainStore
{
  public:
    PDFSCRUB_DLL
    virtual ~ScrubChainStore();

    // Records of the lineage, oldest first. An unknown lineage has none.
    virtual std::vector<ScrubVerificationRecord> load(std::string const& lineage) = 0;
    virtual void append(std::string const& lineage, ScrubVerificationRecord const& record) = 0;

    // chain_link of the newest record, or empty for a new lineage
    PDFSCRUB_DLL
    std::string lastLink(std::string const& lineage);

    // Records kept in memory for the life of the store
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubChainStore> memory();
    // One JSON-lines file per lineage in `path`, which is created if needed. Files are only ever
    // opened for reading or appending.
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubChainStore> directory(std::string const& path);

    // Recompute every link. Returns the index of the first record whose link or previous link does
    // not match, or -1 if the whole chain verifies.
    PDFSCRUB_DLL
    static long long verifyChain(std::vector<ScrubVerificationRecord> const& records);

  protected:
    PDFSCRUB_DLL
    ScrubChainStore() = default;

  private:
    ScrubChainStore(ScrubChainStore const&) = delete;
    ScrubChainStore& operator=(ScrubChainStore const&) = delete;
};

#endif // SCRUBCHAINSTORE_HH
