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


#ifndef SCRUBCRYPTOIMPL_HH
#define SCRUBCRYPTOIMPL_HH

#include <pdfscrub/DLL.h>

#include <string>

// A message digest implementation. pdfscrub needs SHA-256 for the verification hash chain and MD5
// for the document identifiers of rebuilt files; it never encrypts or decrypts anything. The
// built-in implementation uses OpenSSL. See ScrubCryptoProvider for supplying another one.
//
// An instance computes one digest at a time and is not shared between threads.
class PDFSCRUB_DLL_CLASS ScrubCryptoImpl
{
  public:
    enum digest_e { d_md5, d_sha256, d_sha384, d_sha512 };

    PDFSCRUB_DLL
    ScrubCryptoImpl() = default;

    PDFSCRUB_DLL
    virtual ~ScrubCryptoImpl() = default;

    // Discards any digest in progress.
    PDFSCRUB_DLL
    virtual void beginDigest(digest_e) = 0;
    PDFSCRUB_DLL
    virtual void addToDigest(unsigned char const* data, size_t len) = 0;
    // Returns the raw digest bytes.
    PDFSCRUB_DLL
    virtual std::string endDigest() = 0;
};

#endif // SCRUBCRYPTOIMPL_HH
