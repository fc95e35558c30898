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


#ifndef SCRUBCRYPTOPROVIDER_HH
#define SCRUBCRYPTOPROVIDER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubCryptoImpl.hh>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

// Chooses the ScrubCryptoImpl that the digest pipelines use. "openssl" is built in and is the
// default unless the PDFSCRUB_CRYPTO_PROVIDER environment variable names another registered
// implementation. All methods may be called from several threads.
class ScrubCryptoProvider
{
  public:
    typedef std::function<std::shared_ptr<ScrubCryptoImpl>()> provider_fn;

    // A new instance of the default implementation
    PDFSCRUB_DLL
    static std::shared_ptr<ScrubCryptoImpl> getImpl();

    // Registering a name again replaces the earlier factory.
    PDFSCRUB_DLL
    static void registerImpl(std::string const& name, provider_fn f);

    template <typename T>
    static void
    registerImpl(std::string const& name)
    {
        registerImpl(name, []() { return std::make_shared<T>(); });
    }

    // Throws std::logic_error for a name that has not been registered.
    PDFSCRUB_DLL
    static void setDefaultProvider(std::string const& name);

    PDFSCRUB_DLL
    static std::set<std::string> getRegisteredImpls();
    PDFSCRUB_DLL
    static std::string getDefaultProvider();

  private:
    ScrubCryptoProvider();
    ScrubCryptoProvider(ScrubCryptoProvider const&) = delete;
    ScrubCryptoProvider& operator=(ScrubCryptoProvider const&) = delete;

    static ScrubCryptoProvider& instance();
    void select(std::string const& name);

    std::mutex lock;
    std::string default_name;
    std::map<std::string, provider_fn> factories;
};

#endif // SCRUBCRYPTOPROVIDER_HH
