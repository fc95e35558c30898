#include <pdfscrub/ScrubCryptoProvider.hh>

#include <pdfscrub/ScrubCrypto_openssl.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <stdexcept>

ScrubCryptoProvider::ScrubCryptoProvider()
{
    factories["openssl"] = []() { return std::make_shared<ScrubCrypto_openssl>(); };
    std::string name = "openssl";
    ScrubUtil::get_env("PDFSCRUB_CRYPTO_PROVIDER", &name);
    select(name);
}

ScrubCryptoProvider&
ScrubCryptoProvider::instance()
{
    static ScrubCryptoProvider provider;
    return provider;
}

// Called with the lock held, or during construction.
void
ScrubCryptoProvider::select(std::string const& name)
{
    if (!factories.contains(name)) {
        throw std::logic_error(
            "ScrubCryptoProvider: no crypto implementation named \"" + name + "\"");
    }
    default_name = name;
}

std::shared_ptr<ScrubCryptoImpl>
ScrubCryptoProvider::getImpl()
{
    auto& p = instance();
    provider_fn factory;
    {
        std::lock_guard<std::mutex> guard(p.lock);
        factory = p.factories.at(p.default_name);
    }
    return factory();
}

void
ScrubCryptoProvider::registerImpl(std::string const& name, provider_fn f)
{
    auto& p = instance();
    std::lock_guard<std::mutex> guard(p.lock);
    p.factories[name] = std::move(f);
}

void
ScrubCryptoProvider::setDefaultProvider(std::string const& name)
{
    auto& p = instance();
    std::lock_guard<std::mutex> guard(p.lock);
    p.select(name);
}

std::set<std::string>
ScrubCryptoProvider::getRegisteredImpls()
{
    auto& p = instance();
    std::lock_guard<std::mutex> guard(p.lock);
    std::set<std::string> names;
    for (auto const& entry: p.factories) {
        names.insert(entry.first);
    }
    return names;
}

std::string
ScrubCryptoProvider::getDefaultProvider()
{
    auto& p = instance();
    std::lock_guard<std::mutex> guard(p.lock);
    return p.default_name;
}
