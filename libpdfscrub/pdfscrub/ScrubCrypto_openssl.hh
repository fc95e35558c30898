#ifndef SCRUBCRYPTO_OPENSSL_HH
#define SCRUBCRYPTO_OPENSSL_HH

#include <pdfscrub/ScrubCryptoImpl.hh>

#include <memory>
#include <string>

#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <openssl/evp.h>
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif

class ScrubCrypto_openssl final: public ScrubCryptoImpl
{
  public:
    ScrubCrypto_openssl();
    ~ScrubCrypto_openssl() final = default;

    void beginDigest(digest_e) final;
    void addToDigest(unsigned char const* data, size_t len) final;
    std::string endDigest() final;

  private:
    ScrubCrypto_openssl(ScrubCrypto_openssl const&) = delete;
    ScrubCrypto_openssl& operator=(ScrubCrypto_openssl const&) = delete;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx;
    bool started{false};
};

#endif // SCRUBCRYPTO_OPENSSL_HH
