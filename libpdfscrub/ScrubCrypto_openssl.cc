#include <pdfscrub/ScrubCrypto_openssl.hh>

#include <stdexcept>

#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <openssl/err.h>
#if (defined(__GNUC__) || defined(__clang__))
# pragma GCC diagnostic pop
#endif

namespace
{
    // Only the innermost error of OpenSSL's error queue is reported.
    void
    check(int status, char const* call)
    {
        if (status == 1) {
            ERR_clear_error();
            return;
        }
        char detail[256] = "";
        ERR_error_string_n(ERR_get_error(), detail, sizeof(detail));
        ERR_clear_error();
        throw std::runtime_error(std::string("OpenSSL ") + call + ": " + detail);
    }

    EVP_MD const*
    algorithm(ScrubCryptoImpl::digest_e which)
    {
        switch (which) {
        case ScrubCryptoImpl::d_md5:
            return EVP_md5();
        case ScrubCryptoImpl::d_sha256:
            return EVP_sha256();
        case ScrubCryptoImpl::d_sha384:
            return EVP_sha384();
        case ScrubCryptoImpl::d_sha512:
            return EVP_sha512();
        }
        throw std::logic_error("ScrubCrypto_openssl: unknown digest");
    }
} // namespace

ScrubCrypto_openssl::ScrubCrypto_openssl() :
    ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
{
    if (!ctx) {
        throw std::runtime_error("OpenSSL: unable to allocate a digest context");
    }
}

void
ScrubCrypto_openssl::beginDigest(digest_e which)
{
    check(EVP_DigestInit_ex(ctx.get(), algorithm(which), nullptr), "EVP_DigestInit_ex");
    started = true;
}

void
ScrubCrypto_openssl::addToDigest(unsigned char const* data, size_t len)
{
    if (!started) {
        throw std::logic_error("ScrubCrypto_openssl: data added before beginDigest");
    }
    check(EVP_DigestUpdate(ctx.get(), data, len), "EVP_DigestUpdate");
}

std::string
ScrubCrypto_openssl::endDigest()
{
    if (!started) {
        throw std::logic_error("ScrubCrypto_openssl: endDigest called before beginDigest");
    }
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    started = false;
    check(EVP_DigestFinal_ex(ctx.get(), out, &len), "EVP_DigestFinal_ex");
    return {reinterpret_cast<char const*>(out), len};
}
