#include <pdfscrub/Pl_SHA2.hh>

#include <pdfscrub/ScrubCryptoProvider.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <stdexcept>

namespace
{
    ScrubCryptoImpl::digest_e
    sha2_of(int bits)
    {
        switch (bits) {
        case 256:
            return ScrubCryptoImpl::d_sha256;
        case 384:
            return ScrubCryptoImpl::d_sha384;
        case 512:
            return ScrubCryptoImpl::d_sha512;
        default:
            throw std::logic_error("Pl_SHA2: unsupported digest length " + std::to_string(bits));
        }
    }
} // namespace

Pl_SHA2::Pl_SHA2(int bits, Pipeline* next) :
    Pipeline("sha2", next),
    algorithm(sha2_of(bits)),
    crypto(ScrubCryptoProvider::getImpl())
{
}

void
Pl_SHA2::write(unsigned char const* buf, size_t len)
{
    if (!running) {
        crypto->beginDigest(algorithm);
        running = true;
        digest.clear();
    }
    crypto->addToDigest(buf, len);
    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_SHA2::finish()
{
    if (next()) {
        next()->finish();
    }
    if (!running) {
        crypto->beginDigest(algorithm);
    }
    running = false;
    digest = crypto->endDigest();
}

std::string
Pl_SHA2::getRawDigest()
{
    if (running || digest.empty()) {
        throw std::logic_error("Pl_SHA2: digest is not finished");
    }
    return digest;
}

std::string
Pl_SHA2::getHexDigest()
{
    return ScrubUtil::hex_encode(getRawDigest());
}

std::string
Pl_SHA2::hexDigest(std::string_view data, int bits)
{
    Pl_SHA2 sha2(bits);
    sha2.writeView(data);
    sha2.finish();
    return sha2.getHexDigest();
}
