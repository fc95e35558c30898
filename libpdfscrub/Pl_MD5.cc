#include <pdfscrub/Pl_MD5.hh>

#include <pdfscrub/ScrubCryptoProvider.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <stdexcept>

Pl_MD5::Pl_MD5(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next),
    crypto(ScrubCryptoProvider::getImpl())
{
}

void
Pl_MD5::write(unsigned char const* buf, size_t len)
{
    if (!running) {
        crypto->beginDigest(ScrubCryptoImpl::d_md5);
        running = true;
        digest.clear();
    }
    crypto->addToDigest(buf, len);
    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_MD5::finish()
{
    if (next()) {
        next()->finish();
    }
    if (!running) {
        crypto->beginDigest(ScrubCryptoImpl::d_md5);
    }
    running = false;
    digest = crypto->endDigest();
}

std::string
Pl_MD5::getRawDigest()
{
    if (running || digest.empty()) {
        throw std::logic_error(identifier + ": MD5 digest is not finished");
    }
    return digest;
}

std::string
Pl_MD5::getHexDigest()
{
    return ScrubUtil::hex_encode(getRawDigest());
}

std::string
Pl_MD5::rawDigest(std::string_view data)
{
    Pl_MD5 md5("md5");
    md5.writeView(data);
    md5.finish();
    return md5.getRawDigest();
}
