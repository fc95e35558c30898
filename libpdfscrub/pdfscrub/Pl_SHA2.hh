#ifndef PL_SHA2_HH
#define PL_SHA2_HH

#include <pdfscrub/Pipeline.hh>
#include <pdfscrub/ScrubCryptoImpl.hh>

#include <memory>
#include <string_view>

// SHA-2 of everything written, with bits 256, 384 or 512. Data is passed on to next, if any.
// The pipeline may be reused after finish().
class Pl_SHA2 final: public Pipeline
{
  public:
    Pl_SHA2(int bits = 256, Pipeline* next = nullptr);
    ~Pl_SHA2() final = default;
    void write(unsigned char const*, size_t) final;
    void finish() final;
    std::string getHexDigest();
    std::string getRawDigest();

    static std::string hexDigest(std::string_view data, int bits = 256);

  private:
    ScrubCryptoImpl::digest_e algorithm;
    std::shared_ptr<ScrubCryptoImpl> crypto;
    bool running{false};
    std::string digest;
};

#endif // PL_SHA2_HH
