#ifndef PL_MD5_HH
#define PL_MD5_HH

#include <pdfscrub/Pipeline.hh>
#include <pdfscrub/ScrubCryptoImpl.hh>

#include <memory>
#include <string_view>

// Passes data through unchanged and makes its MD5 digest available after finish(). Writing again
// after finish() starts a new digest. Rebuilt files get their document identifier from this.
class Pl_MD5 final: public Pipeline
{
  public:
    Pl_MD5(char const* identifier, Pipeline* next = nullptr);
    ~Pl_MD5() final = default;
    void write(unsigned char const*, size_t) final;
    void finish() final;
    // Throws std::logic_error while a digest is in progress.
    std::string getRawDigest();
    std::string getHexDigest();

    static std::string rawDigest(std::string_view data);

  private:
    std::shared_ptr<ScrubCryptoImpl> crypto;
    bool running{false};
    std::string digest;
};

#endif // PL_MD5_HH
