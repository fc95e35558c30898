#include <pdfscrub/assert_test.h>

#include <pdfscrub/Pl_MD5.hh>
#include <pdfscrub/Pl_SHA2.hh>
#include <pdfscrub/Pl_String.hh>
#include <pdfscrub/ScrubCryptoProvider.hh>
#include <pdfscrub/ScrubUtil.hh>

#include <iostream>

// Answers every digest request with the same bytes, so a test can tell which implementation a
// pipeline used.
class Potato: public ScrubCryptoImpl
{
  public:
    void
    beginDigest(digest_e which) override
    {
        md5 = which == d_md5;
    }
    void
    addToDigest(unsigned char const*, size_t) override
    {
    }
    std::string
    endDigest() override
    {
        return md5 ? "0123456789abcdef" : "potato";
    }

  private:
    bool md5{false};
};

static void
test_sha2(int bits, std::string const& input, std::string const& output)
{
    Pl_SHA2 sha2(bits);
    sha2.writeString(input);
    sha2.finish();
    if (sha2.getHexDigest() != output) {
        std::cout << bits << " failed\n"
                  << "  expected: " << output << "\n"
                  << "  actual:   " << sha2.getHexDigest() << "\n";
        assert(false);
    }
    assert(Pl_SHA2::hexDigest(input, bits) == output);
}

static void
test_digests()
{
    std::string million_a(1000000, 'a');
    test_sha2(256, "abc", "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    test_sha2(
        256,
        "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    test_sha2(
        256, million_a, "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
    test_sha2(
        384,
        "abc",
        "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded163"
        "1a8b605a43ff5bed8086072ba1e7cc2358baeca134c825a7");
    test_sha2(
        512,
        "abc",
        "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
        "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

    // Digests pass data through and may be reused.
    std::string passed;
    Pl_String out("out", nullptr, passed);
    Pl_MD5 md5("md5", &out);
    md5.writeCStr("");
    md5.finish();
    assert(md5.getHexDigest() == "d41d8cd98f00b204e9800998ecf8427e");
    md5.writeCStr("ab");
    md5.writeCStr("c");
    md5.finish();
    assert(md5.getHexDigest() == "900150983cd24fb0d6963f7d28e17f72");
    assert(passed == "abc");
    assert(
        ScrubUtil::hex_encode(Pl_MD5::rawDigest("message digest")) ==
        "f96b697d7cb7938d525a2f31aaf161d0");

    Pl_MD5 unfinished("md5");
    unfinished.writeCStr("partial");
    try {
        unfinished.getRawDigest();
        assert(false);
    } catch (std::logic_error&) {
    }

    try {
        Pl_SHA2 odd(160);
        assert(false);
    } catch (std::logic_error&) {
    }
}

static void
test_provider()
{
    auto initial = ScrubCryptoProvider::getDefaultProvider();
    assert(ScrubCryptoProvider::getRegisteredImpls().contains("openssl"));
    ScrubCryptoProvider::registerImpl<Potato>("potato");
    ScrubCryptoProvider::setDefaultProvider("potato");
    assert(ScrubCryptoProvider::getDefaultProvider() == "potato");
    assert(Pl_MD5::rawDigest("quack") == "0123456789abcdef");
    assert(Pl_SHA2::hexDigest("quack") == ScrubUtil::hex_encode("potato"));
    try {
        ScrubCryptoProvider::setDefaultProvider("turnip");
        assert(false);
    } catch (std::logic_error&) {
    }
    ScrubCryptoProvider::setDefaultProvider(initial);
    assert(
        ScrubUtil::hex_encode(Pl_MD5::rawDigest("abc")) == "900150983cd24fb0d6963f7d28e17f72");
}

int
main()
{
    test_digests();
    test_provider();
    std::cout << "crypto tests done" << std::endl;
    return 0;
}
