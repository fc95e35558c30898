#ifndef SCRUBDCT_HH
#define SCRUBDCT_HH

#include <string>
#include <vector>

// Access to the quantized DCT coefficients of baseline and progressive JPEG data. Coefficients
// are read and written without decoding to pixels, so rewriting them loses nothing else.
//
// All functions throw std::runtime_error with libjpeg's message if the data is not valid JPEG.
class ScrubDCT
{
  public:
    // Every AC coefficient of every block of every component, in file order
    static std::vector<int> readACCoefficients(std::string const& jpeg);

    // Clear the least significant bit of every AC coefficient whose magnitude is at least 2 and
    // write the result as a new JPEG stream with the same parameters. `changed` receives the number
    // of coefficients that changed. Clearing is idempotent.
    static std::string clearACLowBits(std::string const& jpeg, size_t& changed);

    // Compress 8-bit samples (1 component for gray, 3 for RGB) at the given quality.
    static std::string
    compress(std::string const& samples, unsigned width, unsigned height, int components, int quality);
};

#endif // SCRUBDCT_HH
