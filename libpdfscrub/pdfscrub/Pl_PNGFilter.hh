#ifndef PL_PNGFILTER_HH
#define PL_PNGFILTER_HH

#include <pdfscrub/Pipeline.hh>

#include <vector>

// Undoes PNG row filtering, which Flate streams use for /Predictor values 10 to 15. Each input row
// is a filter type byte followed by the row's bytes. The type byte is not passed on.
class Pl_PNGFilter final: public Pipeline
{
  public:
    Pl_PNGFilter(
        char const* identifier,
        Pipeline* next,
        unsigned int columns,
        unsigned int samples_per_pixel = 1,
        unsigned int bits_per_sample = 8);
    ~Pl_PNGFilter() final = default;

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

  private:
    void emitRow();

    // Distance back to the same byte of the previous pixel, at least 1
    size_t pixel_size;
    // Type byte followed by the row being received
    std::vector<unsigned char> row;
    // The previous decoded row, all zero before the first
    std::vector<unsigned char> above;
    size_t filled{0};
};

#endif // PL_PNGFILTER_HH
