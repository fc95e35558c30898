#include <pdfscrub/Pl_PNGFilter.hh>

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace
{
    // Whichever of the three neighbours is closest to left + up - up_left
    int
    paeth(int left, int up, int up_left)
    {
        int estimate = left + up - up_left;
        int d_left = std::abs(estimate - left);
        int d_up = std::abs(estimate - up);
        int d_up_left = std::abs(estimate - up_left);
        if (d_left <= d_up && d_left <= d_up_left) {
            return left;
        }
        return d_up <= d_up_left ? up : up_left;
    }
} // namespace

Pl_PNGFilter::Pl_PNGFilter(
    char const* identifier,
    Pipeline* next,
    unsigned int columns,
    unsigned int samples_per_pixel,
    unsigned int bits_per_sample) :
    Pipeline(identifier, next)
{
    if (!next) {
        throw std::logic_error("Pl_PNGFilter: a next pipeline is required");
    }
    if (samples_per_pixel < 1) {
        throw std::runtime_error("Pl_PNGFilter: samples_per_pixel must be at least 1");
    }
    switch (bits_per_sample) {
    case 1:
    case 2:
    case 4:
    case 8:
    case 16:
        break;
    default:
        throw std::runtime_error("Pl_PNGFilter: bits_per_sample must be 1, 2, 4, 8 or 16");
    }
    unsigned long long bits_per_pixel = 1ULL * bits_per_sample * samples_per_pixel;
    unsigned long long row_size = (bits_per_pixel * columns + 7) / 8;
    if (row_size == 0 || row_size >= UINT_MAX) {
        throw std::runtime_error(
            "Pl_PNGFilter: " + std::to_string(columns) + " is not a usable number of columns");
    }
    pixel_size = static_cast<size_t>((bits_per_pixel + 7) / 8);
    row.assign(static_cast<size_t>(row_size) + 1, 0);
    above.assign(static_cast<size_t>(row_size), 0);
}

void
Pl_PNGFilter::write(unsigned char const* data, size_t len)
{
    while (len > 0) {
        auto n = std::min(len, row.size() - filled);
        std::memcpy(row.data() + filled, data, n);
        filled += n;
        data += n;
        len -= n;
        if (filled == row.size()) {
            emitRow();
        }
    }
}

// Decodes the bytes received for the current row in place. Types 0 and unknown types leave them
// as they are.
void
Pl_PNGFilter::emitRow()
{
    unsigned char* out = row.data() + 1;
    size_t count = filled - 1;
    int type = row[0];
    for (size_t i = 0; i < count; ++i) {
        int left = i >= pixel_size ? out[i - pixel_size] : 0;
        int up = above[i];
        int up_left = i >= pixel_size ? above[i - pixel_size] : 0;
        int predicted = 0;
        switch (type) {
        case 1:
            predicted = left;
            break;
        case 2:
            predicted = up;
            break;
        case 3:
            predicted = (left + up) / 2;
            break;
        case 4:
            predicted = paeth(left, up, up_left);
            break;
        default:
            break;
        }
        out[i] = static_cast<unsigned char>(out[i] + predicted);
    }
    next()->write(out, count);
    std::copy(out, out + count, above.begin());
    filled = 0;
}

// A truncated last row is passed on with the bytes that arrived.
void
Pl_PNGFilter::finish()
{
    if (filled > 1) {
        emitRow();
    }
    filled = 0;
    std::fill(above.begin(), above.end(), 0);
    next()->finish();
}
