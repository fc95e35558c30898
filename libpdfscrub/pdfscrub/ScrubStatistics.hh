#ifndef SCRUBSTATISTICS_HH
#define SCRUBSTATISTICS_HH

#include <array>
#include <cstddef>
#include <map>
#include <string_view>

class ScrubCancel;

// Statistical tests used by the hidden-data detector. Loops over sample data check the cancel
// token, if one is given, every 4096 samples.
namespace pdfscrub::stats
{
    using ByteHistogram = std::array<size_t, 256>;

    ByteHistogram byte_histogram(std::string_view data, ScrubCancel const* cancel = nullptr);

    // Shannon entropy in bits per byte
    double entropy(ByteHistogram const& counts);

    // Probability that the byte frequencies were drawn from a uniform distribution (upper tail of
    // the chi-square test with 255 degrees of freedom)
    double uniformity(ByteHistogram const& counts);

    // Westfeld and Pfitzmann's pairs-of-values test. Values 2k and 2k+1 form a pair; overwriting
    // least significant bits with random data equalizes the counts within each pair. The result is
    // the estimated probability that the values carry such an embedding. Pairs with fewer than
    // `min_pair_count` observations are ignored. Returns 0 if fewer than two pairs qualify.
    double pairs_of_values(std::map<long, size_t> const& histogram, size_t min_pair_count = 10);

    // Regularized upper incomplete gamma function Q(a, x)
    double gamma_q(double a, double x);

    // P(X > chi2) for a chi-square distribution with df degrees of freedom
    double chi_square_upper_tail(double chi2, int df);
} // namespace pdfscrub::stats

#endif // SCRUBSTATISTICS_HH
