#include <pdfscrub/ScrubStatistics.hh>

#include <pdfscrub/ScrubRunContext.hh>

#include <cmath>
#include <stdexcept>

namespace
{
    int const max_iterations = 500;
    double const epsilon = 1e-12;
    double const tiny = 1e-300;

    // Series representation, valid for x < a + 1
    double
    gamma_p_series(double a, double x)
    {
        double ap = a;
        double del = 1.0 / a;
        double sum = del;
        for (int i = 0; i < max_iterations; ++i) {
            ap += 1.0;
            del *= x / ap;
            sum += del;
            if (std::fabs(del) < std::fabs(sum) * epsilon) {
                break;
            }
        }
        return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
    }

    // Continued fraction representation (modified Lentz), valid for x >= a + 1
    double
    gamma_q_fraction(double a, double x)
    {
        double b = x + 1.0 - a;
        double c = 1.0 / tiny;
        double d = 1.0 / b;
        double h = d;
        for (int i = 1; i <= max_iterations; ++i) {
            double an = -i * (i - a);
            b += 2.0;
            d = an * d + b;
            if (std::fabs(d) < tiny) {
                d = tiny;
            }
            c = b + an / c;
            if (std::fabs(c) < tiny) {
                c = tiny;
            }
            d = 1.0 / d;
            double del = d * c;
            h *= del;
            if (std::fabs(del - 1.0) < epsilon) {
                break;
            }
        }
        return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
    }
} // namespace

namespace pdfscrub::stats
{
    ByteHistogram
    byte_histogram(std::string_view data, ScrubCancel const* cancel)
    {
        ByteHistogram counts{};
        size_t i = 0;
        for (auto ch: data) {
            if (cancel && (++i % 4096) == 0) {
                cancel->check("scan");
            }
            ++counts[static_cast<unsigned char>(ch)];
        }
        return counts;
    }

    double
    entropy(ByteHistogram const& counts)
    {
        double total = 0;
        for (auto c: counts) {
            total += static_cast<double>(c);
        }
        if (total == 0) {
            return 0;
        }
        double result = 0;
        for (auto c: counts) {
            if (c) {
                double p = static_cast<double>(c) / total;
                result -= p * std::log2(p);
            }
        }
        return result;
    }

    double
    uniformity(ByteHistogram const& counts)
    {
        double total = 0;
        for (auto c: counts) {
            total += static_cast<double>(c);
        }
        if (total == 0) {
            return 0;
        }
        double expected = total / 256.0;
        double chi2 = 0;
        for (auto c: counts) {
            double diff = static_cast<double>(c) - expected;
            chi2 += diff * diff / expected;
        }
        return chi_square_upper_tail(chi2, 255);
    }

    double
    pairs_of_values(std::map<long, size_t> const& histogram, size_t min_pair_count)
    {
        // Pair k holds the values 2k and 2k + 1. Floor division keeps negative values paired the
        // same way as positive ones.
        std::map<long, std::pair<size_t, size_t>> pairs;
        for (auto const& [value, count]: histogram) {
            long k = (value >= 0) ? value / 2 : -((-value + 1) / 2);
            auto& p = pairs[k];
            if (value - 2 * k == 0) {
                p.first += count;
            } else {
                p.second += count;
            }
        }
        double chi2 = 0;
        int categories = 0;
        for (auto const& [k, p]: pairs) {
            auto n = p.first + p.second;
            if (n < min_pair_count) {
                continue;
            }
            double expected = static_cast<double>(n) / 2.0;
            double diff = static_cast<double>(p.first) - expected;
            chi2 += diff * diff / expected;
            ++categories;
        }
        if (categories < 2) {
            return 0;
        }
        return chi_square_upper_tail(chi2, categories - 1);
    }

    double
    gamma_q(double a, double x)
    {
        if (x < 0 || a <= 0) {
            throw std::logic_error("gamma_q: invalid arguments");
        }
        if (x == 0) {
            return 1.0;
        }
        if (x < a + 1.0) {
            return 1.0 - gamma_p_series(a, x);
        }
        return gamma_q_fraction(a, x);
    }

    double
    chi_square_upper_tail(double chi2, int df)
    {
        if (df < 1) {
            throw std::logic_error("chi_square_upper_tail: degrees of freedom must be positive");
        }
        if (chi2 <= 0) {
            return 1.0;
        }
        return gamma_q(df / 2.0, chi2 / 2.0);
    }
} // namespace pdfscrub::stats
