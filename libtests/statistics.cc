#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubExc.hh>
#include <pdfscrub/ScrubRunContext.hh>
#include <pdfscrub/ScrubStatistics.hh>

#include <cmath>
#include <iostream>

using namespace pdfscrub;

static bool
near(double a, double b, double tolerance = 1e-6)
{
    return std::fabs(a - b) < tolerance;
}

static void
test_distributions()
{
    assert(near(stats::gamma_q(1, 2), std::exp(-2.0)));
    assert(near(stats::gamma_q(1, 0.25), std::exp(-0.25)));
    assert(stats::gamma_q(3, 0) == 1.0);
    // Two degrees of freedom: the upper tail is exp(-chi2 / 2).
    assert(near(stats::chi_square_upper_tail(2, 2), std::exp(-1.0)));
    // The 5% critical value for one degree of freedom
    assert(near(stats::chi_square_upper_tail(3.841459, 1), 0.05, 1e-5));
    assert(stats::chi_square_upper_tail(-1, 3) == 1.0);
    assert(stats::chi_square_upper_tail(1e6, 255) < 1e-12);
    try {
        stats::chi_square_upper_tail(1, 0);
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        stats::gamma_q(0, 1);
        assert(false);
    } catch (std::logic_error&) {
    }
}

static void
test_bytes()
{
    std::string uniform;
    for (int i = 0; i < 256 * 16; ++i) {
        uniform += static_cast<char>(i % 256);
    }
    auto h = stats::byte_histogram(uniform);
    assert(h.at(0) == 16 && h.at(255) == 16);
    assert(near(stats::entropy(h), 8.0));
    assert(stats::uniformity(h) == 1.0);

    auto text = stats::byte_histogram(std::string(4096, 'a'));
    assert(stats::entropy(text) == 0);
    assert(stats::uniformity(text) < 1e-12);

    assert(near(stats::entropy(stats::byte_histogram("abab")), 1.0));
    assert(stats::entropy(stats::byte_histogram("")) == 0);
    assert(stats::uniformity(stats::byte_histogram("")) == 0);

    // Long loops check for cancellation.
    auto cancel = ScrubCancel::create();
    cancel->cancel();
    assert(stats::byte_histogram("short", cancel.get()).at('s') == 1);
    try {
        stats::byte_histogram(uniform, cancel.get());
        assert(false);
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_cancelled);
    }
}

static void
test_pairs_of_values()
{
    // Equal counts within each pair look like an embedded payload.
    std::map<long, size_t> equalized{{0, 50}, {1, 50}, {2, 30}, {3, 30}, {-2, 20}, {-1, 20}};
    assert(stats::pairs_of_values(equalized) == 1.0);

    // Natural data has uneven pairs.
    std::map<long, size_t> natural{{0, 100}, {1, 10}, {2, 80}, {3, 5}, {4, 60}, {5, 3}};
    assert(stats::pairs_of_values(natural) < 1e-6);

    // Too few observations to say anything
    std::map<long, size_t> sparse{{0, 3}, {1, 3}, {2, 4}, {3, 4}};
    assert(stats::pairs_of_values(sparse) == 0);
    assert(stats::pairs_of_values(sparse, 5) == 1.0);
    assert(stats::pairs_of_values({{10, 500}, {11, 500}}) == 0);
}

int
main()
{
    test_distributions();
    test_bytes();
    test_pairs_of_values();
    std::cout << "statistics tests done" << std::endl;
    return 0;
}
