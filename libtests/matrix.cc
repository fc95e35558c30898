#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubMatrix.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <iostream>

static void
check(ScrubMatrix const& m, std::string const& exp)
{
    std::string u = m.unparse();
    if (u != exp) {
        std::cout << "got " << u << ", wanted " << exp << std::endl;
        assert(false);
    }
}

static void
check_xy(double x, double y, std::string const& exp)
{
    std::string u = (ScrubUtil::double_to_string(x, 2) + " " + ScrubUtil::double_to_string(y, 2));
    if (u != exp) {
        std::cout << "got " << u << ", wanted " << exp << std::endl;
        assert(false);
    }
}

int
main()
{
    ScrubMatrix m;
    check(m, "1 0 0 1 0 0");
    m.translate(10, 20);
    check(m, "1 0 0 1 10 20");
    double xp = 0;
    double yp = 0;
    m.transform(10, 100, xp, yp);
    check_xy(xp, yp, "20 120");
    m.concat(ScrubMatrix(1.5, 0, 0, 2, 0, 0));
    check(m, "1.5 0 0 2 10 20");
    m.transform(10, 100, xp, yp);
    check_xy(xp, yp, "25 220");
    m.translate(30, 40);
    check(m, "1.5 0 0 2 55 100");
    m.transform(10, 100, xp, yp);
    check_xy(xp, yp, "70 300");
    m.concat(ScrubMatrix(1, 2, 3, 4, 5, 6));
    check(m, "1.5 4 4.5 8 62.5 112");
    m.transform(240, 480, xp, yp);
    check_xy(xp, yp, "2582.5 4912");

    // Text positioning as the content analyzer does it: Tm, then Td relative to the line start
    ScrubMatrix tm(1, 0, 0, 1, 72, 700);
    tm.translate(0, -14);
    tm.transform(0, 0, xp, yp);
    check_xy(xp, yp, "72 686");
    ScrubMatrix ctm(0, 1, -1, 0, 612, 0);
    ctm.concat(tm);
    ctm.transform(0, 0, xp, yp);
    check_xy(xp, yp, "-74 72");

    assert(ScrubMatrix(1, 2, 3, 4, 5, 6) == ScrubMatrix(1, 2, 3, 4, 5, 6));
    assert(ScrubMatrix() != ScrubMatrix(1, 0, 0, 1, 0, 0.5));
    // Values close to zero print as zero.
    check(ScrubMatrix(1, 0.000001, -0.000001, 1, 0, 0), "1 0 0 1 0 0");

    std::cout << "matrix tests done" << std::endl;
    return 0;
}
