#include <pdfscrub/ScrubMatrix.hh>

#include <pdfscrub/ScrubUtil.hh>

ScrubMatrix::ScrubMatrix() :
    a(1.0),
    b(0.0),
    c(0.0),
    d(1.0),
    e(0.0),
    f(0.0)
{
}

ScrubMatrix::ScrubMatrix(double a, double b, double c, double d, double e, double f) :
    a(a),
    b(b),
    c(c),
    d(d),
    e(e),
    f(f)
{
}

static double
fix_rounding(double d)
{
    if ((d > -0.00001) && (d < 0.00001)) {
        d = 0.0;
    }
    return d;
}

std::string
ScrubMatrix::unparse() const
{
    return (
        ScrubUtil::double_to_string(fix_rounding(a), 5) + " " +
        ScrubUtil::double_to_string(fix_rounding(b), 5) + " " +
        ScrubUtil::double_to_string(fix_rounding(c), 5) + " " +
        ScrubUtil::double_to_string(fix_rounding(d), 5) + " " +
        ScrubUtil::double_to_string(fix_rounding(e), 5) + " " +
        ScrubUtil::double_to_string(fix_rounding(f), 5));
}

void
ScrubMatrix::concat(ScrubMatrix const& other)
{
    double ap = (a * other.a) + (c * other.b);
    double bp = (b * other.a) + (d * other.b);
    double cp = (a * other.c) + (c * other.d);
    double dp = (b * other.c) + (d * other.d);
    double ep = (a * other.e) + (c * other.f) + e;
    double fp = (b * other.e) + (d * other.f) + f;
    a = ap;
    b = bp;
    c = cp;
    d = dp;
    e = ep;
    f = fp;
}

void
ScrubMatrix::translate(double tx, double ty)
{
    concat(ScrubMatrix(1, 0, 0, 1, tx, ty));
}

void
ScrubMatrix::transform(double x, double y, double& xp, double& yp) const
{
    xp = (a * x) + (c * y) + e;
    yp = (b * x) + (d * y) + f;
}

bool
ScrubMatrix::operator==(ScrubMatrix const& rhs) const
{
    return (
        (a == rhs.a) && (b == rhs.b) && (c == rhs.c) && (d == rhs.d) && (e == rhs.e) &&
        (f == rhs.f));
}
