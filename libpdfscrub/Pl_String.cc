#include <pdfscrub/Pl_String.hh>

Pl_String::Pl_String(char const* identifier, Pipeline* next, std::string& s) :
    Pipeline(identifier, next),
    out(s)
{
}

Pl_String::~Pl_String() = default;

void
Pl_String::write(unsigned char const* buf, size_t len)
{
    out.append(reinterpret_cast<char const*>(buf), len);
    if (auto n = next()) {
        n->write(buf, len);
    }
}

void
Pl_String::finish()
{
    if (auto n = next()) {
        n->finish();
    }
}
