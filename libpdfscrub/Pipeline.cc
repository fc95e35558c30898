#include <pdfscrub/Pipeline.hh>

Pipeline::Pipeline(char const* identifier, Pipeline* next) :
    identifier(identifier),
    next_(next)
{
}

void
Pipeline::write(char const* data, size_t len)
{
    write(reinterpret_cast<unsigned char const*>(data), len);
}

void
Pipeline::writeCStr(char const* cstr)
{
    writeView(cstr);
}

void
Pipeline::writeString(std::string const& str)
{
    writeView(str);
}

void
Pipeline::writeView(std::string_view str)
{
    write(str.data(), str.size());
}

Pipeline&
Pipeline::operator<<(char const* cstr)
{
    writeView(cstr);
    return *this;
}

Pipeline&
Pipeline::operator<<(std::string const& str)
{
    writeView(str);
    return *this;
}

Pipeline&
Pipeline::operator<<(int n)
{
    return *this << std::to_string(n);
}

Pipeline&
Pipeline::operator<<(long n)
{
    return *this << std::to_string(n);
}

Pipeline&
Pipeline::operator<<(long long n)
{
    return *this << std::to_string(n);
}

Pipeline&
Pipeline::operator<<(unsigned int n)
{
    return *this << std::to_string(n);
}

Pipeline&
Pipeline::operator<<(unsigned long n)
{
    return *this << std::to_string(n);
}

Pipeline&
Pipeline::operator<<(unsigned long long n)
{
    return *this << std::to_string(n);
}
