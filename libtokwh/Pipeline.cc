#include <tokwh/Pipeline.hh>

#include <cstring>

Pipeline::Pipeline(char const* identifier, Pipeline* next) :
    identifier(identifier),
    next_(next)
{
}

void
Pipeline::writeString(std::string const& str)
{
    write(str.data(), str.size());
}

Pipeline&
Pipeline::operator<<(char const* cstr)
{
    write(cstr, std::strlen(cstr));
    return *this;
}

Pipeline&
Pipeline::operator<<(std::string const& str)
{
    writeString(str);
    return *this;
}

void
Pipeline::write(char const* data, size_t len)
{
    write(reinterpret_cast<unsigned char const*>(data), len);
}
