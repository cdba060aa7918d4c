#include <tokwh/Pl_String.hh>

Pl_String::Pl_String(char const* identifier, Pipeline* next, std::string& s) :
    Pipeline(identifier, next),
    s(s)
{
}

// Must be explicit and not inline so the vtable lands in the library
Pl_String::~Pl_String() = default;

void
Pl_String::write(unsigned char const* buf, size_t len)
{
    if (!len) {
        return;
    }
    s.append(reinterpret_cast<char const*>(buf), len);
    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_String::finish()
{
    if (next()) {
        next()->finish();
    }
}
