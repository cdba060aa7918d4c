#include <tokwh/global_private.hh>

using namespace tokwh;
using namespace tokwh::global;

Limits Limits::l;
Options Options::o;

uint32_t
global::limit_errors()
{
    return Limits::errors();
}

bool
global::options::strict()
{
    return Options::strict();
}

void
global::options::strict(bool value)
{
    Options::strict(value);
}

bool
global::options::allow_raw_html()
{
    return Options::allow_raw_html();
}

void
global::options::allow_raw_html(bool value)
{
    Options::allow_raw_html(value);
}

uint32_t
global::limits::max_tokens()
{
    return Limits::max_tokens();
}

void
global::limits::max_tokens(uint32_t value)
{
    Limits::max_tokens(value);
}

uint64_t
global::limits::max_bytes()
{
    return Limits::max_bytes();
}

void
global::limits::max_bytes(uint64_t value)
{
    Limits::max_bytes(value);
}

uint32_t
global::limits::max_nesting()
{
    return Limits::max_nesting();
}

void
global::limits::max_nesting(uint32_t value)
{
    Limits::max_nesting(value);
}

uint32_t
global::limits::max_items()
{
    return Limits::max_items();
}

void
global::limits::max_items(uint32_t value)
{
    Limits::max_items(value);
}

uint32_t
global::limits::collector_timeout_ms()
{
    return Limits::collector_timeout_ms();
}

void
global::limits::collector_timeout_ms(uint32_t value)
{
    Limits::collector_timeout_ms(value);
}
