#ifndef CL_UTIL_HH
#define CL_UTIL_HH

#include <tokwh/JSON.hh>
#include <tokwh/TWIntC.hh>
#include <tokwh/TokenWarehouse.hh>

#include <optional>
#include <string>

// Helpers shared by the reference collectors.
namespace tokwh::cl
{
    inline JSON
    line_json(std::optional<long long> line)
    {
        return line ? JSON::makeInt(*line) : JSON::makeNull();
    }

    inline JSON
    string_json(std::optional<std::string> const& s)
    {
        return s ? JSON::makeString(*s) : JSON::makeNull();
    }

    inline JSON
    size_json(size_t n)
    {
        return JSON::makeInt(TWIntC::to_longlong(n));
    }

    inline std::optional<size_t>
    section_of(TokenWarehouse& wh, std::optional<long long> line)
    {
        return line ? wh.sectionOf(*line) : std::nullopt;
    }

    inline JSON
    section_json(std::optional<size_t> section)
    {
        return section ? size_json(*section) : JSON::makeNull();
    }
} // namespace tokwh::cl

#endif // CL_UTIL_HH
