#ifndef TOKWH_UTIL_HH
#define TOKWH_UTIL_HH

#include <stdexcept>
#include <string>

using namespace std::literals;

namespace tokwh::util
{
    // tokwh::util is a collection of small helpers for internal use by the library.

    // Throw a logic_error if 'cond' does not hold.
    inline void
    assertion(bool cond, std::string const& msg)
    {
        if (!cond) {
            throw std::logic_error(msg);
        }
    }

    inline void
    internal_error_if(bool cond, std::string const& msg)
    {
        if (cond) {
            throw std::logic_error("INTERNAL ERROR: "s.append(msg).append(
                "\nThis is a tokwh bug. Please report it with the token dump that triggered it."));
        }
    }

    inline constexpr char
    hex_decode_char(char digit)
    {
        return digit <= '9' && digit >= '0'
            ? char(digit - '0')
            : (digit >= 'a' ? char(digit - 'a' + 10)
                            : (digit >= 'A' ? char(digit - 'A' + 10) : '\20'));
    }

    inline constexpr bool
    is_hex_digit(char ch)
    {
        return hex_decode_char(ch) < '\20';
    }

    inline constexpr bool
    is_space(char ch)
    {
        return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\v';
    }

    inline constexpr bool
    is_control(char ch)
    {
        auto c = static_cast<unsigned char>(ch);
        return c < 0x20 || c == 0x7f;
    }

    inline constexpr bool
    is_alpha(char ch)
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    }

    inline constexpr bool
    is_digit(char ch)
    {
        return (ch >= '0' && ch <= '9');
    }

    // h1 .. h6 -> 1 .. 6; anything else is level 1.
    inline int
    heading_level(std::string const& tag)
    {
        if (tag.size() == 2 && (tag[0] == 'h' || tag[0] == 'H') && tag[1] >= '1' && tag[1] <= '6') {
            return tag[1] - '0';
        }
        return 1;
    }

    // "heading_open" -> "heading", "heading_close" -> "heading", anything else unchanged.
    inline std::string
    base_type(std::string const& type)
    {
        if (type.ends_with("_open")) {
            return type.substr(0, type.size() - 5);
        }
        if (type.ends_with("_close")) {
            return type.substr(0, type.size() - 6);
        }
        return type;
    }
} // namespace tokwh::util

#endif // TOKWH_UTIL_HH
