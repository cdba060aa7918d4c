#include <tokwh/TWURL.hh>

#include <tokwh/TWConfig.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/Util.hh>

#include <limits>

using namespace tokwh;

namespace
{
    TWExc
    invalid(std::string const& raw, std::string const& msg)
    {
        // Keep the message printable even when the URL contains control characters.
        return {tokwh_e_invalid_url, "", "URL " + TWUtil::hex_encode(raw.substr(0, 64)), -1, msg};
    }

    bool
    has_control(std::string const& s)
    {
        for (auto ch: s) {
            if (util::is_control(ch)) {
                return true;
            }
        }
        return false;
    }

    bool
    is_protocol_relative(std::string const& s)
    {
        return s.size() >= 2 && (s[0] == '/' || s[0] == '\\') && (s[1] == '/' || s[1] == '\\');
    }

    // Decode %XX escapes once. Anything that is not a valid escape is kept as is.
    std::string
    percent_decode(std::string const& s)
    {
        std::string result;
        result.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size() && util::is_hex_digit(s[i + 1]) &&
                util::is_hex_digit(s[i + 2])) {
                result += static_cast<char>(
                    16 * util::hex_decode_char(s[i + 1]) + util::hex_decode_char(s[i + 2]));
                i += 2;
            } else {
                result += s[i];
            }
        }
        return result;
    }

    // RFC 3492 parameters
    unsigned long constexpr base = 36;
    unsigned long constexpr tmin = 1;
    unsigned long constexpr tmax = 26;
    unsigned long constexpr skew = 38;
    unsigned long constexpr damp = 700;
    unsigned long constexpr initial_bias = 72;
    unsigned long constexpr initial_n = 0x80;

    char
    encode_digit(unsigned long d)
    {
        return static_cast<char>(d < 26 ? 'a' + d : '0' + (d - 26));
    }

    unsigned long
    adapt(unsigned long delta, unsigned long numpoints, bool first)
    {
        delta = first ? delta / damp : delta / 2;
        delta += delta / numpoints;
        unsigned long k = 0;
        while (delta > ((base - tmin) * tmax) / 2) {
            delta /= base - tmin;
            k += base;
        }
        return k + (((base - tmin + 1) * delta) / (delta + skew));
    }
} // namespace

std::set<std::string> const&
TWURL::defaultSchemes()
{
    static std::set<std::string> const schemes{"http", "https", "mailto", "tel"};
    return schemes;
}

std::string
TWURL::punycodeEncode(std::u32string const& input)
{
    static auto constexpr max = std::numeric_limits<unsigned long>::max();

    std::string output;
    for (auto c: input) {
        if (c < initial_n) {
            output += static_cast<char>(c);
        }
    }
    unsigned long const b = output.size();
    unsigned long h = b;
    if (b > 0) {
        output += '-';
    }

    unsigned long n = initial_n;
    unsigned long delta = 0;
    unsigned long bias = initial_bias;
    while (h < input.size()) {
        // Smallest code point >= n in the input
        unsigned long m = max;
        for (auto c: input) {
            if (c >= n && c < m) {
                m = c;
            }
        }
        if ((m - n) > (max - delta) / (h + 1)) {
            throw TWExc(tokwh_e_invalid_url, "", "host", -1, "punycode overflow");
        }
        delta += (m - n) * (h + 1);
        n = m;
        for (auto c: input) {
            if (c < n) {
                ++delta;
            } else if (c == n) {
                unsigned long q = delta;
                for (unsigned long k = base;; k += base) {
                    unsigned long t = k <= bias ? tmin : (k >= bias + tmax ? tmax : k - bias);
                    if (q < t) {
                        break;
                    }
                    output += encode_digit(t + (q - t) % (base - t));
                    q = (q - t) / (base - t);
                }
                output += encode_digit(q);
                bias = adapt(delta, h + 1, h == b);
                delta = 0;
                ++h;
            }
        }
        ++delta;
        ++n;
    }
    return output;
}

std::string
TWURL::hostToASCII(std::string const& host)
{
    std::string result;
    for (auto const& label: TWUtil::split_string(TWUtil::ascii_lower(host), '.')) {
        bool ascii = true;
        for (auto ch: label) {
            if (static_cast<unsigned char>(ch) >= 0x80) {
                ascii = false;
                break;
            }
        }
        std::string converted;
        if (ascii) {
            converted = label;
        } else {
            std::u32string codepoints;
            size_t pos = 0;
            while (pos < label.size()) {
                bool error = false;
                auto cp = TWUtil::get_next_utf8_codepoint(label, pos, error);
                if (error) {
                    throw TWExc(
                        tokwh_e_invalid_url, "", "host", -1, "invalid UTF-8 in host name");
                }
                codepoints += static_cast<char32_t>(cp);
            }
            converted = "xn--" + punycodeEncode(codepoints);
        }
        result += converted;
        result += '.';
    }
    // split_string always returns at least one field; drop the separator after the last one.
    result.pop_back();
    return result;
}

TWURL::Result
TWURL::normalize(
    std::string const& raw, std::set<std::string> const& allowed_schemes, bool allow_relative)
{
    auto url = TWUtil::trim(raw);
    if (url.empty()) {
        throw invalid(raw, "empty URL");
    }
    if (has_control(url)) {
        throw invalid(raw, "control character in URL");
    }
    if (is_protocol_relative(url)) {
        throw invalid(raw, "protocol-relative URL");
    }

    // Decode exactly once. Decoding again would let "%2525..." smuggle a second level of
    // escapes past the checks below.
    url = TWUtil::trim(percent_decode(url));
    if (url.empty()) {
        throw invalid(raw, "empty URL after decoding");
    }
    if (has_control(url)) {
        throw invalid(raw, "encoded control character in URL");
    }
    if (is_protocol_relative(url)) {
        throw invalid(raw, "encoded protocol-relative URL");
    }

    Result result;

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), only if ':' comes before any of /?#
    auto delim = url.find_first_of(":/?#");
    if (delim == std::string::npos || url[delim] != ':') {
        result.normalized = url;
        result.allowed = allow_relative;
        return result;
    }
    for (size_t i = 0; i < delim; ++i) {
        char ch = url[i];
        bool ok = util::is_alpha(ch) ||
            (i > 0 && (util::is_digit(ch) || ch == '+' || ch == '-' || ch == '.'));
        if (!ok) {
            throw invalid(raw, "malformed scheme");
        }
    }
    if (delim == 0) {
        throw invalid(raw, "empty scheme");
    }
    auto scheme = TWUtil::ascii_lower(url.substr(0, delim));
    auto rest = url.substr(delim + 1);

    if (rest.starts_with("//")) {
        auto authority_end = rest.find_first_of("/?#", 2);
        auto authority = rest.substr(
            2, authority_end == std::string::npos ? std::string::npos : authority_end - 2);
        auto tail = authority_end == std::string::npos ? "" : rest.substr(authority_end);

        std::string userinfo;
        if (auto at = authority.rfind('@'); at != std::string::npos) {
            userinfo = authority.substr(0, at + 1);
            authority = authority.substr(at + 1);
        }

        std::string host;
        std::string port;
        if (authority.starts_with("[")) {
            // IP literal
            auto close = authority.find(']');
            if (close == std::string::npos) {
                throw invalid(raw, "unterminated IP literal");
            }
            host = TWUtil::ascii_lower(authority.substr(0, close + 1));
            port = authority.substr(close + 1);
            if (!(port.empty() || port.starts_with(":"))) {
                throw invalid(raw, "garbage after IP literal");
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string::npos) {
                port = authority.substr(colon);
                authority = authority.substr(0, colon);
            }
            for (auto ch: authority) {
                if (!util::is_space(ch)) {
                    host += ch;
                }
            }
            if (host.empty()) {
                throw invalid(raw, "missing host");
            }
            try {
                host = hostToASCII(host);
            } catch (TWExc&) {
                throw invalid(raw, "invalid UTF-8 in host name");
            }
        }
        for (size_t i = 1; i < port.size(); ++i) {
            if (!util::is_digit(port[i])) {
                throw invalid(raw, "invalid port");
            }
        }
        result.normalized = scheme + "://" + userinfo + host + port + tail;
    } else {
        result.normalized = scheme + ":" + rest;
    }
    result.allowed = allowed_schemes.contains(scheme);
    result.scheme = scheme;
    return result;
}

TWURL::Result
TWURL::normalize(std::string const& raw, TWConfig const& config)
{
    return normalize(raw, config.getAllowedSchemes(), config.getAllowRelativeUrls());
}

std::optional<TWURL::Result>
TWURL::tryNormalize(
    std::string const& raw, std::set<std::string> const& allowed_schemes, bool allow_relative)
{
    try {
        return normalize(raw, allowed_schemes, allow_relative);
    } catch (TWExc& e) {
        if (e.getErrorCode() != tokwh_e_invalid_url) {
            throw;
        }
        return std::nullopt;
    }
}

std::optional<TWURL::Result>
TWURL::tryNormalize(std::string const& raw, TWConfig const& config)
{
    return tryNormalize(raw, config.getAllowedSchemes(), config.getAllowRelativeUrls());
}

bool
TWURL::isAllowed(std::string const& raw, TWConfig const& config)
{
    auto result = tryNormalize(raw, config);
    return result && result->allowed;
}
