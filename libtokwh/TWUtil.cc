#include <tokwh/TWUtil.hh>

#include <tokwh/Util.hh>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>

#ifdef __GNUG__
# include <cxxabi.h>
#endif

using namespace tokwh;

namespace
{
    class FileCloser
    {
      public:
        FileCloser(FILE* f) :
            f(f)
        {
        }
        ~FileCloser()
        {
            if (f) {
                fclose(f);
            }
        }

      private:
        FILE* f;
    };

    // Everything after the digits must be whitespace.
    void
    check_trailing(char const* str, char const* end, char const* what)
    {
        if (end == str) {
            throw std::runtime_error(std::string("no digits in ") + what + " \"" + str + "\"");
        }
        while (*end) {
            if (!util::is_space(*end)) {
                throw std::runtime_error(
                    std::string("trailing garbage in ") + what + " \"" + str + "\"");
            }
            ++end;
        }
    }
} // namespace

long long
TWUtil::string_to_ll(char const* str)
{
    errno = 0;
    char* end = nullptr;
#ifdef _MSC_VER
    long long result = _strtoi64(str, &end, 10);
#else
    long long result = strtoll(str, &end, 10);
#endif
    if (errno == ERANGE) {
        throw std::range_error(
            std::string("overflow/underflow converting ") + str + " to 64-bit integer");
    }
    check_trailing(str, end, "integer");
    return result;
}

unsigned long long
TWUtil::string_to_ull(char const* str)
{
    char const* p = str;
    while (*p && util::is_space(*p)) {
        ++p;
    }
    if (*p == '-') {
        throw std::runtime_error(
            std::string("underflow converting ") + str + " to 64-bit unsigned integer");
    }

    errno = 0;
    char* end = nullptr;
#ifdef _MSC_VER
    unsigned long long result = _strtoui64(str, &end, 10);
#else
    unsigned long long result = strtoull(str, &end, 10);
#endif
    if (errno == ERANGE) {
        throw std::range_error(
            std::string("overflow converting ") + str + " to 64-bit unsigned integer");
    }
    check_trailing(str, end, "unsigned integer");
    return result;
}

bool
TWUtil::string_to_bool(char const* str)
{
    auto v = ascii_lower(trim(str));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw std::runtime_error(std::string("invalid boolean value \"") + str + "\"");
}

std::string
TWUtil::hex_encode(std::string const& input)
{
    static auto constexpr hexchars = "0123456789abcdef";
    std::string result;
    result.reserve(2 * input.length());
    for (const char c: input) {
        result += hexchars[static_cast<unsigned char>(c) >> 4];
        result += hexchars[c & 0x0f];
    }
    return result;
}

std::string
TWUtil::ascii_lower(std::string const& str)
{
    std::string result = str;
    for (auto& ch: result) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    return result;
}

std::string
TWUtil::trim(std::string const& str)
{
    size_t first = 0;
    size_t last = str.size();
    while (first < last && util::is_space(str.at(first))) {
        ++first;
    }
    while (last > first && util::is_space(str.at(last - 1))) {
        --last;
    }
    return str.substr(first, last - first);
}

std::vector<std::string>
TWUtil::split_string(std::string const& str, char sep, bool skip_empty)
{
    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        auto pos = str.find(sep, start);
        auto field = str.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (!(skip_empty && field.empty())) {
            result.push_back(field);
        }
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return result;
}

char*
TWUtil::getWhoami(char* argv0)
{
    char* whoami = nullptr;
    if (((whoami = strrchr(argv0, '/')) == nullptr) &&
        ((whoami = strrchr(argv0, '\\')) == nullptr)) {
        whoami = argv0;
    } else {
        ++whoami;
    }

    if ((strlen(whoami) > 4) && (strcmp(whoami + strlen(whoami) - 4, ".exe") == 0)) {
        whoami[strlen(whoami) - 4] = '\0';
    }

    return whoami;
}

bool
TWUtil::get_env(std::string const& var, std::string* value)
{
    char const* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }
    return true;
}

FILE*
TWUtil::safe_fopen(char const* filename, char const* mode)
{
    FILE* f = fopen(filename, mode);
    if (f == nullptr) {
        throw std::runtime_error(
            std::string("open ") + filename + ": " + strerror(errno));
    }
    return f;
}

std::string
TWUtil::read_file_into_string(char const* filename)
{
    FILE* f = safe_fopen(filename, "rb");
    FileCloser fc(f);
    return read_file_into_string(f, filename);
}

std::string
TWUtil::read_file_into_string(FILE* f, std::string const& filename)
{
    // Read in chunks so that pipes and other non-seekable files work.
    size_t const buf_size = 8192;
    std::string buffer(buf_size, '\0');
    std::string result;
    size_t n_read = buf_size;
    while (n_read == buf_size) {
        n_read = fread(buffer.data(), 1, buf_size, f);
        result.append(buffer, 0, n_read);
    }
    if (ferror(f)) {
        throw std::runtime_error("failure reading file " + filename + " into memory");
    }
    return result;
}

std::string
TWUtil::toUTF8(unsigned long uval)
{
    // A code point below 128 is a single byte. Otherwise the first byte has n high bits set
    // followed by a zero bit, where n is the number of bytes, and each continuation byte is
    // 10xxxxxx.
    std::string result;
    if (uval > 0x10ffff) {
        throw std::runtime_error("bounds error in TWUtil::toUTF8");
    } else if (uval < 0x80) {
        result += static_cast<char>(uval);
    } else if (uval < 0x800) {
        result += static_cast<char>(0xc0 | (uval >> 6));
        result += static_cast<char>(0x80 | (uval & 0x3f));
    } else if (uval < 0x10000) {
        result += static_cast<char>(0xe0 | (uval >> 12));
        result += static_cast<char>(0x80 | ((uval >> 6) & 0x3f));
        result += static_cast<char>(0x80 | (uval & 0x3f));
    } else {
        result += static_cast<char>(0xf0 | (uval >> 18));
        result += static_cast<char>(0x80 | ((uval >> 12) & 0x3f));
        result += static_cast<char>(0x80 | ((uval >> 6) & 0x3f));
        result += static_cast<char>(0x80 | (uval & 0x3f));
    }
    return result;
}

unsigned long
TWUtil::get_next_utf8_codepoint(std::string const& utf8_val, size_t& pos, bool& error)
{
    auto o_pos = pos;
    size_t len = utf8_val.length();
    auto ch = static_cast<unsigned char>(utf8_val.at(pos++));
    error = false;
    if (ch < 128) {
        return static_cast<unsigned long>(ch);
    }

    size_t bytes_needed = 0;
    unsigned bit_check = 0x40;
    unsigned char to_clear = 0x80;
    while (ch & bit_check) {
        ++bytes_needed;
        to_clear = static_cast<unsigned char>(to_clear | bit_check);
        bit_check >>= 1;
    }
    if (bytes_needed < 1 || bytes_needed > 3 || (pos + bytes_needed) > len) {
        error = true;
        return 0xfffd;
    }

    auto codepoint = static_cast<unsigned long>(ch & ~to_clear);
    while (bytes_needed > 0) {
        --bytes_needed;
        ch = static_cast<unsigned char>(utf8_val.at(pos++));
        if ((ch & 0xc0) != 0x80) {
            --pos;
            error = true;
            return 0xfffd;
        }
        codepoint <<= 6;
        codepoint += (ch & 0x3f);
    }

    // Reject overlong encodings, surrogates and values above U+10FFFF.
    unsigned long lower_bound = 0;
    switch (pos - o_pos) {
    case 2:
        lower_bound = 1 << 7;
        break;
    case 3:
        lower_bound = 1 << 11;
        break;
    default:
        lower_bound = 1 << 16;
        break;
    }
    if (codepoint < lower_bound || codepoint > 0x10ffff ||
        (codepoint >= 0xd800 && codepoint <= 0xdfff)) {
        error = true;
        return 0xfffd;
    }
    return codepoint;
}

std::string
TWUtil::type_name(std::type_info const& ti)
{
#ifdef __GNUG__
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(ti.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return ti.name();
}
