#include <tokwh/JSON.hh>

#include <tokwh/Pl_String.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/Util.hh>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <locale>
#include <sstream>
#include <stdexcept>

using namespace tokwh;

enum value_type_e {
    vt_dictionary,
    vt_array,
    vt_string,
    vt_number,
    vt_bool,
    vt_null,
};

struct JSON::JSON_value
{
    JSON_value(value_type_e type_code) :
        type_code(type_code)
    {
    }
    virtual ~JSON_value() = default;
    virtual void write(Pipeline*, size_t depth) const = 0;
    value_type_e const type_code;
};

struct JSON::JSON_dictionary: public JSON::JSON_value
{
    JSON_dictionary() :
        JSON_value(vt_dictionary)
    {
    }
    void write(Pipeline*, size_t depth) const override;
    std::map<std::string, JSON> members;
};

struct JSON::JSON_array: public JSON::JSON_value
{
    JSON_array() :
        JSON_value(vt_array)
    {
    }
    void write(Pipeline*, size_t depth) const override;
    std::vector<JSON> elements;
};

struct JSON::JSON_string: public JSON::JSON_value
{
    JSON_string(std::string const& utf8) :
        JSON_value(vt_string),
        utf8(utf8)
    {
    }
    void write(Pipeline*, size_t depth) const override;
    std::string utf8;
};

struct JSON::JSON_number: public JSON::JSON_value
{
    JSON_number(std::string const& encoded) :
        JSON_value(vt_number),
        encoded(encoded)
    {
    }
    void write(Pipeline*, size_t depth) const override;
    std::string encoded;
};

struct JSON::JSON_bool: public JSON::JSON_value
{
    JSON_bool(bool value) :
        JSON_value(vt_bool),
        value(value)
    {
    }
    void write(Pipeline*, size_t depth) const override;
    bool value;
};

struct JSON::JSON_null: public JSON::JSON_value
{
    JSON_null() :
        JSON_value(vt_null)
    {
    }
    void write(Pipeline*, size_t depth) const override;
};

JSON::Members::Members(std::unique_ptr<JSON_value> value) :
    value(std::move(value))
{
}

JSON::Members::~Members() = default;

JSON::JSON(std::unique_ptr<JSON_value> value) :
    m(new Members(std::move(value)))
{
}

void
JSON::writeClose(Pipeline* p, bool first, size_t depth, char const* delimiter)
{
    if (first) {
        *p << delimiter;
    } else {
        std::string s{"\n"};
        s.append(2 * depth, ' ');
        *p << s + delimiter;
    }
}

void
JSON::writeNext(Pipeline* p, bool& first, size_t depth)
{
    std::string s{first ? "\n" : ",\n"};
    first = false;
    s.append(2 * depth, ' ');
    *p << s;
}

void
JSON::JSON_dictionary::write(Pipeline* p, size_t depth) const
{
    bool first = true;
    *p << "{";
    for (auto const& [key, value]: members) {
        writeNext(p, first, depth + 1);
        *p << "\"" + encode_string(key) + "\": ";
        value.write(p, depth + 1);
    }
    writeClose(p, first, depth, "}");
}

void
JSON::JSON_array::write(Pipeline* p, size_t depth) const
{
    bool first = true;
    *p << "[";
    for (auto const& element: elements) {
        writeNext(p, first, depth + 1);
        element.write(p, depth + 1);
    }
    writeClose(p, first, depth, "]");
}

void
JSON::JSON_string::write(Pipeline* p, size_t) const
{
    *p << "\"" + encode_string(utf8) + "\"";
}

void
JSON::JSON_number::write(Pipeline* p, size_t) const
{
    *p << encoded;
}

void
JSON::JSON_bool::write(Pipeline* p, size_t) const
{
    *p << (value ? "true" : "false");
}

void
JSON::JSON_null::write(Pipeline* p, size_t) const
{
    *p << "null";
}

void
JSON::write(Pipeline* p, size_t depth) const
{
    if (!m) {
        *p << "null";
    } else {
        m->value->write(p, depth);
    }
}

std::string
JSON::unparse() const
{
    std::string s;
    Pl_String p("unparse", nullptr, s);
    write(&p, 0);
    return s;
}

std::string
JSON::encode_string(std::string const& str)
{
    static auto constexpr hexchars = "0123456789abcdef";

    auto needs_escape = [](unsigned char ch) { return ch < 0x20 || ch == '\\' || ch == '"'; };

    size_t first_escape = 0;
    while (first_escape < str.size() &&
           !needs_escape(static_cast<unsigned char>(str[first_escape]))) {
        ++first_escape;
    }
    if (first_escape == str.size()) {
        return str;
    }

    std::string result = str.substr(0, first_escape);
    for (size_t i = first_escape; i < str.size(); ++i) {
        auto ch = static_cast<unsigned char>(str[i]);
        if (!needs_escape(ch)) {
            result += str[i];
            continue;
        }
        switch (ch) {
        case '\\':
            result += "\\\\";
            break;
        case '\"':
            result += "\\\"";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            result += ch < 16 ? "\\u000" : "\\u001";
            result += hexchars[ch % 16];
        }
    }
    return result;
}

JSON
JSON::makeDictionary()
{
    return {std::make_unique<JSON_dictionary>()};
}

JSON
JSON::addDictionaryMember(std::string const& key, JSON const& val)
{
    if (auto* obj = m ? dynamic_cast<JSON_dictionary*>(m->value.get()) : nullptr) {
        return obj->members[key] = val.m ? val : makeNull();
    }
    throw std::runtime_error("JSON::addDictionaryMember called on non-dictionary");
}

JSON
JSON::makeArray()
{
    return {std::make_unique<JSON_array>()};
}

JSON
JSON::addArrayElement(JSON const& val)
{
    if (auto* arr = m ? dynamic_cast<JSON_array*>(m->value.get()) : nullptr) {
        arr->elements.push_back(val.m ? val : makeNull());
        return arr->elements.back();
    }
    throw std::runtime_error("JSON::addArrayElement called on non-array");
}

JSON
JSON::makeString(std::string const& utf8)
{
    return {std::make_unique<JSON_string>(utf8)};
}

JSON
JSON::makeInt(long long int value)
{
    return {std::make_unique<JSON_number>(std::to_string(value))};
}

JSON
JSON::makeReal(double value)
{
    std::ostringstream buf;
    buf.imbue(std::locale::classic());
    buf.precision(6);
    buf << std::fixed << value;
    auto s = buf.str();
    // Trim trailing zeroes but keep one digit after the point.
    auto last = s.find_last_not_of('0');
    if (last != std::string::npos && s.at(last) == '.') {
        ++last;
    }
    s.erase(last + 1);
    return {std::make_unique<JSON_number>(s)};
}

JSON
JSON::makeNumber(std::string const& encoded)
{
    return {std::make_unique<JSON_number>(encoded)};
}

JSON
JSON::makeBool(bool value)
{
    return {std::make_unique<JSON_bool>(value)};
}

JSON
JSON::makeNull()
{
    return {std::make_unique<JSON_null>()};
}

bool
JSON::isArray() const
{
    return m && m->value->type_code == vt_array;
}

bool
JSON::isDictionary() const
{
    return m && m->value->type_code == vt_dictionary;
}

bool
JSON::isNull() const
{
    return !m || m->value->type_code == vt_null;
}

bool
JSON::getString(std::string& utf8) const
{
    if (m && m->value->type_code == vt_string) {
        utf8 = dynamic_cast<JSON_string const*>(m->value.get())->utf8;
        return true;
    }
    return false;
}

bool
JSON::getNumber(std::string& value) const
{
    if (m && m->value->type_code == vt_number) {
        value = dynamic_cast<JSON_number const*>(m->value.get())->encoded;
        return true;
    }
    return false;
}

bool
JSON::getInt(long long& value) const
{
    std::string encoded;
    if (!getNumber(encoded) || encoded.find_first_of(".eE") != std::string::npos) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    auto result = strtoll(encoded.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    value = result;
    return true;
}

bool
JSON::getBool(bool& value) const
{
    if (m && m->value->type_code == vt_bool) {
        value = dynamic_cast<JSON_bool const*>(m->value.get())->value;
        return true;
    }
    return false;
}

JSON
JSON::getDictItem(std::string const& key) const
{
    if (auto v = m ? dynamic_cast<JSON_dictionary const*>(m->value.get()) : nullptr) {
        if (auto it = v->members.find(key); it != v->members.end()) {
            return it->second;
        }
    }
    return makeNull();
}

bool
JSON::hasDictItem(std::string const& key) const
{
    if (auto v = m ? dynamic_cast<JSON_dictionary const*>(m->value.get()) : nullptr) {
        return v->members.contains(key);
    }
    return false;
}

size_t
JSON::size() const
{
    if (auto v = m ? dynamic_cast<JSON_dictionary const*>(m->value.get()) : nullptr) {
        return v->members.size();
    }
    if (auto v = m ? dynamic_cast<JSON_array const*>(m->value.get()) : nullptr) {
        return v->elements.size();
    }
    return 0;
}

bool
JSON::forEachDictItem(std::function<void(std::string const& key, JSON value)> fn) const
{
    if (auto v = m ? dynamic_cast<JSON_dictionary const*>(m->value.get()) : nullptr) {
        for (auto const& [key, value]: v->members) {
            fn(key, value);
        }
        return true;
    }
    return false;
}

bool
JSON::forEachArrayItem(std::function<void(JSON value)> fn) const
{
    if (auto v = m ? dynamic_cast<JSON_array const*>(m->value.get()) : nullptr) {
        for (auto const& i: v->elements) {
            fn(i);
        }
        return true;
    }
    return false;
}

namespace
{
    // Parser with an explicit stack of open containers so that deeply nested input cannot
    // overflow the call stack.
    class JSONParser
    {
      public:
        JSONParser(std::string const& input) :
            input(input)
        {
        }

        JSON parse();

      private:
        enum parser_state_e {
            ps_top,
            ps_dict_begin,
            ps_dict_after_key,
            ps_dict_after_colon,
            ps_dict_after_item,
            ps_dict_after_comma,
            ps_array_begin,
            ps_array_after_item,
            ps_array_after_comma,
            ps_done,
        };

        struct StackFrame
        {
            StackFrame(parser_state_e state, JSON item) :
                state(state),
                item(item)
            {
            }

            parser_state_e state;
            JSON item;
        };

        [[noreturn]] void error(std::string const& msg) const;
        void skipSpace();
        std::string readString();
        std::string readNumber();
        std::string readKeyword();
        void addItem(JSON const& item);
        void closeContainer(bool dictionary);

        static size_t constexpr max_depth = 500;

        std::string const& input;
        size_t offset{0};
        parser_state_e parser_state{ps_top};
        std::vector<StackFrame> stack;
        std::string dict_key;
        JSON result;
    };
} // namespace

void
JSONParser::error(std::string const& msg) const
{
    throw std::runtime_error("JSON: offset " + std::to_string(offset) + ": " + msg);
}

void
JSONParser::skipSpace()
{
    while (offset < input.size()) {
        char ch = input[offset];
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
            ++offset;
        } else {
            break;
        }
    }
}

std::string
JSONParser::readString()
{
    // offset is at the opening quote
    ++offset;
    std::string token;
    unsigned long high_surrogate = 0;
    while (true) {
        if (offset >= input.size()) {
            throw std::runtime_error("JSON: premature end of input");
        }
        auto ch = input[offset];
        if (static_cast<unsigned char>(ch) < 0x20) {
            error("control character in string (missing \"?)");
        }
        if (ch == '"') {
            if (high_surrogate) {
                error("UTF-16 high surrogate not followed by low surrogate");
            }
            ++offset;
            return token;
        }
        if (ch != '\\') {
            if (high_surrogate) {
                error("UTF-16 high surrogate not followed by low surrogate");
            }
            token += ch;
            ++offset;
            continue;
        }
        if (++offset >= input.size()) {
            throw std::runtime_error("JSON: premature end of input");
        }
        ch = input[offset];
        if (high_surrogate && ch != 'u') {
            error("UTF-16 high surrogate not followed by low surrogate");
        }
        switch (ch) {
        case '\\':
        case '"':
        case '/':
            token += ch;
            break;
        case 'b':
            token += '\b';
            break;
        case 'f':
            token += '\f';
            break;
        case 'n':
            token += '\n';
            break;
        case 'r':
            token += '\r';
            break;
        case 't':
            token += '\t';
            break;
        case 'u':
            {
                if (offset + 4 >= input.size()) {
                    error("\\u must be followed by four hex digits");
                }
                unsigned long codepoint = 0;
                for (size_t i = 1; i <= 4; ++i) {
                    char digit = input[offset + i];
                    if (!util::is_hex_digit(digit)) {
                        error("\\u must be followed by four hex digits");
                    }
                    codepoint =
                        16 * codepoint + static_cast<unsigned long>(util::hex_decode_char(digit));
                }
                offset += 4;
                if ((codepoint & 0xFC00) == 0xD800) {
                    if (high_surrogate) {
                        error("UTF-16 high surrogate found after previous high surrogate");
                    }
                    high_surrogate = codepoint;
                } else if ((codepoint & 0xFC00) == 0xDC00) {
                    if (!high_surrogate) {
                        error("UTF-16 low surrogate found not immediately after high surrogate");
                    }
                    codepoint = 0x10000U + ((high_surrogate & 0x3FFU) << 10U) + (codepoint & 0x3FF);
                    high_surrogate = 0;
                    token += TWUtil::toUTF8(codepoint);
                } else {
                    if (high_surrogate) {
                        error("UTF-16 high surrogate not followed by low surrogate");
                    }
                    token += TWUtil::toUTF8(codepoint);
                }
            }
            break;
        default:
            error("invalid character after backslash: " + std::string(1, ch));
        }
        ++offset;
    }
}

std::string
JSONParser::readNumber()
{
    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    auto start = offset;
    auto digits = [this]() {
        size_t n = 0;
        while (offset < input.size() && util::is_digit(input[offset])) {
            ++offset;
            ++n;
        }
        return n;
    };
    if (input[offset] == '-') {
        ++offset;
    }
    if (offset < input.size() && input[offset] == '0') {
        ++offset;
        if (offset < input.size() && util::is_digit(input[offset])) {
            error("number with leading zero");
        }
    } else if (digits() == 0) {
        error("numeric literal: no digit after minus sign");
    }
    if (offset < input.size() && input[offset] == '.') {
        ++offset;
        if (digits() == 0) {
            error("numeric literal: no digit after decimal point");
        }
    }
    if (offset < input.size() && (input[offset] == 'e' || input[offset] == 'E')) {
        ++offset;
        if (offset < input.size() && (input[offset] == '+' || input[offset] == '-')) {
            ++offset;
        }
        if (digits() == 0) {
            error("numeric literal: incomplete exponent");
        }
    }
    if (offset < input.size() && !strchr(" \t\r\n,]}", input[offset])) {
        error("numeric literal: unexpected character " + std::string(1, input[offset]));
    }
    return input.substr(start, offset - start);
}

std::string
JSONParser::readKeyword()
{
    auto start = offset;
    while (offset < input.size() && input[offset] >= 'a' && input[offset] <= 'z') {
        ++offset;
    }
    return input.substr(start, offset - start);
}

void
JSONParser::addItem(JSON const& item)
{
    switch (parser_state) {
    case ps_top:
        result = item;
        parser_state = ps_done;
        break;

    case ps_dict_after_colon:
        stack.back().item.addDictionaryMember(dict_key, item);
        parser_state = ps_dict_after_item;
        break;

    case ps_array_begin:
    case ps_array_after_comma:
        stack.back().item.addArrayElement(item);
        parser_state = ps_array_after_item;
        break;

    case ps_dict_begin:
    case ps_dict_after_comma:
        error("expect string as dictionary key");

    case ps_dict_after_key:
        error("expected ':'");

    case ps_dict_after_item:
        error("expected ',' or '}'");

    case ps_array_after_item:
        error("expected ',' or ']'");

    case ps_done:
        error("material follows end of object");
    }

    if (item.isDictionary() || item.isArray()) {
        stack.emplace_back(parser_state, item);
        if (stack.size() > max_depth) {
            error("maximum object depth exceeded");
        }
        parser_state = item.isDictionary() ? ps_dict_begin : ps_array_begin;
    }
}

void
JSONParser::closeContainer(bool dictionary)
{
    if (dictionary) {
        if (!(parser_state == ps_dict_begin || parser_state == ps_dict_after_item)) {
            error("unexpected dictionary end delimiter");
        }
    } else if (!(parser_state == ps_array_begin || parser_state == ps_array_after_item)) {
        error("unexpected array end delimiter");
    }
    ++offset;
    parser_state = stack.back().state;
    stack.pop_back();
}

JSON
JSONParser::parse()
{
    while (true) {
        skipSpace();
        if (offset >= input.size()) {
            break;
        }
        char ch = input[offset];
        if (parser_state == ps_done) {
            error("material follows end of object");
        }
        switch (ch) {
        case '{':
            ++offset;
            addItem(JSON::makeDictionary());
            break;

        case '[':
            ++offset;
            addItem(JSON::makeArray());
            break;

        case '}':
            closeContainer(true);
            break;

        case ']':
            closeContainer(false);
            break;

        case ':':
            if (parser_state != ps_dict_after_key) {
                error("unexpected colon");
            }
            ++offset;
            parser_state = ps_dict_after_colon;
            break;

        case ',':
            if (parser_state == ps_dict_after_item) {
                parser_state = ps_dict_after_comma;
            } else if (parser_state == ps_array_after_item) {
                parser_state = ps_array_after_comma;
            } else {
                error("unexpected comma");
            }
            ++offset;
            break;

        case '"':
            if (parser_state == ps_dict_begin || parser_state == ps_dict_after_comma) {
                dict_key = readString();
                parser_state = ps_dict_after_key;
            } else {
                addItem(JSON::makeString(readString()));
            }
            break;

        default:
            if (ch == '-' || util::is_digit(ch)) {
                addItem(JSON::makeNumber(readNumber()));
            } else if (ch >= 'a' && ch <= 'z') {
                auto keyword = readKeyword();
                if (keyword == "true") {
                    addItem(JSON::makeBool(true));
                } else if (keyword == "false") {
                    addItem(JSON::makeBool(false));
                } else if (keyword == "null") {
                    addItem(JSON::makeNull());
                } else {
                    error("invalid keyword " + keyword);
                }
            } else if (static_cast<unsigned char>(ch) < 0x20) {
                error("control or null character");
            } else {
                error("unexpected character " + std::string(1, ch));
            }
        }
    }
    if (parser_state != ps_done) {
        throw std::runtime_error("JSON: premature end of input");
    }
    return result;
}

JSON
JSON::parse(std::string const& s)
{
    JSONParser jp(s);
    return jp.parse();
}
