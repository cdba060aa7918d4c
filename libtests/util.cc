#include <tokwh/assert_test.h>

#include <tokwh/TWUtil.hh>
#include <tokwh/Util.hh>

#include <cstring>
#include <iostream>
#include <stdexcept>

using namespace tokwh;

static void
test_numbers()
{
    assert(TWUtil::string_to_ll("123") == 123);
    assert(TWUtil::string_to_ll(" -5 ") == -5);
    assert(TWUtil::string_to_ull("18446744073709551615") == 18446744073709551615ULL);
    for (auto bad: {"", "12x", "x", "1 2"}) {
        try {
            TWUtil::string_to_ll(bad);
            assert(false);
        } catch (std::runtime_error&) {
        }
    }
    try {
        TWUtil::string_to_ll("99999999999999999999");
        assert(false);
    } catch (std::range_error&) {
    }
    try {
        TWUtil::string_to_ull("-1");
        assert(false);
    } catch (std::runtime_error&) {
    }

    assert(TWUtil::string_to_bool("TRUE"));
    assert(TWUtil::string_to_bool(" yes"));
    assert(TWUtil::string_to_bool("1"));
    assert(!TWUtil::string_to_bool("off"));
    assert(!TWUtil::string_to_bool("No"));
    try {
        TWUtil::string_to_bool("maybe");
        assert(false);
    } catch (std::runtime_error&) {
    }
}

static void
test_strings()
{
    assert(TWUtil::hex_encode(std::string("\x00\x7f\xff", 3)) == "007fff");
    assert(TWUtil::ascii_lower("HeLLo \xc3\x84") == "hello \xc3\x84");
    assert(TWUtil::trim("\t a b \r\n") == "a b");
    assert(TWUtil::trim("   ").empty());

    auto parts = TWUtil::split_string("a,,b,", ',');
    assert((parts == std::vector<std::string>{"a", "", "b", ""}));
    parts = TWUtil::split_string("a,,b,", ',', true);
    assert((parts == std::vector<std::string>{"a", "b"}));
    assert(TWUtil::split_string("", ',').size() == 1);

    char argv0[] = "/usr/local/bin/tokwh.exe";
    assert(strcmp(TWUtil::getWhoami(argv0), "tokwh") == 0);

    assert(util::base_type("heading_open") == "heading");
    assert(util::base_type("table_close") == "table");
    assert(util::base_type("fence") == "fence");
    assert(util::heading_level("h3") == 3);
    assert(util::heading_level("h7") == 1);
    assert(util::heading_level("p") == 1);
}

static void
test_utf8()
{
    assert(TWUtil::toUTF8(0x41) == "A");
    assert(TWUtil::toUTF8(0xe9) == "\xc3\xa9");
    assert(TWUtil::toUTF8(0x20ac) == "\xe2\x82\xac");
    assert(TWUtil::toUTF8(0x1f600) == "\xf0\x9f\x98\x80");
    try {
        TWUtil::toUTF8(0x110000);
        assert(false);
    } catch (std::runtime_error&) {
    }

    auto decode = [](std::string const& s) {
        std::vector<unsigned long> result;
        size_t pos = 0;
        bool error = false;
        while (pos < s.size()) {
            result.push_back(TWUtil::get_next_utf8_codepoint(s, pos, error));
            if (error) {
                result.push_back(0);
            }
        }
        return result;
    };
    assert((decode("a\xc3\xa9\xe2\x82\xac") == std::vector<unsigned long>{0x61, 0xe9, 0x20ac}));
    // overlong
    assert((decode("\xc0\xaf") == std::vector<unsigned long>{0xfffd, 0}));
    // surrogate
    assert((decode("\xed\xa0\x80") == std::vector<unsigned long>{0xfffd, 0}));
    // truncated sequence; each byte is reported separately
    assert((decode("\xe2\x82") == std::vector<unsigned long>{0xfffd, 0, 0xfffd, 0}));
}

static void
test_type_name()
{
    std::runtime_error e("x");
    std::exception& base = e;
#ifdef __GNUG__
    assert(TWUtil::type_name(typeid(base)) == "std::runtime_error");
#else
    assert(!TWUtil::type_name(typeid(base)).empty());
#endif
}

int
main()
{
    test_numbers();
    test_strings();
    test_utf8();
    test_type_name();
    std::cout << "util tests done\n";
    return 0;
}
