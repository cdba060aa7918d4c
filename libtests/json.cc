#include <tokwh/assert_test.h>

#include <tokwh/JSON.hh>
#include <tokwh/Pl_String.hh>

#include <iostream>
#include <stdexcept>

static void
check(JSON const& j, std::string const& exp)
{
    if (exp != j.unparse()) {
        std::cout << "Got " << j.unparse() << "; wanted " << exp << "\n";
    }
    assert(exp == j.unparse());
}

static void
test_build()
{
    check(JSON::makeNull(), "null");
    check(JSON(), "null");
    check(JSON::makeBool(true), "true");
    check(JSON::makeInt(-42), "-42");
    check(JSON::makeReal(1.5), "1.5");
    check(JSON::makeReal(2.0), "2.0");
    check(JSON::makeNumber("1e3"), "1e3");
    check(JSON::makeString("a\"b\\c\n\x01"), "\"a\\\"b\\\\c\\n\\u0001\"");
    check(JSON::makeString("\xc3\xa9"), "\"\xc3\xa9\"");
    check(JSON::makeDictionary(), "{}");
    check(JSON::makeArray(), "[]");

    auto d = JSON::makeDictionary();
    // Keys come out sorted no matter the insertion order.
    d.addDictionaryMember("b", JSON::makeInt(2));
    auto a = d.addDictionaryMember("a", JSON::makeArray());
    a.addArrayElement(JSON::makeString("x"));
    a.addArrayElement(JSON());
    check(d, "{\n  \"a\": [\n    \"x\",\n    null\n  ],\n  \"b\": 2\n}");
    assert(d.size() == 2);
    assert(d.hasDictItem("a"));
    assert(!d.hasDictItem("c"));
    assert(d.getDictItem("c").isNull());

    // Replacing a member
    d.addDictionaryMember("b", JSON::makeBool(false));
    bool b = true;
    assert(d.getDictItem("b").getBool(b) && !b);

    try {
        a.addDictionaryMember("k", JSON::makeNull());
        assert(false);
    } catch (std::runtime_error&) {
    }
    try {
        d.addArrayElement(JSON::makeNull());
        assert(false);
    } catch (std::runtime_error&) {
    }

    std::string out;
    Pl_String p("out", nullptr, out);
    JSON::makeArray().write(&p);
    assert(out == "[]");
}

static void
test_accessors()
{
    std::string s;
    long long i = 0;
    assert(JSON::makeString("x").getString(s) && s == "x");
    assert(!JSON::makeInt(1).getString(s));
    assert(JSON::makeInt(77).getInt(i) && i == 77);
    assert(!JSON::makeReal(7.5).getInt(i));
    assert(!JSON::makeNumber("99999999999999999999").getInt(i));
    assert(JSON::makeNumber("3.25").getNumber(s) && s == "3.25");

    auto arr = JSON::parse("[1, 2, 3]");
    long long sum = 0;
    assert(arr.forEachArrayItem([&sum](JSON v) {
        long long n = 0;
        assert(v.getInt(n));
        sum += n;
    }));
    assert(sum == 6);
    assert(!arr.forEachDictItem([](std::string const&, JSON) { assert(false); }));
}

static void
test_parse()
{
    auto j = JSON::parse(R"( {"tokens": [{"type": "text", "map": [0, 1], "x": true,
                                          "y": null, "s": "a\u00e9\ud83d\ude00\n"}]} )");
    assert(j.isDictionary());
    auto tokens = j.getDictItem("tokens");
    assert(tokens.isArray() && tokens.size() == 1);
    std::string s;
    tokens.forEachArrayItem([&s](JSON t) {
        assert(t.getDictItem("s").getString(s));
        assert(t.getDictItem("y").isNull());
        assert(t.hasDictItem("y"));
    });
    assert(s == "a\xc3\xa9\xf0\x9f\x98\x80\n");

    // Round trip through the serializer
    auto again = JSON::parse(j.unparse());
    assert(again.unparse() == j.unparse());

    for (auto bad:
         {"",
          "[",
          "{\"a\" 1}",
          "[1,]",
          "{\"a\": 1,}",
          "tru",
          "\"unterminated",
          "\"\\ud800\"",
          "\"\\ud800x\"",
          "[1] 2",
          "01",
          "\"\x01\""}) {
        try {
            JSON::parse(bad);
            std::cout << "parsed bad input: " << bad << "\n";
            assert(false);
        } catch (std::runtime_error& e) {
            std::cout << "expected error: " << e.what() << "\n";
        }
    }

    // The depth limit protects the parser.
    std::string deep(499, '[');
    deep += std::string(499, ']');
    JSON::parse(deep);
    std::string too_deep(501, '[');
    too_deep += std::string(501, ']');
    try {
        JSON::parse(too_deep);
        assert(false);
    } catch (std::runtime_error&) {
    }
}

int
main()
{
    test_build();
    test_accessors();
    test_parse();
    std::cout << "end of json tests\n";
    return 0;
}
