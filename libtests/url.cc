#include <tokwh/assert_test.h>

#include <tokwh/Cl_Links.hh>
#include <tokwh/TWConfig.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWURL.hh>
#include <tokwh/TokenWarehouse.hh>

#include <iostream>
#include <iterator>
#include <vector>

namespace
{
    struct Case
    {
        char const* raw;
        // null means the URL is rejected as invalid
        char const* normalized;
        char const* scheme;
        bool allowed;
    };

    Case const cases[] = {
        {"https://example.com/a", "https://example.com/a", "https", true},
        {"  HTTP://Example.COM:8080/Path?q=1#F  ",
         "http://example.com:8080/Path?q=1#F",
         "http",
         true},
        {"HTTPS:foo", "https:foo", "https", true},
        {"JaVaScRiPt:alert(1)", "javascript:alert(1)", "javascript", false},
        {"%6Aavascript:alert(1)", "javascript:alert(1)", "javascript", false},
        {"javascript%3Aalert(1)", "javascript:alert(1)", "javascript", false},
        {"vbscript:msgbox(1)", "vbscript:msgbox(1)", "vbscript", false},
        {"data:text/html;base64,PHNjcmlwdD4=",
         "data:text/html;base64,PHNjcmlwdD4=",
         "data",
         false},
        {"ftp://example.com/f", "ftp://example.com/f", "ftp", false},
        {"mailto:user@example.com", "mailto:user@example.com", "mailto", true},
        {"tel:+15551234", "tel:+15551234", "tel", true},
        {"https://\xd0\xb5xample.com/", "https://xn--xample-2of.com/", "https", true},
        {"http://b\xc3\xbc" "cher.de", "http://xn--bcher-kva.de", "http", true},
        {"https://user:pw@Example.com/", "https://user:pw@example.com/", "https", true},
        {"https://[::1]:8080/x", "https://[::1]:8080/x", "https", true},
        {"https://exa mple.com/", "https://example.com/", "https", true},
        {"/relative/path", "/relative/path", nullptr, true},
        {"#anchor", "#anchor", nullptr, true},
        {"%252F%252Fevil.com", "%2F%2Fevil.com", nullptr, true},
        {"java\tscript:alert(1)", nullptr, nullptr, false},
        {"java%09script:alert(1)", nullptr, nullptr, false},
        {"//evil.com", nullptr, nullptr, false},
        {"\\\\evil.com", nullptr, nullptr, false},
        {"/\\evil.com", nullptr, nullptr, false},
        {"%2F%2Fevil.com", nullptr, nullptr, false},
        {"", nullptr, nullptr, false},
        {"   ", nullptr, nullptr, false},
        {"https://", nullptr, nullptr, false},
        {"https://user@:80/", nullptr, nullptr, false},
        {"https://a%00b.com", nullptr, nullptr, false},
        {"https://example.com:80a/", nullptr, nullptr, false},
        {"https://[::1/", nullptr, nullptr, false},
        {"1http://x", nullptr, nullptr, false},
        {":no-scheme", nullptr, nullptr, false},
        {"https://bad\xff.com/", nullptr, nullptr, false},
        {"https://example.com/\x7f", nullptr, nullptr, false},
    };
} // namespace

static void
test_cases()
{
    for (auto const& c: cases) {
        auto r = TWURL::tryNormalize(c.raw);
        if (!c.normalized) {
            if (r) {
                std::cout << "accepted invalid URL: " << c.raw << "\n";
            }
            assert(!r);
            try {
                TWURL::normalize(c.raw);
                assert(false);
            } catch (TWExc& e) {
                assert(e.getErrorCode() == tokwh_e_invalid_url);
            }
            continue;
        }
        if (!r || r->normalized != c.normalized) {
            std::cout << "URL " << c.raw << ": got " << (r ? r->normalized : "(invalid)")
                      << "; wanted " << c.normalized << "\n";
        }
        assert(r && r->normalized == c.normalized);
        assert(r->allowed == c.allowed);
        if (c.scheme) {
            assert(r->scheme == std::string(c.scheme));
        } else {
            assert(!r->scheme);
        }
    }
}

static void
test_config()
{
    TWConfig config;
    config.setAllowedSchemes({"HTTPS"}).setAllowRelativeUrls(false);
    assert(TWURL::isAllowed("https://example.com", config));
    assert(!TWURL::isAllowed("http://example.com", config));
    assert(!TWURL::isAllowed("/local", config));
    assert(!TWURL::isAllowed("//evil.com", config));
    auto r = TWURL::normalize("/local", config);
    assert(!r.allowed && r.normalized == "/local");
    assert(TWURL::defaultSchemes().contains("mailto"));
}

static void
test_hosts()
{
    assert(TWURL::hostToASCII("Example.COM") == "example.com");
    assert(TWURL::hostToASCII("m\xc3\xbcnchen.de") == "xn--mnchen-3ya.de");
    assert(
        TWURL::hostToASCII("\xd0\xbf\xd1\x80\xd0\xb8\xd0\xbc\xd0\xb5\xd1\x80.com") ==
        "xn--e1afmkfd.com");
    assert(TWURL::punycodeEncode(U"bücher") == "bcher-kva");
    assert(TWURL::punycodeEncode(U"abc") == "abc-");
    try {
        TWURL::hostToASCII("bad\xc3.com");
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_invalid_url);
    }
}

// Every place that decides whether a URL may be followed has to agree. Run the corpus through
// the link collector and compare each item with a direct call.
static void
test_parity()
{
    TWConfig config;
    std::vector<TWTokenView> tokens;
    for (auto const& c: cases) {
        tokens.emplace_back("link_open", 1, "a", std::nullopt, std::nullopt, "", c.raw);
        tokens.emplace_back("text", 0, "", std::nullopt, std::nullopt, "t", std::nullopt);
        tokens.emplace_back("link_close", -1, "a", std::nullopt, std::nullopt, "", std::nullopt);
    }
    TokenWarehouse wh(tokens, config);
    wh.registerCollector(std::make_shared<Cl_Links>(config));
    wh.dispatchAll();
    auto results = wh.finalizeAll();
    auto items = results["links"].getDictItem("items");
    assert(items.size() == std::size(cases));

    size_t i = 0;
    items.forEachArrayItem([&i, &config](JSON item) {
        auto const& c = cases[i++];
        std::string url;
        assert(item.getDictItem("url").getString(url) && url == c.raw);
        bool allowed = false;
        assert(item.getDictItem("allowed").getBool(allowed));
        assert(allowed == TWURL::isAllowed(c.raw, config));
        assert(allowed == c.allowed);

        auto direct = TWURL::tryNormalize(c.raw, config);
        std::string normalized;
        if (direct) {
            assert(item.getDictItem("normalized").getString(normalized));
            assert(normalized == direct->normalized);
        } else {
            assert(item.getDictItem("normalized").isNull());
        }
    });
    long long count = 0;
    assert(results["links"].getDictItem("count").getInt(count));
    assert(count == static_cast<long long>(std::size(cases)));
}

int
main()
{
    test_cases();
    test_config();
    test_hosts();
    test_parity();
    std::cout << "url tests done" << std::endl;
    return 0;
}
