#include <tokwh/assert_test.h>

#include <tokwh/TWConfig.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/global.hh>

#include <cstdlib>
#include <iostream>

static void
expect_config_error(std::string const& name, std::string const& value)
{
    TWConfig c;
    try {
        c.applySetting(name, value);
        std::cout << name << "=" << value << " was accepted\n";
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_config);
        assert(e.getObject() == name);
        std::cout << "expected: " << e.what() << "\n";
    }
}

static void
test_defaults()
{
    TWConfig c;
    assert(c.getMaxTokens() == 500'000);
    assert(c.getMaxBytes() == 10ULL * 1024 * 1024);
    assert(c.getMaxNesting() == 1'000);
    assert(c.getMaxItems("links") == 10'000);
    assert(c.getMaxItems("images") == 5'000);
    assert(c.getMaxItems("lists") == 50'000);
    assert(c.getMaxItems("no-such-collector") == c.getDefaultMaxItems());
    assert(c.getAllowedSchemes() == std::set<std::string>({"http", "https", "mailto", "tel"}));
    assert(c.getAllowRelativeUrls());
    assert(c.getCollectorTimeoutMillis() == 5'000);
    assert(!c.getAllowRawHtml());
    assert(!c.getStrict());
    assert(c.getMaxWarnings() == 100);

    // Global defaults only affect configurations created afterwards.
    tokwh::global::limits::max_tokens(42);
    TWConfig c2;
    assert(c2.getMaxTokens() == 42);
    assert(c.getMaxTokens() == 500'000);
    tokwh::global::limits::max_tokens(500'000);
}

static void
test_settings()
{
    TWConfig c;
    c.applySetting("TOKWH_MAX_TOKENS", "10")
        .applySetting("TOKWH_MAX_BYTES", " 2048 ")
        .applySetting("TOKWH_MAX_NESTING", "7")
        .applySetting("TOKWH_ALLOWED_SCHEMES", "HTTPS, ftp,,")
        .applySetting("TOKWH_ALLOW_RELATIVE_URLS", "no")
        .applySetting("TOKWH_COLLECTOR_TIMEOUT_SECONDS", "2")
        .applySetting("TOKWH_ALLOW_RAW_HTML", "yes")
        .applySetting("TOKWH_STRICT", "1")
        .applySetting("TOKWH_MAX_WARNINGS", "0");
    assert(c.getMaxTokens() == 10);
    assert(c.getMaxBytes() == 2048);
    assert(c.getMaxNesting() == 7);
    assert(c.getAllowedSchemes() == std::set<std::string>({"https", "ftp"}));
    assert(!c.getAllowRelativeUrls());
    assert(c.getCollectorTimeoutMillis() == 2'000);
    assert(c.getAllowRawHtml());
    assert(c.getStrict());
    assert(c.getMaxWarnings() == 0);

    c.applySetting("TOKWH_MAX_ITEMS_PER_TYPE", "25");
    assert(c.getDefaultMaxItems() == 25);
    assert(c.getMaxItems("math") == 25);
    assert(c.getMaxItems("links") == 10'000);
    c.applySetting("TOKWH_MAX_ITEMS_PER_TYPE", "links=3, default=4,math = 0");
    assert(c.getMaxItems("links") == 3);
    assert(c.getMaxItems("tasklists") == 4);
    assert(c.getMaxItems("math") == 0);

    expect_config_error("TOKWH_MAX_TOKENS", "lots");
    expect_config_error("TOKWH_MAX_TOKENS", "-1");
    expect_config_error("TOKWH_STRICT", "maybe");
    expect_config_error("TOKWH_MAX_ITEMS_PER_TYPE", "links=3,images");
    expect_config_error("TOKWH_MAX_ITEMS_PER_TYPE", "=3");
    expect_config_error("TOKWH_COLLECTOR_TIMEOUT_SECONDS", "5000000");
    expect_config_error("TOKWH_NO_SUCH_SETTING", "1");
}

static void
test_environment()
{
    setenv("TOKWH_MAX_NESTING", "12", 1);
    setenv("TOKWH_ALLOWED_SCHEMES", "https", 1);
    auto c = TWConfig::fromEnvironment();
    assert(c.getMaxNesting() == 12);
    assert(c.getAllowedSchemes() == std::set<std::string>({"https"}));

    setenv("TOKWH_STRICT", "sometimes", 1);
    try {
        TWConfig::fromEnvironment();
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_config);
    }
    unsetenv("TOKWH_STRICT");
    unsetenv("TOKWH_MAX_NESTING");
    unsetenv("TOKWH_ALLOWED_SCHEMES");
}

int
main()
{
    test_defaults();
    test_settings();
    test_environment();
    std::cout << "config tests done" << std::endl;
    return 0;
}
