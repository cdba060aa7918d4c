#include <tokwh/TWConfig.hh>

#include <tokwh/TWExc.hh>
#include <tokwh/TWIntC.hh>
#include <tokwh/TWUtil.hh>
#include <tokwh/global_private.hh>

#include <stdexcept>

using namespace tokwh;

namespace
{
    char const* const env_vars[] = {
        "TOKWH_MAX_TOKENS",
        "TOKWH_MAX_BYTES",
        "TOKWH_MAX_NESTING",
        "TOKWH_MAX_ITEMS_PER_TYPE",
        "TOKWH_ALLOWED_SCHEMES",
        "TOKWH_ALLOW_RELATIVE_URLS",
        "TOKWH_COLLECTOR_TIMEOUT_SECONDS",
        "TOKWH_ALLOW_RAW_HTML",
        "TOKWH_STRICT",
        "TOKWH_MAX_WARNINGS",
    };

    TWExc
    config_error(std::string const& name, std::string const& value, std::string const& detail)
    {
        return {tokwh_e_config, "", name, -1, "invalid value \"" + value + "\": " + detail};
    }
} // namespace

TWConfig::TWConfig() :
    max_tokens(global::Limits::max_tokens()),
    max_bytes(global::Limits::max_bytes()),
    max_nesting(global::Limits::max_nesting()),
    default_max_items(global::Limits::max_items()),
    max_items{
        {"links", 10'000},
        {"images", 5'000},
        {"headings", 5'000},
        {"codeblocks", 2'000},
        {"tables", 1'000},
        {"lists", 50'000},
    },
    allowed_schemes{"http", "https", "mailto", "tel"},
    collector_timeout_ms(global::Limits::collector_timeout_ms()),
    allow_raw_html(global::Options::allow_raw_html()),
    strict(global::Options::strict())
{
}

TWConfig
TWConfig::fromEnvironment()
{
    TWConfig config;
    for (auto const* var: env_vars) {
        std::string value;
        if (TWUtil::get_env(var, &value)) {
            config.applySetting(var, value);
        }
    }
    return config;
}

TWConfig&
TWConfig::applySetting(std::string const& name, std::string const& value)
{
    auto count = [&name, &value]() -> size_t {
        try {
            return TWIntC::to_size(TWUtil::string_to_ull(value.c_str()));
        } catch (std::runtime_error& e) {
            throw config_error(name, value, e.what());
        }
    };
    auto flag = [&name, &value]() {
        try {
            return TWUtil::string_to_bool(value.c_str());
        } catch (std::runtime_error& e) {
            throw config_error(name, value, e.what());
        }
    };

    if (name == "TOKWH_MAX_TOKENS") {
        setMaxTokens(count());
    } else if (name == "TOKWH_MAX_BYTES") {
        setMaxBytes(count());
    } else if (name == "TOKWH_MAX_NESTING") {
        setMaxNesting(count());
    } else if (name == "TOKWH_MAX_ITEMS_PER_TYPE") {
        if (value.find('=') == std::string::npos) {
            setDefaultMaxItems(count());
            return *this;
        }
        for (auto const& item: TWUtil::split_string(value, ',', true)) {
            auto eq = item.find('=');
            if (eq == std::string::npos) {
                throw config_error(name, value, "expected name=count");
            }
            auto collector = TWUtil::trim(item.substr(0, eq));
            auto n = TWUtil::trim(item.substr(eq + 1));
            size_t cap = 0;
            try {
                cap = TWIntC::to_size(TWUtil::string_to_ull(n.c_str()));
            } catch (std::runtime_error& e) {
                throw config_error(name, value, e.what());
            }
            if (collector.empty()) {
                throw config_error(name, value, "empty collector name");
            } else if (collector == "default") {
                setDefaultMaxItems(cap);
            } else {
                setMaxItems(collector, cap);
            }
        }
    } else if (name == "TOKWH_ALLOWED_SCHEMES") {
        std::set<std::string> schemes;
        for (auto const& scheme: TWUtil::split_string(value, ',', true)) {
            auto s = TWUtil::trim(scheme);
            if (!s.empty()) {
                schemes.insert(s);
            }
        }
        setAllowedSchemes(schemes);
    } else if (name == "TOKWH_ALLOW_RELATIVE_URLS") {
        setAllowRelativeUrls(flag());
    } else if (name == "TOKWH_COLLECTOR_TIMEOUT_SECONDS") {
        auto seconds = count();
        if (seconds > 4'000'000) {
            throw config_error(name, value, "timeout too large");
        }
        setCollectorTimeoutMillis(TWIntC::to_uint32(seconds * 1000));
    } else if (name == "TOKWH_ALLOW_RAW_HTML") {
        setAllowRawHtml(flag());
    } else if (name == "TOKWH_STRICT") {
        setStrict(flag());
    } else if (name == "TOKWH_MAX_WARNINGS") {
        setMaxWarnings(count());
    } else {
        throw TWExc(tokwh_e_config, "", name, -1, "unknown setting");
    }
    return *this;
}

size_t
TWConfig::getMaxTokens() const
{
    return max_tokens;
}

TWConfig&
TWConfig::setMaxTokens(size_t value)
{
    max_tokens = value;
    return *this;
}

uint64_t
TWConfig::getMaxBytes() const
{
    return max_bytes;
}

TWConfig&
TWConfig::setMaxBytes(uint64_t value)
{
    max_bytes = value;
    return *this;
}

size_t
TWConfig::getMaxNesting() const
{
    return max_nesting;
}

TWConfig&
TWConfig::setMaxNesting(size_t value)
{
    max_nesting = value;
    return *this;
}

size_t
TWConfig::getMaxItems(std::string const& collector) const
{
    auto it = max_items.find(collector);
    return it == max_items.end() ? default_max_items : it->second;
}

TWConfig&
TWConfig::setMaxItems(std::string const& collector, size_t value)
{
    max_items[collector] = value;
    return *this;
}

size_t
TWConfig::getDefaultMaxItems() const
{
    return default_max_items;
}

TWConfig&
TWConfig::setDefaultMaxItems(size_t value)
{
    default_max_items = value;
    return *this;
}

std::set<std::string> const&
TWConfig::getAllowedSchemes() const
{
    return allowed_schemes;
}

TWConfig&
TWConfig::setAllowedSchemes(std::set<std::string> const& schemes)
{
    allowed_schemes.clear();
    for (auto const& s: schemes) {
        allowed_schemes.insert(TWUtil::ascii_lower(s));
    }
    return *this;
}

bool
TWConfig::getAllowRelativeUrls() const
{
    return allow_relative_urls;
}

TWConfig&
TWConfig::setAllowRelativeUrls(bool value)
{
    allow_relative_urls = value;
    return *this;
}

uint32_t
TWConfig::getCollectorTimeoutMillis() const
{
    return collector_timeout_ms;
}

TWConfig&
TWConfig::setCollectorTimeoutMillis(uint32_t value)
{
    collector_timeout_ms = value;
    return *this;
}

bool
TWConfig::getAllowRawHtml() const
{
    return allow_raw_html;
}

TWConfig&
TWConfig::setAllowRawHtml(bool value)
{
    allow_raw_html = value;
    return *this;
}

bool
TWConfig::getStrict() const
{
    return strict;
}

TWConfig&
TWConfig::setStrict(bool value)
{
    strict = value;
    return *this;
}

size_t
TWConfig::getMaxWarnings() const
{
    return max_warnings;
}

TWConfig&
TWConfig::setMaxWarnings(size_t value)
{
    max_warnings = value;
    return *this;
}
