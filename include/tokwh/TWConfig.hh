// Copyright (c) 2024-2026 The tokwh authors
//
// This file is part of tokwh.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TWCONFIG_HH
#define TWCONFIG_HH

#include <tokwh/DLL.h>

#include <cstdint>
#include <map>
#include <set>
#include <string>

// Security and resource configuration of one warehouse. A default-constructed TWConfig takes its
// limits from tokwh::global and the built-in per-collector item caps. fromEnvironment() applies
// TOKWH_* environment variables on top of that. Setters return *this so that calls can be
// chained.
class TWConfig
{
  public:
    TOKWH_DLL
    TWConfig();

    // Defaults plus TOKWH_MAX_TOKENS, TOKWH_MAX_BYTES, TOKWH_MAX_NESTING,
    // TOKWH_MAX_ITEMS_PER_TYPE, TOKWH_ALLOWED_SCHEMES, TOKWH_ALLOW_RELATIVE_URLS,
    // TOKWH_COLLECTOR_TIMEOUT_SECONDS, TOKWH_ALLOW_RAW_HTML, TOKWH_STRICT and
    // TOKWH_MAX_WARNINGS. Throws TWExc with tokwh_e_config for malformed values.
    TOKWH_DLL
    static TWConfig fromEnvironment();

    // Apply one setting by its environment variable name. Used by fromEnvironment and by tools
    // that accept the same settings from other sources. Throws TWExc with tokwh_e_config for an
    // unknown name or a malformed value.
    TOKWH_DLL
    TWConfig& applySetting(std::string const& name, std::string const& value);

    TOKWH_DLL
    size_t getMaxTokens() const;
    TOKWH_DLL
    TWConfig& setMaxTokens(size_t);

    TOKWH_DLL
    uint64_t getMaxBytes() const;
    TOKWH_DLL
    TWConfig& setMaxBytes(uint64_t);

    TOKWH_DLL
    size_t getMaxNesting() const;
    TOKWH_DLL
    TWConfig& setMaxNesting(size_t);

    // Item cap for the named collector: its specific cap if one is set, otherwise the default.
    TOKWH_DLL
    size_t getMaxItems(std::string const& collector) const;
    TOKWH_DLL
    TWConfig& setMaxItems(std::string const& collector, size_t);
    TOKWH_DLL
    size_t getDefaultMaxItems() const;
    TOKWH_DLL
    TWConfig& setDefaultMaxItems(size_t);

    // Scheme names are stored lower case.
    TOKWH_DLL
    std::set<std::string> const& getAllowedSchemes() const;
    TOKWH_DLL
    TWConfig& setAllowedSchemes(std::set<std::string> const&);

    // Whether a URL without a scheme (a relative reference) counts as allowed.
    TOKWH_DLL
    bool getAllowRelativeUrls() const;
    TOKWH_DLL
    TWConfig& setAllowRelativeUrls(bool);

    // Wall-clock budget for one collector call; 0 disables the watchdog.
    TOKWH_DLL
    uint32_t getCollectorTimeoutMillis() const;
    TOKWH_DLL
    TWConfig& setCollectorTimeoutMillis(uint32_t);

    TOKWH_DLL
    bool getAllowRawHtml() const;
    TOKWH_DLL
    TWConfig& setAllowRawHtml(bool);

    // Rethrow collector errors and timeouts instead of recording them.
    TOKWH_DLL
    bool getStrict() const;
    TOKWH_DLL
    TWConfig& setStrict(bool);

    // Maximum number of warnings kept and printed by a warehouse; 0 means no limit.
    TOKWH_DLL
    size_t getMaxWarnings() const;
    TOKWH_DLL
    TWConfig& setMaxWarnings(size_t);

  private:
    size_t max_tokens;
    uint64_t max_bytes;
    size_t max_nesting;
    size_t default_max_items;
    std::map<std::string, size_t> max_items;
    std::set<std::string> allowed_schemes;
    bool allow_relative_urls{true};
    uint32_t collector_timeout_ms;
    bool allow_raw_html;
    bool strict;
    size_t max_warnings{100};
};

#endif // TWCONFIG_HH
