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

#ifndef TWURL_HH
#define TWURL_HH

#include <tokwh/DLL.h>

#include <optional>
#include <set>
#include <string>

class TWConfig;

// URL normalization shared by every collector and by anything downstream that fetches or renders
// collected URLs. Judging a URL with anything other than these functions risks two components
// disagreeing about whether the same URL is safe, so every call site goes through here.
//
// normalize is a pure function of its arguments.
class TWURL
{
  public:
    struct Result
    {
        // Lower-case scheme; absent for a relative reference.
        std::optional<std::string> scheme;
        std::string normalized;
        bool allowed{false};

        bool operator==(Result const&) const = default;
    };

    // {"http", "https", "mailto", "tel"}
    TOKWH_DLL
    static std::set<std::string> const& defaultSchemes();

    // Normalize a URL. The steps are, in order: strip surrounding whitespace; reject control
    // characters; reject protocol-relative URLs; percent-decode exactly once and repeat the two
    // checks on the result; lower-case the scheme; lower-case the host and convert non-ASCII
    // host labels to punycode; check the scheme against allowed_schemes (which must be lower
    // case). A URL without a scheme is allowed when allow_relative is true.
    //
    // Throws TWExc with tokwh_e_invalid_url for input that cannot be normalized.
    TOKWH_DLL
    static Result normalize(
        std::string const& raw,
        std::set<std::string> const& allowed_schemes = defaultSchemes(),
        bool allow_relative = true);
    TOKWH_DLL
    static Result normalize(std::string const& raw, TWConfig const&);

    // As normalize but returns nothing instead of throwing.
    TOKWH_DLL
    static std::optional<Result> tryNormalize(
        std::string const& raw,
        std::set<std::string> const& allowed_schemes = defaultSchemes(),
        bool allow_relative = true);
    TOKWH_DLL
    static std::optional<Result> tryNormalize(std::string const& raw, TWConfig const&);

    // False for URLs that are not allowed and for URLs that cannot be normalized.
    TOKWH_DLL
    static bool isAllowed(std::string const& raw, TWConfig const&);

    // Convert a host name to its ASCII form: ASCII letters are lower-cased and each label that
    // contains non-ASCII characters is replaced by "xn--" followed by its punycode encoding
    // (RFC 3492). Throws TWExc with tokwh_e_invalid_url for invalid UTF-8.
    TOKWH_DLL
    static std::string hostToASCII(std::string const& host);

    // Encode a sequence of code points with punycode, without the "xn--" prefix.
    TOKWH_DLL
    static std::string punycodeEncode(std::u32string const& input);
};

#endif // TWURL_HH
