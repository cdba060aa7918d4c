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

#ifndef TWUTIL_HH
#define TWUTIL_HH

#include <tokwh/DLL.h>

#include <cstdio>
#include <string>
#include <typeinfo>
#include <vector>

namespace TWUtil
{
    // Parse decimal integers. Leading and trailing whitespace is allowed; anything else that is
    // not part of the number, including an empty string, throws std::runtime_error. Overflow
    // throws std::range_error.
    TOKWH_DLL
    long long string_to_ll(char const* str);
    TOKWH_DLL
    unsigned long long string_to_ull(char const* str);

    // Accepts 1/0, true/false, yes/no, on/off in any case; throws std::runtime_error otherwise.
    TOKWH_DLL
    bool string_to_bool(char const* str);

    // Returns lower-case hex-encoded version of the string, treating each character in the input
    // string as unsigned.
    TOKWH_DLL
    std::string hex_encode(std::string const&);

    // ASCII only; other bytes are left alone.
    TOKWH_DLL
    std::string ascii_lower(std::string const&);

    // Remove ASCII whitespace (space, tab, CR, LF, FF, VT) from both ends.
    TOKWH_DLL
    std::string trim(std::string const&);

    // Split on sep. Empty fields are kept unless skip_empty is true. Fields are not trimmed.
    TOKWH_DLL
    std::vector<std::string>
    split_string(std::string const& str, char sep, bool skip_empty = false);

    // Strip the directory and any ".exe" suffix from argv[0]. Modifies its argument.
    TOKWH_DLL
    char* getWhoami(char* argv0);

    // Get the value of an environment variable. Returns false if it is not set; sets *value if
    // value is not null.
    TOKWH_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    // Wrapper around fopen that throws std::runtime_error, including the file name and the
    // system's message, on failure.
    TOKWH_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    // Read the whole file. Throws std::runtime_error on failure.
    TOKWH_DLL
    std::string read_file_into_string(char const* filename);
    TOKWH_DLL
    std::string read_file_into_string(FILE* f, std::string const& filename);

    // Return the UTF-8 encoding of a code point.
    TOKWH_DLL
    std::string toUTF8(unsigned long uval);

    // Return the next code point from a UTF-8 string starting at pos and advance pos past it. If
    // the sequence is invalid, error is set to true and U+FFFD is returned; pos is advanced past
    // the bad byte so that callers always make progress.
    TOKWH_DLL
    unsigned long
    get_next_utf8_codepoint(std::string const& utf8_val, size_t& pos, bool& error);

    // Human readable name of a dynamic type, used when recording the type of an exception thrown
    // by a collector.
    TOKWH_DLL
    std::string type_name(std::type_info const&);
}; // namespace TWUtil

#endif // TWUTIL_HH
