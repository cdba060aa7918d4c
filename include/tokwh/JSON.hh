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

#ifndef TOKWH_JSON_HH
#define TOKWH_JSON_HH

// A small JSON value type with a serializer and a parser. Collector results are JSON values, and
// token dumps read by the command-line tools are parsed with it.
//
// JSON objects hold their data through a shared pointer. Copying a JSON object, or adding it to
// a container, copies the pointer, so temporary objects can be added to containers and go out of
// scope safely, and an object added in more than one place is shared by all of them.
//
// Dictionary keys are kept sorted, so serializing a value always produces the same bytes. This
// is what makes collector results comparable across processes and hosts.

#include <tokwh/DLL.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Pipeline;

class JSON
{
  public:
    TOKWH_DLL
    std::string unparse() const;

    // Write the serialized value to a pipeline. depth is the current indentation level; nested
    // items are indented by two spaces per level.
    TOKWH_DLL
    void write(Pipeline*, size_t depth = 0) const;

    // Escape a UTF-8 string for use between double quotes. Bytes are passed through unchanged
    // except for the characters JSON requires to be escaped.
    TOKWH_DLL
    static std::string encode_string(std::string const& utf8);

    TOKWH_DLL
    static JSON makeDictionary();
    // addDictionaryMember returns the object that was added so that nested containers can be
    // built in place. Replaces any existing member with the same key. Throws std::runtime_error
    // if this is not a dictionary.
    TOKWH_DLL
    JSON addDictionaryMember(std::string const& key, JSON const&);
    TOKWH_DLL
    static JSON makeArray();
    // Returns the object that was added. Throws std::runtime_error if this is not an array.
    TOKWH_DLL
    JSON addArrayElement(JSON const&);
    TOKWH_DLL
    static JSON makeString(std::string const& utf8);
    TOKWH_DLL
    static JSON makeInt(long long int value);
    TOKWH_DLL
    static JSON makeReal(double value);
    TOKWH_DLL
    static JSON makeNumber(std::string const& encoded);
    TOKWH_DLL
    static JSON makeBool(bool value);
    TOKWH_DLL
    static JSON makeNull();

    TOKWH_DLL
    bool isArray() const;
    TOKWH_DLL
    bool isDictionary() const;
    TOKWH_DLL
    bool isNull() const;

    // Accessors return true and set the argument only if the value has the matching type.
    TOKWH_DLL
    bool getString(std::string& utf8) const;
    TOKWH_DLL
    bool getNumber(std::string& value) const;
    // True only for numbers that are integers in the range of long long.
    TOKWH_DLL
    bool getInt(long long& value) const;
    TOKWH_DLL
    bool getBool(bool& value) const;
    // Returns null if this is not a dictionary or the key is absent.
    TOKWH_DLL
    JSON getDictItem(std::string const& key) const;
    TOKWH_DLL
    bool hasDictItem(std::string const& key) const;
    // Number of members or elements; 0 for scalars.
    TOKWH_DLL
    size_t size() const;
    TOKWH_DLL
    bool forEachDictItem(std::function<void(std::string const& key, JSON value)> fn) const;
    TOKWH_DLL
    bool forEachArrayItem(std::function<void(JSON value)> fn) const;

    // Create a JSON object from a string. Throws std::runtime_error with the offset of the
    // problem for malformed input. Containers may be nested at most 500 deep.
    TOKWH_DLL
    static JSON parse(std::string const&);

    TOKWH_DLL
    JSON() = default;

  private:
    static void writeClose(Pipeline* p, bool first, size_t depth, char const* delimiter);
    static void writeNext(Pipeline* p, bool& first, size_t depth);

    // Value classes are defined in JSON.cc.
    struct JSON_value;
    struct JSON_dictionary;
    struct JSON_array;
    struct JSON_string;
    struct JSON_number;
    struct JSON_bool;
    struct JSON_null;

    JSON(std::unique_ptr<JSON_value>);

    class Members
    {
        friend class JSON;

      public:
        TOKWH_DLL
        ~Members();

      private:
        Members(std::unique_ptr<JSON_value>);
        Members(Members const&) = delete;

        std::unique_ptr<JSON_value> value;
    };

    std::shared_ptr<Members> m;
};

#endif // TOKWH_JSON_HH
