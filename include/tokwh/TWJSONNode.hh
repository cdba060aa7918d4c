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

#ifndef TWJSONNODE_HH
#define TWJSONNODE_HH

#include <tokwh/DLL.h>
#include <tokwh/JSON.hh>
#include <tokwh/TWRawNode.hh>

#include <memory>
#include <string>
#include <vector>

// A TWRawNode backed by one token of a markdown-it style JSON token dump:
//
//   {"type": "link_open", "tag": "a", "nesting": 1, "map": null, "info": "",
//    "content": "", "attrs": [["href", "https://example.com"]], "children": null}
//
// "attrs" may also be a dictionary. Missing and null fields take their default values. A field
// of the wrong type makes its accessor throw std::runtime_error, which the canonicalizer reports
// and replaces with the default, so a damaged dump degrades the same way a misbehaving parser
// plugin does.
class TOKWH_DLL_CLASS TWJSONNode: public TWRawNode
{
  public:
    TOKWH_DLL
    TWJSONNode(JSON token);
    TOKWH_DLL
    ~TWJSONNode() override;

    // Nodes of a token dump: either an array of tokens or a dictionary whose "tokens" member is
    // one. Throws TWExc with tokwh_e_json otherwise.
    TOKWH_DLL
    static std::vector<std::shared_ptr<TWRawNode>> fromDocument(JSON const& document);
    // Parse the text of a token dump and return its nodes. Throws TWExc with tokwh_e_json for
    // malformed JSON.
    TOKWH_DLL
    static std::vector<std::shared_ptr<TWRawNode>> parseDocument(std::string const& text);

    TOKWH_DLL
    std::string type() const override;
    TOKWH_DLL
    int nesting() const override;
    TOKWH_DLL
    std::optional<std::pair<long long, long long>> map() const override;
    TOKWH_DLL
    std::string tag() const override;
    TOKWH_DLL
    std::optional<std::string> info() const override;
    TOKWH_DLL
    std::string content() const override;
    TOKWH_DLL
    std::optional<std::string> attrGet(std::string const& name) const override;
    TOKWH_DLL
    std::vector<std::shared_ptr<TWRawNode>> children() const override;

  private:
    std::string getStringField(std::string const& key) const;

    JSON token;
};

#endif // TWJSONNODE_HH
