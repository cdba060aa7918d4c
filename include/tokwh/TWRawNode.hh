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

#ifndef TWRAWNODE_HH
#define TWRAWNODE_HH

#include <tokwh/DLL.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Interface to one node produced by a parser. Implementations may come from untrusted sources or
// third-party plugins: any accessor may throw anything, return out-of-range values, or return
// children that form a cycle. The canonicalizer calls each accessor at most once per node and
// never holds on to a node after canonicalization.
class TOKWH_DLL_CLASS TWRawNode
{
  public:
    TOKWH_DLL
    virtual ~TWRawNode() = default;

    // Token type, e.g. "heading_open", "inline", "fence".
    virtual std::string type() const = 0;
    // 1 for an opening token, -1 for a closing token, 0 for a self-contained token. Other values
    // are clamped.
    virtual int nesting() const = 0;
    // Source line range [start, end), absent for inline children.
    virtual std::optional<std::pair<long long, long long>> map() const = 0;
    // HTML tag name, e.g. "h2", "a", "img"; may be empty.
    virtual std::string tag() const = 0;
    // Fence info string.
    virtual std::optional<std::string> info() const = 0;
    virtual std::string content() const = 0;
    // Attribute lookup. The canonicalizer asks for "href", "src" and "title".
    virtual std::optional<std::string> attrGet(std::string const& name) const = 0;
    // Nested nodes, e.g. the children of an "inline" token. Most nodes have none.
    virtual std::vector<std::shared_ptr<TWRawNode>> children() const = 0;
};

#endif // TWRAWNODE_HH
