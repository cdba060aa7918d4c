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

#ifndef TWCANONICALIZER_HH
#define TWCANONICALIZER_HH

#include <tokwh/DLL.h>
#include <tokwh/TWExc.hh>
#include <tokwh/TWRawNode.hh>
#include <tokwh/TWTokenView.hh>

#include <functional>
#include <memory>
#include <vector>

// The trust boundary between parser nodes and the rest of tokwh. Every field of a node is read
// exactly once through an allowlist of accessors. An accessor that throws is reported through
// the warning callback and its field takes a default value; the exception never propagates.
class TWCanonicalizer
{
  public:
    typedef std::function<void(TWExc const&)> warning_fn_t;

    // Canonicalize one node without its children. position is used in warnings. Throws TWExc
    // with tokwh_e_malformed_node if node is null.
    TOKWH_DLL
    static TWTokenView canonicalize(
        std::shared_ptr<TWRawNode> const& node, warning_fn_t const& warn = nullptr,
        long long position = -1);

    // Canonicalize a node list, placing each node's children depth-first right after it. Throws
    // TWExc with tokwh_e_resource_limit as soon as more than max_tokens views would be created
    // or children are nested more than max_nesting deep.
    TOKWH_DLL
    static std::vector<TWTokenView> flatten(
        std::vector<std::shared_ptr<TWRawNode>> const& nodes,
        size_t max_tokens,
        size_t max_nesting,
        warning_fn_t const& warn = nullptr);

  private:
    TOKWH_DLL_PRIVATE
    static TWTokenView canonicalizeNode(
        std::shared_ptr<TWRawNode> const& node,
        warning_fn_t const& warn,
        long long position,
        std::vector<std::shared_ptr<TWRawNode>>* children);
};

#endif // TWCANONICALIZER_HH
