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

#ifndef TWTOKENVIEW_HH
#define TWTOKENVIEW_HH

#include <tokwh/DLL.h>

#include <optional>
#include <string>

// Primitive-only projection of one parsed node. A view owns copies of every field and has no
// way to reach the node it was made from, so it is safe to hold and pass around after the trust
// boundary. Views are created by TWCanonicalizer and never change afterwards.
class TWTokenView
{
  public:
    // Largest line number that may appear in a map.
    static long long constexpr MAX_LINE = 1'000'000;

    struct LineRange
    {
        long long start{0};
        long long end{0};

        bool operator==(LineRange const&) const = default;
    };

    TOKWH_DLL
    TWTokenView() = default;

    // Fields are normalized on construction: nesting is clamped to -1..1 and the map is clamped
    // so that 0 <= start <= end <= MAX_LINE.
    TOKWH_DLL
    TWTokenView(
        std::string type,
        int nesting,
        std::string tag,
        std::optional<LineRange> map,
        std::optional<std::string> info,
        std::string content,
        std::optional<std::string> href,
        std::optional<std::string> src = std::nullopt,
        std::optional<std::string> title = std::nullopt);

    // Apply the map clamping rules to a raw pair of line numbers.
    TOKWH_DLL
    static LineRange clampMap(long long start, long long end);

    std::string const&
    type() const
    {
        return type_;
    }
    int
    nesting() const
    {
        return nesting_;
    }
    std::string const&
    tag() const
    {
        return tag_;
    }
    std::optional<LineRange> const&
    map() const
    {
        return map_;
    }
    std::optional<std::string> const&
    info() const
    {
        return info_;
    }
    std::string const&
    content() const
    {
        return content_;
    }
    std::optional<std::string> const&
    href() const
    {
        return href_;
    }
    std::optional<std::string> const&
    src() const
    {
        return src_;
    }
    std::optional<std::string> const&
    title() const
    {
        return title_;
    }
    // Depth among flattened children; 0 for a top-level token.
    size_t
    level() const
    {
        return level_;
    }
    // Number of flattened tokens immediately following this one that belong to its children.
    size_t
    descendants() const
    {
        return descendants_;
    }

    // Sum of the sizes of all string fields.
    TOKWH_DLL
    size_t byteSize() const;

  private:
    friend class TWCanonicalizer;

    std::string type_;
    int nesting_{0};
    std::string tag_;
    std::optional<LineRange> map_;
    std::optional<std::string> info_;
    std::string content_;
    std::optional<std::string> href_;
    std::optional<std::string> src_;
    std::optional<std::string> title_;
    size_t level_{0};
    size_t descendants_{0};
};

#endif // TWTOKENVIEW_HH
