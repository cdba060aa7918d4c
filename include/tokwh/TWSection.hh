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

#ifndef TWSECTION_HH
#define TWSECTION_HH

#include <optional>
#include <string>

// One entry of a warehouse's section table. Sections are sorted by start line, do not overlap,
// and together cover every line from 0 to the end of the document. The preamble section, which
// holds lines before the first heading, has no heading index and level 0.
struct TWSection
{
    std::optional<size_t> heading_index;
    long long start_line{0};
    long long end_line{0};
    int level{0};
    std::string title;

    bool operator==(TWSection const&) const = default;
};

// One fenced code block. lang is the first word of info.
struct TWFence
{
    size_t token_index{0};
    long long start_line{0};
    long long end_line{0};
    std::string info;
    std::string lang;

    bool operator==(TWFence const&) const = default;
};

#endif // TWSECTION_HH
