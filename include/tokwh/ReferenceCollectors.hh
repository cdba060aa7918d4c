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

#ifndef REFERENCECOLLECTORS_HH
#define REFERENCECOLLECTORS_HH

#include <tokwh/DLL.h>
#include <tokwh/TWCollector.hh>
#include <tokwh/TWConfig.hh>

#include <memory>
#include <string>
#include <vector>

namespace tokwh
{
    // One instance of each built-in collector, configured from config: codeblocks, footnotes,
    // headings, html, images, links, lists, math, paragraphs, sections, tables and tasklists.
    TOKWH_DLL
    std::vector<std::shared_ptr<TWCollector>> makeReferenceCollectors(TWConfig const& config);

    // Creates the built-in collector with the given name or returns null if there is none.
    TOKWH_DLL
    std::shared_ptr<TWCollector>
    makeReferenceCollector(std::string const& name, TWConfig const& config);
} // namespace tokwh

#endif // REFERENCECOLLECTORS_HH
