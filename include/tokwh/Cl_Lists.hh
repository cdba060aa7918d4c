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

#ifndef CL_LISTS_HH
#define CL_LISTS_HH

#include <tokwh/TWCollector.hh>

#include <optional>
#include <string>
#include <vector>

// Collects bullet and ordered lists in the order they open. Each list records its nesting depth
// and the text of the first paragraph of each of its items. The item cap applies to list items,
// not to lists.
class TOKWH_DLL_CLASS Cl_Lists: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Lists() = default;
    TOKWH_DLL
    ~Cl_Lists() override;

    TOKWH_DLL
    std::string getName() const override;
    TOKWH_DLL
    TWInterest getInterest() const override;
    TOKWH_DLL
    void onToken(size_t, TWTokenView const&, TWDispatchContext&, TokenWarehouse&) override;
    TOKWH_DLL
    JSON finalize(TokenWarehouse&) override;
    TOKWH_DLL
    size_t itemCount() const override;

  private:
    struct List
    {
        bool ordered{false};
        size_t depth{0};
        std::optional<long long> start_line;
        std::optional<size_t> section;
        std::vector<std::string> items;
    };

    std::vector<List> lists;
    // Positions in lists of the lists that are open
    std::vector<size_t> open;
    bool awaiting_text{false};
    size_t num_items{0};
};

#endif // CL_LISTS_HH
