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

#ifndef CL_TASKLISTS_HH
#define CL_TASKLISTS_HH

#include <tokwh/TWCollector.hh>

#include <optional>
#include <string>
#include <vector>

// Collects list items whose text starts with "[ ]", "[x]" or "[X]".
class TOKWH_DLL_CLASS Cl_Tasklists: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Tasklists() = default;
    TOKWH_DLL
    ~Cl_Tasklists() override;

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
    struct Task
    {
        bool checked{false};
        std::string text;
        std::optional<long long> line;
        std::optional<size_t> section;
    };

    std::vector<Task> tasks;
    bool awaiting_text{false};
    std::optional<long long> item_line;
};

#endif // CL_TASKLISTS_HH
