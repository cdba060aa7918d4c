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

#ifndef CL_TABLES_HH
#define CL_TABLES_HH

#include <tokwh/TWCollector.hh>

#include <optional>
#include <string>
#include <vector>

// Collects tables as rows of trimmed cell text. "header" is true when the first row came from
// the table head; "columns" is the length of the longest row.
class TOKWH_DLL_CLASS Cl_Tables: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Tables() = default;
    TOKWH_DLL
    ~Cl_Tables() override;

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
    struct Table
    {
        std::vector<std::vector<std::string>> rows;
        bool header{false};
        std::optional<long long> start_line;
        std::optional<size_t> section;
    };

    std::vector<Table> tables;
    bool in_table{false};
    bool in_head{false};
    bool in_row{false};
    bool in_cell{false};
    std::string cell;
};

#endif // CL_TABLES_HH
