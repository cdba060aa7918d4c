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

#ifndef CL_MATH_HH
#define CL_MATH_HH

#include <tokwh/TWCollector.hh>

#include <optional>
#include <string>
#include <vector>

// Collects inline and display math produced by math plugins.
class TOKWH_DLL_CLASS Cl_Math: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Math() = default;
    TOKWH_DLL
    ~Cl_Math() override;

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
    struct Formula
    {
        bool display{false};
        std::string content;
        std::optional<long long> line;
        std::optional<size_t> section;
    };

    std::vector<Formula> formulas;
};

#endif // CL_MATH_HH
