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

#ifndef CL_IMAGES_HH
#define CL_IMAGES_HH

#include <tokwh/TWCollector.hh>
#include <tokwh/TWConfig.hh>

#include <optional>
#include <set>
#include <string>
#include <vector>

// Collects images outside code blocks. The source URL is judged the same way Cl_Links judges
// link targets.
class TOKWH_DLL_CLASS Cl_Images: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Images(std::set<std::string> allowed_schemes, bool allow_relative = true);
    TOKWH_DLL
    Cl_Images(TWConfig const&);
    TOKWH_DLL
    ~Cl_Images() override;

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
    struct Image
    {
        std::string src;
        std::optional<std::string> normalized;
        bool allowed{false};
        std::string alt;
        std::optional<std::string> title;
        std::optional<long long> line;
        std::optional<size_t> section;
    };

    std::set<std::string> allowed_schemes;
    bool allow_relative;
    std::vector<Image> images;
};

#endif // CL_IMAGES_HH
