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

#ifndef CL_LINKS_HH
#define CL_LINKS_HH

#include <tokwh/TWCollector.hh>
#include <tokwh/TWConfig.hh>

#include <optional>
#include <set>
#include <string>
#include <vector>

// Collects hyperlinks outside code blocks. Every URL goes through TWURL::normalize with the given
// scheme policy; a URL that cannot be normalized is kept with "allowed": false and a null
// "normalized". The link text is the concatenated text of the tokens between link_open and
// link_close. Links nested inside links are folded into the outer one.
class TOKWH_DLL_CLASS Cl_Links: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Links(std::set<std::string> allowed_schemes, bool allow_relative = true);
    // Scheme policy from config
    TOKWH_DLL
    Cl_Links(TWConfig const&);
    TOKWH_DLL
    ~Cl_Links() override;

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
    struct Link
    {
        std::string url;
        std::optional<std::string> normalized;
        std::optional<std::string> scheme;
        bool allowed{false};
        std::string text;
        std::optional<long long> line;
        std::optional<size_t> section;
    };

    std::set<std::string> allowed_schemes;
    bool allow_relative;
    std::vector<Link> links;
    size_t depth{0};
};

#endif // CL_LINKS_HH
