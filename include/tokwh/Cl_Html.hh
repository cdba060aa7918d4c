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

#ifndef CL_HTML_HH
#define CL_HTML_HH

#include <tokwh/TWCollector.hh>
#include <tokwh/TWConfig.hh>

#include <optional>
#include <string>
#include <vector>

// Flags raw HTML. Unless raw HTML is allowed nothing is collected: the result only says how many
// fragments were dropped. When it is allowed every fragment is returned with
// "needs_sanitization": true. This collector never sanitizes; whoever renders the HTML must.
class TOKWH_DLL_CLASS Cl_Html: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Html(bool allow_raw_html = false);
    TOKWH_DLL
    Cl_Html(TWConfig const&);
    TOKWH_DLL
    ~Cl_Html() override;

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
    struct Fragment
    {
        bool block{false};
        std::string content;
        std::optional<long long> line;
    };

    bool allow_raw_html;
    std::vector<Fragment> fragments;
    size_t dropped{0};
};

#endif // CL_HTML_HH
