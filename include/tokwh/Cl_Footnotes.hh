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

#ifndef CL_FOOTNOTES_HH
#define CL_FOOTNOTES_HH

#include <tokwh/TWCollector.hh>

#include <optional>
#include <string>
#include <vector>

// Collects footnote references and footnote definitions. The text of a definition is the
// content of the inline tokens between footnote_reference_open and footnote_reference_close.
// Definitions may nest; a definition that is never closed is kept with the text seen so far.
class TOKWH_DLL_CLASS Cl_Footnotes: public TWCollector
{
  public:
    TOKWH_DLL
    Cl_Footnotes() = default;
    TOKWH_DLL
    ~Cl_Footnotes() override;

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
    struct Note
    {
        bool definition{false};
        bool closed{false};
        std::string text;
        std::optional<long long> line;
        std::optional<size_t> section;
    };

    std::vector<Note> notes;
    // Indices into notes of the definitions still open, innermost last
    std::vector<size_t> open;
};

#endif // CL_FOOTNOTES_HH
