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

#ifndef TOKWH_PL_STRING_HH
#define TOKWH_PL_STRING_HH

#include <tokwh/Pipeline.hh>

#include <string>

// Appends everything written to it to a std::string passed in at construction. "next" may be
// null; if it is not, data and finish() are passed through. Calling finish() is optional when
// there is no next pipeline.
class TOKWH_DLL_CLASS Pl_String: public Pipeline
{
  public:
    TOKWH_DLL
    Pl_String(char const* identifier, Pipeline* next, std::string& s);
    TOKWH_DLL
    ~Pl_String() override;

    TOKWH_DLL
    void write(unsigned char const* buf, size_t len) override;
    TOKWH_DLL
    void finish() override;

  private:
    std::string& s;
};

#endif // TOKWH_PL_STRING_HH
