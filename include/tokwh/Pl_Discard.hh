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

#ifndef TOKWH_PL_DISCARD_HH
#define TOKWH_PL_DISCARD_HH

#include <tokwh/Pipeline.hh>

// End-of-line pipeline that drops everything. Used to silence a logger channel.
class TOKWH_DLL_CLASS Pl_Discard: public Pipeline
{
  public:
    TOKWH_DLL
    Pl_Discard();
    TOKWH_DLL
    ~Pl_Discard() override;

    TOKWH_DLL
    void write(unsigned char const*, size_t) override;
    TOKWH_DLL
    void finish() override;
};

#endif // TOKWH_PL_DISCARD_HH
