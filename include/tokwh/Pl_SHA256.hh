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

#ifndef TOKWH_PL_SHA256_HH
#define TOKWH_PL_SHA256_HH

#include <tokwh/Pipeline.hh>

#include <memory>
#include <string>

// Computes a SHA-256 digest of everything written to it. "next" may be null; if it is not, data
// is passed through. The digest may be retrieved after finish(). After finish() the pipeline may
// be reused, and writing starts a new digest.
//
// TokenWarehouse::fingerprint writes serialized collector results into this pipeline so that
// results from different hosts can be compared cheaply.
class TOKWH_DLL_CLASS Pl_SHA256: public Pipeline
{
  public:
    TOKWH_DLL
    Pl_SHA256(Pipeline* next = nullptr);
    TOKWH_DLL
    ~Pl_SHA256() override;
    TOKWH_DLL
    void write(unsigned char const*, size_t) override;
    TOKWH_DLL
    void finish() override;
    // Both throw std::logic_error if called while a digest is in progress.
    TOKWH_DLL
    std::string getRawDigest();
    TOKWH_DLL
    std::string getHexDigest();

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // TOKWH_PL_SHA256_HH
