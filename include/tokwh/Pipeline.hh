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

// Generalized output interface. By convention, subclasses of Pipeline are called Pl_Something.
//
// A pipeline created with a pointer to a next pipeline passes its data on to that pipeline. The
// creator of a pipeline owns it; a pipeline never manages the lifetime of its successor.
//
// Call finish() before destroying a pipeline to avoid losing data. Destructors never throw.
//
// The logger writes through pipelines, JSON values are serialized to pipelines, and result
// fingerprints are computed by writing serialized results into Pl_SHA256.

#ifndef TOKWH_PIPELINE_HH
#define TOKWH_PIPELINE_HH

#include <tokwh/DLL.h>

#include <memory>
#include <string>

// Use TOKWH_DLL_CLASS on anything derived from Pipeline so it will work with dynamic_cast across
// the shared object boundary.
class TOKWH_DLL_CLASS Pipeline
{
  public:
    TOKWH_DLL
    Pipeline(char const* identifier, Pipeline* next);

    TOKWH_DLL
    virtual ~Pipeline() = default;

    // Subclasses implement write and finish and, if they are not end-of-line pipelines, call
    // next()->write or next()->finish.
    TOKWH_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    TOKWH_DLL
    virtual void finish() = 0;

    // Convenience methods. Allows *p << "x" << str; this is not a general purpose ostream
    // replacement.
    TOKWH_DLL
    void writeString(std::string const&);
    TOKWH_DLL
    Pipeline& operator<<(char const* cstr);
    TOKWH_DLL
    Pipeline& operator<<(std::string const&);
    TOKWH_DLL
    void write(char const* data, size_t len);

  protected:
    Pipeline*
    next() const noexcept
    {
        return next_;
    }
    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // TOKWH_PIPELINE_HH
