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

#ifndef TWEXC_HH
#define TWEXC_HH

#include <tokwh/Constants.h>
#include <tokwh/DLL.h>

#include <stdexcept>
#include <string>

// Exception thrown for all runtime errors detected by tokwh: documents that exceed resource
// limits, URLs that cannot be normalized, collector failures in strict mode, bad token JSON and
// bad configuration. The same class is used for warnings, which are logged and kept by the
// warehouse instead of being thrown.
class TOKWH_DLL_CLASS TWExc: public std::runtime_error
{
  public:
    // source is the document name (may be empty). object names the collector, node field or
    // setting involved (may be empty). position is a token index or -1 if not applicable.
    TOKWH_DLL
    TWExc(
        tokwh_error_code_e error_code,
        std::string const& source,
        std::string const& object,
        long long position,
        std::string const& message);

    TOKWH_DLL
    ~TWExc() noexcept override = default;

    // what() returns the complete message. The accessors return the values used to construct the
    // exception. Only the error code and message are guaranteed to be non-empty.
    TOKWH_DLL
    tokwh_error_code_e getErrorCode() const;
    TOKWH_DLL
    std::string const& getSource() const;
    TOKWH_DLL
    std::string const& getObject() const;
    // Returns -1 if there is no position.
    TOKWH_DLL
    long long getPosition() const;
    TOKWH_DLL
    std::string const& getMessageDetail() const;

  private:
    TOKWH_DLL_PRIVATE
    static std::string createWhat(
        std::string const& source,
        std::string const& object,
        long long position,
        std::string const& message);

    tokwh_error_code_e error_code;
    std::string source;
    std::string object;
    long long position;
    std::string message;
};

// Thrown when dispatchAll is called on a warehouse that is already dispatching or has already
// dispatched. This is a programming error: it is never recorded in a collector error log and
// always propagates to the caller.
class TOKWH_DLL_CLASS TWReentrancyError: public std::logic_error
{
  public:
    TOKWH_DLL
    TWReentrancyError(std::string const& message);
    TOKWH_DLL
    ~TWReentrancyError() noexcept override = default;
};

// Thrown for a bad command line. The message says what is wrong; callers add the help hint.
class TOKWH_DLL_CLASS TWUsage: public std::runtime_error
{
  public:
    TOKWH_DLL
    TWUsage(std::string const& message);
    TOKWH_DLL
    ~TWUsage() noexcept override = default;
};

#endif // TWEXC_HH
