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

#ifndef TWLOGGER_HH
#define TWLOGGER_HH

#include <tokwh/DLL.h>
#include <tokwh/Pipeline.hh>

#include <iostream>
#include <memory>

// Routes diagnostic output of the warehouse, its collectors and the command-line tools.
//
// Channels and their defaults:
//
// info  -- standard output; progress and verbose messages
// warn  -- whatever error points to, unless set; canonicalization faults, collector errors,
//          collector timeouts and truncation notices
// error -- standard error; fatal problems
//
// Use the default logger unless output has to be captured separately, for example when several
// warehouses run on different threads and each one should report to its own request log. A
// logger may be shared by several warehouses as long as they are not used concurrently.
//
// On deletion, finish() is called on the standard output and standard error pipelines. Custom
// pipelines are not finished by the logger.
class TWLogger
{
  public:
    TOKWH_DLL
    static std::shared_ptr<TWLogger> create();

    TOKWH_DLL
    static std::shared_ptr<TWLogger> defaultLogger();

    TOKWH_DLL
    void info(char const*);
    TOKWH_DLL
    void info(std::string const&);
    TOKWH_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

    TOKWH_DLL
    void warn(char const*);
    TOKWH_DLL
    void warn(std::string const&);
    TOKWH_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

    TOKWH_DLL
    void error(char const*);
    TOKWH_DLL
    void error(std::string const&);
    TOKWH_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);

    TOKWH_DLL
    std::shared_ptr<Pipeline> standardOutput();
    TOKWH_DLL
    std::shared_ptr<Pipeline> standardError();
    TOKWH_DLL
    std::shared_ptr<Pipeline> discard();

    // Passing a null pointer resets to default
    TOKWH_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    TOKWH_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    TOKWH_DLL
    void setError(std::shared_ptr<Pipeline>);

    // Text written in front of every message passed to info, warn or error, e.g. "tokwh: ".
    // Writing directly to a pipeline returned by a getter bypasses the prefix.
    TOKWH_DLL
    void setPrefix(std::string const&);
    TOKWH_DLL
    std::string const& getPrefix() const;

    // Shortcut to reset output to new streams. out_stream is used for info, err_stream for error,
    // and warn is cleared so that it follows error.
    TOKWH_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

  private:
    TWLogger();
    std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);
    void emit(std::shared_ptr<Pipeline> const&, char const*, size_t);

    class Members
    {
        friend class TWLogger;

      public:
        TOKWH_DLL
        ~Members();

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<Pipeline> p_discard;
        std::shared_ptr<Pipeline> p_stdout;
        std::shared_ptr<Pipeline> p_stderr;
        std::shared_ptr<Pipeline> p_info;
        std::shared_ptr<Pipeline> p_warn;
        std::shared_ptr<Pipeline> p_error;
        std::string prefix;
    };
    std::shared_ptr<Members> m;
};

#endif // TWLOGGER_HH
