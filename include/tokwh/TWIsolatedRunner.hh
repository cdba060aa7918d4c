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

#ifndef TWISOLATEDRUNNER_HH
#define TWISOLATEDRUNNER_HH

#include <tokwh/DLL.h>
#include <tokwh/JSON.hh>
#include <tokwh/TWCollector.hh>
#include <tokwh/TWConfig.hh>
#include <tokwh/TWTokenView.hh>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Outcome of running one collector in a child process.
struct TWIsolatedResult
{
    enum status_e {
        st_ok,      // the child finished and sent its result
        st_error,   // the child failed before it could produce a result
        st_timeout, // the child was killed at the hard timeout
        st_crashed, // the child died from a signal or exited without a result
    };

    status_e status{st_error};
    // On st_ok, the collector's result exactly as finalizeAll would give it. Otherwise a result
    // with no items and one error whose kind is "timeout" or "exception".
    JSON result;
    std::string message;
    // Exit status of the child, or the signal number for st_crashed and st_timeout.
    int exit_code{0};
    long long duration_ms{0};

    TOKWH_DLL
    static char const* statusName(status_e);
};

// Runs a collector over a token stream in a forked child process. The child builds its own
// TokenWarehouse from the tokens, registers the collector, dispatches, finalizes and writes the
// result as JSON to a pipe. The parent waits at most hard_timeout_ms for the whole run and kills
// the child with SIGKILL when the time is up, so a collector that never returns and never calls
// checkDeadline cannot hang the caller. Changes the collector makes to itself happen in the
// child and are not seen by the caller.
//
// Only available on POSIX systems. fork is only safe when the calling process has a single
// thread.
class TWIsolatedRunner
{
  public:
    // Exit codes used by the child.
    static int constexpr exit_ok = 0;
    static int constexpr exit_collector_error = 1;
    static int constexpr exit_setup_error = 4;

    // hard_timeout_ms must be positive. Throws TWExc with tokwh_e_system if the pipe or the
    // child process cannot be created, or on platforms without fork.
    TOKWH_DLL
    static TWIsolatedResult run(
        std::vector<TWTokenView> const& tokens,
        std::shared_ptr<TWCollector> collector,
        uint32_t hard_timeout_ms,
        TWConfig const& config = TWConfig(),
        std::string const& text = "");
};

#endif // TWISOLATEDRUNNER_HH
