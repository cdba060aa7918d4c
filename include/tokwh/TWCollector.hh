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

#ifndef TWCOLLECTOR_HH
#define TWCOLLECTOR_HH

#include <tokwh/DLL.h>
#include <tokwh/JSON.hh>
#include <tokwh/TWTokenView.hh>

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

class TokenWarehouse;

// A collector's subscription. types lists the token types the collector wants to see.
// ignore_inside lists base types ("fence", "table", "code_block") whose tokens, and everything
// inside them, are never routed to the collector. A name ending in "_open" or "_close" is
// reduced to its base type.
struct TWInterest
{
    std::set<std::string> types;
    std::set<std::string> ignore_inside;
};

// One failed or overlong collector call.
struct TWCollectorError
{
    std::string collector;
    // Absent when the failure happened in finalize.
    std::optional<size_t> token_index;
    // "exception" or "timeout"
    std::string kind;
    std::string exception_type;
    std::string message;

    TOKWH_DLL
    JSON getJSON() const;
};

// Per-dispatch state handed to every collector call. Collectors may inspect it; only the
// warehouse changes it.
class TWDispatchContext
{
  public:
    TOKWH_DLL
    TWDispatchContext() = default;

    // Number of open ignored regions of the given base type that enclose the current token.
    // Only types named in some collector's ignore_inside set are tracked; others return 0.
    TOKWH_DLL
    size_t ignoreDepth(std::string const& type) const;
    bool
    insideIgnored(std::string const& type) const
    {
        return ignoreDepth(type) > 0;
    }

    TOKWH_DLL
    std::vector<TWCollectorError> const& getErrors() const;

    TOKWH_DLL
    bool isTruncated(std::string const& collector) const;

    // Index of the token being dispatched; absent during finalize.
    TOKWH_DLL
    std::optional<size_t> getTokenIndex() const;

    // Name of the collector being called.
    TOKWH_DLL
    std::string const& getCollectorName() const;

    // Throws TWExc with tokwh_e_collector_timeout once the current call has used up its time
    // budget. Collectors that loop over more than a handful of items should call this
    // periodically; it is how a long-running call is cut short.
    TOKWH_DLL
    void checkDeadline() const;

    // Call before starting a new item, passing the number of items already held. Returns false
    // once the collector's item cap is reached; the collector must then not start the item and
    // receives no further tokens after the current call. A collector that uses this keeps
    // receiving tokens after reaching its cap until it is refused, so the last item within the
    // cap is complete. A collector that never calls it is cut off as soon as it reaches its cap.
    TOKWH_DLL
    bool admitItem(size_t items_held);

  private:
    friend class TokenWarehouse;

    // Sorted; an index into this vector is a type's bit number.
    std::vector<std::string> ignore_types;
    std::vector<size_t> ignore_depth;
    std::vector<TWCollectorError> errors;
    std::set<std::string> truncated;
    std::optional<size_t> token_index;
    std::string collector;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    size_t item_cap{0};
    bool admit_asked{false};
    bool cap_refused{false};
};

// Interface implemented by every extractor. A collector sees tokens in document order, only the
// types it declared interest in, and never tokens inside regions it asked to ignore.
//
// Collector calls must not block: no network, file or database access and no sleeping. Work of
// that kind belongs after TokenWarehouse::finalizeAll returns. Every call runs under a time
// budget and an exception boundary: an exception or a timeout is recorded and dispatch moves on.
//
// A collector must not keep a reference to the warehouse after finalize returns.
class TOKWH_DLL_CLASS TWCollector
{
  public:
    TOKWH_DLL
    virtual ~TWCollector() = default;

    // Unique within one warehouse; used as the key of the collector's result.
    virtual std::string getName() const = 0;

    // Read once, at registration.
    virtual TWInterest getInterest() const = 0;

    // Called before onToken for every routed token; returning false skips onToken.
    TOKWH_DLL
    virtual bool shouldProcess(TWTokenView const&, TWDispatchContext&, TokenWarehouse&);

    virtual void
    onToken(size_t index, TWTokenView const&, TWDispatchContext&, TokenWarehouse&) = 0;

    // Produce the collector's result. A dictionary is expected; any other value is placed under
    // "items". The warehouse adds "count", "truncated" and "errors".
    virtual JSON finalize(TokenWarehouse&) = 0;

    // Number of items accumulated so far. The result is marked truncated once this reaches the
    // collector's item cap.
    virtual size_t itemCount() const = 0;
};

#endif // TWCOLLECTOR_HH
