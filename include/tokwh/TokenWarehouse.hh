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

#ifndef TOKENWAREHOUSE_HH
#define TOKENWAREHOUSE_HH

#include <tokwh/DLL.h>
#include <tokwh/JSON.hh>
#include <tokwh/TWCollector.hh>
#include <tokwh/TWConfig.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWLogger.hh>
#include <tokwh/TWRawNode.hh>
#include <tokwh/TWSection.hh>
#include <tokwh/TWTokenView.hh>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// A TokenWarehouse holds the token stream of one parsed document. It canonicalizes the parser's
// nodes once, rejects documents that exceed the configured limits, builds index tables over the
// tokens and then dispatches every token to the registered collectors in a single forward pass.
//
// Lifecycle:
//
//   TokenWarehouse w(nodes, config, text);  // may throw TWExc(tokwh_e_resource_limit)
//   w.registerCollector(...);               // any number, before dispatchAll
//   w.dispatchAll();                        // exactly once
//   auto results = w.finalizeAll();         // exactly once
//
// A warehouse belongs to one document and one thread. It is never reused and must not be used
// concurrently. Collectors run under an exception boundary and a time budget: a failing collector
// loses its own result at most and never affects the others, unless strict mode is on, in which
// case the first failure is thrown as a TWExc.
class TokenWarehouse
{
  public:
    enum state_e { st_idle, st_dispatching, st_finalized };

    // Canonicalize nodes (children are flattened in place) and check limits. text is the
    // document source; it is used for lineText and for the byte limit and may be empty. If
    // logger is null, the default logger is used. Throws TWExc with tokwh_e_resource_limit if
    // the document is too large or too deep and with tokwh_e_malformed_node for a null node.
    // Faults in individual node fields are reported as warnings.
    TOKWH_DLL
    TokenWarehouse(
        std::vector<std::shared_ptr<TWRawNode>> const& nodes,
        TWConfig const& config = TWConfig(),
        std::string const& text = "",
        std::shared_ptr<TWLogger> logger = nullptr);

    // Same, for tokens that were already canonicalized.
    TOKWH_DLL
    TokenWarehouse(
        std::vector<TWTokenView> tokens,
        TWConfig const& config = TWConfig(),
        std::string const& text = "",
        std::shared_ptr<TWLogger> logger = nullptr);

    TOKWH_DLL
    ~TokenWarehouse();

    TokenWarehouse(TokenWarehouse const&) = delete;
    TokenWarehouse& operator=(TokenWarehouse const&) = delete;

    // Collector names must be unique. Throws std::logic_error for a null collector, a duplicate
    // name, or a call after dispatchAll has started.
    TOKWH_DLL
    void registerCollector(std::shared_ptr<TWCollector>);

    // Route every token to the interested collectors. May be called once. Throws
    // TWReentrancyError if the warehouse is dispatching or has dispatched already. In strict
    // mode, throws TWExc with tokwh_e_collector or tokwh_e_collector_timeout on the first
    // collector failure. The warehouse is finalized however this returns.
    TOKWH_DLL
    void dispatchAll();

    // Finalize every collector and return the results keyed by collector name. Each result is a
    // dictionary with "count", "truncated" and "errors" added. Afterwards the warehouse drops
    // its collectors. Throws std::logic_error unless dispatchAll has run, and on a second call.
    TOKWH_DLL
    std::map<std::string, JSON> finalizeAll();

    TOKWH_DLL
    state_e getState() const;

    // Index of the section containing line, or none for lines outside the document. Never
    // throws.
    TOKWH_DLL
    std::optional<size_t> sectionOf(long long line) const;
    TOKWH_DLL
    std::vector<TWSection> const& getSections() const;
    TOKWH_DLL
    std::vector<TWFence> const& getFences() const;

    TOKWH_DLL
    std::vector<TWTokenView> const& getTokens() const;
    // Ascending positions of tokens of the given type.
    TOKWH_DLL
    std::vector<size_t> const& byType(std::string const& type) const;
    // The matching close token of an open token, or the reverse.
    TOKWH_DLL
    std::optional<size_t> pairOf(size_t index) const;
    // The innermost open token or parent node enclosing the token.
    TOKWH_DLL
    std::optional<size_t> parentOf(size_t index) const;
    // The token's start line, taken from the nearest token with a map.
    TOKWH_DLL
    std::optional<long long> lineOf(size_t index) const;

    // Line of the source text, without its line terminator; empty outside the text.
    TOKWH_DLL
    std::string lineText(long long line) const;
    // Larger of the number of source lines and the highest line referenced by any map.
    TOKWH_DLL
    long long lineCount() const;

    TOKWH_DLL
    TWConfig const& getConfig() const;
    TOKWH_DLL
    std::shared_ptr<TWLogger> getLogger() const;

    // Collector errors and timeouts recorded so far.
    TOKWH_DLL
    std::vector<TWCollectorError> const& getErrors() const;

    // Log a warning and keep it. At most getConfig().getMaxWarnings() warnings are kept and
    // logged; the rest are only counted.
    TOKWH_DLL
    void warn(TWExc const& e);
    TOKWH_DLL
    std::vector<TWExc> const& getWarnings() const;
    TOKWH_DLL
    bool anyWarnings() const;
    // Includes warnings that were not kept.
    TOKWH_DLL
    size_t numWarnings() const;

    // Combine results into one dictionary keyed by collector name.
    TOKWH_DLL
    static JSON resultsToJSON(std::map<std::string, JSON> const& results);
    // Hex SHA-256 of the serialized results. Equal results always give equal fingerprints.
    TOKWH_DLL
    static std::string fingerprint(std::map<std::string, JSON> const& results);

  private:
    struct CollectorEntry;
    class Members;

    void initialize(std::string const& text);
    void checkLimits(std::string const& text);
    void compileRouting();
    // Run one collector call under the exception boundary and the watchdog. Returns false if the
    // call failed.
    template <typename F>
    bool invoke(CollectorEntry& entry, std::optional<size_t> index, F fn);
    void recordError(
        CollectorEntry& entry,
        std::optional<size_t> index,
        bool timeout,
        std::string const& exception_type,
        std::string const& message);

    std::unique_ptr<Members> m;
};

#endif // TOKENWAREHOUSE_HH
