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

#ifndef TOKWH_GLOBAL_HH
#define TOKWH_GLOBAL_HH

#include <tokwh/DLL.h>

#include <cstdint>

// Process-wide defaults. A default-constructed TWConfig copies these values, so changing them
// affects warehouses created afterwards and never a warehouse that already exists. These
// functions are not thread-safe; set them during start-up.

namespace tokwh::global
{
    /// @brief Retrieves the number of limit errors.
    ///
    /// Returns the number of times a document was rejected by the resource guard or a collector
    /// was truncated at its item cap. This item is read only.
    TOKWH_DLL
    uint32_t limit_errors();

    namespace options
    {
        /// @brief Retrieves whether collector errors are rethrown instead of recorded.
        TOKWH_DLL
        bool strict();

        /// @brief Make collector errors and timeouts fatal. Intended for tests.
        TOKWH_DLL
        void strict(bool value);

        /// @brief Retrieves whether raw HTML is collected.
        TOKWH_DLL
        bool allow_raw_html();

        /// @brief Allow the html collector to return raw HTML. Off by default.
        TOKWH_DLL
        void allow_raw_html(bool value);
    } // namespace options

    namespace limits
    {
        /// @brief Maximum number of tokens, children included, in one document. Default 500,000.
        TOKWH_DLL
        uint32_t max_tokens();
        TOKWH_DLL
        void max_tokens(uint32_t value);

        /// @brief Maximum document size in bytes. Default 10 MiB.
        TOKWH_DLL
        uint64_t max_bytes();
        TOKWH_DLL
        void max_bytes(uint64_t value);

        /// @brief Maximum nesting depth. Default 1,000.
        ///
        /// The nesting limit also bounds the explicit stacks used while flattening children, so
        /// it cannot be disabled.
        TOKWH_DLL
        uint32_t max_nesting();
        TOKWH_DLL
        void max_nesting(uint32_t value);

        /// @brief Item cap for collectors without a specific cap. Default 10,000.
        TOKWH_DLL
        uint32_t max_items();
        TOKWH_DLL
        void max_items(uint32_t value);

        /// @brief Time budget for one collector call in milliseconds. Default 5,000. 0 disables.
        TOKWH_DLL
        uint32_t collector_timeout_ms();
        TOKWH_DLL
        void collector_timeout_ms(uint32_t value);
    } // namespace limits
} // namespace tokwh::global

#endif // TOKWH_GLOBAL_HH
