/* Copyright (c) 2024-2026 The tokwh authors
 *
 * This file is part of tokwh.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef TOKWHCONSTANTS_H
#define TOKWHCONSTANTS_H

/*
 * Keep this file 'C' compatible so that the constants can be used
 * from foreign function interfaces.
 *
 * New values must be added to the end of each enumeration so that no
 * constant's numerical value ever changes.
 */

/* Exit codes from the tokwh CLI */

enum tokwh_exit_code_e {
    tokwh_exit_success = 0,
    tokwh_exit_error = 2,
    /* Results were produced but warnings or collector errors occurred */
    tokwh_exit_warning = 3,
};

/* Error codes */

enum tokwh_error_code_e {
    tokwh_e_success = 0,
    tokwh_e_internal,          /* logic/programming error -- indicates bug */
    tokwh_e_system,            /* I/O error, memory error, etc. */
    tokwh_e_resource_limit,    /* document exceeds token/byte/nesting caps */
    tokwh_e_malformed_node,    /* node field could not be read */
    tokwh_e_collector,         /* a collector raised an exception */
    tokwh_e_collector_timeout, /* a collector exceeded its time budget */
    tokwh_e_invalid_url,       /* URL could not be normalized */
    tokwh_e_json,              /* error in token JSON input */
    tokwh_e_config,            /* bad configuration value */
};

/* Token nesting as reported by the parser */

enum tokwh_nesting_e {
    tokwh_n_close = -1,
    tokwh_n_self = 0,
    tokwh_n_open = 1,
};

#endif /* TOKWHCONSTANTS_H */
