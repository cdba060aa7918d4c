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

#ifndef TOKWH_DLL_HH
#define TOKWH_DLL_HH

#define TOKWH_MAJOR_VERSION 1
#define TOKWH_MINOR_VERSION 0
#define TOKWH_PATCH_VERSION 0
#define TOKWH_VERSION "1.0.0"

/*
 * This file defines symbols that control which functions, classes,
 * and methods are exposed to the public ABI (application binary
 * interface). See below for an explanation.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libtokwh_EXPORTS
#  define TOKWH_DLL __declspec(dllexport)
# else
#  define TOKWH_DLL
# endif
# define TOKWH_DLL_PRIVATE
#elif defined __GNUC__
# define TOKWH_DLL __attribute__((visibility("default")))
# define TOKWH_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define TOKWH_DLL
# define TOKWH_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define TOKWH_DLL_CLASS TOKWH_DLL
#else
# define TOKWH_DLL_CLASS
#endif

/*

The library is built with "visibility=hidden", so anything that is
part of the public ABI has to be marked explicitly.

* TOKWH_DLL exports a function or method.

* TOKWH_DLL_CLASS exports a class together with its run-time type
  information. This is required for any class that is thrown as an
  exception, derived from outside the library (collectors, raw nodes,
  pipelines) or used with dynamic_cast across the shared object
  boundary. On Windows it expands to nothing since run-time type
  information is always available there.

* TOKWH_DLL_PRIVATE hides a private method of an exported class.

* libtokwh_EXPORTS is only used to select dllexport when building the
  DLL on Windows.

*/

#endif /* TOKWH_DLL_HH */
