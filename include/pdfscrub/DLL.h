/* Copyright (c) 2026 pdfscrub authors
 *
 * This file is part of pdfscrub.
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

#ifndef PDFSCRUB_DLL_HH
#define PDFSCRUB_DLL_HH

#define PDFSCRUB_MAJOR_VERSION 1
#define PDFSCRUB_MINOR_VERSION 0
#define PDFSCRUB_PATCH_VERSION 0
#define PDFSCRUB_VERSION "1.0.0"

/*
 * PDFSCRUB_DLL marks functions and methods that belong to the public
 * ABI. PDFSCRUB_DLL_CLASS marks classes whose runtime type information
 * must be visible across the shared object boundary: anything used as
 * an exception, derived from, or tested with dynamic_cast. Private
 * methods of exported classes may be hidden again with
 * PDFSCRUB_DLL_PRIVATE. The library is built with hidden visibility by
 * default.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libpdfscrub_EXPORTS
#  define PDFSCRUB_DLL __declspec(dllexport)
# else
#  define PDFSCRUB_DLL
# endif
# define PDFSCRUB_DLL_PRIVATE
#elif defined __GNUC__
# define PDFSCRUB_DLL __attribute__((visibility("default")))
# define PDFSCRUB_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define PDFSCRUB_DLL
# define PDFSCRUB_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define PDFSCRUB_DLL_CLASS PDFSCRUB_DLL
#else
# define PDFSCRUB_DLL_CLASS
#endif

#endif /* PDFSCRUB_DLL_HH */
