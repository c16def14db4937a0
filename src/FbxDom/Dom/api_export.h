//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef FBXDOM_DOM_STATIC
#    define FBXDOM_DOM_API
#  else
#    ifdef FBXDOM_DOM_EXPORTS
#      define FBXDOM_DOM_API __declspec(dllexport)
#    else
#      define FBXDOM_DOM_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef FBXDOM_DOM_EXPORTS
#    define FBXDOM_DOM_API __attribute__((visibility("default")))
#  else
#    define FBXDOM_DOM_API
#  endif
#else
#  define FBXDOM_DOM_API
#endif

#define FBXDOM_DOM_NDAPI [[nodiscard]] FBXDOM_DOM_API
