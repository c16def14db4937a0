//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef FBXDOM_TREE_STATIC
#    define FBXDOM_TREE_API
#  else
#    ifdef FBXDOM_TREE_EXPORTS
#      define FBXDOM_TREE_API __declspec(dllexport)
#    else
#      define FBXDOM_TREE_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef FBXDOM_TREE_EXPORTS
#    define FBXDOM_TREE_API __attribute__((visibility("default")))
#  else
#    define FBXDOM_TREE_API
#  endif
#else
#  define FBXDOM_TREE_API
#endif

#define FBXDOM_TREE_NDAPI [[nodiscard]] FBXDOM_TREE_API
