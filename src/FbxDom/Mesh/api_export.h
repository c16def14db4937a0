//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef FBXDOM_MESH_STATIC
#    define FBXDOM_MESH_API
#  else
#    ifdef FBXDOM_MESH_EXPORTS
#      define FBXDOM_MESH_API __declspec(dllexport)
#    else
#      define FBXDOM_MESH_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef FBXDOM_MESH_EXPORTS
#    define FBXDOM_MESH_API __attribute__((visibility("default")))
#  else
#    define FBXDOM_MESH_API
#  endif
#else
#  define FBXDOM_MESH_API
#endif

#define FBXDOM_MESH_NDAPI [[nodiscard]] FBXDOM_MESH_API
