//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

//! Single entry point for logging in FbxDom.
/*!
 @file Logging.h

 All FbxDom code logs through loguru, configured to use fmt-style format
 strings (`LOG_F(INFO, "value: {}", v)`). The build defines
 `LOGURU_USE_FMTLIB=1` for every target that links the logging library; this
 header only fails loudly if that did not happen, so that no translation unit
 silently falls back to printf-style formatting.

 Types that want to appear in log messages provide an ADL-visible
 `to_string(T)` and are passed as `to_string(value)`.

 Conventions:
 - `LOG_F(WARNING, ...)` for malformed but recoverable document content.
 - `DLOG_F(1..3, ...)` for tracing document loading and lookups.
 - `CHECK_F` / `ABORT_F` for violated internal invariants, never for bad
   document data, which is reported through `fbxdom::Result`.
*/

#if !defined(LOGURU_USE_FMTLIB) || !LOGURU_USE_FMTLIB
#  error "FbxDom requires loguru built with LOGURU_USE_FMTLIB=1"
#endif

#include <fmt/format.h>

#include <loguru/loguru.hpp>
