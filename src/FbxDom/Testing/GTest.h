//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <FbxDom/Base/Errors.h>

#define NOLINT_TEST(ts, name) TEST(ts, name) // NOLINT
#define NOLINT_TEST_F(ts, name) TEST_F(ts, name) // NOLINT
#define NOLINT_TEST_P(ts, name) TEST_P(ts, name) // NOLINT
#define NOLINT_EXPECT_THROW(st, ex) EXPECT_THROW(st, ex) // NOLINT

namespace fbxdom::testing {

//! Matches a failed `fbxdom::Result` whose error is of the given kind.
/*!
 ```cpp
 EXPECT_THAT(UnitScaleFactor::Create(0.0),
   FailsWith(DomError::kInvalidNumericValue));
 ```
*/
MATCHER_P(FailsWith, kind, "") // NOLINT
{
  if (arg.has_value()) {
    *result_listener << "which holds a value";
    return false;
  }
  *result_listener << "which fails with " << to_string(arg.error());
  return arg.error().Kind() == kind;
}

} // namespace fbxdom::testing
