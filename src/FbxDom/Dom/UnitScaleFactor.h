//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Dom/api_export.h>

namespace fbxdom::dom {

//! Size of one document unit, in centimeters.
/*!
 Always a normal floating point number: never zero, subnormal, infinite or
 NaN. Negative values are representable and accepted as-is.
*/
class UnitScaleFactor {
public:
  //! @return the factor, or a kInvalidNumericValue error when `value` is not a
  //! normal floating point number.
  FBXDOM_DOM_NDAPI static auto Create(double value) -> Result<UnitScaleFactor>;

  [[nodiscard]] auto CentimetersPerUnit() const noexcept -> double
  {
    return value_;
  }

  friend auto operator==(const UnitScaleFactor&, const UnitScaleFactor&)
    -> bool
    = default;

private:
  explicit UnitScaleFactor(double value) noexcept
    : value_(value)
  {
  }

  double value_;
};

} // namespace fbxdom::dom
