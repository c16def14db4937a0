//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cmath>

#include <FbxDom/Dom/UnitScaleFactor.h>

using fbxdom::dom::UnitScaleFactor;

auto UnitScaleFactor::Create(const double value) -> Result<UnitScaleFactor>
{
  if (std::fpclassify(value) != FP_NORMAL) {
    return MakeError(DomError::kInvalidNumericValue,
      "invalid `UnitScaleFactor`: expected \"normal\" floating-point number, "
      "but got {}",
      value);
  }
  return UnitScaleFactor(value);
}
