//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <FbxDom/Tree/AttributeValue.h>

auto fbxdom::tree::to_string(AttributeType value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case AttributeType::kBool:     return "bool";
    case AttributeType::kI16:      return "i16";
    case AttributeType::kI32:      return "i32";
    case AttributeType::kI64:      return "i64";
    case AttributeType::kF32:      return "f32";
    case AttributeType::kF64:      return "f64";
    case AttributeType::kArrBool:  return "bool[]";
    case AttributeType::kArrI32:   return "i32[]";
    case AttributeType::kArrI64:   return "i64[]";
    case AttributeType::kArrF32:   return "f32[]";
    case AttributeType::kArrF64:   return "f64[]";
    case AttributeType::kString:   return "string";
    case AttributeType::kBinary:   return "binary";
    // clang-format on
  }

  return "__NotSupported__";
}
