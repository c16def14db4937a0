//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>

#include <FbxDom/Base/Errors.h>

auto fbxdom::to_string(DomError value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case DomError::kNodeNotFound:          return "NodeNotFound";
    case DomError::kPropertyNotFound:      return "PropertyNotFound";
    case DomError::kPropertyTypeMismatch:  return "PropertyTypeMismatch";
    case DomError::kInvalidEnumValue:      return "InvalidEnumValue";
    case DomError::kInvalidNumericValue:   return "InvalidNumericValue";
    case DomError::kMalformedIndexBuffer:  return "MalformedIndexBuffer";
    case DomError::kMalformedNode:         return "MalformedNode";
    case DomError::kUnsupportedVersion:    return "UnsupportedVersion";
    case DomError::kInvalidObjectClass:    return "InvalidObjectClass";
    case DomError::kIndexOutOfRange:       return "IndexOutOfRange";
    // clang-format on
  }

  return "__NotSupported__";
}

auto fbxdom::DomErrorCategory::message(int ev) const -> std::string
{
  switch (static_cast<DomError>(ev)) {
  case DomError::kNodeNotFound:
    return "A required node is missing from the document tree";
  case DomError::kPropertyNotFound:
    return "Property is present in neither the object nor its class template";
  case DomError::kPropertyTypeMismatch:
    return "Stored property value does not match the requested type";
  case DomError::kInvalidEnumValue:
    return "Value is outside the set of valid enumerators";
  case DomError::kInvalidNumericValue:
    return "Numeric value is outside its valid domain";
  case DomError::kMalformedIndexBuffer:
    return "Polygon vertex index buffer violates the polygon encoding";
  case DomError::kMalformedNode:
    return "Node attributes or children do not have the expected layout";
  case DomError::kUnsupportedVersion:
    return "Document version is not supported";
  case DomError::kInvalidObjectClass:
    return "Object does not have the requested class";
  case DomError::kIndexOutOfRange:
    return "Index does not address an element of its index space";
  default:
    return "Unknown FbxDom error";
  }
}

auto fbxdom::GetDomErrorCategory() noexcept -> const DomErrorCategory&
{
  static DomErrorCategory instance;
  return instance;
}

auto fbxdom::to_string(const Error& error) -> std::string
{
  return fmt::format("{}: {}", to_string(error.Kind()), error.Message());
}
