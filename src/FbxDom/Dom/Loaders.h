//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Config/DocumentConfig.h>
#include <FbxDom/Dom/Properties.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/AttributeValue.h>

namespace fbxdom::dom {

//! Raw byte payload of a `blob` property.
using Bytes = std::vector<std::byte>;

namespace detail {
  //! Name of a loadable type, for error messages.
  template <typename T>
  constexpr auto LoadableTypeName() noexcept -> const char*
  {
    // clang-format off
    if constexpr (std::is_same_v<T, bool>)              { return "bool"; }
    else if constexpr (std::is_same_v<T, std::int16_t>) { return "int16"; }
    else if constexpr (std::is_same_v<T, std::int32_t>) { return "int32"; }
    else if constexpr (std::is_same_v<T, std::int64_t>) { return "int64"; }
    else if constexpr (std::is_same_v<T, std::uint32_t>){ return "uint32"; }
    else if constexpr (std::is_same_v<T, std::uint64_t>){ return "uint64"; }
    else if constexpr (std::is_same_v<T, float>)        { return "float"; }
    else if constexpr (std::is_same_v<T, double>)       { return "double"; }
    else if constexpr (std::is_same_v<T, std::string>)  { return "string"; }
    else if constexpr (std::is_same_v<T, Bytes>)        { return "bytes"; }
    else                                                { return "?"; }
    // clang-format on
  }

  template <typename T, typename Variant> struct IsAlternative;
  template <typename T, typename... Ts>
  struct IsAlternative<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> { };

  //! Whether attributes can hold `T` without conversion.
  template <typename T>
  constexpr bool kIsStoredType
    = IsAlternative<T, tree::AttributeValue::Storage>::value;

  template <typename T>
  concept SignedLoadable = std::is_same_v<T, std::int16_t>
    || std::is_same_v<T, std::int32_t> || std::is_same_v<T, std::int64_t>;

  template <typename T>
  concept UnsignedLoadable
    = std::is_same_v<T, std::uint32_t> || std::is_same_v<T, std::uint64_t>;

  template <typename T>
  concept Loadable = std::is_same_v<T, bool> || SignedLoadable<T>
    || UnsignedLoadable<T> || std::is_same_v<T, float>
    || std::is_same_v<T, double> || std::is_same_v<T, std::string>
    || std::is_same_v<T, Bytes>;

  FBXDOM_DOM_NDAPI auto TypeMismatch(const PropertyHandle& property,
    const tree::AttributeValue& stored, const char* requested)
    -> std::unexpected<Error>;

  FBXDOM_DOM_NDAPI auto ArityMismatch(const PropertyHandle& property,
    std::size_t expected) -> std::unexpected<Error>;

  //! Any integer attribute, widened to int64.
  FBXDOM_DOM_NDAPI auto StoredInteger(const tree::AttributeValue& value)
    -> std::optional<std::int64_t>;

  //! Converts one value attribute of `property` to `T` under `policy`.
  template <Loadable T>
  auto ConvertAttribute(const PropertyHandle& property,
    const tree::AttributeValue& value, NumericConversion policy) -> Result<T>
  {
    if constexpr (kIsStoredType<T>) {
      if (const auto* exact = value.TryGet<T>()) {
        return *exact;
      }
    }
    if (policy == NumericConversion::kExact) {
      return TypeMismatch(property, value, LoadableTypeName<T>());
    }

    if constexpr (SignedLoadable<T> || UnsignedLoadable<T>) {
      if (const auto stored = StoredInteger(value)) {
        if (!std::in_range<T>(*stored)) {
          return MakeError(DomError::kPropertyTypeMismatch,
            "property `{}` value {} does not fit in {}", property.Name(),
            *stored, LoadableTypeName<T>());
        }
        return static_cast<T>(*stored);
      }
    } else if constexpr (std::is_same_v<T, double>) {
      if (const auto* single = value.TryGet<float>()) {
        return static_cast<double>(*single);
      }
    }
    return TypeMismatch(property, value, LoadableTypeName<T>());
  }
} // namespace detail

//! Loads a property holding exactly one primitive value.
/*!
 Supported types: `bool`, `int16_t`, `int32_t`, `int64_t`, `uint32_t`,
 `uint64_t`, `float`, `double`, `std::string` and `Bytes`.

 With NumericConversion::kExact only the attribute type matching `T` is
 accepted. With kLossless an integer attribute also loads into any integer
 type that can represent its value, and an `f32` attribute into `double`.
 Conversions between integers and floating point always fail.
*/
template <detail::Loadable T> class PrimitiveLoader {
public:
  using Output = T;

  explicit PrimitiveLoader(
    NumericConversion policy = NumericConversion::kLossless) noexcept
    : policy_(policy)
  {
  }

  [[nodiscard]] auto Load(const PropertyHandle& property) const -> Result<T>
  {
    const auto values = property.ValuePart();
    if (values.size() != 1) {
      return detail::ArityMismatch(property, 1);
    }
    return detail::ConvertAttribute<T>(property, values.front(), policy_);
  }

private:
  NumericConversion policy_;
};

//! Loads `Vector3D`, `Color`, `Lcl Translation` and similar properties stored
//! as three floating point values.
class Vec3Loader {
public:
  using Output = glm::dvec3;

  explicit Vec3Loader(
    NumericConversion policy = NumericConversion::kLossless) noexcept
    : policy_(policy)
  {
  }

  FBXDOM_DOM_NDAPI auto Load(const PropertyHandle& property) const
    -> Result<glm::dvec3>;

private:
  NumericConversion policy_;
};

static_assert(PropertyLoader<PrimitiveLoader<std::int32_t>>);
static_assert(PropertyLoader<PrimitiveLoader<std::string>>);
static_assert(PropertyLoader<Vec3Loader>);

} // namespace fbxdom::dom
