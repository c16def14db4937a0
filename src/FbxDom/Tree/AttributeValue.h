//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <FbxDom/Tree/api_export.h>

namespace fbxdom::tree {

//! Type tag of a node attribute, in the order of the FBX binary type codes
//! `C Y I L F D b i l f d S R`.
enum class AttributeType : std::uint8_t {
  kBool,
  kI16,
  kI32,
  kI64,
  kF32,
  kF64,
  kArrBool,
  kArrI32,
  kArrI64,
  kArrF32,
  kArrF64,
  kString,
  kBinary,
};

//! String representation of enum values in `AttributeType`.
FBXDOM_TREE_NDAPI auto to_string(AttributeType value) noexcept -> const char*;

//! One typed attribute of a tree node, as produced by the binary decoder.
class AttributeValue {
public:
  // Alternative order must follow AttributeType.
  using Storage = std::variant<bool, std::int16_t, std::int32_t, std::int64_t,
    float, double, std::vector<bool>, std::vector<std::int32_t>,
    std::vector<std::int64_t>, std::vector<float>, std::vector<double>,
    std::string, std::vector<std::byte>>;

  template <typename T>
    requires(!std::same_as<std::remove_cvref_t<T>, AttributeValue>
      && std::is_constructible_v<Storage, std::in_place_type_t<T>, T>)
  explicit AttributeValue(T value)
    : storage_(std::in_place_type<T>, std::move(value))
  {
  }

  explicit AttributeValue(std::string_view text)
    : storage_(std::in_place_type<std::string>, text)
  {
  }

  explicit AttributeValue(const char* text)
    : storage_(std::in_place_type<std::string>, text)
  {
  }

  [[nodiscard]] auto Type() const noexcept -> AttributeType
  {
    return static_cast<AttributeType>(storage_.index());
  }

  //! Returns a pointer to the stored value if it holds exactly `T`.
  template <typename T> [[nodiscard]] auto TryGet() const noexcept -> const T*
  {
    return std::get_if<T>(&storage_);
  }

  //! Returns the string payload, if this is a string attribute.
  [[nodiscard]] auto AsString() const noexcept
    -> std::optional<std::string_view>
  {
    if (const auto* text = TryGet<std::string>()) {
      return std::string_view(*text);
    }
    return std::nullopt;
  }

  [[nodiscard]] auto GetStorage() const noexcept -> const Storage&
  {
    return storage_;
  }

  friend auto operator==(const AttributeValue&, const AttributeValue&) -> bool
    = default;

private:
  Storage storage_;
};

} // namespace fbxdom::tree
