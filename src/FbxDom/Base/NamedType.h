//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

// Based on NamedType, Copyright (c) 2017 Jonathan Boccara
// License: MIT
// https://github.com/joboccara/NamedType

#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace fbxdom {

//! CRTP base giving a skill access to the strong type that inherits it.
template <typename T, template <typename> class Skill> struct Crtp {
  [[nodiscard]] constexpr auto underlying() noexcept -> T&
  {
    return static_cast<T&>(*this);
  }
  [[nodiscard]] constexpr auto underlying() const noexcept -> T const&
  {
    return static_cast<T const&>(*this);
  }
};

//! Strongly typed wrapper around a value type with opt-in skills.
/*!
 Two NamedType instantiations that differ only by their `Parameter` tag are
 distinct, non-convertible types. This is what keeps the various mesh index
 spaces apart: a control point index cannot be handed to an accessor that
 expects a polygon vertex index without an explicit `get()` and re-wrap.

 Skills are CRTP mixins adding behavior (comparison, hashing, printing) to
 one strong type without affecting others that share the underlying type.

 ### Usage Examples

 ```cpp
 using Width = fbxdom::NamedType<int, struct WidthTag, fbxdom::Comparable>;
 using Height = fbxdom::NamedType<int, struct HeightTag>;

 Width w { 10 };
 int raw = w.get();
 // Height h = w; // does not compile
 ```

 @tparam T         Underlying value type; references are not supported.
 @tparam Parameter Unique tag type that differentiates strong types.
 @tparam Skills    Zero or more skill mixins.
*/
template <typename T, typename Parameter, template <typename> class... Skills>
class NamedType : public Skills<NamedType<T, Parameter, Skills...>>... {
  static_assert(
    !std::is_reference_v<T>, "NamedType does not wrap reference types");

public:
  using UnderlyingType = T;

  constexpr NamedType() = default;

  explicit constexpr NamedType(T const& value) noexcept(
    std::is_nothrow_copy_constructible_v<T>)
    : value_(value)
  {
  }

  explicit constexpr NamedType(T&& value) noexcept(
    std::is_nothrow_move_constructible_v<T>)
    : value_(std::move(value))
  {
  }

  [[nodiscard]] constexpr auto get() noexcept -> T& { return value_; }
  [[nodiscard]] constexpr auto get() const noexcept -> T const&
  {
    return value_;
  }

private:
  T value_ {};
};

//! Provides `==` and `<=>` for NamedType.
template <typename T> struct Comparable : Crtp<T, Comparable> {
  [[nodiscard]] friend constexpr auto operator==(
    T const& lhs, T const& rhs) noexcept -> bool
  {
    return lhs.get() == rhs.get();
  }
  [[nodiscard]] friend constexpr auto operator<=>(
    T const& lhs, T const& rhs) noexcept
  {
    return lhs.get() <=> rhs.get();
  }
};

//! Provides stream output for NamedType (also used by GTest printers).
template <typename T> struct Printable : Crtp<T, Printable> {
  friend auto operator<<(std::ostream& os, T const& object) -> std::ostream&
  {
    return os << object.get();
  }
};

//! Enables std::hash support for NamedType.
template <typename T> struct Hashable {
  static constexpr bool is_hashable = true;
};

} // namespace fbxdom

template <typename T, typename Parameter, template <typename> class... Skills>
  requires(fbxdom::NamedType<T, Parameter, Skills...>::is_hashable)
struct std::hash<fbxdom::NamedType<T, Parameter, Skills...>> {
  [[nodiscard]] auto operator()(
    fbxdom::NamedType<T, Parameter, Skills...> const& x) const noexcept
    -> std::size_t
  {
    return std::hash<T> {}(x.get());
  }
};
