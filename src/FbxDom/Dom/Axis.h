//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <glm/mat3x3.hpp>
#include <glm/vec3.hpp>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Dom/api_export.h>

namespace fbxdom::dom {

//! Coordinate axis, with the numeric codes used by the `*Axis` properties.
enum class Axis : std::uint8_t {
  kX = 0,
  kY = 1,
  kZ = 2,
};

//! One of the six directions along a coordinate axis.
enum class SignedAxis : std::uint8_t {
  kPosX,
  kNegX,
  kPosY,
  kNegY,
  kPosZ,
  kNegZ,
};

FBXDOM_DOM_NDAPI auto to_string(Axis value) noexcept -> const char*;

//! String representation of enum values in `SignedAxis` (`+X`, `-Y`, ...).
FBXDOM_DOM_NDAPI auto to_string(SignedAxis value) noexcept -> const char*;

[[nodiscard]] constexpr auto MakeSignedAxis(Axis axis, bool positive) noexcept
  -> SignedAxis
{
  return static_cast<SignedAxis>(
    static_cast<std::uint8_t>(axis) * 2 + (positive ? 0 : 1));
}

[[nodiscard]] constexpr auto AxisOf(SignedAxis value) noexcept -> Axis
{
  return static_cast<Axis>(static_cast<std::uint8_t>(value) / 2);
}

[[nodiscard]] constexpr auto IsPositive(SignedAxis value) noexcept -> bool
{
  return static_cast<std::uint8_t>(value) % 2 == 0;
}

//! Unit vector pointing in the direction of `value`.
FBXDOM_DOM_NDAPI auto ToVector(SignedAxis value) noexcept -> glm::dvec3;

//! Decodes an (axis code, sign) pair read from the `<name>Axis` and
//! `<name>AxisSign` properties.
/*!
 Valid codes are 0 (X), 1 (Y) and 2 (Z); valid signs are 1 and -1. Any other
 pair is a kInvalidEnumValue error, reporting the axis code when it is invalid
 and the sign otherwise.

 @param name Property name prefix (`Up`, `Front`, `Coord`, `OriginalUp`),
        used in error messages.
*/
FBXDOM_DOM_NDAPI auto DecodeAxis(std::string_view name, std::int32_t code,
  std::int32_t sign) -> Result<SignedAxis>;

enum class Handedness : std::uint8_t {
  kRightHanded,
  kLeftHanded,
};

FBXDOM_DOM_NDAPI auto to_string(Handedness value) noexcept -> const char*;

//! Orientation of a document's coordinate system.
/*!
 Made of three signed axes on three distinct coordinate axes. The system is
 right-handed when `cross(right, up) == front`.
*/
class AxisSystem {
public:
  //! @return the axis system, or nullopt when two of the signed axes share a
  //! coordinate axis.
  FBXDOM_DOM_NDAPI static auto FromUpFrontRight(
    SignedAxis up, SignedAxis front, SignedAxis right)
    -> std::optional<AxisSystem>;

  [[nodiscard]] auto Up() const noexcept -> SignedAxis { return up_; }
  [[nodiscard]] auto Front() const noexcept -> SignedAxis { return front_; }
  [[nodiscard]] auto Right() const noexcept -> SignedAxis { return right_; }

  FBXDOM_DOM_NDAPI auto GetHandedness() const noexcept -> Handedness;

  //! Matrix whose columns are the right, up and front unit vectors.
  FBXDOM_DOM_NDAPI auto BasisMatrix() const noexcept -> glm::dmat3;

  friend auto operator==(const AxisSystem&, const AxisSystem&) -> bool
    = default;

private:
  AxisSystem(SignedAxis up, SignedAxis front, SignedAxis right) noexcept
    : up_(up)
    , front_(front)
    , right_(right)
  {
  }

  SignedAxis up_;
  SignedAxis front_;
  SignedAxis right_;
};

//! Formats as `up=+Y, front=+Z, right=+X`.
FBXDOM_DOM_NDAPI auto to_string(const AxisSystem& value) -> std::string;

} // namespace fbxdom::dom
