//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <optional>
#include <string>

#include <glm/geometric.hpp>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/Axis.h>

using fbxdom::Result;
using fbxdom::dom::Axis;
using fbxdom::dom::AxisSystem;
using fbxdom::dom::Handedness;
using fbxdom::dom::SignedAxis;

auto fbxdom::dom::to_string(const Axis value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case Axis::kX: return "X";
    case Axis::kY: return "Y";
    case Axis::kZ: return "Z";
    // clang-format on
  }

  return "__NotSupported__";
}

auto fbxdom::dom::to_string(const SignedAxis value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case SignedAxis::kPosX: return "+X";
    case SignedAxis::kNegX: return "-X";
    case SignedAxis::kPosY: return "+Y";
    case SignedAxis::kNegY: return "-Y";
    case SignedAxis::kPosZ: return "+Z";
    case SignedAxis::kNegZ: return "-Z";
    // clang-format on
  }

  return "__NotSupported__";
}

auto fbxdom::dom::to_string(const Handedness value) noexcept -> const char*
{
  switch (value) {
    // clang-format off
    case Handedness::kRightHanded: return "RightHanded";
    case Handedness::kLeftHanded:  return "LeftHanded";
    // clang-format on
  }

  return "__NotSupported__";
}

auto fbxdom::dom::ToVector(const SignedAxis value) noexcept -> glm::dvec3
{
  glm::dvec3 v { 0.0 };
  v[static_cast<glm::length_t>(AxisOf(value))] = IsPositive(value) ? 1.0 : -1.0;
  return v;
}

auto fbxdom::dom::DecodeAxis(const std::string_view name,
  const std::int32_t code, const std::int32_t sign) -> Result<SignedAxis>
{
  // clang-format off
  if (code == 0 && sign == 1)  { return SignedAxis::kPosX; }
  if (code == 0 && sign == -1) { return SignedAxis::kNegX; }
  if (code == 1 && sign == 1)  { return SignedAxis::kPosY; }
  if (code == 1 && sign == -1) { return SignedAxis::kNegY; }
  if (code == 2 && sign == 1)  { return SignedAxis::kPosZ; }
  if (code == 2 && sign == -1) { return SignedAxis::kNegZ; }
  // clang-format on

  const bool code_valid = code >= 0 && code <= 2;
  const bool sign_valid = sign == 1 || sign == -1;
  if (!code_valid) {
    return MakeError(DomError::kInvalidEnumValue,
      "invalid `{}Axis` property value: expected 0, 1, or 2 but got {}", name,
      code);
  }
  if (!sign_valid) {
    return MakeError(DomError::kInvalidEnumValue,
      "invalid `{}AxisSign` property value: expected 1 or -1, but got {}", name,
      sign);
  }
  ABORT_F("axis ({}, {}) for `{}Axis` is valid but missing from the table",
    code, sign, name);
}

auto AxisSystem::FromUpFrontRight(const SignedAxis up, const SignedAxis front,
  const SignedAxis right) -> std::optional<AxisSystem>
{
  const auto u = AxisOf(up);
  const auto f = AxisOf(front);
  const auto r = AxisOf(right);
  if (u == f || u == r || f == r) {
    return std::nullopt;
  }
  return AxisSystem(up, front, right);
}

auto AxisSystem::GetHandedness() const noexcept -> Handedness
{
  const auto front = glm::cross(ToVector(right_), ToVector(up_));
  return front == ToVector(front_) ? Handedness::kRightHanded
                                   : Handedness::kLeftHanded;
}

auto AxisSystem::BasisMatrix() const noexcept -> glm::dmat3
{
  return glm::dmat3(ToVector(right_), ToVector(up_), ToVector(front_));
}

auto fbxdom::dom::to_string(const AxisSystem& value) -> std::string
{
  return fmt::format("up={}, front={}, right={}", to_string(value.Up()),
    to_string(value.Front()), to_string(value.Right()));
}
