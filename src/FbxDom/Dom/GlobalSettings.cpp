//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/GlobalSettings.h>

using fbxdom::Result;
using fbxdom::dom::AxisSystem;
using fbxdom::dom::GlobalSettings;
using fbxdom::dom::SignedAxis;
using fbxdom::dom::UnitScaleFactor;

namespace {

constexpr std::string_view kNodeName = "GlobalSettings";

} // namespace

auto GlobalSettings::FromTree(const tree::Tree& tree,
  const DefinitionsCache& definitions, const DocumentConfig& config)
  -> Result<GlobalSettings>
{
  const auto node = tree.Root().FirstChildByName(kNodeName);
  if (!node) {
    return MakeError(DomError::kNodeNotFound,
      "expected top-level `{}` node but not found", kNodeName);
  }

  std::optional<PropertiesNodeId> direct;
  if (const auto props = node->FirstChildByName("Properties70")) {
    direct = PropertiesNodeId { props->Id() };
  } else {
    DLOG_F(1, "`{}` has no Properties70, using the template only", kNodeName);
  }
  const auto defaults = definitions.PropsNodeId(
    kNodeName, config.GlobalSettingsNativeType());

  return GlobalSettings(ObjectProperties(
    tree, direct, defaults, config.GetNumericConversion()));
}

auto GlobalSettings::ReadAxis(std::string_view name) const
  -> Result<SignedAxis>
{
  const auto code_key = fmt::format("{}Axis", name);
  const auto code = properties_.Value<std::int32_t>(code_key);
  if (!code) {
    return std::unexpected(code.error());
  }
  const auto sign = properties_.Value<std::int32_t>(code_key + "Sign");
  if (!sign) {
    return std::unexpected(sign.error());
  }
  return DecodeAxis(name, *code, *sign);
}

auto GlobalSettings::UpAxis() const -> Result<SignedAxis>
{
  return ReadAxis("Up");
}

auto GlobalSettings::FrontAxis() const -> Result<SignedAxis>
{
  return ReadAxis("Front");
}

auto GlobalSettings::RightAxis() const -> Result<SignedAxis>
{
  return ReadAxis("Coord");
}

auto GlobalSettings::OriginalUpAxis() const -> Result<SignedAxis>
{
  return ReadAxis("OriginalUp");
}

auto GlobalSettings::GetAxisSystem() const -> Result<AxisSystem>
{
  const auto up = UpAxis();
  if (!up) {
    return std::unexpected(up.error());
  }
  const auto front = FrontAxis();
  if (!front) {
    return std::unexpected(front.error());
  }
  const auto right = RightAxis();
  if (!right) {
    return std::unexpected(right.error());
  }

  auto system = AxisSystem::FromUpFrontRight(*up, *front, *right);
  if (!system) {
    return MakeError(DomError::kInvalidEnumValue,
      "invalid axis system: up={}, front={}, right={} must lie on three "
      "distinct axes",
      to_string(*up), to_string(*front), to_string(*right));
  }
  return *system;
}

auto GlobalSettings::UnitScaleFactorRaw() const -> Result<double>
{
  return properties_.Value<double>("UnitScaleFactor");
}

auto GlobalSettings::GetUnitScaleFactor() const -> Result<UnitScaleFactor>
{
  return UnitScaleFactorRaw().and_then(UnitScaleFactor::Create);
}
