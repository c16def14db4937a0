//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <utility>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Config/DocumentConfig.h>
#include <FbxDom/Dom/Axis.h>
#include <FbxDom/Dom/DefinitionsCache.h>
#include <FbxDom/Dom/ObjectProperties.h>
#include <FbxDom/Dom/UnitScaleFactor.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/Tree.h>

namespace fbxdom::dom {

//! Typed view of the top-level `GlobalSettings` node.
/*!
 Every accessor reads its properties on demand and fails independently, so a
 document with a broken `FrontAxisSign` still reports its unit scale.
 Properties missing from the node fall back to the `GlobalSettings` template
 of the Definitions section.
*/
class GlobalSettings {
public:
  //! @return the settings, or kNodeNotFound when the document has no
  //! `GlobalSettings` node.
  FBXDOM_DOM_NDAPI static auto FromTree(const tree::Tree& tree,
    const DefinitionsCache& definitions, const DocumentConfig& config)
    -> Result<GlobalSettings>;

  //! Up, front and right axes, validated as a whole.
  FBXDOM_DOM_NDAPI auto GetAxisSystem() const -> Result<AxisSystem>;

  //! `UpAxis` and `UpAxisSign`.
  FBXDOM_DOM_NDAPI auto UpAxis() const -> Result<SignedAxis>;

  //! `FrontAxis` and `FrontAxisSign`.
  FBXDOM_DOM_NDAPI auto FrontAxis() const -> Result<SignedAxis>;

  //! `CoordAxis` and `CoordAxisSign`.
  FBXDOM_DOM_NDAPI auto RightAxis() const -> Result<SignedAxis>;

  //! `OriginalUpAxis` and `OriginalUpAxisSign`, the up axis of the authoring
  //! application before export.
  FBXDOM_DOM_NDAPI auto OriginalUpAxis() const -> Result<SignedAxis>;

  FBXDOM_DOM_NDAPI auto GetUnitScaleFactor() const -> Result<UnitScaleFactor>;

  //! `UnitScaleFactor` as stored, without validation.
  FBXDOM_DOM_NDAPI auto UnitScaleFactorRaw() const -> Result<double>;

  [[nodiscard]] auto RawProperties() const noexcept -> const ObjectProperties&
  {
    return properties_;
  }

private:
  explicit GlobalSettings(ObjectProperties properties)
    : properties_(std::move(properties))
  {
  }

  [[nodiscard]] auto ReadAxis(std::string_view name) const
    -> Result<SignedAxis>;

  ObjectProperties properties_;
};

} // namespace fbxdom::dom
