//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <FbxDom/Base/Errors.h>
#include <FbxDom/Config/DocumentConfig.h>
#include <FbxDom/Dom/Loaders.h>
#include <FbxDom/Dom/Properties.h>
#include <FbxDom/Dom/api_export.h>
#include <FbxDom/Tree/Tree.h>

namespace fbxdom::dom {

//! Properties of one object, with fallback to its class defaults.
/*!
 An object stores in its own `Properties70` node only the properties that
 differ from the class template registered in the Definitions section. This
 class combines both into an ordered list of lookup scopes, the object's own
 node first, then the template, and answers every lookup from the first scope
 that has the key. Either scope may be missing.

 Both scopes are views into the document tree, which must outlive this object.

 ### Usage Examples

 ```cpp
 auto up = props.Value<std::int32_t>("UpAxis");
 if (!up) {
   LOG_F(WARNING, "{}", to_string(up.error()));
 }
 auto color = props.Value("DiffuseColor", Vec3Loader {});
 ```
*/
class ObjectProperties {
public:
  FBXDOM_DOM_API ObjectProperties(const tree::Tree& tree,
    std::optional<PropertiesNodeId> direct,
    std::optional<PropertiesNodeId> defaults,
    NumericConversion conversion = NumericConversion::kLossless);

  //! Finds `key` in the first scope that has it.
  FBXDOM_DOM_NDAPI auto Get(std::string_view key) const
    -> std::optional<PropertyHandle>;

  //! Finds `key` and decodes it with `loader`.
  /*!
   @return the decoded value; a kPropertyNotFound error when no scope has the
   key; or the loader's error (kPropertyTypeMismatch) when the stored value
   does not have the requested type.
  */
  template <PropertyLoader Loader>
  [[nodiscard]] auto Value(std::string_view key, const Loader& loader) const
    -> Result<typename Loader::Output>
  {
    const auto property = Get(key);
    if (!property) {
      return NotFound(key);
    }
    return loader.Load(*property);
  }

  //! Decodes a single primitive value with this object's conversion policy.
  template <typename T>
  [[nodiscard]] auto Value(std::string_view key) const -> Result<T>
  {
    return Value(key, PrimitiveLoader<T> { conversion_ });
  }

  //! Lookup scopes, in resolution order.
  [[nodiscard]] auto Scopes() const noexcept
    -> std::span<const PropertiesHandle>
  {
    return scopes_;
  }

  [[nodiscard]] auto HasDirect() const noexcept -> bool { return has_direct_; }

  [[nodiscard]] auto HasDefaults() const noexcept -> bool
  {
    return scopes_.size() > (has_direct_ ? 1U : 0U);
  }

  [[nodiscard]] auto GetNumericConversion() const noexcept -> NumericConversion
  {
    return conversion_;
  }

private:
  FBXDOM_DOM_NDAPI static auto NotFound(std::string_view key)
    -> std::unexpected<Error>;

  std::vector<PropertiesHandle> scopes_;
  bool has_direct_ { false };
  NumericConversion conversion_;
};

} // namespace fbxdom::dom
