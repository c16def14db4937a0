//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <FbxDom/Base/Macros.h>

namespace fbxdom {

//! How strictly stored property values must match the requested C++ type.
enum class NumericConversion : std::uint8_t {
  //! Only the identical attribute type is accepted.
  kExact,
  //! Integer attributes are also accepted for any integer type that can
  //! represent the stored value, and `f32` for a `double` request.
  kLossless,
};

//! Immutable configuration of a loaded Document.
/*!
 Value type, copied into the Document at load time. Build it through
 `DocumentConfig::Create()`:

 ```cpp
 auto config = DocumentConfig::Create()
                 .WithNumericConversion(NumericConversion::kExact)
                 .Build();
 ```
*/
class DocumentConfig final {
public:
  class Builder;

  [[nodiscard]] static auto Create() -> Builder;

  //! Constructs a default configuration.
  DocumentConfig() = default;

  ~DocumentConfig() = default;

  FBXDOM_DEFAULT_COPYABLE(DocumentConfig)
  FBXDOM_DEFAULT_MOVABLE(DocumentConfig)

  [[nodiscard]] auto GetNumericConversion() const noexcept -> NumericConversion
  {
    return numeric_conversion_;
  }

  //! Whether documents outside the FBX 7.x version range are rejected.
  [[nodiscard]] auto EnforceVersionRange() const noexcept -> bool
  {
    return enforce_version_range_;
  }

  //! Native type name of the GlobalSettings property template, as found under
  //! `Definitions/ObjectType "GlobalSettings"/PropertyTemplate`.
  [[nodiscard]] auto GlobalSettingsNativeType() const noexcept
    -> std::string_view
  {
    return global_settings_native_type_;
  }

private:
  static constexpr std::string_view kDefaultGlobalSettingsNativeType
    = "FbxGlobalSettings";

  NumericConversion numeric_conversion_ { NumericConversion::kLossless };
  bool enforce_version_range_ { true };
  std::string global_settings_native_type_ {
    std::string(kDefaultGlobalSettingsNativeType),
  };
};

class DocumentConfig::Builder final {
public:
  Builder() = default;
  ~Builder() = default;

  FBXDOM_DEFAULT_COPYABLE(Builder)
  FBXDOM_DEFAULT_MOVABLE(Builder)

  [[nodiscard]] auto WithNumericConversion(
    const NumericConversion conversion) && -> Builder&&
  {
    config_.numeric_conversion_ = conversion;
    return std::move(*this);
  }

  [[nodiscard]] auto WithVersionRangeEnforced(
    const bool enforce) && -> Builder&&
  {
    config_.enforce_version_range_ = enforce;
    return std::move(*this);
  }

  [[nodiscard]] auto WithGlobalSettingsNativeType(
    std::string native_type) && -> Builder&&
  {
    config_.global_settings_native_type_ = std::move(native_type);
    return std::move(*this);
  }

  [[nodiscard]] auto Build() && -> DocumentConfig
  {
    return std::move(config_);
  }

  [[nodiscard]] auto BuildShared() && -> std::shared_ptr<const DocumentConfig>
  {
    return std::make_shared<const DocumentConfig>(std::move(config_));
  }

private:
  DocumentConfig config_;
};

[[nodiscard]] inline auto DocumentConfig::Create() -> Builder
{
  return Builder {};
}

} // namespace fbxdom
