//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <optional>
#include <string_view>

#include <FbxDom/Base/Logging.h>
#include <FbxDom/Dom/Document.h>
#include <FbxDom/Dom/Object.h>

using fbxdom::dom::ObjectHandle;
using fbxdom::dom::ObjectId;
using fbxdom::dom::ObjectProperties;

namespace {

// Separates the object name from its class in the name attribute.
constexpr std::string_view kNameClassSeparator { "\x00\x01", 2 };

} // namespace

auto ObjectHandle::Id() const noexcept -> ObjectId
{
  return ObjectId { *node_.Attributes().front().TryGet<std::int64_t>() };
}

auto ObjectHandle::Name() const noexcept -> std::string_view
{
  const auto attributes = node_.Attributes();
  if (attributes.size() < 2) {
    return {};
  }
  const auto full_name = attributes[1].AsString().value_or(std::string_view {});
  return full_name.substr(0, full_name.find(kNameClassSeparator));
}

auto ObjectHandle::Subclass() const noexcept -> std::string_view
{
  const auto attributes = node_.Attributes();
  if (attributes.size() < 3) {
    return {};
  }
  return attributes[2].AsString().value_or(std::string_view {});
}

auto ObjectHandle::Properties(std::string_view native_type) const
  -> ObjectProperties
{
  std::optional<PropertiesNodeId> direct;
  if (const auto props = node_.FirstChildByName("Properties70")) {
    direct = PropertiesNodeId { props->Id() };
  }
  const auto defaults
    = document_->Definitions().PropsNodeId(Class(), native_type);
  DLOG_F(3, "object {} properties: direct={}, template `{}`/`{}`={}",
    Id().get(), direct.has_value(), Class(), native_type, defaults.has_value());
  return ObjectProperties(document_->GetTree(), direct, defaults,
    document_->GetConfig().GetNumericConversion());
}
