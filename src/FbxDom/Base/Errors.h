//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <FbxDom/Base/api_export.h>

namespace fbxdom {

//! Domain-specific document errors exposed as std::error_code.
enum class DomError : int {
  kNodeNotFound = 1,
  kPropertyNotFound,
  kPropertyTypeMismatch,
  kInvalidEnumValue,
  kInvalidNumericValue,
  kMalformedIndexBuffer,
  kMalformedNode,
  kUnsupportedVersion,
  kInvalidObjectClass,
  kIndexOutOfRange,
};

//! String representation of enum values in `DomError`.
FBXDOM_BASE_NDAPI auto to_string(DomError value) noexcept -> const char*;

//! Category for document errors.
class DomErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "FbxDom Error";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override;
};

// Implemented in the .cpp so that error_code identity comparisons hold across
// shared library boundaries.
FBXDOM_BASE_NDAPI auto GetDomErrorCategory() noexcept
  -> const DomErrorCategory&;

// Helper to create std::error_code from DomError
inline auto make_error_code(DomError e) noexcept -> std::error_code
{
  return { static_cast<int>(e), GetDomErrorCategory() };
}

//! A failed document query: the error kind plus a description of the
//! offending key, node or value.
class Error {
public:
  Error(DomError kind, std::string message)
    : kind_(kind)
    , message_(std::move(message))
  {
  }

  [[nodiscard]] auto Kind() const noexcept -> DomError { return kind_; }

  [[nodiscard]] auto Code() const noexcept -> std::error_code
  {
    return make_error_code(kind_);
  }

  [[nodiscard]] auto Message() const noexcept -> const std::string&
  {
    return message_;
  }

  friend auto operator==(const Error&, const Error&) -> bool = default;

private:
  DomError kind_;
  std::string message_;
};

//! Formats an error as `<kind>: <message>`.
FBXDOM_BASE_NDAPI auto to_string(const Error& error) -> std::string;

//! Outcome of every fallible document query.
template <typename T> using Result = std::expected<T, Error>;

//! Builds the unexpected side of a Result with an fmt-formatted message.
template <typename... Args>
[[nodiscard]] auto MakeError(DomError kind,
  fmt::format_string<Args...> format, Args&&... args) -> std::unexpected<Error>
{
  return std::unexpected(
    Error(kind, fmt::format(format, std::forward<Args>(args)...)));
}

} // namespace fbxdom

// Inject std::is_error_code_enum specialization into std so that DomError can
// be implicitly converted to std::error_code.
template <> struct std::is_error_code_enum<fbxdom::DomError> : true_type { };
