// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_ERRORS_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_ERRORS_H_

#include <optional>
#include <string_view>

#include "absl/status/status.h"

/**
 * @file errors.h
 * @brief Error kinds raised by the crop engine
 *
 * Every kind maps onto a canonical absl::StatusCode and additionally carries
 * a payload naming the kind, so callers can tell a malformed document from a
 * corrupt tile even when both travel through several layers of
 * RETURN_IF_ERROR.
 */

namespace omeslice {
namespace core {

/// @brief Error kinds surfaced by the engine
enum class ErrorKind {
  kMalformedMetadata,    ///< Unreadable or inconsistent OME-XML
  kOutOfBounds,          ///< Invalid crop, or crop empty at a level
  kSourceRead,           ///< Tile read or decode failure
  kChannelMismatch,      ///< Declared vs physical sample layout disagree
  kUnsupportedGeometry,  ///< Pyramid level degenerate after crop
};

/// Payload type URL under which the kind name is stored.
inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.omeslice/omeslice.ErrorKind";

/// @brief Get string representation of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMalformedMetadata:
      return "MalformedMetadataError";
    case ErrorKind::kOutOfBounds:
      return "OutOfBoundsError";
    case ErrorKind::kSourceRead:
      return "SourceReadError";
    case ErrorKind::kChannelMismatch:
      return "ChannelMismatchError";
    case ErrorKind::kUnsupportedGeometry:
      return "UnsupportedGeometryError";
  }
  return "unknown";
}

/// @brief Canonical status code used for an error kind
absl::StatusCode GetStatusCode(ErrorKind kind);

/// @brief Build a status of the given kind
absl::Status MakeError(ErrorKind kind, std::string_view message);

absl::Status MalformedMetadataError(std::string_view message);
absl::Status OutOfBoundsError(std::string_view message);
absl::Status SourceReadError(std::string_view message);
absl::Status ChannelMismatchError(std::string_view message);
absl::Status UnsupportedGeometryError(std::string_view message);

/// @brief Recover the error kind of a status
/// @return The kind, or nullopt for ok statuses and foreign errors
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

/// @brief Check whether a status carries the given kind
inline bool IsErrorKind(const absl::Status& status, ErrorKind kind) {
  return GetErrorKind(status) == kind;
}

/// @brief Re-tag a foreign error as the given kind, keeping its message
///
/// Statuses that already carry a kind, and ok statuses, are returned as-is.
absl::Status AsErrorKind(const absl::Status& status, ErrorKind kind);

}  // namespace core

using core::ErrorKind;
using core::GetErrorKind;
using core::IsErrorKind;
using core::AsErrorKind;
using core::MalformedMetadataError;
using core::OutOfBoundsError;
using core::SourceReadError;
using core::ChannelMismatchError;
using core::UnsupportedGeometryError;

}  // namespace omeslice

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_CORE_ERRORS_H_
