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

#include "omeslice/core/errors.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/cord.h"

namespace omeslice {
namespace core {

namespace {

constexpr std::array<ErrorKind, 5> kAllKinds = {
    ErrorKind::kMalformedMetadata, ErrorKind::kOutOfBounds,
    ErrorKind::kSourceRead, ErrorKind::kChannelMismatch,
    ErrorKind::kUnsupportedGeometry};

}  // namespace

absl::StatusCode GetStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kMalformedMetadata:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kOutOfBounds:
      return absl::StatusCode::kOutOfRange;
    case ErrorKind::kSourceRead:
      return absl::StatusCode::kDataLoss;
    case ErrorKind::kChannelMismatch:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kUnsupportedGeometry:
      return absl::StatusCode::kUnimplemented;
  }
  return absl::StatusCode::kUnknown;
}

absl::Status MakeError(ErrorKind kind, std::string_view message) {
  absl::Status status(GetStatusCode(kind), message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(GetName(kind)));
  return status;
}

absl::Status MalformedMetadataError(std::string_view message) {
  return MakeError(ErrorKind::kMalformedMetadata, message);
}

absl::Status OutOfBoundsError(std::string_view message) {
  return MakeError(ErrorKind::kOutOfBounds, message);
}

absl::Status SourceReadError(std::string_view message) {
  return MakeError(ErrorKind::kSourceRead, message);
}

absl::Status ChannelMismatchError(std::string_view message) {
  return MakeError(ErrorKind::kChannelMismatch, message);
}

absl::Status UnsupportedGeometryError(std::string_view message) {
  return MakeError(ErrorKind::kUnsupportedGeometry, message);
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  const std::optional<absl::Cord> payload =
      status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  const std::string name(*payload);
  for (ErrorKind kind : kAllKinds) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

absl::Status AsErrorKind(const absl::Status& status, ErrorKind kind) {
  if (status.ok() || GetErrorKind(status).has_value()) {
    return status;
  }
  absl::Status tagged = MakeError(kind, status.message());
  status.ForEachPayload(
      [&tagged](std::string_view type_url, const absl::Cord& payload) {
        tagged.SetPayload(type_url, payload);
      });
  return tagged;
}

}  // namespace core
}  // namespace omeslice
