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
#ifndef AIFO_OMESLICE_INCLUDE_OMESLICE_STATUS_STATUS_MACROS_H_
#define AIFO_OMESLICE_INCLUDE_OMESLICE_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace omeslice::status {

/// Marker separating the root message from the appended frames.
inline constexpr std::string_view kFrameMarker = "\n  at ";

/**
 * @brief Formats one stack-frame line.
 *
 * Produces "  at Function (file.cpp:123) [CODE] - optional message".
 */
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string frame = absl::StrCat("  at ", function, " (", file, ":", line,
                                   ") [", absl::StatusCodeToString(code), "]");
  if (!message.empty()) {
    absl::StrAppend(&frame, " - ", message);
  }
  return frame;
}

/// @brief Returns the message without any appended frames.
inline std::string_view RootMessage(std::string_view full_message) {
  const auto pos = full_message.find(kFrameMarker);
  return pos == std::string_view::npos ? full_message
                                       : full_message.substr(0, pos);
}

/**
 * @brief Appends exactly one frame to a non-ok status.
 *
 * The code and every payload of the input status are carried over, so a
 * status keeps its error kind however many layers it crosses.
 *
 * @param st        Original status (returned as-is when ok).
 * @param function  Name of the calling function.
 * @param file      Source file path.
 * @param line      Source line number.
 * @param message   Optional per-frame message.
 */
inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  if (st.ok()) {
    return st;
  }

  std::string out(st.message());
  out.push_back('\n');
  out += FormatStackFrame(function, file, line, st.code(), message);

  absl::Status traced(st.code(), out);
  st.ForEachPayload(
      [&traced](std::string_view type_url, const absl::Cord& payload) {
        traced.SetPayload(type_url, payload);
      });
  return traced;
}

/// @brief StatusOr overload; values pass through untouched.
template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace omeslice::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief Create a traced absl::Status with an initial frame.
 *
 * @param code    The absl::StatusCode to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                        \
  ::omeslice::status::AddTrace(absl::Status((code), (message)), __func__, \
                               __FILE__, __LINE__)

/**
 * @brief Attach a frame to an existing status (typically one produced by an
 * error-kind factory) at the point where it is first returned.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define TRACE_STATUS(status_expr) \
  ::omeslice::status::AddTrace((status_expr), __func__, __FILE__, __LINE__)

/**
 * @brief Propagate an absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param msg   Message for this frame (may be empty).
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                           \
  do {                                                                       \
    auto _st = (expr);                                                       \
    if (!_st.ok()) {                                                         \
      return ::omeslice::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                          (msg));                            \
    }                                                                        \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
 *
 * The value is moved out, so move-only types are accepted.
 *
 * @param lhs   Target variable (already declared).
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                     \
  do {                                                                       \
    auto _sor = (expr);                                                      \
    if (!_sor.ok()) {                                                        \
      return ::omeslice::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                          __LINE__, ##__VA_ARGS__);          \
    }                                                                        \
    lhs = std::move(_sor).value();                                           \
  } while (0)

/**
 * @brief Declare a variable and unpack a StatusOr<T> into it.
 *
 * @param type   The type of the variable to declare.
 * @param name   The name of the variable to declare.
 * @param expr   A StatusOr<T>-producing expression.
 * @param ...    Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN(type, name, expr, ...) \
  type name;                                            \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

#endif  // AIFO_OMESLICE_INCLUDE_OMESLICE_STATUS_STATUS_MACROS_H_
