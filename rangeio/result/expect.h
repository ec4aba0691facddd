//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include <fmt/core.h>  // IWYU pragma: export

#include "rangeio/result/error_type.h"
#include "rangeio/result/result_type.h"  // IWYU pragma: export

namespace rangeio {

/**
 * Error return macros that record the location in the file. RANGEIO_ERRF takes
 * an fmt format string, RANGEIO_ERR a stream expression.
 *
 * Example usage:
 *
 *     if (fstat(fd, &st) != 0) {
 *       return RANGEIO_ERRF("fstat on '{}' failed: {}", path, strerror(errno));
 *     }
 */
#define RANGEIO_ERR(MSG) (RANGEIO_STACK_TRACE_ENTRY("") << MSG)
#define RANGEIO_ERRF(MSG, ...) \
  (RANGEIO_STACK_TRACE_ENTRY("") << fmt::format(FMT_STRING(MSG), __VA_ARGS__))

template <typename T>
T OutcomeDereference(std::optional<T>&& value) {
  return std::move(*value);
}

inline void OutcomeDereference(Result<void>&&) {}

template <typename T>
T OutcomeDereference(Result<T>&& result) {
  return std::move(*result);
}

template <typename T>
typename std::enable_if<std::is_convertible_v<T, bool>, T>::type
OutcomeDereference(T&& value) {
  return std::forward<T>(value);
}

inline bool TypeIsSuccess(bool value) { return value; }

template <typename T>
bool TypeIsSuccess(std::optional<T>& value) {
  return value.has_value();
}

template <typename T>
bool TypeIsSuccess(Result<T>& value) {
  return value.ok();
}

inline auto ErrorFromType(bool) { return StackTraceError(); }

template <typename T>
inline auto ErrorFromType(std::optional<T>&) {
  return StackTraceError();
}

template <typename T>
auto ErrorFromType(Result<T>& value) {
  return value.error();
}

#define RANGEIO_EXPECT_OVERLOAD(_1, _2, NAME, ...) NAME

#define RANGEIO_EXPECT2(RESULT, MSG)                          \
  ({                                                          \
    decltype(RESULT)&& macro_intermediate_result = RESULT;    \
    if (!TypeIsSuccess(macro_intermediate_result)) {          \
      auto current_entry = RANGEIO_STACK_TRACE_ENTRY(#RESULT); \
      current_entry << MSG;                                   \
      auto error = ErrorFromType(macro_intermediate_result);  \
      error.PushEntry(std::move(current_entry));              \
      return std::move(error);                                \
    };                                                        \
    OutcomeDereference(std::move(macro_intermediate_result)); \
  })

#define RANGEIO_EXPECT1(RESULT) RANGEIO_EXPECT2(RESULT, "")

/**
 * Error propagation macro usable as an expression.
 *
 * The first argument is a Result, an optional, or something convertible to
 * bool. On success the macro evaluates to the contained value (or the
 * unconverted value). On failure it returns from the enclosing function, which
 * must itself return a Result, with the inner error extended by a stack entry
 * for this call site and the optional message.
 *
 * Example usage:
 *
 *     Result<ObjectAttrs> Attrs(const Context&);
 *
 *     Result<int64_t> ObjectSize(const Context& ctx) {
 *       ObjectAttrs attrs = RANGEIO_EXPECT(Attrs(ctx), "No attributes");
 *       return attrs.size;
 *     }
 */
#define RANGEIO_EXPECT(...)                                            \
  RANGEIO_EXPECT_OVERLOAD(__VA_ARGS__, RANGEIO_EXPECT2, RANGEIO_EXPECT1) \
  (__VA_ARGS__)

#define RANGEIO_EXPECTF(RESULT, MSG, ...) \
  RANGEIO_EXPECT(RESULT, fmt::format(FMT_STRING(MSG), __VA_ARGS__))

#define RANGEIO_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, MSG)    \
  ({                                                                        \
    auto&& lhs_macro_intermediate_result = LHS_RESULT;                      \
    auto&& rhs_macro_intermediate_result = RHS_RESULT;                      \
    bool comparison_result = lhs_macro_intermediate_result COMPARE_OP       \
        rhs_macro_intermediate_result;                                      \
    if (!comparison_result) {                                               \
      auto current_entry = RANGEIO_STACK_TRACE_ENTRY("");                   \
      current_entry << "Expected \"" << #LHS_RESULT << "\" " << #COMPARE_OP \
                    << " \"" << #RHS_RESULT << "\" but was "                \
                    << lhs_macro_intermediate_result << " vs "              \
                    << rhs_macro_intermediate_result << ". ";               \
      current_entry << MSG;                                                 \
      auto error = ErrorFromType(false);                                    \
      error.PushEntry(std::move(current_entry));                            \
      return std::move(error);                                              \
    };                                                                      \
    comparison_result;                                                      \
  })

#define RANGEIO_COMPARE_EXPECT3(COMPARE_OP, LHS_RESULT, RHS_RESULT) \
  RANGEIO_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, "")

#define RANGEIO_COMPARE_EXPECT_OVERLOAD(_1, _2, _3, _4, NAME, ...) NAME

#define RANGEIO_COMPARE_EXPECT(...)                                     \
  RANGEIO_COMPARE_EXPECT_OVERLOAD(__VA_ARGS__, RANGEIO_COMPARE_EXPECT4, \
                                  RANGEIO_COMPARE_EXPECT3)              \
  (__VA_ARGS__)

#define RANGEIO_EXPECT_EQ(LHS_RESULT, RHS_RESULT, ...) \
  RANGEIO_COMPARE_EXPECT(==, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define RANGEIO_EXPECT_NE(LHS_RESULT, RHS_RESULT, ...) \
  RANGEIO_COMPARE_EXPECT(!=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define RANGEIO_EXPECT_LE(LHS_RESULT, RHS_RESULT, ...) \
  RANGEIO_COMPARE_EXPECT(<=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define RANGEIO_EXPECT_LT(LHS_RESULT, RHS_RESULT, ...) \
  RANGEIO_COMPARE_EXPECT(<, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define RANGEIO_EXPECT_GE(LHS_RESULT, RHS_RESULT, ...) \
  RANGEIO_COMPARE_EXPECT(>=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define RANGEIO_EXPECT_GT(LHS_RESULT, RHS_RESULT, ...) \
  RANGEIO_COMPARE_EXPECT(>, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)

}  // namespace rangeio
