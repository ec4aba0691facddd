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

#include <stddef.h>
#include <unistd.h>

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/expected.h>
#include <fmt/core.h>  // IWYU pragma: export
#include <fmt/format.h>

namespace rangeio {

class StackTraceError;

/**
 * One frame of an error trace: where a failure was observed or propagated,
 * and the message attached at that point.
 */
class StackTraceEntry {
 public:
  enum class FormatSpecifier : char {
    /** Prefix multi-line output with an arrow. */
    kArrow = 'a',
    /** Use terminal colors in the other specifiers. */
    kColor = 'c',
    /** The function name without namespace or arguments. */
    kFunction = 'f',
    /** The RANGEIO_EXPECT(exp) expression. */
    kLongExpression = 'E',
    /** The full source file path and line number. */
    kLongLocation = 'L',
    /** The message streamed into the entry. */
    kMessage = 'm',
    /** Prefix output with the stack frame index. */
    kNumbers = 'n',
    /** The function signature with fully-qualified types. */
    kPrettyFunction = 'F',
    /** Basename, line, function and message on one line. */
    kShort = 's',
    /** The `exp` inside `RANGEIO_EXPECT(exp)` */
    kShortExpression = 'e',
    /** The source file basename and line number. */
    kShortLocation = 'l',
  };
  static constexpr auto kVerbose = {
      FormatSpecifier::kArrow,
      FormatSpecifier::kColor,
      FormatSpecifier::kNumbers,
      FormatSpecifier::kShort,
  };
  static constexpr auto kVeryVerbose = {
      FormatSpecifier::kArrow,          FormatSpecifier::kColor,
      FormatSpecifier::kNumbers,        FormatSpecifier::kLongLocation,
      FormatSpecifier::kPrettyFunction, FormatSpecifier::kLongExpression,
      FormatSpecifier::kMessage,
  };

  StackTraceEntry(std::string file, size_t line, std::string pretty_function,
                  std::string function, std::string expression = "");

  StackTraceEntry(const StackTraceEntry& other);
  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other);
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  bool HasMessage() const;
  std::string Message() const { return message_.str(); }

  // Renders this entry according to `specifiers`. `index` is the position in
  // the enclosing trace, if any, used by kNumbers.
  fmt::format_context::iterator format(
      fmt::format_context& ctx, const std::vector<FormatSpecifier>& specifiers,
      std::optional<int> index) const;

 private:
  std::string file_;
  size_t line_;
  std::string pretty_function_;
  std::string function_;
  std::string expression_;
  std::stringstream message_;
};

// Format string for StackTraceError, taken from RANGEIO_ERROR_FORMAT when set.
std::string ResultErrorFormat(bool color);

#define RANGEIO_STACK_TRACE_ENTRY(expression)                       \
  ::rangeio::StackTraceEntry(__FILE__, __LINE__, __PRETTY_FUNCTION__, \
                             __func__, expression)

}  // namespace rangeio

/**
 * Formats a StackTraceEntry with {:specifiers}, where `specifiers` is an
 * ordered list of StackTraceEntry::FormatSpecifier characters. `v` expands to
 * the verbose set and `V` to the very verbose set.
 */
template <>
struct fmt::formatter<rangeio::StackTraceEntry> {
 public:
  constexpr auto parse(format_parse_context& ctx)
      -> format_parse_context::iterator {
    auto it = ctx.begin();
    for (; it != ctx.end() && *it != '}'; it++) {
      if (*it == 'v') {
        specs_.insert(specs_.end(), rangeio::StackTraceEntry::kVerbose);
      } else if (*it == 'V') {
        specs_.insert(specs_.end(), rangeio::StackTraceEntry::kVeryVerbose);
      } else {
        specs_.push_back(
            static_cast<rangeio::StackTraceEntry::FormatSpecifier>(*it));
      }
    }
    return it;
  }

  auto format(const rangeio::StackTraceEntry& entry, format_context& ctx) const
      -> format_context::iterator {
    return entry.format(ctx, specs_, std::nullopt);
  }

 private:
  std::vector<rangeio::StackTraceEntry::FormatSpecifier> specs_;
};

namespace rangeio {

class StackTraceError {
 public:
  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  StackTraceError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }

  std::string Message() const {
    return fmt::format(fmt::runtime("{:m}"), *this);
  }

  std::string Trace() const { return fmt::format(fmt::runtime("{:v}"), *this); }

  std::string FormatForEnv(bool color = (isatty(STDERR_FILENO) == 1)) const {
    return fmt::format(fmt::runtime(ResultErrorFormat(color)), *this);
  }

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  std::vector<StackTraceEntry> stack_;
};

inline StackTraceEntry::operator StackTraceError() && {
  return StackTraceError().PushEntry(std::move(*this));
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(StackTraceError(std::move(*this)));
}

std::ostream& operator<<(std::ostream&, const StackTraceError&);

}  // namespace rangeio

/**
 * Formats a whole trace as {:specifiers}. Entries are rendered outermost
 * first unless `^` is given. With `<outer>/<inner>`, the specifiers after the
 * slash apply only to the innermost entry, where the failure originated.
 */
template <>
struct fmt::formatter<rangeio::StackTraceError> {
 public:
  constexpr auto parse(format_parse_context& ctx)
      -> format_parse_context::iterator {
    auto it = ctx.begin();
    for (; it != ctx.end() && *it != '}'; it++) {
      auto& target = has_inner_specs_ ? inner_specs_ : specs_;
      if (*it == 'v') {
        target.insert(target.end(), Entry::kVerbose);
      } else if (*it == 'V') {
        target.insert(target.end(), Entry::kVeryVerbose);
      } else if (*it == '/') {
        has_inner_specs_ = true;
      } else if (*it == '^') {
        inner_to_outer_ = true;
      } else {
        target.push_back(static_cast<Entry::FormatSpecifier>(*it));
      }
    }
    return it;
  }

  format_context::iterator format(const rangeio::StackTraceError& error,
                                  format_context& ctx) const;

 private:
  using Entry = rangeio::StackTraceEntry;

  bool inner_to_outer_ = false;
  bool has_inner_specs_ = false;
  std::vector<Entry::FormatSpecifier> specs_;
  std::vector<Entry::FormatSpecifier> inner_specs_;
};
