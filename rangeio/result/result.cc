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

#include "rangeio/result/error_type.h"

#include <stddef.h>
#include <stdlib.h>

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

namespace rangeio {
namespace {

constexpr char kTerminalBoldRed[] = "\033[0;1;31m";
constexpr char kTerminalCyan[] = "\033[0;36m";
constexpr char kTerminalRed[] = "\033[0;31m";
constexpr char kTerminalReset[] = "\033[0m";
constexpr char kTerminalUnderline[] = "\033[0;4m";
constexpr char kTerminalYellow[] = "\033[0;33m";

std::string Basename(const std::string& file) {
  auto last_slash = file.rfind('/');
  return file.substr(last_slash == std::string::npos ? 0 : last_slash + 1);
}

std::string Colored(bool color, const char* code, const std::string& text) {
  return color ? code + text + kTerminalReset : text;
}

}  // namespace

StackTraceEntry::StackTraceEntry(std::string file, size_t line,
                                 std::string pretty_function,
                                 std::string function, std::string expression)
    : file_(std::move(file)),
      line_(line),
      pretty_function_(std::move(pretty_function)),
      function_(std::move(function)),
      expression_(std::move(expression)) {}

StackTraceEntry::StackTraceEntry(const StackTraceEntry& other)
    : file_(other.file_),
      line_(other.line_),
      pretty_function_(other.pretty_function_),
      function_(other.function_),
      expression_(other.expression_),
      message_(other.message_.str()) {}

StackTraceEntry& StackTraceEntry::operator=(const StackTraceEntry& other) {
  file_ = other.file_;
  line_ = other.line_;
  pretty_function_ = other.pretty_function_;
  function_ = other.function_;
  expression_ = other.expression_;
  message_.str(other.message_.str());
  return *this;
}

bool StackTraceEntry::HasMessage() const { return !message_.str().empty(); }

/*
 * Specifiers [a,c,n] change how every line is decorated; each of the others
 * produces one line of output. Both the single entry formatter and the whole
 * trace formatter go through here.
 */
fmt::format_context::iterator StackTraceEntry::format(
    fmt::format_context& ctx, const std::vector<FormatSpecifier>& specifiers,
    std::optional<int> index) const {
  auto out = ctx.out();
  std::vector<FormatSpecifier> lines;
  bool arrow = false;
  bool color = false;
  bool numbers = false;
  for (auto spec : specifiers) {
    switch (spec) {
      case FormatSpecifier::kArrow:
        arrow = true;
        continue;
      case FormatSpecifier::kColor:
        color = true;
        continue;
      case FormatSpecifier::kNumbers:
        numbers = true;
        continue;
      case FormatSpecifier::kLongExpression:
      case FormatSpecifier::kShortExpression:
        if (expression_.empty()) {
          continue;
        }
        break;
      case FormatSpecifier::kMessage:
        if (!HasMessage()) {
          continue;
        }
        break;
      default:
        break;
    }
    lines.emplace_back(spec);
  }
  if (lines.empty()) {
    lines.push_back(FormatSpecifier::kShort);
  }
  const std::string short_file = Basename(file_);
  for (size_t i = 0; i < lines.size(); i++) {
    if (index.has_value() && numbers) {
      out = fmt::format_to(
          out, "{}. ", Colored(color, kTerminalYellow, std::to_string(*index)));
    }
    if (arrow && i + 2 < lines.size()) {
      out = fmt::format_to(out, "{}",
                           Colored(color, kTerminalRed, numbers ? "|  " : " | "));
    } else if (arrow && i + 2 == lines.size()) {
      out = fmt::format_to(out, "{}",
                           Colored(color, kTerminalRed, numbers ? "v  " : " v "));
    }
    switch (lines[i]) {
      case FormatSpecifier::kFunction:
        out = fmt::format_to(out, "{}", Colored(color, kTerminalCyan, function_));
        break;
      case FormatSpecifier::kLongExpression:
        out = fmt::format_to(out, "RANGEIO_EXPECT({})", expression_);
        break;
      case FormatSpecifier::kLongLocation:
        out = fmt::format_to(
            out, "{}:{}", Colored(color, kTerminalUnderline, file_),
            Colored(color, kTerminalYellow, std::to_string(line_)));
        break;
      case FormatSpecifier::kMessage:
        out = fmt::format_to(out, "{}",
                             Colored(color, kTerminalBoldRed, message_.str()));
        break;
      case FormatSpecifier::kPrettyFunction:
        out = fmt::format_to(out, "{}",
                             Colored(color, kTerminalCyan, pretty_function_));
        break;
      case FormatSpecifier::kShort:
        out = fmt::format_to(
            out, "{}:{} | {} | {}",
            Colored(color, kTerminalUnderline, short_file),
            Colored(color, kTerminalYellow, std::to_string(line_)),
            Colored(color, kTerminalCyan, function_),
            HasMessage() ? Colored(color, kTerminalBoldRed, message_.str())
                         : "");
        break;
      case FormatSpecifier::kShortExpression:
        out = fmt::format_to(out, "{}", expression_);
        break;
      case FormatSpecifier::kShortLocation:
        out = fmt::format_to(
            out, "{}:{}", Colored(color, kTerminalUnderline, short_file),
            Colored(color, kTerminalYellow, std::to_string(line_)));
        break;
      default:
        out = fmt::format_to(out, "unknown specifier");
    }
    if (i + 1 < lines.size()) {
      out = fmt::format_to(out, "\n");
    }
  }
  return out;
}

std::string ResultErrorFormat(bool color) {
  const char* error_format = getenv("RANGEIO_ERROR_FORMAT");
  std::string fmt_str = error_format == nullptr
                            ? (color ? "cns/acLFEm" : "ns/aLFEm")
                            : error_format;
  if (fmt_str.find('}') != std::string::npos) {
    fmt_str = "v";
  }
  return "{:" + fmt_str + "}";
}

std::ostream& operator<<(std::ostream& out, const StackTraceError& error) {
  return out << error.Trace();
}

}  // namespace rangeio

fmt::format_context::iterator fmt::formatter<rangeio::StackTraceError>::format(
    const rangeio::StackTraceError& error, format_context& ctx) const {
  auto out = ctx.out();
  const auto& stack = error.Stack();
  const int size = static_cast<int>(stack.size());
  const int begin = inner_to_outer_ ? 0 : size - 1;
  const int end = inner_to_outer_ ? size : -1;
  const int step = inner_to_outer_ ? 1 : -1;
  for (int i = begin; i != end; i += step) {
    const auto& specs = has_inner_specs_ && i == 0 ? inner_specs_ : specs_;
    out = stack[i].format(ctx, specs, i);
    if (i + step != end) {
      out = fmt::format_to(out, "\n");
    }
  }
  return out;
}
