/*
 * Copyright 2023 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>
#include <string>

namespace pretty {

// A width larger than any line. Used as the size of anything that must break
// and as the blank space of a required newline. Small enough that adding a
// few thousand of them to a running total cannot overflow.
static constexpr int kInfinity = 0xFFFF;

enum class token_kind { string, brk, begin, end, eof };

// How the breaks of a group behave when the group does not fit on one line.
enum class breaks {
  // Every break in the group becomes a newline.
  consistent,
  // Each break becomes a newline only if the text up to the next break does
  // not fit on the current line.
  inconsistent,
};

// `token` is one element of the stream fed to the scanner.
//
// Examples:
// ```
// token::begin(2, breaks::consistent)
// token::string("foo")
// token::brk(1, 0)
// token::string("bar")
// token::end()
// token::eof()
// ```
class token {
 private:
  token_kind kind_ = token_kind::eof;
  std::string text_;
  int width_ = 0;
  int blank_space_ = 0;
  int offset_ = 0;
  breaks mode_ = breaks::inconsistent;

  explicit token(token_kind kind) : kind_(kind) {}

 public:
  // An eof token; ring buffers default construct their slots.
  token() = default;

  // Atomic text, never split. Its width is its display width.
  static token string(std::string text);

  // An optional line break. If printed inline it emits `blank_space` blanks,
  // otherwise a newline indented `offset` past the enclosing group's indent.
  static token brk(int blank_space = 1, int offset = 0);

  // A break that is always taken.
  static token newline(int offset = 0);

  // Opens a group whose broken lines are indented `offset` past the column
  // the group starts at.
  static token begin(int offset = 0, breaks mode = breaks::inconsistent);

  // Closes the innermost open group.
  static token end();

  // Terminates the stream and flushes everything still buffered.
  static token eof();

  token_kind kind() const { return kind_; }
  bool is_string() const { return kind_ == token_kind::string; }
  bool is_break() const { return kind_ == token_kind::brk; }
  bool is_begin() const { return kind_ == token_kind::begin; }
  bool is_end() const { return kind_ == token_kind::end; }
  bool is_eof() const { return kind_ == token_kind::eof; }

  const std::string& text() const { return text_; }
  int width() const { return width_; }
  int blank_space() const { return blank_space_; }
  int offset() const { return offset_; }
  breaks mode() const { return mode_; }

  // The amount this token adds to the width of a line printed without breaks.
  int inline_width() const;

  bool operator==(const token& other) const;
  bool operator!=(const token& other) const { return !(*this == other); }

  // Debug rendering, e.g. `Break(1, 0)` or `String("foo")`
  std::string to_string() const;
};

const char* to_string(token_kind kind);
const char* to_string(breaks mode);

}  // namespace pretty
