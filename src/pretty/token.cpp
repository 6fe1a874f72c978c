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

#include "token.h"

#include <algorithm>
#include <sstream>

#include "width.h"

namespace pretty {

token token::string(std::string text) {
  token t(token_kind::string);
  size_t width = display_width(text);
  t.width_ = static_cast<int>(std::min<size_t>(width, kInfinity));
  t.text_ = std::move(text);
  return t;
}

token token::brk(int blank_space, int offset) {
  token t(token_kind::brk);
  t.blank_space_ = std::max(blank_space, 0);
  t.offset_ = offset;
  return t;
}

token token::newline(int offset) { return brk(kInfinity, offset); }

token token::begin(int offset, breaks mode) {
  token t(token_kind::begin);
  t.offset_ = offset;
  t.mode_ = mode;
  return t;
}

token token::end() { return token(token_kind::end); }

token token::eof() { return token(token_kind::eof); }

int token::inline_width() const {
  switch (kind_) {
    case token_kind::string:
      return width_;
    case token_kind::brk:
      return blank_space_;
    default:
      return 0;
  }
}

bool token::operator==(const token& other) const {
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case token_kind::string:
      return text_ == other.text_;
    case token_kind::brk:
      return blank_space_ == other.blank_space_ && offset_ == other.offset_;
    case token_kind::begin:
      return offset_ == other.offset_ && mode_ == other.mode_;
    default:
      return true;
  }
}

std::string token::to_string() const {
  std::stringstream ss;
  switch (kind_) {
    case token_kind::string:
      ss << "String(\"" << text_ << "\")";
      break;
    case token_kind::brk:
      if (blank_space_ == kInfinity) {
        ss << "Newline(" << offset_ << ")";
      } else {
        ss << "Break(" << blank_space_ << ", " << offset_ << ")";
      }
      break;
    case token_kind::begin:
      ss << "Begin(" << offset_ << ", " << pretty::to_string(mode_) << ")";
      break;
    case token_kind::end:
      ss << "End";
      break;
    case token_kind::eof:
      ss << "Eof";
      break;
  }
  return ss.str();
}

const char* to_string(token_kind kind) {
  switch (kind) {
    case token_kind::string:
      return "String";
    case token_kind::brk:
      return "Break";
    case token_kind::begin:
      return "Begin";
    case token_kind::end:
      return "End";
    case token_kind::eof:
      return "Eof";
  }
  return "?";
}

const char* to_string(breaks mode) {
  switch (mode) {
    case breaks::consistent:
      return "Consistent";
    case breaks::inconsistent:
      return "Inconsistent";
  }
  return "?";
}

}  // namespace pretty
