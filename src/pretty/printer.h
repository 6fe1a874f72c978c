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
#include <vector>

#include "sink.h"
#include "token.h"

namespace pretty {

// How an open group prints its breaks, decided when its Begin is printed.
enum class print_mode { fits, consistent, inconsistent };

const char* to_string(print_mode mode);

struct print_frame {
  // Space left on the line that a broken line of this group starts from.
  int64_t baseline;
  print_mode mode;
};

// The second half of the engine. Receives tokens whose sizes the scanner has
// already resolved and turns them into calls on a sink.
class printer {
 private:
  sink& out;
  int64_t margin;
  int64_t space;
  std::vector<print_frame> stack;
  size_t overflows = 0;
  size_t unmatched_ends = 0;

  // Frame used by breaks outside of every group.
  print_frame outer_frame() const { return print_frame{margin, print_mode::inconsistent}; }

  // Innermost group that did not fit, or the outer frame if there is none.
  print_frame enclosing_broken_frame() const;

  void print_inline(int blank_space);
  void print_newline(const print_frame& frame, int offset);

 public:
  printer(sink& out, int line_width);

  // `size` is the resolved size of `t`: the width of the whole group for a
  // Begin, the width up to the next break at the same level for a Break, and
  // the width of the text for a String.
  void print(const token& t, int64_t size);

  int64_t line_width() const { return margin; }

  // Space remaining on the current line. Negative after an overflow.
  int64_t remaining() const { return space; }

  // Number of groups open at print time.
  size_t depth() const { return stack.size(); }

  // Mode of the innermost open group.
  print_mode mode() const { return stack.empty() ? outer_frame().mode : stack.back().mode; }

  // Number of strings that were wider than the space left on their line.
  size_t overflow_count() const { return overflows; }

  // Number of End tokens that had no open group to close.
  size_t unmatched_end_count() const { return unmatched_ends; }
};

}  // namespace pretty
