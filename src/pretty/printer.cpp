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

#include "printer.h"

#include "tracing.h"

namespace pretty {

const char* to_string(print_mode mode) {
  switch (mode) {
    case print_mode::fits:
      return "Fits";
    case print_mode::consistent:
      return "Consistent";
    case print_mode::inconsistent:
      return "Inconsistent";
  }
  return "?";
}

printer::printer(sink& out, int line_width)
    : out(out), margin(line_width), space(line_width) {}

print_frame printer::enclosing_broken_frame() const {
  for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
    if (it->mode != print_mode::fits) return *it;
  }
  return outer_frame();
}

void printer::print_inline(int blank_space) {
  space -= blank_space;
  out.spaces(blank_space);
}

void printer::print_newline(const print_frame& frame, int offset) {
  space = frame.baseline - offset;
  out.newline(static_cast<int>(margin - space));
}

void printer::print(const token& t, int64_t size) {
  switch (t.kind()) {
    case token_kind::begin: {
      if (size > space) {
        print_mode mode = t.mode() == breaks::consistent ? print_mode::consistent
                                                         : print_mode::inconsistent;
        stack.push_back(print_frame{space - t.offset(), mode});
      } else {
        stack.push_back(print_frame{0, print_mode::fits});
      }
      break;
    }

    case token_kind::end: {
      // Tolerate ends without a begin, there is nothing left to close.
      if (stack.empty()) {
        ++unmatched_ends;
        log::warning("End token without an open group").component("printer")();
        break;
      }
      stack.pop_back();
      break;
    }

    case token_kind::brk: {
      print_frame frame = stack.empty() ? outer_frame() : stack.back();
      switch (frame.mode) {
        case print_mode::fits:
          // A required newline can only land here if a group was misreported
          // as fitting; honour the newline rather than emitting its blanks.
          if (t.blank_space() >= kInfinity) {
            print_newline(enclosing_broken_frame(), t.offset());
          } else {
            print_inline(t.blank_space());
          }
          break;
        case print_mode::consistent:
          print_newline(frame, t.offset());
          break;
        case print_mode::inconsistent:
          if (size > space) {
            print_newline(frame, t.offset());
          } else {
            print_inline(t.blank_space());
          }
          break;
      }
      break;
    }

    case token_kind::string: {
      if (size > space) {
        ++overflows;
        log::warning("string of width %lld overflows the %lld columns left on the line",
                     static_cast<long long>(size), static_cast<long long>(space))
            .component("printer")();
      }
      space -= size;
      out.text(t.text());
      break;
    }

    case token_kind::eof:
      break;
  }
}

}  // namespace pretty
