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

#include "pretty/printer.h"

#include <sstream>

#include "unit.h"

using namespace pretty;

namespace {

// Records every call so tests can check exactly what the printer asked for.
class recording_sink : public sink {
 public:
  std::vector<std::string> calls;

  void text(const std::string& str) override { calls.push_back("text " + str); }
  void spaces(int count) override { calls.push_back("spaces " + std::to_string(count)); }
  void newline(int indent) override { calls.push_back("newline " + std::to_string(indent)); }
};

}  // namespace

TEST(printer_string) {
  recording_sink out;
  printer p(out, 10);
  p.print(token::string("abc"), 3);
  EXPECT_EQUAL(int64_t(7), p.remaining());
  EXPECT_EQUAL(std::vector<std::string>({"text abc"}), out.calls);
  EXPECT_EQUAL(0u, p.overflow_count());
}

TEST(printer_fitting_group) {
  recording_sink out;
  printer p(out, 10);
  p.print(token::begin(2, breaks::consistent), 7);
  EXPECT_TRUE(p.mode() == print_mode::fits);
  p.print(token::string("abc"), 3);
  p.print(token::brk(1, 0), 4);
  p.print(token::string("def"), 3);
  p.print(token::end(), 0);
  EXPECT_EQUAL(0u, p.depth());
  EXPECT_EQUAL(int64_t(3), p.remaining());
  EXPECT_EQUAL(std::vector<std::string>({"text abc", "spaces 1", "text def"}), out.calls);
}

TEST(printer_consistent_group) {
  recording_sink out;
  printer p(out, 10);
  p.print(token::string("xy"), 2);
  p.print(token::begin(2, breaks::consistent), 20);
  EXPECT_TRUE(p.mode() == print_mode::consistent);
  p.print(token::string("abc"), 3);
  // Even a break whose section would fit goes to a new line.
  p.print(token::brk(1, 0), 1);
  p.print(token::string("def"), 3);
  p.print(token::brk(1, -2), 1);
  p.print(token::end(), 0);
  EXPECT_EQUAL(std::vector<std::string>({"text xy", "text abc", "newline 4", "text def",
                                         "newline 2"}),
               out.calls);
  EXPECT_EQUAL(int64_t(8), p.remaining());
}

TEST(printer_inconsistent_group) {
  recording_sink out;
  printer p(out, 10);
  p.print(token::begin(1, breaks::inconsistent), 20);
  EXPECT_TRUE(p.mode() == print_mode::inconsistent);
  p.print(token::string("abcd"), 4);
  p.print(token::brk(1, 0), 5);
  p.print(token::string("efgh"), 4);
  p.print(token::brk(1, 0), 5);
  p.print(token::string("ijkl"), 4);
  p.print(token::end(), 0);
  EXPECT_EQUAL(std::vector<std::string>({"text abcd", "spaces 1", "text efgh", "newline 1",
                                         "text ijkl"}),
               out.calls);
}

TEST(printer_break_outside_group) {
  recording_sink out;
  printer p(out, 6);
  p.print(token::string("abcd"), 4);
  p.print(token::brk(1, 0), 1);
  p.print(token::string("e"), 1);
  p.print(token::brk(1, 3), 4);
  p.print(token::string("fgh"), 3);
  EXPECT_EQUAL(std::vector<std::string>({"text abcd", "spaces 1", "text e", "newline 3",
                                         "text fgh"}),
               out.calls);
  EXPECT_EQUAL(int64_t(0), p.remaining());
}

TEST(printer_newline_token) {
  recording_sink out;
  printer p(out, 80);
  p.print(token::string("a"), 1);
  p.print(token::newline(0), kInfinity);
  p.print(token::string("b"), 1);
  EXPECT_EQUAL(std::vector<std::string>({"text a", "newline 0", "text b"}), out.calls);
  EXPECT_EQUAL(int64_t(79), p.remaining());
}

TEST(printer_newline_in_fitting_group) {
  recording_sink out;
  printer p(out, 80);
  p.print(token::begin(), 3);
  p.print(token::string("a"), 1);
  p.print(token::newline(2), kInfinity);
  p.print(token::string("b"), 1);
  p.print(token::end(), 0);
  EXPECT_EQUAL(std::vector<std::string>({"text a", "newline 2", "text b"}), out.calls);
}

TEST(printer_newline_keeps_enclosing_indent) {
  recording_sink out;
  printer p(out, 20);
  p.print(token::string("xy"), 2);
  p.print(token::begin(2, breaks::consistent), 30);
  p.print(token::begin(), 3);
  EXPECT_TRUE(p.mode() == print_mode::fits);
  p.print(token::string("a"), 1);
  p.print(token::newline(0), kInfinity);
  p.print(token::string("b"), 1);
  p.print(token::end(), 0);
  p.print(token::end(), 0);
  EXPECT_EQUAL(std::vector<std::string>({"text xy", "text a", "newline 4", "text b"}), out.calls);
  EXPECT_EQUAL(int64_t(15), p.remaining());
}

TEST(printer_overflow) {
  recording_sink out;
  printer p(out, 5);
  p.print(token::string("abcdefgh"), 8);
  EXPECT_EQUAL(1u, p.overflow_count());
  EXPECT_EQUAL(int64_t(-3), p.remaining());
  EXPECT_EQUAL(std::vector<std::string>({"text abcdefgh"}), out.calls);
}

TEST(printer_unmatched_end) {
  recording_sink out;
  printer p(out, 10);
  p.print(token::end(), 0);
  p.print(token::end(), 0);
  EXPECT_EQUAL(2u, p.unmatched_end_count());
  EXPECT_EQUAL(0u, p.depth());
  p.print(token::string("ok"), 2);
  EXPECT_EQUAL(std::vector<std::string>({"text ok"}), out.calls);
}

TEST(printer_nesting_depth) {
  recording_sink out;
  printer p(out, 10);
  p.print(token::begin(), 20);
  p.print(token::begin(0, breaks::consistent), 2);
  EXPECT_EQUAL(2u, p.depth());
  EXPECT_TRUE(p.mode() == print_mode::fits);
  p.print(token::end(), 0);
  EXPECT_TRUE(p.mode() == print_mode::inconsistent);
  p.print(token::end(), 0);
  EXPECT_EQUAL(0u, p.depth());
}

TEST(ostream_sink_no_trailing_blanks) {
  std::stringstream ss;
  ostream_sink out(ss);
  out.text("a");
  out.spaces(3);
  out.newline(2);
  out.text("");
  out.newline(0);
  out.text("b");
  out.spaces(1);
  out.text("c");
  out.spaces(5);
  EXPECT_EQUAL("a\n\nb c", ss.str());
}

TEST(ostream_sink_indent) {
  std::stringstream ss;
  ostream_sink out(ss);
  out.text("x");
  out.newline(4);
  out.text("y");
  out.newline(-1);
  out.text("z");
  EXPECT_EQUAL("x\n    y\nz", ss.str());
}
