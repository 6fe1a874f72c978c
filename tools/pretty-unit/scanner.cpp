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

#include "pretty/scanner.h"

#include <sstream>
#include <stdexcept>

#include "pretty/engine.h"
#include "unit.h"

using namespace pretty;

static std::vector<token> three_words(breaks mode) {
  return {token::begin(0, mode), token::string("aaaa"), token::brk(),
          token::string("bbbb"), token::brk(),          token::string("cccc"),
          token::end(),          token::eof()};
}

static std::vector<std::string> split_lines(const std::string& str) {
  std::vector<std::string> lines;
  std::stringstream ss(str);
  std::string line;
  while (std::getline(ss, line)) lines.push_back(line);
  return lines;
}

TEST(scanner_group_fits) {
  EXPECT_EQUAL("aaaa bbbb cccc", format(three_words(breaks::consistent), 20));
  EXPECT_EQUAL("aaaa bbbb cccc", format(three_words(breaks::inconsistent), 14));
}

TEST(scanner_consistent_breaks_all) {
  EXPECT_EQUAL("aaaa\nbbbb\ncccc", format(three_words(breaks::consistent), 8));
  // One column short of fitting still breaks every line.
  EXPECT_EQUAL("aaaa\nbbbb\ncccc", format(three_words(breaks::consistent), 13));
}

TEST(scanner_inconsistent_packs) {
  EXPECT_EQUAL("aaaa bbbb\ncccc", format(three_words(breaks::inconsistent), 9));
  EXPECT_EQUAL("aaaa\nbbbb\ncccc", format(three_words(breaks::inconsistent), 8));
}

TEST(scanner_nested_groups) {
  std::vector<token> stream = {
      token::begin(2, breaks::consistent),
      token::string("xxxx"),
      token::brk(),
      token::begin(0, breaks::inconsistent),
      token::string("a"),
      token::brk(),
      token::string("b"),
      token::end(),
      token::brk(),
      token::string("yyyy"),
      token::end(),
      token::eof(),
  };
  EXPECT_EQUAL("xxxx\n  a b\n  yyyy", format(stream, 8));
  EXPECT_EQUAL("xxxx a b yyyy", format(stream, 13));
}

TEST(scanner_break_offset) {
  std::vector<token> stream = {
      token::string("f("),   token::begin(2, breaks::consistent),
      token::brk(0, 0),      token::string("x,"),
      token::brk(1, 0),      token::string("y"),
      token::brk(0, -2),     token::end(),
      token::string(")"),    token::eof(),
  };
  EXPECT_EQUAL("f(x, y)", format(stream, 20));
  EXPECT_EQUAL("f(\n    x,\n    y\n  )", format(stream, 5));
}

TEST(scanner_strings_in_order) {
  std::vector<token> stream;
  std::string expected;
  stream.push_back(token::begin(1, breaks::inconsistent));
  for (int i = 0; i < 200; ++i) {
    std::string word = "w" + std::to_string(i % 37);
    if (i > 0) stream.push_back(token::brk());
    if (i % 10 == 0) stream.push_back(token::begin(2, breaks::consistent));
    stream.push_back(token::string(word));
    if (i % 10 == 9) stream.push_back(token::end());
    expected += word;
  }
  stream.push_back(token::end());
  stream.push_back(token::eof());

  for (int width : {1, 7, 16, 40, 1000}) {
    std::string out = format(stream, width);
    std::string joined;
    for (char c : out) {
      if (c != ' ' && c != '\n') joined += c;
    }
    EXPECT_EQUAL(expected, joined) << "at line width " << width;
  }
}

TEST(scanner_lines_within_width) {
  std::vector<token> stream;
  stream.push_back(token::begin(0, breaks::inconsistent));
  for (int i = 0; i < 500; ++i) {
    if (i > 0) stream.push_back(token::brk());
    stream.push_back(token::string(std::string(1 + i % 5, 'a' + i % 26)));
  }
  stream.push_back(token::end());
  stream.push_back(token::eof());

  for (const auto& line : split_lines(format(stream, 12))) {
    EXPECT_TRUE(line.size() <= 12) << "line \"" << line << "\"";
  }
}

TEST(scanner_bounded_window) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 10);
  e.feed(token::begin(0, breaks::inconsistent));
  for (int i = 0; i < 1000; ++i) {
    if (i > 0) e.feed(token::brk());
    if (i % 4 == 0) e.feed(token::begin(1, breaks::consistent));
    e.feed(token::string(std::string(1 + i % 7, 'x')));
    if (i % 4 == 3) e.feed(token::end());
  }
  e.feed(token::end());
  e.feed(token::eof());

  const scanner& s = e.get_scanner();
  EXPECT_TRUE(s.max_window_width() <= 30) << "window reached " << s.max_window_width();
  EXPECT_EQUAL(30u, s.capacity());
  EXPECT_TRUE(s.done());
  EXPECT_EQUAL(0u, s.buffered());
  EXPECT_EQUAL(0u, s.pending());
  EXPECT_EQUAL(0u, e.get_printer().depth());
}

TEST(scanner_bounded_window_wide_breaks) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 10);
  e.feed(token::begin());
  for (int i = 0; i < 25; ++i) e.feed(token::brk(2, 0));
  e.feed(token::string("x"));
  e.feed(token::end());
  e.feed(token::eof());

  EXPECT_TRUE(e.get_scanner().max_window_width() <= 30)
      << "window reached " << e.get_scanner().max_window_width();
  ASSERT_FALSE(ss.str().empty());
  EXPECT_EQUAL('x', ss.str().back());
}

TEST(scanner_bounded_window_newline) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 10);
  e.feed(token::begin());
  e.feed(token::string("a"));
  e.feed(token::newline());
  EXPECT_TRUE(e.get_scanner().window_width() <= 30)
      << "window is " << e.get_scanner().window_width();
  e.feed(token::string("b"));
  e.feed(token::end());
  e.feed(token::eof());

  EXPECT_TRUE(e.get_scanner().max_window_width() <= 30)
      << "window reached " << e.get_scanner().max_window_width();
  EXPECT_EQUAL("a\nb", ss.str());
}

TEST(scanner_bounded_window_negative_offset) {
  std::vector<token> stream;
  std::string expected = "aaaaaaaaaa";
  stream.push_back(token::begin(0, breaks::consistent));
  stream.push_back(token::string(expected));
  stream.push_back(token::brk(1, -30));
  stream.push_back(token::begin());
  for (int i = 0; i < 40; ++i) {
    stream.push_back(token::string("b"));
    stream.push_back(token::brk());
    expected += "b";
  }
  stream.push_back(token::end());
  stream.push_back(token::end());
  stream.push_back(token::eof());

  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 10);
  for (const auto& t : stream) e.feed(t);

  EXPECT_TRUE(e.get_scanner().max_window_width() <= 30)
      << "window reached " << e.get_scanner().max_window_width();
  std::string joined;
  for (char c : ss.str()) {
    if (c != ' ' && c != '\n') joined += c;
  }
  EXPECT_EQUAL(expected, joined);
}

TEST(scanner_newline_token) {
  std::vector<token> stream = {
      token::begin(2, breaks::inconsistent),
      token::string("a"),
      token::newline(),
      token::string("b"),
      token::brk(),
      token::string("c"),
      token::end(),
      token::eof(),
  };
  EXPECT_EQUAL("a\n  b c", format(stream, 80));
}

TEST(scanner_newline_outside_group) {
  std::vector<token> stream = {token::string("a"), token::newline(), token::string("b"),
                               token::eof()};
  EXPECT_EQUAL("a\nb", format(stream, 80));
}

TEST(scanner_overflow) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 5);
  e.feed(token::begin());
  e.feed(token::string("abcdefgh"));
  e.feed(token::brk());
  e.feed(token::string("ij"));
  e.feed(token::end());
  e.feed(token::eof());
  EXPECT_EQUAL("abcdefgh\nij", ss.str());
  EXPECT_EQUAL(1u, e.get_printer().overflow_count());
}

TEST(scanner_unmatched_end) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 20);
  e.feed(token::string("aaaa"));
  e.feed(token::end());
  e.feed(token::begin());
  e.feed(token::string("bbbb"));
  e.feed(token::end());
  e.feed(token::end());
  e.feed(token::brk());
  e.feed(token::string("cccc"));
  e.feed(token::eof());
  EXPECT_EQUAL("aaaabbbb cccc", ss.str());
  EXPECT_EQUAL(2u, e.get_printer().unmatched_end_count());
  EXPECT_EQUAL(0u, e.get_printer().depth());
}

TEST(scanner_unclosed_group_at_eof) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 20);
  e.feed(token::begin(0, breaks::consistent));
  e.feed(token::string("aaaa"));
  e.feed(token::brk());
  e.feed(token::string("bbbb"));
  e.feed(token::eof());
  EXPECT_EQUAL("aaaa bbbb", ss.str());
  EXPECT_EQUAL(1u, e.get_printer().depth());
  EXPECT_EQUAL(0u, e.get_scanner().buffered());
}

TEST(scanner_unclosed_group_breaks) {
  std::vector<token> stream = {token::begin(0, breaks::consistent), token::string("aaaa"),
                               token::brk(), token::string("bbbb"), token::eof()};
  EXPECT_EQUAL("aaaa\nbbbb", format(stream, 6));
}

TEST(scanner_deep_nesting_capacity) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 1);
  for (int i = 0; i < 12; ++i) e.feed(token::begin());
  e.feed(token::string("a"));
  for (int i = 0; i < 12; ++i) e.feed(token::end());
  e.feed(token::eof());
  EXPECT_EQUAL("a", ss.str());
  EXPECT_EQUAL(3u, e.get_scanner().capacity());
  EXPECT_TRUE(e.get_scanner().capacity_break_count() > 0);
  EXPECT_EQUAL(0u, e.get_printer().depth());
}

TEST(scanner_feed_after_eof) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 10);
  e.feed(token::string("a"));
  e.feed(token::eof());
  e.feed(token::string("b"));
  e.feed(token::eof());
  EXPECT_EQUAL("a", ss.str());
  EXPECT_TRUE(e.get_scanner().done());
}

TEST(scanner_empty_stream) {
  EXPECT_EQUAL("", format({}, 10));
  EXPECT_EQUAL("", format({token::begin(), token::end(), token::eof()}, 10));
}

TEST(engine_clamps_width) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 0);
  EXPECT_EQUAL(int64_t(1), e.get_printer().line_width());
  EXPECT_EQUAL("a\nb", format({token::string("a"), token::brk(), token::string("b")}, -4));
}

TEST(engine_wide_characters) {
  // Each ideograph is two columns, so the pair does not fit in five.
  std::vector<token> stream = {token::begin(), token::string("\xe6\x97\xa5\xe6\x9c\xac"),
                               token::brk(), token::string("ab"), token::end()};
  EXPECT_EQUAL("\xe6\x97\xa5\xe6\x9c\xac\nab", format(stream, 5));
  EXPECT_EQUAL("\xe6\x97\xa5\xe6\x9c\xac ab", format(stream, 7));
}

namespace {

class failing_sink : public sink {
 public:
  void text(const std::string& str) override { throw std::runtime_error("write failed"); }
  void spaces(int count) override {}
  void newline(int indent) override {}
};

}  // namespace

TEST(engine_sink_errors_propagate) {
  failing_sink out;
  engine e(out, 10);
  bool thrown = false;
  try {
    e.feed(token::string("a"));
  } catch (const std::runtime_error& err) {
    thrown = true;
    EXPECT_EQUAL("write failed", std::string(err.what()));
  }
  EXPECT_TRUE(thrown);
}
