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

#include "pretty/token.h"

#include "pretty/width.h"
#include "unit.h"

using namespace pretty;

TEST(width_ascii) {
  EXPECT_EQUAL(0u, display_width(""));
  EXPECT_EQUAL(5u, display_width("hello"));
}

TEST(width_unicode) {
  // U+00E9 is two bytes but one column.
  EXPECT_EQUAL(1u, display_width("\xc3\xa9"));

  // CJK ideographs take two columns each.
  EXPECT_EQUAL(4u, display_width("\xe6\x97\xa5\xe6\x9c\xac"));

  // A combining acute accent adds no column.
  EXPECT_EQUAL(1u, display_width("e\xcc\x81"));
}

TEST(width_invalid_utf8) {
  EXPECT_EQUAL(1u, display_width("\xff"));
  EXPECT_EQUAL(3u, display_width("a\xff" "b"));
}

TEST(token_default_is_eof) {
  token t;
  EXPECT_TRUE(t.is_eof());
  EXPECT_TRUE(t == token::eof());
}

TEST(token_string) {
  token t = token::string("\xe6\x97\xa5 x");
  EXPECT_TRUE(t.is_string());
  EXPECT_EQUAL("\xe6\x97\xa5 x", t.text());
  EXPECT_EQUAL(4, t.width());
  EXPECT_EQUAL(4, t.inline_width());

  token empty = token::string("");
  EXPECT_EQUAL(0, empty.width());
}

TEST(token_break) {
  token t = token::brk();
  EXPECT_TRUE(t.is_break());
  EXPECT_EQUAL(1, t.blank_space());
  EXPECT_EQUAL(0, t.offset());
  EXPECT_EQUAL(1, t.inline_width());

  token wide = token::brk(4, -2);
  EXPECT_EQUAL(4, wide.blank_space());
  EXPECT_EQUAL(-2, wide.offset());

  EXPECT_EQUAL(0, token::brk(-3).blank_space());
}

TEST(token_newline) {
  token t = token::newline(2);
  EXPECT_TRUE(t.is_break());
  EXPECT_EQUAL(kInfinity, t.blank_space());
  EXPECT_EQUAL(2, t.offset());
  EXPECT_TRUE(t == token::brk(kInfinity, 2));
}

TEST(token_begin) {
  token t = token::begin();
  EXPECT_TRUE(t.is_begin());
  EXPECT_EQUAL(0, t.offset());
  EXPECT_TRUE(t.mode() == breaks::inconsistent);
  EXPECT_EQUAL(0, t.inline_width());

  token c = token::begin(2, breaks::consistent);
  EXPECT_EQUAL(2, c.offset());
  EXPECT_TRUE(c.mode() == breaks::consistent);
}

TEST(token_equality) {
  EXPECT_TRUE(token::string("a") == token::string("a"));
  EXPECT_TRUE(token::string("a") != token::string("b"));
  EXPECT_TRUE(token::brk(1, 0) != token::brk(1, 2));
  EXPECT_TRUE(token::begin(2, breaks::consistent) != token::begin(2, breaks::inconsistent));
  EXPECT_TRUE(token::end() == token::end());
  EXPECT_TRUE(token::end() != token::eof());
}

TEST(token_to_string) {
  EXPECT_EQUAL("String(\"foo\")", token::string("foo").to_string());
  EXPECT_EQUAL("Break(1, 0)", token::brk().to_string());
  EXPECT_EQUAL("Newline(4)", token::newline(4).to_string());
  EXPECT_EQUAL("Begin(2, Consistent)", token::begin(2, breaks::consistent).to_string());
  EXPECT_EQUAL("Begin(0, Inconsistent)", token::begin().to_string());
  EXPECT_EQUAL("End", token::end().to_string());
  EXPECT_EQUAL("Eof", token::eof().to_string());
  EXPECT_EQUAL("Break", std::string(to_string(token_kind::brk)));
}
