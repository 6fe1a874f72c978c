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

#include "../pretty-format/tokenizer.h"

#include <pretty/engine.h>

#include "unit.h"

using namespace pretty;

static std::vector<std::string> describe(const std::vector<token>& stream) {
  std::vector<std::string> out;
  for (const auto& t : stream) out.push_back(t.to_string());
  return out;
}

TEST(tokenizer_words) {
  TokenizerOptions options;
  EXPECT_EQUAL(std::vector<std::string>({"Begin(0, Inconsistent)", "String(\"a\")", "Break(1, 0)",
                                         "String(\"bc\")", "End", "Eof"}),
               describe(tokenize("  a \n\t bc  \n", options)));
}

TEST(tokenizer_brackets) {
  TokenizerOptions options;
  EXPECT_EQUAL(
      std::vector<std::string>({"Begin(0, Inconsistent)", "String(\"f\")", "String(\"(\")",
                                "Begin(2, Inconsistent)", "String(\"x,\")", "Break(1, 0)",
                                "String(\"y\")", "End", "String(\")\")", "End", "Eof"}),
      describe(tokenize("f(x, y)", options)));
}

TEST(tokenizer_blanks_inside_brackets) {
  TokenizerOptions options;
  options.indent = 4;
  options.mode = breaks::consistent;
  EXPECT_EQUAL(std::vector<std::string>({"Begin(0, Consistent)", "String(\"[\")",
                                         "Begin(4, Consistent)", "String(\"a\")", "End",
                                         "String(\"]\")", "End", "Eof"}),
               describe(tokenize("[ a ]", options)));
}

TEST(tokenizer_empty) {
  TokenizerOptions options;
  EXPECT_EQUAL(std::vector<std::string>({"Begin(0, Inconsistent)", "End", "Eof"}),
               describe(tokenize("", options)));
  EXPECT_EQUAL(std::vector<std::string>({"Begin(0, Inconsistent)", "End", "Eof"}),
               describe(tokenize(" \n ", options)));
}

TEST(tokenizer_unbalanced) {
  TokenizerOptions options;
  EXPECT_EQUAL(std::vector<std::string>({"Begin(0, Inconsistent)", "End", "String(\"}\")",
                                         "String(\"{\")", "Begin(2, Inconsistent)", "End",
                                         "Eof"}),
               describe(tokenize("}{", options)));
  EXPECT_EQUAL("}{", format(tokenize("}{", options), 10));
}

TEST(tokenizer_invalid_utf8) {
  TokenizerOptions options;
  std::vector<token> stream = tokenize("a\xff" "b", options);
  std::string joined;
  for (const auto& t : stream) {
    if (t.is_string()) joined += t.text();
  }
  EXPECT_EQUAL("a\xff" "b", joined);
}

TEST(tokenizer_format) {
  TokenizerOptions options;
  std::vector<token> stream = tokenize("f(aaa  bbb\nccc)", options);
  EXPECT_EQUAL("f(aaa bbb ccc)", format(stream, 20));
  EXPECT_EQUAL("f(aaa\n    bbb\n    ccc)", format(stream, 8));
}
