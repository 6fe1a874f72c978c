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

#include "tokenizer.h"

#include <re2/re2.h>

static const RE2& lexeme_re() {
  static const RE2 re("(\\s+)|([\\(\\[\\{])|([\\)\\]\\}])|([^\\s\\(\\)\\[\\]\\{\\}]+)");
  return re;
}

std::vector<pretty::token> tokenize(const std::string& text, const TokenizerOptions& options) {
  std::vector<pretty::token> out;
  out.push_back(pretty::token::begin(0, options.mode));

  // A blank only turns into a break once we know it sits between two pieces
  // of text rather than at the start or end of a group.
  bool after_text = false;
  bool blank = false;

  re2::StringPiece input(text);
  re2::StringPiece space, open, close, word;
  while (!input.empty()) {
    if (!RE2::Consume(&input, lexeme_re(), &space, &open, &close, &word)) {
      // Bytes that are not valid UTF-8 match nothing; pass them through one
      // at a time as text.
      space = open = close = re2::StringPiece();
      word = re2::StringPiece(input.data(), 1);
      input.remove_prefix(1);
    }

    if (!space.empty()) {
      blank = after_text;
      continue;
    }

    if (!close.empty()) {
      out.push_back(pretty::token::end());
      out.push_back(pretty::token::string(std::string(close.data(), close.size())));
      after_text = true;
      blank = false;
      continue;
    }

    if (blank) out.push_back(pretty::token::brk(1, 0));
    blank = false;

    if (!open.empty()) {
      out.push_back(pretty::token::string(std::string(open.data(), open.size())));
      out.push_back(pretty::token::begin(options.indent, options.mode));
      after_text = false;
      continue;
    }

    out.push_back(pretty::token::string(std::string(word.data(), word.size())));
    after_text = true;
  }

  out.push_back(pretty::token::end());
  out.push_back(pretty::token::eof());
  return out;
}
