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

#include <pretty/token.h>

#include <string>
#include <vector>

struct TokenizerOptions {
  // Indent of the lines of a group that breaks
  int indent = 2;
  pretty::breaks mode = pretty::breaks::inconsistent;
};

// Splits raw text into a token stream for the engine.
//
// Runs of non-blank characters become strings. Blanks between them become a
// single Break(1, 0), so the original spacing and line structure are dropped.
// An opening bracket is emitted as a string followed by a Begin, and a closing
// bracket as an End followed by a string. Everything is wrapped in one
// top-level group and terminated by eof.
//
// Brackets need not balance; the engine recovers from stray ends and from
// groups left open at eof.
std::vector<pretty::token> tokenize(const std::string& text, const TokenizerOptions& options);
