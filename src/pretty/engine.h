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

#include <string>
#include <vector>

#include "printer.h"
#include "scanner.h"
#include "sink.h"
#include "token.h"

namespace pretty {

// `engine` owns the scanner/printer pair for a single formatting pass. It is
// created with the line width, fed one token stream ending in eof, and then
// discarded.
//
// Examples:
// ```
// std::stringstream ss;
// pretty::ostream_sink out(ss);
// pretty::engine e(out, 20);
// e.feed(token::begin(0, breaks::consistent));
// e.feed(token::string("aaaa"));
// e.feed(token::brk());
// e.feed(token::string("bbbb"));
// e.feed(token::end());
// e.feed(token::eof());
// ss.str() -> "aaaa bbbb"
// ```
class engine {
 private:
  printer p;
  scanner s;

 public:
  // `line_width` below 1 is raised to 1.
  engine(sink& out, int line_width);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  void feed(token t) { s.feed(std::move(t)); }

  const printer& get_printer() const { return p; }
  const scanner& get_scanner() const { return s; }
};

// Formats `stream` into a string. An eof is appended if the stream does not
// already end with one.
std::string format(const std::vector<token>& stream, int line_width);

}  // namespace pretty
