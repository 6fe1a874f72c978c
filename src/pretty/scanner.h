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

#include "printer.h"
#include "ring_buffer.h"
#include "token.h"

namespace pretty {

// The first half of the engine, "scan" in Oppen's paper.
//
// Tokens are buffered until the size the printer needs for them is known:
// a Begin needs the width of its whole group and a Break needs the width up to
// the next break or end at the same level. Sizes are kept in a ring buffer
// parallel to the tokens. While a size is unknown it holds the negated running
// total at the time the token arrived, so adding the running total later
// yields the width.
//
// Whenever the buffered text is wider than the space left on the line, the
// oldest pending token is given size kInfinity and printed. That token can no
// longer fit, so there is no reason to keep it, and the buffer never holds
// more than about three lines of text.
class scanner {
 private:
  printer& out;

  ring_buffer<token> tokens;
  ring_buffer<int64_t> sizes;

  // Absolute stream positions of tokens whose sizes are still pending, oldest
  // at the front. `token_offset` is the absolute position of `tokens[0]`.
  ring_buffer<size_t> scan_stack;
  size_t token_offset = 0;

  int64_t left_total = 1;
  int64_t right_total = 1;

  int64_t max_window = 0;
  size_t capacity_breaks = 0;
  bool finished = false;

  int64_t& size_at(size_t position) { return sizes[position - token_offset]; }
  const token& token_at(size_t position) const { return tokens[position - token_offset]; }

  // Starts a new window once nothing is pending.
  void reset();

  // Appends to both buffers. Pending tokens are also pushed on the scan stack.
  void push(token t, int64_t size, bool pending);

  // Sets the sizes that the arrival of a break (or of eof, when `to_bottom`)
  // makes known.
  void resolve_pending(bool to_bottom);

  // Prints from the front while the window is wider than the space left on
  // the line, or than three lines.
  void force_fit();

  // Forces breaks until the buffers have room for one more token.
  void make_room();

  // Prints and drops every token at the front whose size is known.
  void flush_front();

  void force_bottom();

 public:
  explicit scanner(printer& out);

  // Scans one token. The last token fed must be eof.
  void feed(token t);

  // Width of the buffered, not yet printed text.
  int64_t window_width() const { return right_total - left_total; }

  // Widest the window has been at the end of any call to `feed`.
  int64_t max_window_width() const { return max_window; }

  size_t buffered() const { return tokens.size(); }
  size_t pending() const { return scan_stack.size(); }
  size_t capacity() const { return tokens.capacity(); }

  // Number of breaks forced because the buffers filled up before the window
  // got wider than the line.
  size_t capacity_break_count() const { return capacity_breaks; }

  bool done() const { return finished; }
};

}  // namespace pretty
