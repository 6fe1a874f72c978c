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

#include "scanner.h"

#include <algorithm>

#include "tracing.h"

namespace pretty {

static size_t buffer_capacity(const printer& out) {
  return static_cast<size_t>(std::max<int64_t>(3 * out.line_width(), 3));
}

scanner::scanner(printer& out)
    : out(out),
      tokens(buffer_capacity(out)),
      sizes(buffer_capacity(out)),
      scan_stack(buffer_capacity(out)) {}

void scanner::reset() {
  // Nothing is pending, so anything still buffered already has its size.
  flush_front();
  tokens.clear();
  sizes.clear();
  token_offset = 0;
  left_total = right_total = 1;
}

void scanner::push(token t, int64_t size, bool pending) {
  if (tokens.full()) make_room();
  if (pending) scan_stack.push_back(token_offset + tokens.size());
  tokens.push_back(std::move(t));
  sizes.push_back(size);
}

void scanner::resolve_pending(bool to_bottom) {
  int depth = 0;
  while (!scan_stack.empty()) {
    size_t x = scan_stack.back();
    const token& t = token_at(x);
    if (t.is_begin()) {
      // At eof an unclosed group is treated as closed at the end of input.
      if (depth == 0 && !to_bottom) break;
      if (depth > 0) --depth;
      scan_stack.pop_back();
      size_at(x) += right_total;
    } else if (t.is_end()) {
      scan_stack.pop_back();
      size_at(x) += 1;
      ++depth;
    } else {
      scan_stack.pop_back();
      size_at(x) += right_total;
      if (depth == 0 && !to_bottom) break;
    }
  }
}

void scanner::force_bottom() {
  // Only the oldest buffered token can be forced; anything in front of it is
  // already sized and gets printed first.
  if (!scan_stack.empty() && scan_stack.front() == token_offset) {
    size_at(scan_stack.pop_front()) = kInfinity;
  }
}

void scanner::force_fit() {
  // Negative break offsets can leave more space than a line holds; the window
  // is still capped at three lines.
  while (window_width() > std::min(out.remaining(), 3 * out.line_width()) && !tokens.empty()) {
    force_bottom();
    flush_front();
  }
}

void scanner::make_room() {
  ++capacity_breaks;
  log::warning("token buffer of %zu entries is full, forcing a break", tokens.capacity())
      .component("scanner")();
  while (tokens.full()) {
    force_bottom();
    flush_front();
  }
}

void scanner::flush_front() {
  while (!tokens.empty() && sizes.front() >= 0) {
    token t = tokens.pop_front();
    int64_t size = sizes.pop_front();
    ++token_offset;
    out.print(t, size);
    left_total += t.inline_width();
  }
}

void scanner::feed(token t) {
  if (finished) {
    log::warning("%s fed after eof is ignored", t.to_string().c_str()).component("scanner")();
    return;
  }

  switch (t.kind()) {
    case token_kind::begin: {
      if (scan_stack.empty()) reset();
      push(std::move(t), -right_total, true);
      break;
    }

    case token_kind::end: {
      if (scan_stack.empty()) {
        flush_front();
        out.print(t, 0);
      } else {
        push(std::move(t), -1, true);
      }
      break;
    }

    case token_kind::brk: {
      if (scan_stack.empty()) {
        reset();
      } else {
        resolve_pending(false);
      }
      int blank_space = t.blank_space();
      push(std::move(t), -right_total, true);
      right_total += blank_space;
      force_fit();
      break;
    }

    case token_kind::string: {
      if (scan_stack.empty()) {
        flush_front();
        out.print(t, t.width());
      } else {
        int width = t.width();
        push(std::move(t), width, false);
        right_total += width;
        force_fit();
      }
      break;
    }

    case token_kind::eof: {
      finished = true;
      resolve_pending(true);
      flush_front();
      if (out.depth() > 0) {
        log::warning("%zu groups still open at eof", out.depth()).component("scanner")();
      }
      break;
    }
  }

  max_window = std::max(max_window, window_width());
}

}  // namespace pretty
