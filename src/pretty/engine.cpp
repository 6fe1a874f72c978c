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

#include "engine.h"

#include <sstream>

#include "tracing.h"

namespace pretty {

static int checked_width(int line_width) {
  if (line_width >= 1) return line_width;
  log::warning("line width %d is too small, using 1", line_width).component("engine")();
  return 1;
}

engine::engine(sink& out, int line_width) : p(out, checked_width(line_width)), s(p) {}

std::string format(const std::vector<token>& stream, int line_width) {
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, line_width);

  for (const auto& t : stream) {
    e.feed(t);
  }

  if (stream.empty() || !stream.back().is_eof()) {
    e.feed(token::eof());
  }

  return ss.str();
}

}  // namespace pretty
