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

#include "sink.h"

namespace pretty {

void ostream_sink::text(const std::string& str) {
  if (str.empty()) return;
  if (pending > 0) {
    out << std::string(pending, ' ');
    pending = 0;
  }
  out << str;
}

void ostream_sink::spaces(int count) {
  if (count > 0) pending += count;
}

void ostream_sink::newline(int indent) {
  out << '\n';
  pending = indent > 0 ? indent : 0;
}

}  // namespace pretty
