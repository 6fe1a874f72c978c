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

#include "width.h"

#include <utf8proc.h>

namespace pretty {

template <class F>
static void for_each_codepoint(const std::string& str, F&& f) {
  const utf8proc_uint8_t* iter = reinterpret_cast<const utf8proc_uint8_t*>(str.data());
  const utf8proc_uint8_t* iter_end = iter + str.size();
  while (iter < iter_end) {
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t size = utf8proc_iterate(iter, iter_end - iter, &codepoint);

    // < 0 means error parsing utf8, step over the offending byte
    if (size <= 0) {
      f(-1);
      iter += 1;
      continue;
    }

    iter += size;
    f(codepoint);
  }
}

size_t display_width(const std::string& str) {
  size_t width = 0;
  for_each_codepoint(str, [&](utf8proc_int32_t codepoint) {
    if (codepoint < 0) {
      width += 1;
      return;
    }
    int w = utf8proc_charwidth(codepoint);
    if (w > 0) width += w;
  });
  return width;
}

}  // namespace pretty
