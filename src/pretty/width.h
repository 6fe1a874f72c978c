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

#include <cstddef>
#include <string>

namespace pretty {

// Human visible "width" of `str`, in terminal columns.
//
// Each code point contributes its `utf8proc_charwidth`, so combining marks
// count 0 and east asian wide characters count 2. Bytes that do not decode as
// UTF-8 count 1 each.
size_t display_width(const std::string& str);

}  // namespace pretty
