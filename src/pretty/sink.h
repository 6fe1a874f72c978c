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

#include <ostream>
#include <string>

namespace pretty {

// Abstract destination of the printer. This is the entire output surface of
// the engine; exceptions thrown by an implementation propagate out of
// `scanner::feed` untouched.
class sink {
 public:
  virtual ~sink() = default;

  // Emit `str` verbatim.
  virtual void text(const std::string& str) = 0;

  // Emit `count` blanks.
  virtual void spaces(int count) = 0;

  // End the current line and indent the next one by `indent` blanks.
  virtual void newline(int indent) = 0;
};

// Writes to an ostream. Blanks are held back until the next text so that no
// line ends in trailing whitespace.
class ostream_sink : public sink {
 private:
  std::ostream& out;
  int pending = 0;

 public:
  explicit ostream_sink(std::ostream& out) : out(out) {}

  void text(const std::string& str) override;
  void spaces(int count) override;
  void newline(int indent) override;
};

}  // namespace pretty
