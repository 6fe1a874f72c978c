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

#include <cassert>
#include <cstddef>
#include <utility>
#include <vector>

namespace pretty {

// `ring_buffer` is a fixed capacity double ended queue. Storage is allocated
// once at construction and never grows; appending to a full buffer or removing
// from an empty one is a programming error.
//
// Elements are addressed by their logical offset from the front, so `r[0]` is
// always the oldest element still in the buffer.
//
// Examples:
// ```
// ring_buffer<int> r(3);
// r.push_back(1);
// r.push_back(2);
// r.push_back(3);
// r.pop_front() -> 1
// r.push_back(4);
// r[0] -> 2
// r.back() -> 4
// ```
template <class T>
class ring_buffer {
 private:
  std::vector<T> storage;
  size_t head = 0;
  size_t length = 0;

  size_t wrap(size_t index) const { return (head + index) % storage.size(); }

 public:
  explicit ring_buffer(size_t capacity) : storage(capacity) { assert(capacity > 0); }

  size_t size() const { return length; }
  size_t capacity() const { return storage.size(); }
  bool empty() const { return length == 0; }
  bool full() const { return length == storage.size(); }

  T& operator[](size_t index) {
    assert(index < length);
    return storage[wrap(index)];
  }

  const T& operator[](size_t index) const {
    assert(index < length);
    return storage[wrap(index)];
  }

  T& front() {
    assert(!empty());
    return storage[head];
  }

  const T& front() const {
    assert(!empty());
    return storage[head];
  }

  T& back() {
    assert(!empty());
    return storage[wrap(length - 1)];
  }

  const T& back() const {
    assert(!empty());
    return storage[wrap(length - 1)];
  }

  // O(1)
  void push_back(T value) {
    assert(!full() && "ring_buffer is full");
    storage[wrap(length)] = std::move(value);
    ++length;
  }

  // O(1)
  T pop_front() {
    assert(!empty() && "ring_buffer is empty");
    T x = std::move(storage[head]);
    head = (head + 1) % storage.size();
    --length;
    return x;
  }

  // O(1)
  T pop_back() {
    assert(!empty() && "ring_buffer is empty");
    --length;
    return std::move(storage[wrap(length)]);
  }

  // O(1). Old elements are left in place and overwritten by later pushes.
  void clear() {
    head = 0;
    length = 0;
  }
};

}  // namespace pretty
