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

#include "pretty/ring_buffer.h"

#include "unit.h"

using namespace pretty;

TEST(ring_buffer_basic) {
  ring_buffer<int> buf(3);
  EXPECT_TRUE(buf.empty());
  EXPECT_FALSE(buf.full());
  EXPECT_EQUAL(3u, buf.capacity());

  buf.push_back(1);
  buf.push_back(2);
  buf.push_back(3);
  EXPECT_TRUE(buf.full());
  EXPECT_EQUAL(3u, buf.size());
  EXPECT_EQUAL(1, buf.front());
  EXPECT_EQUAL(3, buf.back());
  EXPECT_EQUAL(2, buf[1]);
}

TEST(ring_buffer_wraps) {
  ring_buffer<int> buf(3);
  buf.push_back(1);
  buf.push_back(2);
  buf.push_back(3);
  EXPECT_EQUAL(1, buf.pop_front());
  EXPECT_EQUAL(2, buf.pop_front());

  // Both of these land in slots freed at the start of the storage.
  buf.push_back(4);
  buf.push_back(5);
  ASSERT_EQUAL(3u, buf.size());
  EXPECT_EQUAL(3, buf[0]);
  EXPECT_EQUAL(4, buf[1]);
  EXPECT_EQUAL(5, buf[2]);
  EXPECT_EQUAL(5, buf.pop_back());
  EXPECT_EQUAL(4, buf.back());
}

TEST(ring_buffer_both_ends) {
  ring_buffer<int> buf(4);
  for (int i = 0; i < 10; ++i) {
    buf.push_back(i);
    buf.push_back(i + 100);
    EXPECT_EQUAL(i, buf.pop_front());
    EXPECT_EQUAL(i + 100, buf.pop_back());
    EXPECT_TRUE(buf.empty());
  }
}

TEST(ring_buffer_mutate) {
  ring_buffer<int> buf(2);
  buf.push_back(-7);
  buf.push_back(0);
  buf[0] += 10;
  buf.back() = 42;
  EXPECT_EQUAL(3, buf.front());
  EXPECT_EQUAL(42, buf[1]);
}

TEST(ring_buffer_clear) {
  ring_buffer<std::string> buf(2);
  buf.push_back("a");
  buf.push_back("b");
  buf.pop_front();
  buf.clear();
  EXPECT_TRUE(buf.empty());
  EXPECT_EQUAL(2u, buf.capacity());
  buf.push_back("c");
  buf.push_back("d");
  EXPECT_EQUAL("c", buf.front());
  EXPECT_EQUAL("d", buf.back());
}
