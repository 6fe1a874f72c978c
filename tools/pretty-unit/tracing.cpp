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

#include "pretty/tracing.h"

#include <sstream>

#include "pretty/engine.h"
#include "unit.h"

using namespace pretty;

namespace {

// Subscribers cannot be removed individually, so every test that captures
// events shares this one and points it at its own vector for its duration.
std::vector<log::Event>* captured = nullptr;

class capture_subscriber : public log::Subscriber {
 public:
  void receive(const log::Event& e) override {
    if (captured) captured->push_back(e);
  }
};

struct capture {
  std::vector<log::Event> events;

  capture() {
    static bool subscribed = false;
    if (!subscribed) {
      log::subscribe(std::make_unique<capture_subscriber>());
      subscribed = true;
    }
    captured = &events;
  }

  ~capture() { captured = nullptr; }

  size_t count(const char* component) const {
    size_t n = 0;
    for (const auto& e : events) {
      const std::string* c = e.get(log::LOG_COMPONENT);
      if (c && *c == component) ++n;
    }
    return n;
  }
};

}  // namespace

TEST(tracing_event_fields) {
  capture c;
  log::warning("width %d of %s", 7, "x").component("test")();
  ASSERT_EQUAL(1u, c.events.size());
  const log::Event& e = c.events[0];
  ASSERT_TRUE(e.get(log::LOG_MESSAGE) != nullptr);
  EXPECT_EQUAL("width 7 of x", *e.get(log::LOG_MESSAGE));
  EXPECT_EQUAL("warning", *e.get(log::LOG_LEVEL));
  EXPECT_EQUAL("test", *e.get(log::LOG_COMPONENT));
  EXPECT_TRUE(e.get(log::LOG_TIME) != nullptr);
  EXPECT_TRUE(e.get(log::URGENT) == nullptr);
}

TEST(tracing_extra_items) {
  capture c;
  log::error("boom").urgent()({{"path", "a.txt"}});
  ASSERT_EQUAL(1u, c.events.size());
  EXPECT_EQUAL("a.txt", *c.events[0].get("path"));
  EXPECT_EQUAL("1", *c.events[0].get(log::URGENT));
  EXPECT_EQUAL("error", *c.events[0].get(log::LOG_LEVEL));
}

TEST(tracing_format_subscribers) {
  std::stringstream full;
  log::FormatSubscriber format(full.rdbuf());
  format.receive(log::event().level("info").message("hello %d", 1));
  EXPECT_EQUAL("[level=info] hello 1\n", full.str());

  std::stringstream simple;
  log::SimpleFormatSubscriber simple_format(simple.rdbuf());
  simple_format.receive(log::event().level("warning").message("careful"));
  simple_format.receive(log::event());
  EXPECT_EQUAL("[warning]: careful\n<empty message>\n", simple.str());
}

TEST(tracing_filter_subscriber) {
  std::stringstream ss;
  log::FilterSubscriber filter(
      std::make_unique<log::SimpleFormatSubscriber>(ss.rdbuf()),
      [](const log::Event& e) { return e.get(log::LOG_COMPONENT) != nullptr; });
  filter.receive(log::event().message("dropped"));
  filter.receive(log::event().component("kept").message("kept"));
  EXPECT_EQUAL("kept\n", ss.str());
}

TEST(tracing_engine_warnings) {
  capture c;
  std::stringstream ss;
  ostream_sink out(ss);
  engine e(out, 3);
  e.feed(token::end());
  e.feed(token::begin());
  e.feed(token::string("toolong"));
  e.feed(token::eof());
  e.feed(token::string("late"));

  EXPECT_EQUAL(2u, c.count("printer"));
  EXPECT_EQUAL(2u, c.count("scanner"));
}
