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

#include <pretty/tracing.h>

#include <csetjmp>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "util/term.h"

// Represents an error message to display to the user
struct ErrorMessage {
  // Test and failure location information
  const char* test_name;
  const char* file;
  int line;

  // The generated error message with precise details
  std::stringstream predicate_error;

  // The error message supplied by the user
  std::stringstream user_error;
};

// Escapes `str` for display between double quotes
std::string escape_string(const std::string& str);

// A class that handles the return value from EXPECT_* and ASSERT_*
// On assert failure it longjumps back to the test harness. Allows
// the user to add specilized messages to errors like gtest. If the
// the test did not fail, the user supplied messages are ignored.
struct TestStream {
  std::stringstream* ss;
  std::jmp_buf* assert_throw;
  TestStream(std::stringstream* ss_, std::jmp_buf* assert_) : ss(ss_), assert_throw(assert_) {}
  ~TestStream() {
    if (assert_throw) std::longjmp(*assert_throw, 1);
  }
  template <class T>
  TestStream& operator<<(T&& x) {
    if (ss) *ss << x;
    return *this;
  }
};

// Public:
struct TestLogger {
  // This has to be a unique_ptr because apparently some versions of libstdc++
  // do not have a copy constructor for stringstream.
  std::vector<std::unique_ptr<ErrorMessage>> errors;
  std::jmp_buf return_jmp_buffer;
  const char* test_name = nullptr;

 private:
  ErrorMessage& record(int line, const char* file) {
    errors.emplace_back(new ErrorMessage);
    auto& err = errors.back();
    err->test_name = test_name;
    err->file = file;
    err->line = line;
    return *err;
  }

  TestStream fail(ErrorMessage& err, bool assert) {
    pretty::log::info("%s:%d: %s", err.file, err.line, err.predicate_error.str().c_str())
        .component("pretty-unit")();
    return TestStream(&err.user_error, assert ? &return_jmp_buffer : nullptr);
  }

  template <class T>
  TestStream expect_scalar(bool assert, const T& expected, const T& actual, int line,
                           const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = record(line, file);
    err.predicate_error << "Expected:\n\t" << term_colour(TERM_MAGENTA) << expected;
    err.predicate_error << term_normal() << "\nBut got:\n\t";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual;
    err.predicate_error << term_normal() << std::endl;
    return fail(err, assert);
  }

 public:
  TestStream expect(bool assert, bool expected, bool cond, const char* cond_str, int line,
                    const char* file) {
    if (cond == expected) return TestStream(nullptr, nullptr);
    auto expected_str = expected ? "true" : "false";
    auto actual_str = cond ? "true" : "false";
    auto& err = record(line, file);
    err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << "`" << cond_str << "`";
    err.predicate_error << term_normal() << " to be ";
    err.predicate_error << term_colour(TERM_MAGENTA) << expected_str;
    err.predicate_error << term_normal() << ", but was found to be ";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
    err.predicate_error << term_normal() << std::endl;
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, std::vector<std::string> expected,
                          std::vector<std::string> actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected.size() != actual.size()) {
      auto& err = record(line, file);
      err.predicate_error << "Expected vector length:\n\t" << term_colour(TERM_MAGENTA)
                          << expected.size();
      err.predicate_error << term_normal() << "\nBut actual vector length was:\n\t";
      err.predicate_error << term_colour(TERM_MAGENTA) << actual.size();
      err.predicate_error << term_normal() << std::endl;
      return fail(err, assert);
    }

    for (size_t i = 0; i < expected.size(); ++i) {
      if (expected[i] != actual[i]) {
        auto& err = record(line, file);
        err.predicate_error << "Expected vectors to be equal:\n\t" << term_colour(TERM_MAGENTA)
                            << expected_str;
        err.predicate_error << term_normal() << "\nAnd:\n\t";
        err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
        err.predicate_error << term_normal() << "\nBut were found to differ at index " << i;
        err.predicate_error << term_colour(TERM_MAGENTA) << "\n\t(" << actual_str << ")[" << i
                            << "] = \"" << escape_string(actual[i]) << "\"\n";
        err.predicate_error << term_normal() << "But:\n\t" << term_colour(TERM_MAGENTA) << "("
                            << expected_str << ")[" << i << "] = \""
                            << escape_string(expected[i]) << "\"\n";
        err.predicate_error << term_normal() << std::endl;
        return fail(err, assert);
      }
    }

    return TestStream(nullptr, nullptr);
  }

  TestStream expect_equal(bool assert, int expected, int actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    return expect_scalar(assert, expected, actual, line, file);
  }

  TestStream expect_equal(bool assert, size_t expected, size_t actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    return expect_scalar(assert, expected, actual, line, file);
  }

  TestStream expect_equal(bool assert, int64_t expected, int64_t actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    return expect_scalar(assert, expected, actual, line, file);
  }

  TestStream expect_equal(bool assert, std::string expected, std::string actual,
                          const char* expected_str, const char* actual_str, int line,
                          const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = record(line, file);
    err.predicate_error << "Expected:\n\t"
                        << "(" << expected.size() << ")" << term_colour(TERM_MAGENTA) << '"'
                        << escape_string(expected) << '"';
    err.predicate_error << term_normal() << "\nBut got:\n\t";
    err.predicate_error << "(" << actual.size() << ")" << term_colour(TERM_MAGENTA) << '"'
                        << escape_string(actual) << '"';
    err.predicate_error << term_normal() << std::endl;
    return fail(err, assert);
  }

  TestStream expect_equal(bool assert, const char* expected, std::string actual,
                          const char* expected_str, const char* actual_str, int line,
                          const char* file) {
    return expect_equal(assert, std::string(expected), std::move(actual), expected_str,
                        actual_str, line, file);
  }

  template <class T1, class T2>
  TestStream expect_equal(bool assert, T1&& expected, T2&& actual, const char* expected_str,
                          const char* actual_str, int line, const char* file) {
    if (expected == actual) return TestStream(nullptr, nullptr);
    auto& err = record(line, file);
    err.predicate_error << "Expected " << term_colour(TERM_MAGENTA) << "`" << expected_str << "`";
    err.predicate_error << term_normal() << " to be equal to `";
    err.predicate_error << term_colour(TERM_MAGENTA) << actual_str;
    err.predicate_error << "`" << term_normal() << ", but was found to differ" << std::endl;
    return fail(err, assert);
  }
};

#define NUM_ERRORS() (logger__.errors.size())

// Public:
#define EXPECT_TRUE(cond) (logger__.expect(false, true, (cond), #cond, __LINE__, __FILE__))
#define ASSERT_TRUE(cond) (logger__.expect(true, true, (cond), #cond, __LINE__, __FILE__))
#define EXPECT_FALSE(cond) (logger__.expect(false, false, (cond), #cond, __LINE__, __FILE__))
#define ASSERT_FALSE(cond) (logger__.expect(true, false, (cond), #cond, __LINE__, __FILE__))
#define EXPECT_EQUAL(x, y) (logger__.expect_equal(false, (x), (y), #x, #y, __LINE__, __FILE__))
#define ASSERT_EQUAL(x, y) (logger__.expect_equal(true, (x), (y), #x, #y, __LINE__, __FILE__))

using TestFunc = void (*)(TestLogger&);

struct TestRegister {
  TestRegister(const char* test_name, TestFunc test, std::initializer_list<const char*> tags);
};

#define TEST_FUNC(ret_type, name, ...) static ret_type name(TestLogger& logger__, __VA_ARGS__)

#define TEST_FUNC_CALL(func, ...) func(logger__, __VA_ARGS__)

#define TEST(name, ...)                                                          \
  static void Test__##name(TestLogger&);                                         \
  static TestRegister Test__Unique__##name(#name, &Test__##name, {__VA_ARGS__}); \
  static void Test__##name(TestLogger& logger__)
