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

// Open Group Base Specifications Issue 7
#define _XOPEN_SOURCE 700
#define _POSIX_C_SOURCE 200809L

#include "unit.h"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>

#include "util/term.h"

struct Test {
  std::string test_name;
  TestFunc test;
  std::set<std::string> tags;
  Test(const char* test_name_, TestFunc test_, std::set<std::string> tags)
      : test_name(test_name_), test(test_), tags(tags) {}
};

// Registry filled by the static TestRegister objects of each test file.
// Function local so it exists before any of them run.
static std::vector<Test>* get_tests() {
  static std::vector<Test> tests;
  return &tests;
}

TestRegister::TestRegister(const char* test_name, TestFunc test,
                           std::initializer_list<const char*> tags) {
  std::set<std::string> test_tags;
  for (const auto* tag : tags) {
    test_tags.emplace(tag);
  }
  get_tests()->emplace_back(test_name, test, std::move(test_tags));
}

std::string escape_string(const std::string& str) {
  std::string out;
  for (unsigned char c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

bool matches_prefix(const std::vector<std::string>& prefixes, const Test& test) {
  if (prefixes.empty()) return true;

  for (const auto& prefix : prefixes) {
    if (test.test_name.find(prefix) == 0) {
      return true;
    }
  }
  return false;
}

bool matches_tags(const std::set<std::string>& tags, const Test& test) {
  // A tagged test only runs when all of its tags were asked for.
  for (const auto& tag : test.tags) {
    if (tags.count(tag) == 0) {
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  bool no_color = false;
  std::vector<std::string> prefixes;
  std::set<std::string> tags;
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (strcmp(arg, "--no-color") == 0) {
      no_color = true;
    }
    if (strcmp(arg, "--prefix") == 0 && i + 1 < argc) {
      prefixes.emplace_back(argv[++i]);
    }
    if (strcmp(arg, "--tag") == 0 && i + 1 < argc) {
      tags.emplace(argv[++i]);
    }
  }
  term_init(!no_color);

  static std::ofstream log_file("pretty-unit.log");
  if (!log_file) {
    std::cerr << "Unable to init logging: pretty-unit.log failed to open" << std::endl;
  } else {
    pretty::log::subscribe(std::make_unique<pretty::log::FormatSubscriber>(log_file.rdbuf()));
  }

  TestLogger logger;
  std::set<std::string> failed_tests;
  std::set<std::string> passing_tests;
  for (auto& test : *get_tests()) {
    size_t num_errors = logger.errors.size();
    logger.test_name = test.test_name.c_str();
    if (setjmp(logger.return_jmp_buffer)) {
      // An assertion failed; it is already recorded.
      continue;
    }
    if (!matches_prefix(prefixes, test)) continue;
    if (!matches_tags(tags, test)) continue;
    test.test(logger);
    if (num_errors == logger.errors.size()) passing_tests.emplace(test.test_name);
  }

  for (auto& err : logger.errors) {
    std::cerr << term_intensity(2);
    std::cerr << err->file << ":" << err->line << ": ";
    std::cerr << term_colour(TERM_RED);
    std::cerr << "error: ";
    std::cerr << term_normal();
    std::cerr << std::endl;
    std::string msg = err->user_error.str();
    if (msg.size() > 0) {
      std::cerr << msg << std::endl;
    }
    std::cerr << err->predicate_error.str() << std::endl;
    failed_tests.emplace(err->test_name);
  }

  if (failed_tests.size()) {
    std::cerr << term_colour(TERM_RED);
    std::cerr << "FAILED:" << std::endl;
    for (auto& test_name : failed_tests) {
      std::cerr << "  " << test_name << std::endl;
    }
  }

  if (passing_tests.size()) {
    std::cout << term_colour(TERM_GREEN);
    std::cout << "PASSED:" << std::endl;
    for (auto& test_name : passing_tests) {
      std::cout << "  " << test_name << std::endl;
    }
  }

  if (failed_tests.size()) {
    std::cerr << term_normal();
    std::cerr << "\n\nFAILURE" << std::endl;
    return 1;
  } else {
    std::cout << term_normal();
    std::cout << "\n\nSUCCESS" << std::endl;
    return 0;
  }
}
