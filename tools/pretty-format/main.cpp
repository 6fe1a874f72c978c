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

#include <dirent.h>
#include <errno.h>
#include <pretty/engine.h>
#include <pretty/tracing.h>
#include <pretty/width.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "gopt.h"
#include "tokenizer.h"
#include "util/term.h"

#ifndef PRETTY_VERSION
#define PRETTY_VERSION unknown
#endif
#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define VERSION_STR TOSTRING(PRETTY_VERSION)

void print_help(const char *argv0) {
  // clang-format off
  std::cout << std::endl
    << "Usage: " << argv0 << " [OPTIONS] [<file or directory> ...]" << std::endl
    << "  --width N      -w N     Format to N columns (default 80)"                  << std::endl
    << "  --indent N     -t N     Indent broken groups by N columns (default 2)"     << std::endl
    << "  --consistent   -c       Break every break of a group that does not fit"    << std::endl
    << "  --ext LIST     -e LIST  Extensions to format inside directories"           << std::endl
    << "                          (comma separated, default swift,gyb)"              << std::endl
    << "  --check        -n       Report lines wider than the width, don't format"   << std::endl
    << "                          (and strings that overflow the line)"              << std::endl
    << "  --debug        -d       Print the token stream and engine warnings"        << std::endl
    << "  --help         -h       Print this help message and exit"                  << std::endl
    << "  --version      -v       Print the version and exit"                        << std::endl
    << std::endl;
  // clang-format on
}

void print_version() { std::cout << "pretty-format " << VERSION_STR << std::endl; }

static struct option *find_option(struct option *options, const char *name) {
  for (struct option *o = options; !(o->flags & GOPT_LAST); ++o) {
    if (o->long_name && strcmp(o->long_name, name) == 0) return o;
  }
  return nullptr;
}

static bool parse_int(const char *str, int min, int *out) {
  if (!str || !*str) return false;
  char *end;
  errno = 0;
  long x = strtol(str, &end, 10);
  if (errno != 0 || *end != '\0' || x < min || x > pretty::kInfinity) return false;
  *out = static_cast<int>(x);
  return true;
}

static std::set<std::string> split_extensions(const std::string &list) {
  std::set<std::string> out;
  std::stringstream ss(list);
  std::string ext;
  while (std::getline(ss, ext, ',')) {
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    if (!ext.empty()) out.insert(ext);
  }
  return out;
}

static bool has_extension(const std::string &path, const std::set<std::string> &exts) {
  size_t slash = path.rfind('/');
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return false;
  return exts.count(path.substr(dot + 1)) != 0;
}

// Expands directories into the files below them with a matching extension.
// Files named explicitly are kept whatever their extension.
static bool collect_paths(const char *argv0, const std::string &path,
                          const std::set<std::string> &exts, bool explicit_path,
                          std::vector<std::string> &out) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    std::cerr << argv0 << ": " << path << ": " << strerror(errno) << std::endl;
    return false;
  }

  if (!S_ISDIR(st.st_mode)) {
    if (explicit_path || has_extension(path, exts)) out.push_back(path);
    return true;
  }

  DIR *dir = opendir(path.c_str());
  if (!dir) {
    std::cerr << argv0 << ": " << path << ": " << strerror(errno) << std::endl;
    return false;
  }

  std::vector<std::string> children;
  while (struct dirent *entry = readdir(dir)) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
    children.push_back(path + "/" + entry->d_name);
  }
  closedir(dir);

  std::sort(children.begin(), children.end());
  bool ok = true;
  for (const auto &child : children) {
    ok = collect_paths(argv0, child, exts, false, out) && ok;
  }
  return ok;
}

static bool read_file(const std::string &name, std::string &contents) {
  std::ifstream file(name);
  if (!file) return false;
  std::stringstream ss;
  ss << file.rdbuf();
  contents = ss.str();
  return !file.bad();
}

// Prints every line of `formatted` wider than `width`. Returns the number found.
static size_t report_wide_lines(const std::string &name, const std::string &formatted, int width) {
  size_t found = 0;
  std::stringstream ss(formatted);
  std::string line;
  for (size_t lineno = 1; std::getline(ss, line); ++lineno) {
    size_t w = pretty::display_width(line);
    if (w <= static_cast<size_t>(width)) continue;
    ++found;
    std::cerr << term_intensity(2) << name << ":" << lineno << ": " << term_normal()
              << "line is " << w << " columns wide, limit is " << width << std::endl;
    std::cerr << "    " << term_colour(TERM_RED) << line << term_normal() << std::endl;
  }
  return found;
}

int main(int argc, char **argv) {
  // clang-format off
  struct option options[] {
    { 'w',      "width", GOPT_ARGUMENT_REQUIRED},
    { 't',     "indent", GOPT_ARGUMENT_REQUIRED},
    { 'c', "consistent", GOPT_ARGUMENT_FORBIDDEN},
    { 'e',        "ext", GOPT_ARGUMENT_REQUIRED},
    { 'n',      "check", GOPT_ARGUMENT_FORBIDDEN},
    { 'd',      "debug", GOPT_ARGUMENT_FORBIDDEN},
    { 'h',       "help", GOPT_ARGUMENT_FORBIDDEN},
    { 'v',    "version", GOPT_ARGUMENT_FORBIDDEN},
    {   0,            0, GOPT_LAST}
  };
  // clang-format on

  argc = gopt(argv, options);
  gopt_errors(argv[0], options);

  bool help = find_option(options, "help")->count;
  bool version = find_option(options, "version")->count;
  bool consistent = find_option(options, "consistent")->count;
  bool check = find_option(options, "check")->count;
  bool debug = find_option(options, "debug")->count;
  const char *width_arg = find_option(options, "width")->argument;
  const char *indent_arg = find_option(options, "indent")->argument;
  const char *ext_arg = find_option(options, "ext")->argument;

  if (help) {
    print_help(argv[0]);
    exit(EXIT_SUCCESS);
  }

  if (version) {
    print_version();
    exit(EXIT_SUCCESS);
  }

  int width = 80;
  if (width_arg && !parse_int(width_arg, 1, &width)) {
    std::cerr << argv[0] << ": --width must be a positive integer, not '" << width_arg << "'"
              << std::endl;
    exit(EXIT_FAILURE);
  }

  TokenizerOptions tokenizer_options;
  if (indent_arg && !parse_int(indent_arg, 0, &tokenizer_options.indent)) {
    std::cerr << argv[0] << ": --indent must be a non-negative integer, not '" << indent_arg
              << "'" << std::endl;
    exit(EXIT_FAILURE);
  }
  if (consistent) tokenizer_options.mode = pretty::breaks::consistent;

  std::set<std::string> exts = split_extensions(ext_arg ? ext_arg : "swift,gyb");

  if (argc < 2) {
    std::cerr << argv[0] << ": missing files to format" << std::endl;
    exit(EXIT_FAILURE);
  }

  term_init(true);

  if (debug) {
    pretty::log::subscribe(std::make_unique<pretty::log::SimpleFormatSubscriber>(std::cerr.rdbuf()));
  } else if (check) {
    // Overflowing strings explain most wide lines, so --check shows what the
    // printer reports even without --debug.
    pretty::log::subscribe(std::make_unique<pretty::log::FilterSubscriber>(
        std::make_unique<pretty::log::SimpleFormatSubscriber>(std::cerr.rdbuf()),
        [](const pretty::log::Event &e) {
          const std::string *component = e.get(pretty::log::LOG_COMPONENT);
          return component && *component == "printer";
        }));
  }

  std::vector<std::string> paths;
  bool ok = true;
  for (int i = 1; i < argc; i++) {
    ok = collect_paths(argv[0], argv[i], exts, true, paths) && ok;
  }
  if (!ok) exit(EXIT_FAILURE);

  size_t wide_lines = 0;
  for (const auto &name : paths) {
    std::string contents;
    if (!read_file(name, contents)) {
      std::cerr << argv[0] << ": failed to read file: '" << name << "'" << std::endl;
      exit(EXIT_FAILURE);
    }

    std::vector<pretty::token> stream = tokenize(contents, tokenizer_options);

    if (debug) {
      for (const auto &t : stream) {
        std::cerr << t.to_string() << std::endl;
      }
    }

    std::string formatted = pretty::format(stream, width);

    if (check) {
      wide_lines += report_wide_lines(name, formatted, width);
      continue;
    }

    std::cout << formatted << std::endl;
  }

  if (check && wide_lines > 0) {
    std::cerr << argv[0] << ": " << wide_lines << " lines wider than " << width << " columns"
              << std::endl;
    exit(EXIT_FAILURE);
  }

  exit(EXIT_SUCCESS);
}
