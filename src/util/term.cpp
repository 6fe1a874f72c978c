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

#include "util/term.h"

#include <curses.h>
#include <term.h>
#include <unistd.h>

static bool tty = false;
static const char *sgr0;

static bool missing_termfn(const char *s) { return !s || s == (const char *)-1; }

static const char *wrap_termfn(const char *s) {
  if (missing_termfn(s)) return "";
  return s;
}

const char *term_colour(int code) {
  static char setaf_lit[] = "setaf";
  if (!sgr0) return "";
  char *format = tigetstr(setaf_lit);
  if (missing_termfn(format)) return "";
  return wrap_termfn(tparm(format, code));
}

const char *term_intensity(int code) {
  static char dim_lit[] = "dim";
  static char bold_lit[] = "bold";
  if (!sgr0) return "";
  if (code == 1) return wrap_termfn(tigetstr(dim_lit));
  if (code == 2) return wrap_termfn(tigetstr(bold_lit));
  return "";
}

const char *term_normal() { return sgr0 ? sgr0 : ""; }

bool term_tty() { return tty && sgr0; }

bool term_init(bool tty_, bool skip_atty) {
  tty = tty_;

  if (!tty) {
    return false;
  }

  if (!skip_atty && (isatty(1) != 1 || isatty(2) != 1)) {
    return false;
  }

  int eret;
  int ret = setupterm(0, 2, &eret);
  if (ret != OK) {
    return false;
  }

  // tigetstr function argument is (char*) on some platforms, so we need this hack:
  static char sgr0_lit[] = "sgr0";
  sgr0 = tigetstr(sgr0_lit);
  if (missing_termfn(sgr0)) {
    sgr0 = nullptr;
    return false;
  }

  return true;
}
