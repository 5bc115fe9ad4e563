/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "core/status.hpp"

#include <cstdio>
#include <string>

static int g_pass = 0;
static int g_fail = 0;

template <class T, class U = T>
inline void check_eq(const char* label, const T& got, const U& expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

inline void check_true(const char* label, bool v) { check_eq(label, v, true); }

// Passes when r holds an error with the given code.
template <class R>
inline void check_err(const char* label, const R& r, sindri::core::Errc code) {
  if (!r && r.error().code == code) {
    ++g_pass;
    return;
  }
  if (r) std::fprintf(stderr, "FAIL %s: succeeded\n", label);
  else std::fprintf(stderr, "FAIL %s: %s\n", label, r.error().describe().c_str());
  ++g_fail;
}

template <class R>
inline bool check_ok(const char* label, const R& r) {
  if (r) {
    ++g_pass;
    return true;
  }
  std::fprintf(stderr, "FAIL %s: %s\n", label, r.error().describe().c_str());
  ++g_fail;
  return false;
}

inline int report(const char* suite) {
  std::fprintf(stdout, "%s: %d passed, %d failed\n", suite, g_pass, g_fail);
  return g_fail ? 1 : 0;
}
