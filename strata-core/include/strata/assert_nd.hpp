/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#ifndef STRATA_ASSERT_ND_HPP_
#define STRATA_ASSERT_ND_HPP_

#include <string>

/**
 * @def ASSERT_ND(x)
 * @ingroup IDIOMS
 * @brief assert() replacement that prints a backtrace in debug builds and compiles to nothing,
 * without unused-variable warnings, in release builds.
 * @details
 * The release expansion uses the (void) sizeof(x) trick so that x is never evaluated even
 * when it is a function call.
 * @attention ASSERT_ND is for internal invariants only. A caller's contract violation that
 * must be caught in release builds, such as asking a Log pointer for its HeapId, is reported
 * with LOG(FATAL) instead.
 */
/**
 * @def UNUSED_ND(var)
 * @ingroup IDIOMS
 * @brief Marks a variable used only in ASSERT_ND.
 */
namespace strata {
/** Formats a failed assertion. */
std::string print_assert(const char* file, const char* func, int line, const char* description);
/** Prints out the current backtrace. Best-effort. */
std::string print_backtrace();

/**
 * print_assert() + print_backtrace() to stderr.
 * The text is also kept in a global variable so that a signal handler can show it later.
 */
void print_assert_backtrace(const char* file, const char* func, int line, const char* description);

/** Retrieves the text left by print_assert_backtrace(). Called by signal handlers. */
std::string get_recent_assert_backtrace();
}  // namespace strata

#ifdef NDEBUG
#define ASSERT_ND(x) do { (void) sizeof(x); } while (0)
#define UNUSED_ND(var) ASSERT_ND(var)
#else  // NDEBUG
#include <cassert>
#define ASSERT_QUOTE(str) #str
#define ASSERT_ND(x) do { if (!(x)) { \
  strata::print_assert_backtrace(__FILE__, __FUNCTION__, __LINE__, ASSERT_QUOTE(x)); \
  assert(x); \
  } } while (0)
#define UNUSED_ND(var)
#endif  // NDEBUG

#endif  // STRATA_ASSERT_ND_HPP_
