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
#include "strata/assert_nd.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "strata/assorted/rich_backtrace.hpp"

namespace strata {

/** Text of assertions failed so far in this process. Read by signal handlers. */
std::string static_recent_assert_backtrace;

std::string print_assert(const char* file, const char* func, int line, const char* description) {
  std::stringstream str;
  str << "**** Assertion failed: \"" << description << "\" in "
    << func << "() " << file << ":" << line << std::endl;
  return str.str();
}

std::string print_backtrace() {
  std::vector<std::string> frames = assorted::get_backtrace(true);
  std::stringstream str;
  str << "=== Backtrace (" << frames.size() << " frames)" << std::endl;
  for (size_t i = 0; i < frames.size(); ++i) {
    str << "  #" << i << " " << frames[i] << std::endl;
  }
  return str.str();
}

void print_assert_backtrace(const char* file, const char* func, int line, const char* description) {
  std::string message = print_assert(file, func, line, description) + print_backtrace();
  static_recent_assert_backtrace += message;
  std::cerr << message;
}

std::string get_recent_assert_backtrace() {
  return static_recent_assert_backtrace;
}

}  // namespace strata
