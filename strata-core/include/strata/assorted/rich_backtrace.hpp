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
#ifndef STRATA_ASSORTED_RICH_BACKTRACE_HPP_
#define STRATA_ASSORTED_RICH_BACKTRACE_HPP_

#include <string>
#include <vector>

namespace strata {
namespace assorted {

/**
 * @brief Returns the backtrace of the current stack, one string per frame.
 * @details
 * glibc's backtrace() gives the addresses and mangled symbols. If rich is true we also ask
 * libbacktrace for source files and line numbers, which works for shared libraries too.
 * This does not care about out-of-memory situations.
 */
std::vector<std::string> get_backtrace(bool rich = true);

}  // namespace assorted
}  // namespace strata

#endif  // STRATA_ASSORTED_RICH_BACKTRACE_HPP_
