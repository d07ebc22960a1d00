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
#include "strata/pagecache/size_class.hpp"

#include <glog/logging.h>

#include <ostream>

#include "strata/compiler.hpp"

namespace strata {
namespace pagecache {

SizeClass SizeClass::from_length(uint64_t length) {
  if (length <= 1U) {
    return SizeClass(0);
  }
  if (UNLIKELY(length > (1ULL << kMaxExponent))) {
    LOG(FATAL) << "Length " << length << " has no power-of-two size class in 64 bits";
  }
  // next power of two of length is 2^(64 - clz(length - 1))
  return SizeClass(static_cast<uint8_t>(64 - __builtin_clzll(length - 1U)));
}

uint64_t SizeClass::size() const {
  if (UNLIKELY(!is_valid())) {
    LOG(FATAL) << "Size class exponent " << static_cast<int>(exponent_) << " overflows 64 bits";
  }
  return 1ULL << exponent_;
}

std::ostream& operator<<(std::ostream& o, const SizeClass& v) {
  o << "<SizeClass exponent=\"" << static_cast<int>(v.exponent_) << "\"";
  if (v.is_valid()) {
    o << " size=\"" << v.size() << "\"";
  }
  o << " />";
  return o;
}

}  // namespace pagecache
}  // namespace strata
