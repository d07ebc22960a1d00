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
#include "strata/heap/heap_id.hpp"

#include <glog/logging.h>

#include <ostream>

#include "strata/compiler.hpp"

namespace strata {
namespace heap {

HeapId HeapId::from_size_class_exponent(uint8_t exponent, uint32_t index) {
  if (UNLIKELY(exponent < kMinTrailingZeros || exponent > kMinTrailingZeros + kMaxSlab)) {
    LOG(FATAL) << "Size class exponent " << static_cast<int>(exponent)
      << " does not correspond to any heap slab";
  }
  return HeapId(exponent - kMinTrailingZeros, index);
}

std::ostream& operator<<(std::ostream& o, const HeapId& v) {
  o << "<HeapId slab=\"" << static_cast<int>(v.slab_)
    << "\" index=\"" << v.index_
    << "\" slab_size=\"" << v.slab_size() << "\" />";
  return o;
}

}  // namespace heap
}  // namespace strata
