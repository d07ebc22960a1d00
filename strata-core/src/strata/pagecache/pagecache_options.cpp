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
#include "strata/pagecache/pagecache_options.hpp"

#include "strata/externalize/externalizable.hpp"

namespace strata {
namespace pagecache {
PagecacheOptions::PagecacheOptions()
  : page_table_capacity_(kDefaultPageTableCapacity),
    segment_size_(kDefaultSegmentSize) {
}

ErrorStack PagecacheOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, page_table_capacity_);
  EXTERNALIZE_LOAD_ELEMENT(element, segment_size_);
  return kRetOk;
}

ErrorStack PagecacheOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the page table"));

  EXTERNALIZE_SAVE_ELEMENT(element, page_table_capacity_,
    "Number of page ids the page table can hold, including the meta and counter pages."
    " Allocated up-front, 8 bytes each. Must be larger than 2.");
  EXTERNALIZE_SAVE_ELEMENT(element, segment_size_, "Byte size of one log segment.");
  return kRetOk;
}

}  // namespace pagecache
}  // namespace strata
