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
#ifndef STRATA_PAGECACHE_PAGECACHE_OPTIONS_HPP_
#define STRATA_PAGECACHE_PAGECACHE_OPTIONS_HPP_
#include <stdint.h>

#include "strata/cxx11.hpp"
#include "strata/externalize/externalizable.hpp"

namespace strata {
namespace pagecache {
/**
 * @brief Set of options for the page table and its log coordinates.
 * @ingroup PAGECACHE
 */
struct PagecacheOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /** Constant values. */
  enum Constants {
    kDefaultPageTableCapacity = 1 << 20,
    kDefaultSegmentSize = 1 << 23,
  };

  PagecacheOptions();

  /**
   * @brief Number of page ids the page table can hold, including the meta and counter pages.
   * @details
   * The table is allocated up-front with 8 bytes per page id. Must be larger than 2.
   */
  uint64_t    page_table_capacity_;

  /**
   * @brief Byte size of one log segment.
   * @details
   * Used to decide whether a page still has data in a segment that is being reclaimed.
   * Must be positive.
   */
  uint64_t    segment_size_;

  EXTERNALIZABLE(PagecacheOptions);
};
}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_PAGECACHE_OPTIONS_HPP_
