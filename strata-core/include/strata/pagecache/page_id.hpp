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
#ifndef STRATA_PAGECACHE_PAGE_ID_HPP_
#define STRATA_PAGECACHE_PAGE_ID_HPP_
#include <stdint.h>

/**
 * @file strata/pagecache/page_id.hpp
 * @brief Logical page identifiers.
 * @ingroup PAGECACHE
 */
namespace strata {
namespace pagecache {

/**
 * @typedef PageId
 * @brief Stable logical identifier of a page, the index into the page table.
 * @ingroup PAGECACHE
 * @details
 * Two ids are special. 0 is the meta page (names of trees to their root pages) and 1 is the
 * monotonic counter page. Everything from kFirstNodePageId on is an ordinary tree node.
 */
typedef uint64_t PageId;

const PageId kMetaPageId = 0;
const PageId kCounterPageId = 1;
const PageId kFirstNodePageId = 2;

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_PAGE_ID_HPP_
