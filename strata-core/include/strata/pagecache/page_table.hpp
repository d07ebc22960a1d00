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
#ifndef STRATA_PAGECACHE_PAGE_TABLE_HPP_
#define STRATA_PAGECACHE_PAGE_TABLE_HPP_
#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "strata/cxx11.hpp"
#include "strata/error_code.hpp"
#include "strata/initializable.hpp"
#include "strata/pagecache/fwd.hpp"
#include "strata/pagecache/page_id.hpp"
#include "strata/pagecache/page_pointer.hpp"
#include "strata/reclaim/fwd.hpp"

namespace strata {
namespace pagecache {

/**
 * @brief Maps page ids to PagePointer values.
 * @ingroup PAGECACHE
 * @details
 * A fixed-capacity array of 8-byte slots, one per page id, each holding PagePointer::to_bits().
 * Slots start Unassigned. kMetaPageId and kCounterPageId are reserved. allocate() hands out
 * ids from kFirstNodePageId upwards and never reuses them.
 *
 * @par Ownership
 * The table owns the record of every InMemory and LogAndHeap pointer installed in it.
 * A successful compare_and_swap() transfers ownership of the desired value's record to the
 * table and retires the expected value's record through the guard. A failed one leaves the
 * desired record with the caller, who usually destroys it with
 * PointerRead::destroy_immediately() since nobody else has seen it.
 * Records still installed at uninitialize() are destroyed there, including those on ids
 * that allocate() never handed out.
 *
 * @par Concurrency
 * load() and compare_and_swap() are lock-free and may be called from any thread holding a
 * pinned reclaim::Guard of the same PageCache.
 */
class PageTable CXX11_FINAL : public DefaultInitializable {
 public:
  explicit PageTable(const PagecacheOptions* options);

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /**
   * Reserves a new page id. Its slot is Unassigned.
   * @return kErrorCodePcPageTableFull if all page ids are taken
   */
  ErrorCode   allocate(PageId* out);

  /**
   * @brief Atomically reads the pointer of the page.
   * @param[in] guard must be pinned, and stay pinned while out's record is accessed
   * @return kErrorCodePcPageIdOutOfRange if page_id is not below the capacity
   */
  ErrorCode   load(PageId page_id, reclaim::Guard* guard, PagePointer* out) const;

  /**
   * @brief Installs desired if the slot still holds expected.
   * @param[in] guard must be pinned. On success the expected record is retired through it,
   * unless desired is the same value.
   * @param[out] observed the value found in the slot. Equals expected on success.
   * @return kErrorCodePcPointerRaced if the slot held another value,
   * kErrorCodePcPageIdOutOfRange if page_id is not below the capacity
   */
  ErrorCode   compare_and_swap(
    PageId page_id,
    const PagePointer& expected,
    const PagePointer& desired,
    reclaim::Guard* guard,
    PagePointer* observed);

  uint64_t    get_capacity() const { return slots_.size(); }
  /** Number of page ids handed out so far, including the two reserved ones. */
  uint64_t    get_allocated_count() const;

  friend std::ostream& operator<<(std::ostream& o, const PageTable& v);

 private:
  const PagecacheOptions* const options_;
  /** PagePointer bits. Only touched via raw atomics. */
  std::vector<uint64_t>         slots_;
  /** Only touched via raw atomics. */
  PageId                        next_page_id_;
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_PAGE_TABLE_HPP_
