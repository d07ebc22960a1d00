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
#ifndef STRATA_PAGECACHE_PAGE_CACHE_HPP_
#define STRATA_PAGECACHE_PAGE_CACHE_HPP_
#include <stdint.h>

#include <iosfwd>

#include "strata/cxx11.hpp"
#include "strata/error_code.hpp"
#include "strata/initializable.hpp"
#include "strata/strata_options.hpp"
#include "strata/debugging/debugging_supports.hpp"
#include "strata/log/log_id.hpp"
#include "strata/pagecache/page_id.hpp"
#include "strata/pagecache/page_table.hpp"
#include "strata/reclaim/epoch_reclaimer.hpp"

namespace strata {
namespace pagecache {

/**
 * @defgroup PAGECACHE Page Cache
 * @brief Page locations of a log-structured page cache.
 * @details
 * Every page of the cache is addressed by a PageId. Where its current version lives is a
 * PagePointer: in memory, in the heap store, in the write-ahead log, or in both the log and
 * the heap store. The PageTable maps ids to pointers and is updated with compare-and-swaps.
 * Records that superseded pointers address are destroyed through epoch-based reclamation
 * once no reader can observe them.
 *
 * @par Example
 * @code{.cpp}
 * StrataOptions options;
 * PageCache cache(options);
 * COERCE_ERROR(cache.initialize());
 * {
 *   reclaim::Guard guard;
 *   WRAP_ERROR_CODE(cache.get_reclaimer()->pin(&guard));
 *   PageId page_id;
 *   WRAP_ERROR_CODE(cache.get_page_table()->allocate(&page_id));
 *   ...
 * }
 * COERCE_ERROR(cache.uninitialize());
 * @endcode
 */

/**
 * @brief Owns the modules of one page cache instance and starts/stops them in order.
 * @ingroup PAGECACHE
 * @details
 * initialize() starts debugging supports (glog), checks the options and the address space,
 * then starts the EpochReclaimer and the PageTable. uninitialize() stops them in reverse order.
 * All guards must be released before uninitialize().
 */
class PageCache CXX11_FINAL : public DefaultInitializable {
 public:
  explicit PageCache(const StrataOptions& options);

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  const StrataOptions&        get_options() const { return options_; }
  debugging::DebuggingSupports* get_debug() { return &debugging_; }
  reclaim::EpochReclaimer*    get_reclaimer() { return &reclaimer_; }
  PageTable*                  get_page_table() { return &page_table_; }

  /**
   * @brief Whether the current version of the page still has data in the log segment that
   * contains segment_offset, using the configured segment size.
   * @details
   * Pins its own guard. Used when deciding whether a segment can be reclaimed.
   * @return kErrorCodePcUnassignedPointer or kErrorCodePcCorruptPointer on such slots,
   * or any error of PageTable::load() and EpochReclaimer::pin()
   */
  ErrorCode   page_exists_on_segment(PageId page_id, log::LogOffset segment_offset, bool* out);

  friend std::ostream& operator<<(std::ostream& o, const PageCache& v);

 private:
  /** Checks option values that individual modules do not check themselves. */
  ErrorStack  check_options() const;
  /** Checks that heap addresses fit in a PagePointer payload. */
  ErrorStack  check_address_space() const;

  const StrataOptions         options_;
  debugging::DebuggingSupports  debugging_;
  reclaim::EpochReclaimer     reclaimer_;
  PageTable                   page_table_;
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_PAGE_CACHE_HPP_
