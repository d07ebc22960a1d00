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
#include "strata/pagecache/page_table.hpp"

#include <glog/logging.h>

#include <ostream>

#include "strata/assert_nd.hpp"
#include "strata/compiler.hpp"
#include "strata/error_stack.hpp"
#include "strata/assorted/raw_atomics.hpp"
#include "strata/pagecache/pagecache_options.hpp"
#include "strata/pagecache/pointer_read.hpp"
#include "strata/reclaim/epoch_reclaimer.hpp"

namespace strata {
namespace pagecache {

PageTable::PageTable(const PagecacheOptions* options)
  : options_(options), next_page_id_(kFirstNodePageId) {
}

ErrorStack PageTable::initialize_once() {
  if (options_->page_table_capacity_ <= kFirstNodePageId) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange,
      "page_table_capacity_ must be larger than the reserved page ids");
  }
  LOG(INFO) << "Initializing PageTable with " << options_->page_table_capacity_ << " slots...";
  slots_.assign(options_->page_table_capacity_, PagePointer().to_bits());
  assorted::atomic_store_seq_cst<PageId>(&next_page_id_, kFirstNodePageId);
  return kRetOk;
}

ErrorStack PageTable::uninitialize_once() {
  LOG(INFO) << "Uninitializing PageTable...";
  uint64_t destroyed = 0;
  // compare_and_swap() also accepts ids that allocate() has not handed out yet
  for (PageId page_id = 0; page_id < slots_.size(); ++page_id) {
    PointerRead read = PagePointer::from_bits(slots_[page_id]).read();
    if (read.get_kind() == kPointerInMemory || read.get_kind() == kPointerLogAndHeap) {
      read.destroy_immediately();
      ++destroyed;
    }
  }
  LOG(INFO) << "Destroyed " << destroyed << " records still installed in PageTable";
  slots_.clear();
  return kRetOk;
}

ErrorCode PageTable::allocate(PageId* out) {
  ASSERT_ND(is_initialized());
  PageId current = assorted::atomic_load_acquire<PageId>(&next_page_id_);
  while (true) {
    if (current >= slots_.size()) {
      return kErrorCodePcPageTableFull;
    }
    if (assorted::raw_atomic_compare_exchange_weak<PageId>(&next_page_id_, &current, current + 1U)) {
      *out = current;
      return kErrorCodeOk;
    }
  }
}

ErrorCode PageTable::load(PageId page_id, reclaim::Guard* guard, PagePointer* out) const {
  ASSERT_ND(guard->is_active());
  UNUSED_ND(guard);
  if (UNLIKELY(page_id >= slots_.size())) {
    return kErrorCodePcPageIdOutOfRange;
  }
  // seq_cst, not acquire. EpochReclaimer::pin() publishes the guard's epoch with a seq_cst
  // CAS, and that store must be ordered before this load.
  *out = PagePointer::from_bits(assorted::atomic_load_seq_cst<uint64_t>(&slots_[page_id]));
  return kErrorCodeOk;
}

ErrorCode PageTable::compare_and_swap(
  PageId page_id,
  const PagePointer& expected,
  const PagePointer& desired,
  reclaim::Guard* guard,
  PagePointer* observed) {
  ASSERT_ND(guard->is_active());
  if (UNLIKELY(page_id >= slots_.size())) {
    return kErrorCodePcPageIdOutOfRange;
  }
  uint64_t bits = expected.to_bits();
  bool swapped = assorted::raw_atomic_compare_exchange_strong<uint64_t>(
    &slots_[page_id],
    &bits,
    desired.to_bits());
  *observed = PagePointer::from_bits(bits);
  if (!swapped) {
    DVLOG(1) << "compare_and_swap() on page " << page_id << " raced. expected=" << expected
      << ", observed=" << *observed;
    return kErrorCodePcPointerRaced;
  }
  if (expected.to_bits() != desired.to_bits()) {
    // the record is still installed when nothing changed
    expected.read().defer_destroy(guard);
  }
  return kErrorCodeOk;
}

uint64_t PageTable::get_allocated_count() const {
  return assorted::atomic_load_acquire<PageId>(&next_page_id_);
}

std::ostream& operator<<(std::ostream& o, const PageTable& v) {
  o << "<PageTable>"
    << "<capacity_>" << v.get_capacity() << "</capacity_>"
    << "<allocated_>" << v.get_allocated_count() << "</allocated_>"
    << "</PageTable>";
  return o;
}

}  // namespace pagecache
}  // namespace strata
