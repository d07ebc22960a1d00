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
#include "strata/pagecache/page_cache.hpp"

#include <glog/logging.h>

#include <ostream>

#include "strata/error_stack.hpp"
#include "strata/error_stack_batch.hpp"
#include "strata/pagecache/page_pointer.hpp"
#include "strata/pagecache/pointer_read.hpp"

namespace strata {
namespace pagecache {

PageCache::PageCache(const StrataOptions& options)
  : options_(options),
    debugging_(&options_.debugging_),
    reclaimer_(&options_.reclaim_),
    page_table_(&options_.pagecache_) {
}

ErrorStack PageCache::initialize_once() {
  CHECK_ERROR(debugging_.initialize());
  LOG(INFO) << "Initializing PageCache...";
  // on error, initialize() calls uninitialize_once() to release what we started so far
  CHECK_ERROR(check_options());
  CHECK_ERROR(check_address_space());
  CHECK_ERROR(reclaimer_.initialize());
  CHECK_ERROR(page_table_.initialize());
  LOG(INFO) << "Initialized PageCache. " << page_table_;
  return kRetOk;
}

ErrorStack PageCache::uninitialize_once() {
  LOG(INFO) << "Uninitializing PageCache...";
  ErrorStackBatch batch;
  // page table first: it retires nothing more, it destroys what it still holds
  batch.push_back(page_table_.uninitialize());
  batch.push_back(reclaimer_.uninitialize());
  LOG(INFO) << "Uninitialized PageCache";
  batch.push_back(debugging_.uninitialize());
  return SUMMARIZE_ERROR_BATCH(batch);
}

ErrorStack PageCache::check_options() const {
  if (options_.pagecache_.segment_size_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "segment_size_ must be positive");
  }
  if (options_.pagecache_.page_table_capacity_ <= kFirstNodePageId) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange,
      "page_table_capacity_ must be larger than the reserved page ids");
  }
  if (options_.reclaim_.participant_slots_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "participant_slots_ must be positive");
  }
  return kRetOk;
}

ErrorStack PageCache::check_address_space() const {
  if (sizeof(void*) != 8U) {
    return ERROR_STACK_MSG(kErrorCodePcAddressSpaceTooWide, "only 64-bit platforms are supported");
  }
  // a heap address is a good sample of where records are allocated
  uint64_t* probe = new uint64_t(0);
  uintptr_t address = reinterpret_cast<uintptr_t>(probe);
  delete probe;
  if ((address >> (PagePointer::kPayloadBytes * 8U)) != 0) {
    LOG(ERROR) << "Heap address " << std::hex << address << std::dec << " uses more than "
      << (PagePointer::kPayloadBytes * 8U) << " bits";
    return ERROR_STACK(kErrorCodePcAddressSpaceTooWide);
  }
  return kRetOk;
}

ErrorCode PageCache::page_exists_on_segment(
  PageId page_id,
  log::LogOffset segment_offset,
  bool* out) {
  reclaim::Guard guard;
  CHECK_ERROR_CODE(reclaimer_.pin(&guard));
  PagePointer pointer;
  CHECK_ERROR_CODE(page_table_.load(page_id, &guard, &pointer));
  PointerRead read;
  CHECK_ERROR_CODE(pointer.read_checked(&read));
  *out = read.exists_on_segment(segment_offset, options_.pagecache_.segment_size_, page_id);
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const PageCache& v) {
  o << "<PageCache>" << v.page_table_ << v.reclaimer_ << "</PageCache>";
  return o;
}

}  // namespace pagecache
}  // namespace strata
