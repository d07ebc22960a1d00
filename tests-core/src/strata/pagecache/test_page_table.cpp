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
#include <stdint.h>
#include <gtest/gtest.h>

#include <iostream>
#include <thread>
#include <vector>

#include "strata/error_stack.hpp"
#include "strata/test_common.hpp"
#include "strata/assorted/raw_atomics.hpp"
#include "strata/heap/heap_id.hpp"
#include "strata/pagecache/page_pointer.hpp"
#include "strata/pagecache/page_table.hpp"
#include "strata/pagecache/pagecache_options.hpp"
#include "strata/pagecache/persisted_records.hpp"
#include "strata/pagecache/pointer_read.hpp"
#include "strata/reclaim/epoch_reclaimer.hpp"
#include "strata/reclaim/reclaim_options.hpp"

namespace strata {
namespace pagecache {
DEFINE_TEST_CASE_PACKAGE(PageTableTest, strata.pagecache);

/** A resident record that counts its own destruction. */
struct TrackedNode : public ResidentRecord {
  explicit TrackedNode(uint64_t* destroyed)
    : ResidentRecord(kResidentNode, PagePointer()), destroyed_(destroyed) {}
  ~TrackedNode() {
    assorted::raw_atomic_fetch_add<uint64_t>(destroyed_, 1U);
  }
  uint64_t* destroyed_;
};

struct PageTableFixture {
  PageTableFixture() : reclaimer_(&reclaim_options_), table_(&options_) {
    options_.page_table_capacity_ = 16;
    reclaim_options_.participant_slots_ = 8;
    reclaim_options_.auto_collect_threshold_ = 0;
    COERCE_ERROR(reclaimer_.initialize());
    COERCE_ERROR(table_.initialize());
  }
  ~PageTableFixture() {
    COERCE_ERROR(table_.uninitialize());
    COERCE_ERROR(reclaimer_.uninitialize());
  }
  PagecacheOptions          options_;
  reclaim::ReclaimOptions   reclaim_options_;
  reclaim::EpochReclaimer   reclaimer_;
  PageTable                 table_;
};

TEST(PageTableTest, InitialState) {
  PageTableFixture fixture;
  EXPECT_EQ(16U, fixture.table_.get_capacity());
  EXPECT_EQ(kFirstNodePageId, fixture.table_.get_allocated_count());
  reclaim::Guard guard;
  EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));
  for (PageId page_id = 0; page_id < 16U; ++page_id) {
    PagePointer pointer = PagePointer::new_free(1);
    EXPECT_EQ(kErrorCodeOk, fixture.table_.load(page_id, &guard, &pointer));
    EXPECT_TRUE(pointer.is_unassigned());
  }
  PagePointer pointer;
  EXPECT_EQ(kErrorCodePcPageIdOutOfRange, fixture.table_.load(16, &guard, &pointer));
}

TEST(PageTableTest, Allocate) {
  PageTableFixture fixture;
  for (PageId expected = kFirstNodePageId; expected < 16U; ++expected) {
    PageId page_id = 0;
    EXPECT_EQ(kErrorCodeOk, fixture.table_.allocate(&page_id));
    EXPECT_EQ(expected, page_id);
  }
  PageId page_id = 0;
  EXPECT_EQ(kErrorCodePcPageTableFull, fixture.table_.allocate(&page_id));
  EXPECT_EQ(kErrorCodePcPageTableFull, fixture.table_.allocate(&page_id));
  EXPECT_EQ(16U, fixture.table_.get_allocated_count());
}

TEST(PageTableTest, CompareAndSwap) {
  PageTableFixture fixture;
  reclaim::Guard guard;
  EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));
  PageId page_id;
  EXPECT_EQ(kErrorCodeOk, fixture.table_.allocate(&page_id));

  PagePointer log_pointer = PagePointer::new_log(SizeClass(10), 2048);
  PagePointer observed;
  EXPECT_EQ(kErrorCodeOk,
    fixture.table_.compare_and_swap(page_id, PagePointer(), log_pointer, &guard, &observed));
  EXPECT_TRUE(observed.is_unassigned());

  PagePointer loaded;
  EXPECT_EQ(kErrorCodeOk, fixture.table_.load(page_id, &guard, &loaded));
  EXPECT_EQ(log_pointer, loaded);

  // stale expectation
  PagePointer heap_pointer = PagePointer::new_heap(heap::HeapId(1, 3));
  EXPECT_EQ(kErrorCodePcPointerRaced,
    fixture.table_.compare_and_swap(page_id, PagePointer(), heap_pointer, &guard, &observed));
  EXPECT_EQ(log_pointer, observed);

  EXPECT_EQ(kErrorCodeOk,
    fixture.table_.compare_and_swap(page_id, observed, heap_pointer, &guard, &observed));
  EXPECT_EQ(kErrorCodeOk, fixture.table_.load(page_id, &guard, &loaded));
  EXPECT_EQ(heap_pointer, loaded);
  EXPECT_EQ(0U, fixture.reclaimer_.get_pending_count());

  EXPECT_EQ(kErrorCodePcPageIdOutOfRange,
    fixture.table_.compare_and_swap(100, loaded, log_pointer, &guard, &observed));
}

TEST(PageTableTest, SupersededRecordIsRetired) {
  uint64_t destroyed = 0;
  {
    PageTableFixture fixture;
    PageId page_id;
    EXPECT_EQ(kErrorCodeOk, fixture.table_.allocate(&page_id));
    {
      reclaim::Guard guard;
      EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));
      PagePointer first = PagePointer::new_in_memory(SizeClass(6), new TrackedNode(&destroyed));
      PagePointer observed;
      EXPECT_EQ(kErrorCodeOk,
        fixture.table_.compare_and_swap(page_id, PagePointer(), first, &guard, &observed));

      PagePointer second = PagePointer::new_in_memory(SizeClass(6), new TrackedNode(&destroyed));
      EXPECT_EQ(kErrorCodeOk,
        fixture.table_.compare_and_swap(page_id, first, second, &guard, &observed));
      EXPECT_EQ(1U, fixture.reclaimer_.get_pending_count());

      // a loser keeps its record and destroys it right away
      PagePointer loser = PagePointer::new_in_memory(SizeClass(6), new TrackedNode(&destroyed));
      EXPECT_EQ(kErrorCodePcPointerRaced,
        fixture.table_.compare_and_swap(page_id, first, loser, &guard, &observed));
      EXPECT_EQ(second, observed);
      loser.read().destroy_immediately();
      EXPECT_EQ(1U, destroyed);

      fixture.reclaimer_.advance_epoch();
      EXPECT_EQ(0U, fixture.reclaimer_.collect());
    }
    EXPECT_EQ(1U, fixture.reclaimer_.collect());
    EXPECT_EQ(2U, destroyed);
  }
  // the installed record is destroyed with the table
  EXPECT_EQ(3U, destroyed);
}

TEST(PageTableTest, SwapWithSameValueKeepsRecord) {
  uint64_t destroyed = 0;
  {
    PageTableFixture fixture;
    PageId page_id;
    EXPECT_EQ(kErrorCodeOk, fixture.table_.allocate(&page_id));
    PagePointer first = PagePointer::new_in_memory(SizeClass(6), new TrackedNode(&destroyed));
    {
      reclaim::Guard guard;
      EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));
      PagePointer observed;
      EXPECT_EQ(kErrorCodeOk,
        fixture.table_.compare_and_swap(page_id, PagePointer(), first, &guard, &observed));
      EXPECT_EQ(kErrorCodeOk,
        fixture.table_.compare_and_swap(page_id, first, first, &guard, &observed));
      EXPECT_EQ(first, observed);
      EXPECT_EQ(0U, fixture.reclaimer_.get_pending_count());
    }
    fixture.reclaimer_.advance_epoch();
    EXPECT_EQ(0U, fixture.reclaimer_.collect());
    EXPECT_EQ(0U, destroyed);

    reclaim::Guard guard;
    EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));
    PagePointer loaded;
    EXPECT_EQ(kErrorCodeOk, fixture.table_.load(page_id, &guard, &loaded));
    EXPECT_EQ(first, loaded);
    EXPECT_EQ(kResidentNode, loaded.read().as_resident(page_id).kind_);
  }
  // destroyed exactly once, by the table
  EXPECT_EQ(1U, destroyed);
}

TEST(PageTableTest, UnallocatedIdRecordDestroyedAtTeardown) {
  uint64_t destroyed = 0;
  {
    PageTableFixture fixture;
    EXPECT_EQ(kFirstNodePageId, fixture.table_.get_allocated_count());
    reclaim::Guard guard;
    EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));
    PagePointer record = PagePointer::new_in_memory(SizeClass(6), new TrackedNode(&destroyed));
    PagePointer observed;
    EXPECT_EQ(kErrorCodeOk,
      fixture.table_.compare_and_swap(10, PagePointer(), record, &guard, &observed));
    guard.release();
    EXPECT_EQ(0U, destroyed);
  }
  EXPECT_EQ(1U, destroyed);
}

TEST(PageTableTest, LogAndHeapLifecycle) {
  PageTableFixture fixture;
  PageId page_id;
  EXPECT_EQ(kErrorCodeOk, fixture.table_.allocate(&page_id));
  reclaim::Guard guard;
  EXPECT_EQ(kErrorCodeOk, fixture.reclaimer_.pin(&guard));

  heap::HeapId heap_id(2, 7);
  PagePointer combined = PagePointer::new_log_and_heap(SizeClass(17), 4096, heap_id, 11);
  PagePointer observed;
  EXPECT_EQ(kErrorCodeOk,
    fixture.table_.compare_and_swap(page_id, PagePointer(), combined, &guard, &observed));

  // compaction: drop the log copy
  PagePointer compacted = combined;
  compacted.forget_heap_log_coordinates();
  EXPECT_EQ(kErrorCodeOk,
    fixture.table_.compare_and_swap(page_id, combined, compacted, &guard, &observed));
  EXPECT_EQ(1U, fixture.reclaimer_.get_pending_count());

  PagePointer loaded;
  EXPECT_EQ(kErrorCodeOk, fixture.table_.load(page_id, &guard, &loaded));
  EXPECT_EQ(kPointerHeap, loaded.get_kind());
  EXPECT_EQ(heap_id, loaded.read().heap_id());
  EXPECT_EQ(1ULL << 17, loaded.read().encoded_size());
  guard.release();
}

const int kThreads = 4;
const int kRounds = 200;

/**
 * Every thread tries to replace the page's record in each round. Exactly one wins per value,
 * losers destroy their own records.
 */
struct CasRaceImpl {
  CasRaceImpl(PageTableFixture* fixture, PageId page_id)
    : fixture_(fixture), page_id_(page_id), wins_(0), destroyed_(0) {}
  void handle() {
    for (int i = 0; i < kRounds; ++i) {
      reclaim::Guard guard;
      ErrorCode pinned = fixture_->reclaimer_.pin(&guard);
      EXPECT_EQ(kErrorCodeOk, pinned);
      if (pinned != kErrorCodeOk) {
        return;
      }
      PagePointer current;
      EXPECT_EQ(kErrorCodeOk, fixture_->table_.load(page_id_, &guard, &current));
      PagePointer mine = PagePointer::new_in_memory(SizeClass(6), new TrackedNode(&destroyed_));
      PagePointer observed;
      ErrorCode ret = fixture_->table_.compare_and_swap(page_id_, current, mine, &guard, &observed);
      if (ret == kErrorCodeOk) {
        assorted::raw_atomic_fetch_add<uint64_t>(&wins_, 1U);
      } else {
        EXPECT_EQ(kErrorCodePcPointerRaced, ret);
        EXPECT_NE(current, observed);
        mine.read().destroy_immediately();
      }
    }
  }
  PageTableFixture* fixture_;
  PageId            page_id_;
  uint64_t          wins_;
  uint64_t          destroyed_;
};

TEST(PageTableTest, ConcurrentCompareAndSwap) {
  PageTableFixture* fixture = new PageTableFixture();
  PageId page_id;
  EXPECT_EQ(kErrorCodeOk, fixture->table_.allocate(&page_id));
  CasRaceImpl impl(fixture, page_id);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back(std::thread(&CasRaceImpl::handle, &impl));
  }
  for (int i = 0; i < kThreads; ++i) {
    threads[i].join();
  }
  std::cout << fixture->reclaimer_ << std::endl;
  EXPECT_GT(impl.wins_, 0U);

  fixture->reclaimer_.advance_epoch();
  fixture->reclaimer_.collect();
  // everything but the installed record is gone
  const uint64_t total = kThreads * kRounds;
  EXPECT_EQ(total - 1U, impl.destroyed_);
  delete fixture;
  EXPECT_EQ(total, impl.destroyed_);
}

TEST(PageTableTest, InvalidCapacity) {
  PagecacheOptions options;
  options.page_table_capacity_ = 2;
  PageTable table(&options);
  ErrorStack result = table.initialize();
  EXPECT_EQ(kErrorCodeConfValueOutofrange, result.get_error_code());
}

}  // namespace pagecache
}  // namespace strata

TEST_MAIN_CAPTURE_SIGNALS(PageTableTest, strata.pagecache);
