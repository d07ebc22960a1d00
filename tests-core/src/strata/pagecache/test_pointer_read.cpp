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

#include <vector>

#include "strata/error_stack.hpp"
#include "strata/test_common.hpp"
#include "strata/heap/heap_id.hpp"
#include "strata/pagecache/page_pointer.hpp"
#include "strata/pagecache/persisted_records.hpp"
#include "strata/pagecache/pointer_read.hpp"
#include "strata/reclaim/epoch_reclaimer.hpp"
#include "strata/reclaim/reclaim_options.hpp"
#include "strata/tree/tree_types.hpp"

namespace strata {
namespace pagecache {
DEFINE_TEST_CASE_PACKAGE(PointerReadTest, strata.pagecache);

std::vector<log::LogOffset> collect_offsets(const PointerRead& read, PageId page_id) {
  std::vector<log::LogOffset> offsets;
  for (LogOffsetCursor cursor = read.log_offset_entries(page_id); cursor.is_valid();
    cursor.next()) {
    offsets.push_back(cursor.get());
  }
  return offsets;
}

/** A node with base offset o1, fragments o2, a heap-only fragment, and o3. */
PersistedNode* make_node(log::LogOffset o1, log::LogOffset o2, log::LogOffset o3) {
  tree::Node node;
  node.lo_ = "a";
  node.items_.push_back(tree::Node::Item("k", "v"));
  PersistedNode* record = new PersistedNode(node, PagePointer::new_log(SizeClass(8), o1), 10);
  record->frags_.push_back(PagePointer::new_log(SizeClass(6), o2));
  record->frags_.push_back(PagePointer::new_heap(heap::HeapId(0, 3)));
  record->frags_.push_back(PagePointer::new_log(SizeClass(6), o3));
  return record;
}

TEST(PointerReadTest, HeapHasNoOffsets) {
  PointerRead read = PagePointer::new_heap(heap::HeapId(2, 7)).read();
  EXPECT_TRUE(collect_offsets(read, kFirstNodePageId).empty());
}

TEST(PointerReadTest, LogAndFreeOffsets) {
  std::vector<log::LogOffset> offsets
    = collect_offsets(PagePointer::new_log(SizeClass(3), 300).read(), 5);
  ASSERT_EQ(1U, offsets.size());
  EXPECT_EQ(300U, offsets[0]);

  offsets = collect_offsets(PagePointer::new_free(4096).read(), 5);
  ASSERT_EQ(1U, offsets.size());
  EXPECT_EQ(4096U, offsets[0]);
}

TEST(PointerReadTest, LogAndHeapOffsets) {
  PointerRead read
    = PagePointer::new_log_and_heap(SizeClass(15), 65536, heap::HeapId(0, 1), 3).read();
  std::vector<log::LogOffset> offsets = collect_offsets(read, 9);
  ASSERT_EQ(1U, offsets.size());
  EXPECT_EQ(65536U, offsets[0]);
  read.destroy_immediately();
}

TEST(PointerReadTest, NodeOffsets) {
  PersistedNode* record = make_node(100, 200, 300);
  PointerRead read = PagePointer::new_in_memory(SizeClass(10), record).read();
  std::vector<log::LogOffset> offsets = collect_offsets(read, kFirstNodePageId);
  ASSERT_EQ(3U, offsets.size());
  EXPECT_EQ(100U, offsets[0]);
  EXPECT_EQ(200U, offsets[1]);
  EXPECT_EQ(300U, offsets[2]);

  // each call gives a fresh enumeration
  EXPECT_EQ(offsets, collect_offsets(read, kFirstNodePageId));
  read.destroy_immediately();
}

TEST(PointerReadTest, NodeWithHeapBase) {
  tree::Node node;
  PersistedNode* record = new PersistedNode(node, PagePointer::new_heap(heap::HeapId(1, 1)), 0);
  record->frags_.push_back(PagePointer::new_heap(heap::HeapId(1, 2)));
  record->frags_.push_back(PagePointer::new_log(SizeClass(6), 64));
  PointerRead read = PagePointer::new_in_memory(SizeClass(10), record).read();
  std::vector<log::LogOffset> offsets = collect_offsets(read, 7);
  ASSERT_EQ(1U, offsets.size());
  EXPECT_EQ(64U, offsets[0]);

  record->frags_.clear();
  EXPECT_TRUE(collect_offsets(read, 7).empty());
  read.destroy_immediately();
}

TEST(PointerReadTest, MetaAndCounterOffsets) {
  tree::Meta meta;
  meta.set_root("main", 5);
  PersistedMeta* meta_record = new PersistedMeta(meta, PagePointer::new_log(SizeClass(7), 1000));
  PointerRead meta_read = PagePointer::new_in_memory(SizeClass(7), meta_record).read();
  std::vector<log::LogOffset> offsets = collect_offsets(meta_read, kMetaPageId);
  ASSERT_EQ(1U, offsets.size());
  EXPECT_EQ(1000U, offsets[0]);
  EXPECT_EQ(5U, meta_read.as_meta().meta_.get_root("main"));
  EXPECT_EQ(0U, meta_read.as_meta().meta_.get_root("other"));

  PersistedCounter* counter_record
    = new PersistedCounter(9, PagePointer::new_heap(heap::HeapId(0, 0)));
  PointerRead counter_read = PagePointer::new_in_memory(SizeClass(3), counter_record).read();
  EXPECT_TRUE(collect_offsets(counter_read, kCounterPageId).empty());
  EXPECT_EQ(9U, counter_read.as_counter().counter_);

  meta_read.destroy_immediately();
  counter_read.destroy_immediately();
}

TEST(PointerReadTest, ExistsOnSegment) {
  PointerRead read = PagePointer::new_log(SizeClass(4), 2500).read();
  EXPECT_TRUE(read.exists_on_segment(2048, 1024, 5));
  EXPECT_TRUE(read.exists_on_segment(3000, 1024, 5));
  EXPECT_FALSE(read.exists_on_segment(1024, 1024, 5));
  EXPECT_FALSE(read.exists_on_segment(3072, 1024, 5));

  EXPECT_FALSE(PagePointer::new_heap(heap::HeapId(0, 0)).read().exists_on_segment(0, 1024, 5));

  PersistedNode* record = make_node(100, 1500, 5000);
  PointerRead node_read = PagePointer::new_in_memory(SizeClass(10), record).read();
  EXPECT_TRUE(node_read.exists_on_segment(0, 1024, 5));
  EXPECT_TRUE(node_read.exists_on_segment(1024, 1024, 5));
  EXPECT_FALSE(node_read.exists_on_segment(2048, 1024, 5));
  EXPECT_TRUE(node_read.exists_on_segment(4096, 1024, 5));
  node_read.destroy_immediately();
}

TEST(PointerReadTest, ResidentTags) {
  PersistedNode* record = make_node(1, 2, 3);
  PointerRead read = PagePointer::new_in_memory(SizeClass(10), record).read();
  EXPECT_EQ(record, &read.as_node());
  EXPECT_EQ(kResidentNode, read.as_resident(kFirstNodePageId).kind_);
  EXPECT_EQ("a", read.as_node().node_.lo_);
  EXPECT_EQ(10U, read.as_node().ts_);
  EXPECT_EQ(kResidentMeta, resident_kind_of(kMetaPageId));
  EXPECT_EQ(kResidentCounter, resident_kind_of(kCounterPageId));
  EXPECT_EQ(kResidentNode, resident_kind_of(12345));
  read.destroy_immediately();
}

TEST(PointerReadTest, DeferDestroy) {
  reclaim::ReclaimOptions options;
  options.auto_collect_threshold_ = 0;
  reclaim::EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  {
    reclaim::Guard guard;
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
    PagePointer::new_in_memory(SizeClass(5), make_node(1, 2, 3)).read().defer_destroy(&guard);
    PagePointer::new_log_and_heap(SizeClass(15), 7, heap::HeapId(0, 1), 1).read()
      .defer_destroy(&guard);
    // record-less kinds retire nothing
    PagePointer::new_free(1).read().defer_destroy(&guard);
    PagePointer::new_heap(heap::HeapId(0, 1)).read().defer_destroy(&guard);
    PagePointer().read().defer_destroy(&guard);
    EXPECT_EQ(2U, reclaimer.get_pending_count());
    reclaimer.advance_epoch();
    EXPECT_EQ(0U, reclaimer.collect());
  }
  EXPECT_EQ(2U, reclaimer.collect());
  EXPECT_EQ(0U, reclaimer.get_pending_count());
  EXPECT_EQ(2U, reclaimer.get_destroyed_count());
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(PointerReadDeathTest, MismatchedRecord) {
  PersistedNode* record = make_node(1, 2, 3);
  PointerRead read = PagePointer::new_in_memory(SizeClass(10), record).read();
  EXPECT_DEATH(read.as_meta(), "as_meta\\(\\) on a PersistedNode record");
  EXPECT_DEATH(read.as_counter(), "as_counter\\(\\) on a PersistedNode record");
  EXPECT_DEATH(read.as_resident(kMetaPageId), "must hold a PersistedMeta record");
  EXPECT_DEATH(read.log_offset_entries(kCounterPageId), "must hold a PersistedCounter record");
  EXPECT_DEATH(read.as_log_and_heap(), "requires a LogAndHeap");
  read.destroy_immediately();
}

TEST(PointerReadDeathTest, InvalidEnumeration) {
  EXPECT_DEATH(PagePointer().read().log_offset_entries(3), "invalid pointer");
  EXPECT_DEATH(PagePointer::new_free(1).read().exists_on_segment(0, 0, 3), "segment_size 0");
}

}  // namespace pagecache
}  // namespace strata

TEST_MAIN_CAPTURE_SIGNALS(PointerReadTest, strata.pagecache);
