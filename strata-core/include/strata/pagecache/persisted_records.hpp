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
#ifndef STRATA_PAGECACHE_PERSISTED_RECORDS_HPP_
#define STRATA_PAGECACHE_PERSISTED_RECORDS_HPP_
#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "strata/cxx11.hpp"
#include "strata/heap/heap_id.hpp"
#include "strata/log/log_id.hpp"
#include "strata/pagecache/page_id.hpp"
#include "strata/pagecache/page_pointer.hpp"
#include "strata/pagecache/truncated_log_offset.hpp"
#include "strata/tree/tree_types.hpp"

/**
 * @file strata/pagecache/persisted_records.hpp
 * @brief Heap-allocated records that InMemory and LogAndHeap page pointers address.
 * @ingroup PAGECACHE
 * @details
 * Records are immutable once published. An update builds a new record, installs a new
 * pointer to it, and retires the old one through PointerRead::defer_destroy().
 */
namespace strata {
namespace pagecache {

/**
 * @brief Which of the resident record types a record is.
 * @ingroup PAGECACHE
 */
enum ResidentKind {
  kResidentMeta = 0,
  kResidentCounter = 1,
  kResidentNode = 2,
};

/** The record type that the given page id must hold when resident. */
inline ResidentKind resident_kind_of(PageId page_id) {
  if (page_id == kMetaPageId) {
    return kResidentMeta;
  } else if (page_id == kCounterPageId) {
    return kResidentCounter;
  }
  return kResidentNode;
}

const char* get_resident_kind_name(ResidentKind kind);

/**
 * @brief Common prefix of every record an InMemory pointer addresses.
 * @ingroup PAGECACHE
 * @details
 * base_ is the pointer this page was materialized from, which tells where the consolidated
 * version of the page lives. The kind_ tag lets PointerRead check its downcasts instead of
 * trusting the page id alone.
 */
struct ResidentRecord {
  virtual ~ResidentRecord() {}

  const ResidentKind  kind_;
  PagePointer         base_;

 protected:
  ResidentRecord(ResidentKind kind, const PagePointer& base) : kind_(kind), base_(base) {}
};

/** The meta page (kMetaPageId). */
struct PersistedMeta CXX11_FINAL : public ResidentRecord {
  PersistedMeta(const tree::Meta& meta, const PagePointer& base)
    : ResidentRecord(kResidentMeta, base), meta_(meta) {}

  tree::Meta  meta_;

  friend std::ostream& operator<<(std::ostream& o, const PersistedMeta& v);
};

/** The counter page (kCounterPageId). */
struct PersistedCounter CXX11_FINAL : public ResidentRecord {
  PersistedCounter(uint64_t counter, const PagePointer& base)
    : ResidentRecord(kResidentCounter, base), counter_(counter) {}

  uint64_t    counter_;

  friend std::ostream& operator<<(std::ostream& o, const PersistedCounter& v);
};

/**
 * @brief An ordinary page: a node plus where it came from.
 * @details
 * frags_ are deltas applied on top of base_ that are not merged into a consolidated version
 * yet, in the order they were applied.
 */
struct PersistedNode CXX11_FINAL : public ResidentRecord {
  PersistedNode(const tree::Node& node, const PagePointer& base, uint64_t ts)
    : ResidentRecord(kResidentNode, base), node_(node), ts_(ts) {}

  tree::Node                node_;
  std::vector<PagePointer>  frags_;
  /** Timestamp of the latest change. */
  uint64_t                  ts_;

  friend std::ostream& operator<<(std::ostream& o, const PersistedNode& v);
};

/** Marks a page as reclaimed, wrapping the pointer it had. */
struct PersistedFree {
  explicit PersistedFree(const PagePointer& page_pointer) : page_pointer_(page_pointer) {}

  PagePointer page_pointer_;

  friend std::ostream& operator<<(std::ostream& o, const PersistedFree& v);
};

/**
 * @brief A page written to the log whose value also lives in the heap store.
 * @details
 * Exists only until compaction consolidates the page, when
 * PagePointer::forget_heap_log_coordinates() turns the pointer into a plain Heap pointer.
 */
struct LogAndHeap {
  LogAndHeap(const TruncatedLogOffset& log_offset, const heap::HeapId& heap_id, log::Lsn lsn)
    : log_offset_(log_offset), heap_id_(heap_id), log_lsn_(lsn) {}

  log::LogOffset  get_log_offset() const { return log_offset_.to_offset(); }
  /** A Log pointer to the same offset, sized by the heap slab. */
  PagePointer     to_log_pointer() const;

  TruncatedLogOffset  log_offset_;
  heap::HeapId        heap_id_;
  log::Lsn            log_lsn_;

  friend std::ostream& operator<<(std::ostream& o, const LogAndHeap& v);
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_PERSISTED_RECORDS_HPP_
