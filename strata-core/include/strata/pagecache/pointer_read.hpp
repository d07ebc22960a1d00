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
#ifndef STRATA_PAGECACHE_POINTER_READ_HPP_
#define STRATA_PAGECACHE_POINTER_READ_HPP_
#include <stdint.h>

#include <iosfwd>

#include "strata/heap/heap_id.hpp"
#include "strata/log/log_id.hpp"
#include "strata/pagecache/fwd.hpp"
#include "strata/pagecache/page_id.hpp"
#include "strata/pagecache/page_pointer.hpp"
#include "strata/pagecache/size_class.hpp"
#include "strata/pagecache/truncated_log_offset.hpp"
#include "strata/reclaim/fwd.hpp"

namespace strata {
namespace pagecache {

/**
 * @brief Forward-only enumeration of the log offsets reachable from one PointerRead.
 * @ingroup PAGECACHE
 * @details
 * Obtained from PointerRead::log_offset_entries(). Each call gives a fresh cursor, so the
 * enumeration is not restartable but can be repeated. A cursor over an InMemory read refers
 * to the resident record, so it has the same guard requirement as the read.
 * @code{.cpp}
 * for (LogOffsetCursor cursor = read.log_offset_entries(page_id); cursor.is_valid();
 *   cursor.next()) {
 *   use(cursor.get());
 * }
 * @endcode
 */
class LogOffsetCursor {
 public:
  /** Whether get() can be called. */
  bool            is_valid() const { return valid_; }
  log::LogOffset  get() const;
  void            next();

 private:
  friend class PointerRead;
  enum Source {
    kSourceNone = 0,
    kSourceSingle,
    kSourceNode,
  };

  LogOffsetCursor();
  explicit LogOffsetCursor(log::LogOffset single);
  explicit LogOffsetCursor(const PersistedNode* node);

  /** Advances position_ to the next base/fragment that has a log offset. */
  void            settle();

  Source                source_;
  const PersistedNode*  node_;
  /** 0 is the node's base, i is fragment i - 1. */
  uint32_t              position_;
  bool                  valid_;
  log::LogOffset        current_;
};

/**
 * @brief A decoded PagePointer.
 * @ingroup PAGECACHE
 * @details
 * Exactly one kind is active. Heap, Log and Free reads are self-contained data.
 * InMemory and LogAndHeap reads carry the record address, so their accessors must only be
 * used while the guard under which the pointer was loaded is still pinned.
 * Calling an accessor of another kind dies with LOG(FATAL).
 *
 * Which record an InMemory read addresses depends on the page id it was loaded from
 * (kMetaPageId, kCounterPageId or a node). Every record also carries that as an explicit
 * tag, and the typed accessors check it.
 */
class PointerRead {
 public:
  /** An Unassigned read. */
  PointerRead();

  PointerKind     get_kind() const { return kind_; }
  /** False for Unassigned and Corrupt reads. */
  bool            is_valid() const;
  SizeClass       get_size_class() const { return size_class_; }

  bool            is_free() const { return kind_ == kPointerFree; }
  /** The size class's size, or 0 for Free. */
  uint64_t        encoded_size() const;

  /** Only for Heap. */
  heap::HeapId              heap_id() const;
  /** Only for Log and Free. */
  const TruncatedLogOffset& get_log_offset() const;
  /** Only for LogAndHeap. */
  const LogAndHeap&         as_log_and_heap() const;
  /** Only for InMemory reads of ordinary node pages. */
  const PersistedNode&      as_node() const;
  /** Only for InMemory reads of kMetaPageId. */
  const PersistedMeta&      as_meta() const;
  /** Only for InMemory reads of kCounterPageId. */
  const PersistedCounter&   as_counter() const;
  /** Only for InMemory. Also checks the record matches the page id it was loaded from. */
  const ResidentRecord&     as_resident(PageId page_id) const;

  /**
   * @brief Enumerates every log offset reachable from this pointer.
   * @details
   *  \li Heap: nothing
   *  \li Log, Free: the embedded offset
   *  \li LogAndHeap: the offset in the record
   *  \li InMemory: for meta and counter pages, the base's offset. For nodes, the base's offset
   * then each fragment's in insertion order. Pointers without an offset are skipped.
   *
   * Dies on invalid reads.
   */
  LogOffsetCursor log_offset_entries(PageId page_id) const;

  /**
   * Whether any offset of log_offset_entries() is in the same segment as segment_offset.
   * @pre segment_size > 0
   */
  bool            exists_on_segment(
    log::LogOffset segment_offset,
    uint64_t segment_size,
    PageId page_id) const;

  /**
   * @brief Retires the record of an InMemory or LogAndHeap read. No-op for other kinds.
   * @details
   * Call exactly once per superseded pointer value, from the thread whose compare-and-swap
   * replaced it. The record is destroyed after every guard that could have observed it is
   * released. PageTable::compare_and_swap() does this for you.
   */
  void            defer_destroy(reclaim::Guard* guard) const;

  /**
   * @brief Destroys the record right away. No-op for record-less kinds.
   * @details
   * Only for values no other thread can have observed: a pointer whose installation lost a
   * race, or the page table's contents at shutdown.
   */
  void            destroy_immediately() const;

  friend std::ostream& operator<<(std::ostream& o, const PointerRead& v);

 private:
  friend class PagePointer;

  /** Dies unless kind_ == expected. */
  void            check_kind(PointerKind expected, const char* accessor) const;

  PointerKind         kind_;
  /** The kind byte as stored. Differs from kind_ only for corrupt reads. */
  uint8_t             raw_kind_;
  SizeClass           size_class_;
  /** Heap */
  uint32_t            heap_index_;
  /** Log, Free */
  TruncatedLogOffset  log_offset_;
  /** InMemory */
  ResidentRecord*     resident_;
  /** LogAndHeap */
  LogAndHeap*         log_and_heap_;
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_POINTER_READ_HPP_
