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
#ifndef STRATA_PAGECACHE_PAGE_POINTER_HPP_
#define STRATA_PAGECACHE_PAGE_POINTER_HPP_
#include <stdint.h>

#include <iosfwd>

#include "strata/error_code.hpp"
#include "strata/heap/heap_id.hpp"
#include "strata/log/log_id.hpp"
#include "strata/pagecache/fwd.hpp"
#include "strata/pagecache/size_class.hpp"

namespace strata {
namespace pagecache {

/**
 * @brief Where a page currently resides. Stored in the kind byte of a PagePointer.
 * @ingroup PAGECACHE
 * @details
 * The numbers are part of the byte layout and must not change.
 */
enum PointerKind {
  /** A resident record (PersistedMeta, PersistedCounter or PersistedNode) in memory. */
  kPointerInMemory = 0,
  /** A slot in the heap store. */
  kPointerHeap = 1,
  /** Only in the write-ahead log. */
  kPointerLog = 2,
  /** In both the log and the heap store, until compaction drops the log copy. */
  kPointerLogAndHeap = 3,
  /** A reclaimed log position. */
  kPointerFree = 4,
  /** Nothing assigned yet. The value of a default-constructed PagePointer. */
  kPointerUnassigned = 5,
  /** Not a stored value. What read() reports for a kind byte above kPointerUnassigned. */
  kPointerCorrupt = 6,
};

/** Returns a readable name of the kind, eg "InMemory". */
const char* get_pointer_kind_name(PointerKind kind);

/**
 * @brief The 8-byte location of a page: 6 payload bytes, a size-class byte and a kind byte.
 * @ingroup PAGECACHE
 * @details
 * @par Byte layout
 * <table>
 * <tr><th>bytes 0-5</th><th>byte 6</th><th>byte 7</th></tr>
 * <tr><td>payload</td><td>SizeClass exponent</td><td>PointerKind</td></tr>
 * </table>
 * The integer view (to_bits()/from_bits()) is little-endian regardless of the host, so byte 0
 * is the least significant byte. The payload is:
 *  \li InMemory, LogAndHeap: low 48 bits of the record's address.
 *  \li Heap: 32-bit HeapId::index_ in bytes 0-3, bytes 4-5 zero. The slab is derived from the
 * size-class byte.
 *  \li Log, Free: a TruncatedLogOffset. Free pointers have size-class byte 0.
 *  \li Unassigned: zeros.
 *
 * @par Atomicity
 * This class is a plain value. The page table keeps the bits in a uint64_t and swaps them
 * with a compare-and-swap. Dereferencing the record of an InMemory or LogAndHeap pointer is
 * safe only while holding a reclaim::Guard pinned before the pointer was loaded.
 *
 * @par Address space
 * Packing an address assumes user-space addresses fit in 48 bits, which is true on x86-64
 * and AArch64 Linux with 4-level page tables. Every packing checks it and PageCache checks it
 * once at initialization.
 *
 * @par Contract violations
 * Accessors for the wrong kind, such as heap_id() on a Log pointer, die with LOG(FATAL).
 */
class PagePointer {
 public:
  enum Constants {
    kBytes = 8,
    kPayloadBytes = 6,
    kSizeClassByte = 6,
    kKindByte = 7,
  };

  /** An Unassigned pointer. */
  PagePointer();

  static PagePointer  from_bits(uint64_t bits);
  uint64_t            to_bits() const;
  const uint8_t*      get_bytes() const { return bytes_; }

  /**
   * @brief Points to a resident record.
   * @details
   * The pointer does not take ownership by itself. Ownership moves to it once it is
   * successfully installed in the page table.
   */
  static PagePointer  new_in_memory(SizeClass size_class, ResidentRecord* record);
  static PagePointer  new_heap(const heap::HeapId& heap_id);
  /** Data only in the log. Tagged kPointerLog. */
  static PagePointer  new_log(SizeClass size_class, log::LogOffset offset);
  /** A reclaimed log position. Size class 0. */
  static PagePointer  new_free(log::LogOffset offset);
  /**
   * @brief Offset-carrying pointer of an explicit kind.
   * @param[in] kind kPointerLog or kPointerFree. Any other kind dies.
   * @details
   * new_log() and new_free() are shorthands of this.
   */
  static PagePointer  new_log_offset_pointer(
    PointerKind kind,
    SizeClass size_class,
    log::LogOffset offset);
  /**
   * @brief Allocates a LogAndHeap record and points to it.
   * @details
   * The only constructor with a side effect. The record must eventually be released with
   * PointerRead::defer_destroy() once superseded in the page table, or with
   * PointerRead::destroy_immediately() if the pointer was never published.
   */
  static PagePointer  new_log_and_heap(
    SizeClass size_class,
    log::LogOffset offset,
    const heap::HeapId& heap_id,
    log::Lsn lsn);

  /**
   * @brief Decodes this pointer.
   * @details
   * Total: an Unassigned pointer decodes to a read of kind kPointerUnassigned, and an
   * undefined kind byte or an out-of-range size class to kPointerCorrupt. Both are
   * !is_valid() and none of their payload accessors can be called.
   */
  PointerRead         read() const;

  /**
   * Same as read() but reports invalid pointers as errors.
   * @return kErrorCodePcUnassignedPointer or kErrorCodePcCorruptPointer on such pointers
   */
  ErrorCode           read_checked(PointerRead* out) const;

  /**
   * @brief LogAndHeap -> Heap, dropping the log offset and the lsn. No-op on other kinds.
   * @details
   * The LogAndHeap record is still owned by the previous value of this pointer, which must be
   * retired separately. Idempotent.
   */
  void                forget_heap_log_coordinates();

  /**
   * @brief The log offset of Log and Free pointers.
   * @return false for all other kinds, leaving out untouched
   */
  bool                get_log_offset(log::LogOffset* out) const;

  /** Heap or LogAndHeap. */
  bool                is_heap_resident() const;
  /** Only for Heap pointers. */
  heap::HeapId        heap_id() const;

  /** Whether this is a LogAndHeap pointer, which compaction must still consolidate. */
  bool                is_lone_log_and_heap() const;
  /** Whether the data lives solely in the log. */
  bool                is_inline() const;
  /**
   * @brief Whether this pointer can be embedded as-is in a persisted snapshot.
   * @details
   * True only for Heap, Log and Free pointers, whose payloads are stable across restarts.
   * InMemory and LogAndHeap payloads are addresses.
   */
  bool                is_merged_into_snapshot() const;
  bool                is_unassigned() const { return bytes_[kKindByte] == kPointerUnassigned; }

  /** Raw kind byte as PointerKind. Values above kPointerUnassigned map to kPointerCorrupt. */
  PointerKind         get_kind() const;
  uint8_t             get_kind_byte() const { return bytes_[kKindByte]; }
  SizeClass           get_size_class() const { return SizeClass(bytes_[kSizeClassByte]); }

  bool operator==(const PagePointer& other) const;
  bool operator!=(const PagePointer& other) const { return !operator==(other); }

  friend std::ostream& operator<<(std::ostream& o, const PagePointer& v);

 private:
  static PagePointer  pack_address(const void* address, SizeClass size_class, PointerKind kind);
  uintptr_t           unpack_address() const;

  uint8_t bytes_[kBytes];
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_PAGE_POINTER_HPP_
