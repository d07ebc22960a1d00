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
#ifndef STRATA_HEAP_HEAP_ID_HPP_
#define STRATA_HEAP_HEAP_ID_HPP_
#include <stdint.h>

#include <iosfwd>

/**
 * @file strata/heap/heap_id.hpp
 * @brief Coordinates of a slot in the heap store, which keeps values too large for the log.
 * @ingroup HEAP
 */
namespace strata {
namespace heap {

/**
 * @brief Size-class exponent of the smallest heap slab.
 * @ingroup HEAP
 * @details
 * Slab 0 holds values of 2^15 = 32KiB, slab 1 holds 64KiB, and so on. Smaller values are
 * never spilled to the heap store.
 */
const uint8_t kMinTrailingZeros = 15;

/**
 * @brief Largest slab whose size class still fits in 64 bits.
 * @ingroup HEAP
 */
const uint8_t kMaxSlab = 63 - kMinTrailingZeros;

/**
 * @brief Identifies one slot in the heap store as (slab, index within the slab).
 * @ingroup HEAP
 * @details
 * A Heap page pointer stores index_ in its payload and slab_ + kMinTrailingZeros as its
 * size-class byte, so the slab needs no bytes of its own.
 */
struct HeapId {
  HeapId() : slab_(0), index_(0) {}
  HeapId(uint8_t slab, uint32_t index) : slab_(slab), index_(index) {}

  /**
   * Inverse of get_size_class_exponent(). Dies if the exponent is below kMinTrailingZeros,
   * which no heap slab uses.
   */
  static HeapId from_size_class_exponent(uint8_t exponent, uint32_t index);

  uint8_t   get_size_class_exponent() const { return slab_ + kMinTrailingZeros; }
  /** Bytes of one slot in this slab. */
  uint64_t  slab_size() const { return 1ULL << get_size_class_exponent(); }

  bool operator==(const HeapId& other) const {
    return slab_ == other.slab_ && index_ == other.index_;
  }
  bool operator!=(const HeapId& other) const { return !operator==(other); }

  friend std::ostream& operator<<(std::ostream& o, const HeapId& v);

  uint8_t   slab_;
  uint32_t  index_;
};

}  // namespace heap
}  // namespace strata
#endif  // STRATA_HEAP_HEAP_ID_HPP_
