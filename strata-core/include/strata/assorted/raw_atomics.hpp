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
#ifndef STRATA_ASSORTED_RAW_ATOMICS_HPP_
#define STRATA_ASSORTED_RAW_ATOMICS_HPP_

#include <stdint.h>

/**
 * @file strata/assorted/raw_atomics.hpp
 * @ingroup ASSORTED
 * @brief Atomic operations on plain (non std::atomic) integers.
 * @details
 * The page table and the reclaimer keep their words as plain uint64_t arrays so that the
 * public headers stay C++98-clean and so that a PagePointer word can be copied around as raw
 * bytes. These wrap GCC/Clang __atomic builtins, which is what std::atomic does internally.
 * All read-modify-write operations are sequentially consistent.
 */

namespace strata {
namespace assorted {

/**
 * @brief Atomic CAS.
 * @return whether the swap happened. If not, *expected receives the current value.
 */
template <typename T>
inline bool raw_atomic_compare_exchange_strong(T* target, T* expected, T desired) {
  return ::__atomic_compare_exchange_n(
    target,
    expected,
    desired,
    false,
    __ATOMIC_SEQ_CST,
    __ATOMIC_SEQ_CST);
}

/**
 * @brief Weak version of raw_atomic_compare_exchange_strong().
 * @details
 * Checks the value with a plain read first, which avoids the bus lock when the CAS would
 * obviously fail. Use it only in retry loops.
 */
template <typename T>
inline bool raw_atomic_compare_exchange_weak(T* target, T* expected, T desired) {
  if (*target != *expected) {
    *expected = *target;
    return false;
  }
  return raw_atomic_compare_exchange_strong<T>(target, expected, desired);
}

/** Atomic fetch-add, returning the previous value. */
template <typename T>
inline T raw_atomic_fetch_add(T* target, T addendum) {
  return ::__atomic_fetch_add(target, addendum, __ATOMIC_SEQ_CST);
}

template <typename T>
inline T atomic_load_seq_cst(const T* target) {
  return ::__atomic_load_n(target, __ATOMIC_SEQ_CST);
}

template <typename T>
inline T atomic_load_acquire(const T* target) {
  return ::__atomic_load_n(target, __ATOMIC_ACQUIRE);
}

template <typename T>
inline void atomic_store_seq_cst(T* target, T value) {
  ::__atomic_store_n(target, value, __ATOMIC_SEQ_CST);
}

template <typename T>
inline void atomic_store_release(T* target, T value) {
  ::__atomic_store_n(target, value, __ATOMIC_RELEASE);
}

}  // namespace assorted
}  // namespace strata

#endif  // STRATA_ASSORTED_RAW_ATOMICS_HPP_
