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
#ifndef STRATA_PAGECACHE_SIZE_CLASS_HPP_
#define STRATA_PAGECACHE_SIZE_CLASS_HPP_
#include <stdint.h>

#include <iosfwd>

namespace strata {
namespace pagecache {

/**
 * @brief A power-of-two upper bound of a length, stored as its exponent in one byte.
 * @ingroup PAGECACHE
 * @details
 * from_length(n) rounds n up to the next power of two and keeps its trailing-zero count, so
 * size() >= n and size() < 2n for every n > 0. The exact length is lost. 0 and 1 both map to
 * exponent 0 (size 1).
 */
class SizeClass {
 public:
  /** Largest exponent whose size() is representable. */
  enum Constants {
    kMaxExponent = 63,
  };

  SizeClass() : exponent_(0) {}
  /** Wraps a raw exponent byte, as stored in a page pointer. */
  explicit SizeClass(uint8_t exponent) : exponent_(exponent) {}

  /**
   * Smallest size class that holds length bytes. Dies if length > 2^63, which can not be
   * rounded up within 64 bits.
   */
  static SizeClass from_length(uint64_t length);

  uint8_t   get_exponent() const { return exponent_; }
  /** 2^exponent. Dies if the exponent is above kMaxExponent. */
  uint64_t  size() const;
  bool      is_valid() const { return exponent_ <= kMaxExponent; }

  bool operator==(const SizeClass& other) const { return exponent_ == other.exponent_; }
  bool operator!=(const SizeClass& other) const { return exponent_ != other.exponent_; }
  bool operator<(const SizeClass& other) const { return exponent_ < other.exponent_; }

  friend std::ostream& operator<<(std::ostream& o, const SizeClass& v);

 private:
  uint8_t exponent_;
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_SIZE_CLASS_HPP_
