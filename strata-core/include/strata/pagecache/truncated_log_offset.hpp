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
#ifndef STRATA_PAGECACHE_TRUNCATED_LOG_OFFSET_HPP_
#define STRATA_PAGECACHE_TRUNCATED_LOG_OFFSET_HPP_
#include <stdint.h>

#include <iosfwd>

#include "strata/error_code.hpp"
#include "strata/log/log_id.hpp"

namespace strata {
namespace pagecache {

/**
 * @brief A log offset narrowed to 6 little-endian bytes.
 * @ingroup PAGECACHE
 * @details
 * This is exactly the payload of Log and Free page pointers. Offsets must be below
 * log::kLogOffsetLimit (2^48). from_offset() dies on larger values rather than truncating
 * them. try_from_offset() is the non-fatal variant for offsets that come from outside.
 */
class TruncatedLogOffset {
 public:
  enum Constants {
    kBytes = 6,
  };

  /** Offset 0. */
  TruncatedLogOffset();

  static TruncatedLogOffset from_offset(log::LogOffset offset);
  /** @return kErrorCodePcLogOffsetTooLarge if offset does not fit in 48 bits. */
  static ErrorCode          try_from_offset(log::LogOffset offset, TruncatedLogOffset* out);
  /** Reads kBytes bytes. */
  static TruncatedLogOffset from_bytes(const uint8_t* bytes);

  log::LogOffset  to_offset() const;
  /** Writes kBytes bytes. */
  void            copy_to(uint8_t* bytes) const;

  bool operator==(const TruncatedLogOffset& other) const;
  bool operator!=(const TruncatedLogOffset& other) const { return !operator==(other); }
  bool operator<(const TruncatedLogOffset& other) const {
    return to_offset() < other.to_offset();
  }

  friend std::ostream& operator<<(std::ostream& o, const TruncatedLogOffset& v);

 private:
  uint8_t bytes_[kBytes];
};

}  // namespace pagecache
}  // namespace strata
#endif  // STRATA_PAGECACHE_TRUNCATED_LOG_OFFSET_HPP_
