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
#include "strata/pagecache/truncated_log_offset.hpp"

#include <glog/logging.h>

#include <cstring>
#include <ostream>

#include "strata/compiler.hpp"
#include "strata/assorted/assorted_func.hpp"

namespace strata {
namespace pagecache {

STATIC_SIZE_CHECK(sizeof(TruncatedLogOffset), 6)

TruncatedLogOffset::TruncatedLogOffset() {
  std::memset(bytes_, 0, sizeof(bytes_));
}

TruncatedLogOffset TruncatedLogOffset::from_offset(log::LogOffset offset) {
  TruncatedLogOffset ret;
  if (UNLIKELY(try_from_offset(offset, &ret) != kErrorCodeOk)) {
    LOG(FATAL) << "Log offset " << offset << " (" << assorted::Hex(offset)
      << ") does not fit in 48 bits";
  }
  return ret;
}

ErrorCode TruncatedLogOffset::try_from_offset(log::LogOffset offset, TruncatedLogOffset* out) {
  if (offset >= log::kLogOffsetLimit) {
    return kErrorCodePcLogOffsetTooLarge;
  }
  for (int i = 0; i < kBytes; ++i) {
    out->bytes_[i] = static_cast<uint8_t>(offset >> (8 * i));
  }
  return kErrorCodeOk;
}

TruncatedLogOffset TruncatedLogOffset::from_bytes(const uint8_t* bytes) {
  TruncatedLogOffset ret;
  std::memcpy(ret.bytes_, bytes, kBytes);
  return ret;
}

log::LogOffset TruncatedLogOffset::to_offset() const {
  log::LogOffset ret = 0;
  for (int i = kBytes - 1; i >= 0; --i) {
    ret = (ret << 8) | bytes_[i];
  }
  return ret;
}

void TruncatedLogOffset::copy_to(uint8_t* bytes) const {
  std::memcpy(bytes, bytes_, kBytes);
}

bool TruncatedLogOffset::operator==(const TruncatedLogOffset& other) const {
  return std::memcmp(bytes_, other.bytes_, kBytes) == 0;
}

std::ostream& operator<<(std::ostream& o, const TruncatedLogOffset& v) {
  o << v.to_offset();
  return o;
}

}  // namespace pagecache
}  // namespace strata
