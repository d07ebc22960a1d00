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
#ifndef STRATA_LOG_LOG_ID_HPP_
#define STRATA_LOG_LOG_ID_HPP_
#include <stdint.h>

/**
 * @file strata/log/log_id.hpp
 * @brief Typedefs of ID types used to locate data in the write-ahead log.
 * @ingroup LOG
 * @details
 * The log itself (writer, reader, segment files) lives outside this library. We only need
 * its coordinates to describe where a page was written.
 */
namespace strata {
namespace log {

/**
 * @typedef LogOffset
 * @brief Byte offset of an entry in the write-ahead log.
 * @ingroup LOG
 * @details
 * Page pointers pack this into 48 bits, so valid offsets are below kLogOffsetLimit.
 */
typedef uint64_t LogOffset;

/**
 * @typedef Lsn
 * @brief Log sequence number, monotonically increasing per write.
 * @ingroup LOG
 */
typedef int64_t Lsn;

/**
 * @typedef SegmentId
 * @brief Ordinal of a fixed-size log segment, the unit of log space reclamation.
 * @ingroup LOG
 */
typedef uint64_t SegmentId;

/** Exclusive upper bound of a LogOffset that fits in a page pointer. 2^48. */
const LogOffset kLogOffsetLimit = 1ULL << 48;

/**
 * @brief Returns the segment that contains the given offset.
 * @ingroup LOG
 * @pre segment_size > 0
 */
inline SegmentId to_segment_id(LogOffset offset, uint64_t segment_size) {
  return offset / segment_size;
}

}  // namespace log
}  // namespace strata
#endif  // STRATA_LOG_LOG_ID_HPP_
