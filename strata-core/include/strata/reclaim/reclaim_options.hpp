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
#ifndef STRATA_RECLAIM_RECLAIM_OPTIONS_HPP_
#define STRATA_RECLAIM_RECLAIM_OPTIONS_HPP_
#include <stdint.h>

#include "strata/cxx11.hpp"
#include "strata/externalize/externalizable.hpp"

namespace strata {
namespace reclaim {
/**
 * @brief Set of options for epoch-based reclamation.
 * @ingroup RECLAIM
 */
struct ReclaimOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultParticipantSlots = 256,
    kDefaultAutoCollectThreshold = 1024,
  };

  ReclaimOptions();

  /**
   * @brief Maximum number of guards pinned at the same time.
   * @details
   * Each pinned guard occupies one cache line. pin() fails with
   * kErrorCodeReclaimNoParticipantSlot when all are in use. Must be at least 1.
   */
  uint32_t    participant_slots_;

  /**
   * @brief Number of retired objects that triggers an epoch advance and a collection from
   * Guard::defer(). 0 means collections happen only when explicitly requested.
   */
  uint32_t    auto_collect_threshold_;

  EXTERNALIZABLE(ReclaimOptions);
};
}  // namespace reclaim
}  // namespace strata
#endif  // STRATA_RECLAIM_RECLAIM_OPTIONS_HPP_
