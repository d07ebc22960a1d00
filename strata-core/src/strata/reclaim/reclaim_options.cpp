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
#include "strata/reclaim/reclaim_options.hpp"

#include "strata/externalize/externalizable.hpp"

namespace strata {
namespace reclaim {
ReclaimOptions::ReclaimOptions()
  : participant_slots_(kDefaultParticipantSlots),
    auto_collect_threshold_(kDefaultAutoCollectThreshold) {
}

ErrorStack ReclaimOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, participant_slots_);
  EXTERNALIZE_LOAD_ELEMENT(element, auto_collect_threshold_);
  return kRetOk;
}

ErrorStack ReclaimOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for epoch-based reclamation"));

  EXTERNALIZE_SAVE_ELEMENT(element, participant_slots_,
    "Maximum number of guards pinned at the same time. Must be at least 1.");
  EXTERNALIZE_SAVE_ELEMENT(element, auto_collect_threshold_,
    "Number of retired objects that triggers an epoch advance and a collection."
    " 0 disables automatic collection.");
  return kRetOk;
}

}  // namespace reclaim
}  // namespace strata
