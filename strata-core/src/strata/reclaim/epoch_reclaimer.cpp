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
#include "strata/reclaim/epoch_reclaimer.hpp"

#include <glog/logging.h>

#include <ostream>
#include <vector>

#include "strata/assert_nd.hpp"
#include "strata/compiler.hpp"
#include "strata/error_stack.hpp"
#include "strata/assorted/raw_atomics.hpp"

namespace strata {
namespace reclaim {

////////////////////////////////////////////////////////////////////////////////
///
///       Guard
///
////////////////////////////////////////////////////////////////////////////////
void Guard::defer(Destructor destructor, void* object) {
  if (UNLIKELY(!is_active())) {
    LOG(FATAL) << "Guard::defer() on a guard that is not pinned";
  }
  reclaimer_->defer(destructor, object);
}

void Guard::release() {
  if (!is_active()) {
    return;
  }
  reclaimer_->unpin(slot_);
  reclaimer_ = CXX11_NULLPTR;
  slot_ = 0;
  pinned_epoch_ = 0;
}

std::ostream& operator<<(std::ostream& o, const Guard& v) {
  o << "<Guard active=\"" << v.is_active() << "\" slot=\"" << v.slot_
    << "\" pinned_epoch=\"" << v.pinned_epoch_ << "\" />";
  return o;
}

////////////////////////////////////////////////////////////////////////////////
///
///       EpochReclaimer
///
////////////////////////////////////////////////////////////////////////////////
EpochReclaimer::EpochReclaimer(const ReclaimOptions* options)
  : options_(options), current_epoch_(0), destroyed_count_(0) {
}

ErrorStack EpochReclaimer::initialize_once() {
  if (options_->participant_slots_ == 0) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, "participant_slots_ must be positive");
  }
  LOG(INFO) << "Initializing EpochReclaimer with " << options_->participant_slots_
    << " participant slots...";
  ParticipantSlot empty;
  empty.pinned_epoch_ = 0;
  slots_.assign(options_->participant_slots_, empty);
  assorted::atomic_store_seq_cst<ReclaimEpoch>(&current_epoch_, 1U);
  assorted::atomic_store_seq_cst<uint64_t>(&destroyed_count_, 0U);
  {
    std::lock_guard<std::mutex> guard(garbage_mutex_);
    garbage_.clear();
  }
  return kRetOk;
}

ErrorStack EpochReclaimer::uninitialize_once() {
  uint32_t active = get_active_guard_count();
  if (active > 0) {
    LOG(ERROR) << "EpochReclaimer still has " << active << " pinned guards";
    return ERROR_STACK(kErrorCodeReclaimActiveGuards);
  }
  std::vector<Garbage> all;
  {
    std::lock_guard<std::mutex> guard(garbage_mutex_);
    all.swap(garbage_);
  }
  LOG(INFO) << "Uninitializing EpochReclaimer. Destroying " << all.size()
    << " remaining objects...";
  destroy_all(all);
  assorted::raw_atomic_fetch_add<uint64_t>(&destroyed_count_, all.size());
  slots_.clear();
  return kRetOk;
}

ErrorCode EpochReclaimer::pin(Guard* guard) {
  ASSERT_ND(is_initialized());
  ASSERT_ND(!guard->is_active());
  const uint32_t count = slots_.size();
  for (uint32_t i = 0; i < count; ++i) {
    ReclaimEpoch expected = 0;
    if (assorted::atomic_load_acquire<ReclaimEpoch>(&slots_[i].pinned_epoch_) != 0) {
      continue;
    }
    ReclaimEpoch epoch = get_current_epoch();
    if (assorted::raw_atomic_compare_exchange_strong<ReclaimEpoch>(
      &slots_[i].pinned_epoch_,
      &expected,
      epoch)) {
      guard->reclaimer_ = this;
      guard->slot_ = i;
      guard->pinned_epoch_ = epoch;
      return kErrorCodeOk;
    }
  }
  DVLOG(0) << "All " << count << " participant slots are in use";
  return kErrorCodeReclaimNoParticipantSlot;
}

void EpochReclaimer::unpin(uint32_t slot) {
  ASSERT_ND(slot < slots_.size());
  ASSERT_ND(slots_[slot].pinned_epoch_ != 0);
  assorted::atomic_store_release<ReclaimEpoch>(&slots_[slot].pinned_epoch_, 0U);
}

void EpochReclaimer::defer(Destructor destructor, void* object) {
  ASSERT_ND(destructor);
  bool auto_collect = false;
  {
    std::lock_guard<std::mutex> guard(garbage_mutex_);
    Garbage entry;
    entry.destructor_ = destructor;
    entry.object_ = object;
    entry.retired_epoch_ = get_current_epoch();
    garbage_.push_back(entry);
    auto_collect = options_->auto_collect_threshold_ > 0
      && garbage_.size() >= options_->auto_collect_threshold_;
  }
  if (auto_collect) {
    advance_epoch();
    collect();
  }
}

ReclaimEpoch EpochReclaimer::advance_epoch() {
  return assorted::raw_atomic_fetch_add<ReclaimEpoch>(&current_epoch_, 1U) + 1U;
}

uint64_t EpochReclaimer::collect() {
  std::vector<Garbage> reclaimable;
  {
    std::lock_guard<std::mutex> guard(garbage_mutex_);
    // computed under the lock so that no entry is stamped between this and the scan below
    const ReclaimEpoch min_active = get_min_active_epoch();
    std::vector<Garbage> remaining;
    for (uint32_t i = 0; i < garbage_.size(); ++i) {
      if (garbage_[i].retired_epoch_ < min_active) {
        reclaimable.push_back(garbage_[i]);
      } else {
        remaining.push_back(garbage_[i]);
      }
    }
    garbage_.swap(remaining);
  }
  destroy_all(reclaimable);
  assorted::raw_atomic_fetch_add<uint64_t>(&destroyed_count_, reclaimable.size());
  DVLOG(1) << "Collected " << reclaimable.size() << " objects";
  return reclaimable.size();
}

void EpochReclaimer::destroy_all(const std::vector<Garbage>& garbage) {
  for (uint32_t i = 0; i < garbage.size(); ++i) {
    garbage[i].destructor_(garbage[i].object_);
  }
}

ReclaimEpoch EpochReclaimer::get_current_epoch() const {
  return assorted::atomic_load_seq_cst<ReclaimEpoch>(&current_epoch_);
}

ReclaimEpoch EpochReclaimer::get_min_active_epoch() const {
  ReclaimEpoch min_epoch = get_current_epoch();
  for (uint32_t i = 0; i < slots_.size(); ++i) {
    ReclaimEpoch pinned = assorted::atomic_load_seq_cst<ReclaimEpoch>(&slots_[i].pinned_epoch_);
    if (pinned != 0 && pinned < min_epoch) {
      min_epoch = pinned;
    }
  }
  return min_epoch;
}

uint32_t EpochReclaimer::get_active_guard_count() const {
  uint32_t count = 0;
  for (uint32_t i = 0; i < slots_.size(); ++i) {
    if (assorted::atomic_load_acquire<ReclaimEpoch>(&slots_[i].pinned_epoch_) != 0) {
      ++count;
    }
  }
  return count;
}

uint64_t EpochReclaimer::get_pending_count() const {
  std::lock_guard<std::mutex> guard(garbage_mutex_);
  return garbage_.size();
}

uint64_t EpochReclaimer::get_destroyed_count() const {
  return assorted::atomic_load_seq_cst<uint64_t>(&destroyed_count_);
}

std::ostream& operator<<(std::ostream& o, const EpochReclaimer& v) {
  o << "<EpochReclaimer>"
    << "<current_epoch_>" << v.get_current_epoch() << "</current_epoch_>"
    << "<active_guards_>" << v.get_active_guard_count() << "</active_guards_>"
    << "<pending_>" << v.get_pending_count() << "</pending_>"
    << "<destroyed_>" << v.get_destroyed_count() << "</destroyed_>"
    << "</EpochReclaimer>";
  return o;
}

}  // namespace reclaim
}  // namespace strata
