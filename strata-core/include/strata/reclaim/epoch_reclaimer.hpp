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
#ifndef STRATA_RECLAIM_EPOCH_RECLAIMER_HPP_
#define STRATA_RECLAIM_EPOCH_RECLAIMER_HPP_
#include <stdint.h>

#include <iosfwd>
#include <mutex>
#include <vector>

#include "strata/cxx11.hpp"
#include "strata/error_code.hpp"
#include "strata/initializable.hpp"
#include "strata/reclaim/fwd.hpp"
#include "strata/reclaim/reclaim_options.hpp"

namespace strata {
namespace reclaim {

/**
 * @typedef ReclaimEpoch
 * @brief Value of the global reclamation epoch. 0 means "not pinned" in participant slots.
 * @ingroup RECLAIM
 */
typedef uint64_t ReclaimEpoch;

/**
 * @typedef Destructor
 * @brief Function that destroys a retired object.
 * @ingroup RECLAIM
 */
typedef void (*Destructor)(void* object);

/**
 * @brief Proof that the holder has pinned a reclamation epoch.
 * @ingroup RECLAIM
 * @details
 * While a guard is active, no object retired at or after its pinned epoch is destroyed, so
 * records read through the page table stay dereferenceable. Released by release() or the
 * destructor. Not copyable. A guard must be used by one thread at a time.
 */
class Guard {
 public:
  Guard() : reclaimer_(CXX11_NULLPTR), slot_(0), pinned_epoch_(0) {}
  ~Guard() { release(); }

  Guard(const Guard&) CXX11_FUNC_DELETE;
  Guard& operator=(const Guard&) CXX11_FUNC_DELETE;

  bool          is_active() const { return reclaimer_ != CXX11_NULLPTR; }
  ReclaimEpoch  get_pinned_epoch() const { return pinned_epoch_; }

  /**
   * @brief Retires an object: destructor(object) runs once no guard can observe it.
   * @pre is_active()
   */
  void          defer(Destructor destructor, void* object);

  /** Unpins. Does nothing if not active. */
  void          release();

  friend std::ostream& operator<<(std::ostream& o, const Guard& v);

 private:
  friend class EpochReclaimer;
  EpochReclaimer* reclaimer_;
  uint32_t        slot_;
  ReclaimEpoch    pinned_epoch_;
};

/**
 * @brief Epoch-based reclamation of records retired from the page table.
 * @ingroup RECLAIM
 * @details
 * @par Protocol
 * A global epoch counter starts at 1. pin() stamps a free participant slot with the current
 * epoch. Guard::defer() puts the object on the garbage list with the epoch at retirement.
 * collect() destroys entries retired before the smallest pinned epoch (or before the current
 * epoch if nothing is pinned). advance_epoch() bumps the counter so later retirements get a
 * larger stamp.
 * Thus an object is destroyed only after every guard that was pinned when it was retired has
 * been released and the epoch has advanced past its stamp.
 *
 * @par Concurrency
 * pin() and release() are lock-free compare-and-swaps on cache-line-sized slots. defer() and
 * collect() take a mutex on the garbage list. Destructors run outside the mutex.
 */
class EpochReclaimer CXX11_FINAL : public DefaultInitializable {
 public:
  explicit EpochReclaimer(const ReclaimOptions* options);

  ErrorStack  initialize_once() CXX11_OVERRIDE;
  /** Fails with kErrorCodeReclaimActiveGuards if any guard is still pinned. */
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /**
   * @brief Pins the current epoch into the given guard.
   * @pre !guard->is_active()
   * @return kErrorCodeReclaimNoParticipantSlot if all slots are in use
   */
  ErrorCode     pin(Guard* guard);

  /** Increments the global epoch and returns the new value. */
  ReclaimEpoch  advance_epoch();

  /**
   * Destroys every retired object that no pinned guard can observe.
   * @return number of objects destroyed
   */
  uint64_t      collect();

  ReclaimEpoch  get_current_epoch() const;
  /** Smallest pinned epoch, or the current epoch if nothing is pinned. */
  ReclaimEpoch  get_min_active_epoch() const;
  uint32_t      get_active_guard_count() const;
  uint64_t      get_pending_count() const;
  uint64_t      get_destroyed_count() const;

  friend std::ostream& operator<<(std::ostream& o, const EpochReclaimer& v);

 private:
  friend class Guard;

  /** One per concurrently pinned guard. Padded to a cache line against false sharing. */
  struct ParticipantSlot {
    ReclaimEpoch  pinned_epoch_;
    char          padding_[64 - sizeof(ReclaimEpoch)];
  };
  struct Garbage {
    Destructor    destructor_;
    void*         object_;
    ReclaimEpoch  retired_epoch_;
  };

  void          unpin(uint32_t slot);
  void          defer(Destructor destructor, void* object);
  /** Runs destructors of the given entries. Must be called without garbage_mutex_. */
  static void   destroy_all(const std::vector<Garbage>& garbage);

  const ReclaimOptions* const options_;

  /** Only touched via raw atomics. */
  ReclaimEpoch                  current_epoch_;
  std::vector<ParticipantSlot>  slots_;

  mutable std::mutex            garbage_mutex_;
  std::vector<Garbage>          garbage_;
  /** Only touched via raw atomics. */
  uint64_t                      destroyed_count_;
};

}  // namespace reclaim
}  // namespace strata
#endif  // STRATA_RECLAIM_EPOCH_RECLAIMER_HPP_
