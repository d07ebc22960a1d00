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
#include <stdint.h>
#include <gtest/gtest.h>

#include <iostream>
#include <thread>
#include <vector>

#include "strata/error_stack.hpp"
#include "strata/test_common.hpp"
#include "strata/assorted/raw_atomics.hpp"
#include "strata/reclaim/epoch_reclaimer.hpp"
#include "strata/reclaim/reclaim_options.hpp"

namespace strata {
namespace reclaim {
DEFINE_TEST_CASE_PACKAGE(EpochReclaimerTest, strata.reclaim);

/** Counts destructions in the pointed uint64_t instead of freeing anything. */
void count_destruction(void* object) {
  assorted::raw_atomic_fetch_add<uint64_t>(reinterpret_cast<uint64_t*>(object), 1U);
}

ReclaimOptions manual_options() {
  ReclaimOptions options;
  options.participant_slots_ = 4;
  options.auto_collect_threshold_ = 0;
  return options;
}

TEST(EpochReclaimerTest, InitializeUninitialize) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  EXPECT_TRUE(reclaimer.is_initialized());
  EXPECT_EQ(1U, reclaimer.get_current_epoch());
  EXPECT_EQ(0U, reclaimer.get_active_guard_count());
  COERCE_ERROR(reclaimer.uninitialize());
  EXPECT_FALSE(reclaimer.is_initialized());
}

TEST(EpochReclaimerTest, PinRelease) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  {
    Guard guard;
    EXPECT_FALSE(guard.is_active());
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
    EXPECT_TRUE(guard.is_active());
    EXPECT_EQ(1U, guard.get_pinned_epoch());
    EXPECT_EQ(1U, reclaimer.get_active_guard_count());
    guard.release();
    EXPECT_FALSE(guard.is_active());
    EXPECT_EQ(0U, reclaimer.get_active_guard_count());
    guard.release();  // no-op
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
  }
  EXPECT_EQ(0U, reclaimer.get_active_guard_count());
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(EpochReclaimerTest, NoSlot) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  {
    Guard guards[4];
    for (int i = 0; i < 4; ++i) {
      EXPECT_EQ(kErrorCodeOk, reclaimer.pin(guards + i));
    }
    Guard extra;
    EXPECT_EQ(kErrorCodeReclaimNoParticipantSlot, reclaimer.pin(&extra));
    EXPECT_FALSE(extra.is_active());
    guards[2].release();
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&extra));
  }
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(EpochReclaimerTest, DeferredUntilReleased) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  uint64_t destroyed = 0;
  Guard reader;
  EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&reader));
  {
    Guard writer;
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&writer));
    writer.defer(&count_destruction, &destroyed);
    writer.defer(&count_destruction, &destroyed);
  }
  EXPECT_EQ(2U, reclaimer.get_pending_count());

  // the reader may still observe them
  EXPECT_EQ(0U, reclaimer.collect());
  reclaimer.advance_epoch();
  EXPECT_EQ(0U, reclaimer.collect());
  EXPECT_EQ(0U, destroyed);

  reader.release();
  EXPECT_EQ(2U, reclaimer.collect());
  EXPECT_EQ(2U, destroyed);
  EXPECT_EQ(0U, reclaimer.get_pending_count());
  EXPECT_EQ(2U, reclaimer.get_destroyed_count());
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(EpochReclaimerTest, NeedsEpochAdvance) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  uint64_t destroyed = 0;
  {
    Guard guard;
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
    guard.defer(&count_destruction, &destroyed);
  }
  // retired in the current epoch. a guard pinned now could have loaded it.
  EXPECT_EQ(0U, reclaimer.collect());
  EXPECT_EQ(2U, reclaimer.advance_epoch());
  EXPECT_EQ(1U, reclaimer.collect());
  EXPECT_EQ(1U, destroyed);
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(EpochReclaimerTest, LaterGuardDoesNotBlock) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  uint64_t destroyed = 0;
  {
    Guard guard;
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
    guard.defer(&count_destruction, &destroyed);
  }
  reclaimer.advance_epoch();
  Guard late;
  EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&late));
  EXPECT_EQ(2U, late.get_pinned_epoch());
  EXPECT_EQ(2U, reclaimer.get_min_active_epoch());
  EXPECT_EQ(1U, reclaimer.collect());
  EXPECT_EQ(1U, destroyed);
  late.release();
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(EpochReclaimerTest, AutoCollect) {
  ReclaimOptions options;
  options.participant_slots_ = 2;
  options.auto_collect_threshold_ = 8;
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  uint64_t destroyed = 0;
  {
    Guard guard;
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
    for (int i = 0; i < 7; ++i) {
      guard.defer(&count_destruction, &destroyed);
    }
    EXPECT_EQ(7U, reclaimer.get_pending_count());
    guard.release();
    reclaimer.advance_epoch();
    EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
    guard.defer(&count_destruction, &destroyed);
  }
  // the 8th defer advanced the epoch and collected what only the released guard protected
  EXPECT_EQ(7U, destroyed);
  EXPECT_EQ(1U, reclaimer.get_pending_count());
  COERCE_ERROR(reclaimer.uninitialize());
  EXPECT_EQ(8U, destroyed);
}

TEST(EpochReclaimerTest, UninitializeWithActiveGuard) {
  ReclaimOptions options = manual_options();
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  uint64_t destroyed = 0;
  Guard guard;
  EXPECT_EQ(kErrorCodeOk, reclaimer.pin(&guard));
  guard.defer(&count_destruction, &destroyed);
  ErrorStack result = reclaimer.uninitialize();
  EXPECT_TRUE(result.is_error());
  EXPECT_EQ(kErrorCodeReclaimActiveGuards, result.get_error_code());
  EXPECT_TRUE(reclaimer.is_initialized());
  EXPECT_EQ(0U, destroyed);

  guard.release();
  COERCE_ERROR(reclaimer.uninitialize());
  EXPECT_EQ(1U, destroyed);
}

TEST(EpochReclaimerTest, InvalidOptions) {
  ReclaimOptions options;
  options.participant_slots_ = 0;
  EpochReclaimer reclaimer(&options);
  ErrorStack result = reclaimer.initialize();
  EXPECT_EQ(kErrorCodeConfValueOutofrange, result.get_error_code());
  EXPECT_FALSE(reclaimer.is_initialized());
}

const int kThreads = 6;
const int kIterations = 500;

struct ConcurrentDeferImpl {
  explicit ConcurrentDeferImpl(EpochReclaimer* reclaimer) : reclaimer_(reclaimer), destroyed_(0) {}
  void handle() {
    for (int i = 0; i < kIterations; ++i) {
      Guard guard;
      ErrorCode code = reclaimer_->pin(&guard);
      EXPECT_EQ(kErrorCodeOk, code);
      if (code != kErrorCodeOk) {
        return;
      }
      guard.defer(&count_destruction, &destroyed_);
      if (i % 50 == 0) {
        reclaimer_->advance_epoch();
      }
    }
  }
  EpochReclaimer* reclaimer_;
  uint64_t        destroyed_;
};

TEST(EpochReclaimerTest, Concurrent) {
  ReclaimOptions options;
  options.participant_slots_ = kThreads;
  options.auto_collect_threshold_ = 100;
  EpochReclaimer reclaimer(&options);
  COERCE_ERROR(reclaimer.initialize());
  ConcurrentDeferImpl impl(&reclaimer);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back(std::thread(&ConcurrentDeferImpl::handle, &impl));
  }
  for (int i = 0; i < kThreads; ++i) {
    threads[i].join();
  }
  std::cout << reclaimer << std::endl;
  reclaimer.advance_epoch();
  reclaimer.collect();
  EXPECT_EQ(0U, reclaimer.get_pending_count());
  EXPECT_EQ(static_cast<uint64_t>(kThreads * kIterations),
    assorted::atomic_load_seq_cst<uint64_t>(&impl.destroyed_));
  EXPECT_EQ(impl.destroyed_, reclaimer.get_destroyed_count());
  COERCE_ERROR(reclaimer.uninitialize());
}

TEST(EpochReclaimerDeathTest, DeferWithoutPin) {
  uint64_t destroyed = 0;
  Guard guard;
  EXPECT_DEATH(guard.defer(&count_destruction, &destroyed), "not pinned");
}

}  // namespace reclaim
}  // namespace strata

TEST_MAIN_CAPTURE_SIGNALS(EpochReclaimerTest, strata.reclaim);
