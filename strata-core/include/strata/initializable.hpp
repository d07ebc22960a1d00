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
#ifndef STRATA_INITIALIZABLE_HPP_
#define STRATA_INITIALIZABLE_HPP_

#include "strata/cxx11.hpp"
#include "strata/error_stack.hpp"

namespace strata {

/**
 * @brief The pure-virtual interface to initialize/uninitialize non-trivial resources.
 * @ingroup IDIOMS
 * @details
 * Constructors of our modules do nothing that can fail. Allocating the page table, registering
 * with glog or validating options happens in initialize(), which reports errors as ErrorStack.
 * The destructor does not call uninitialize(): callers must do it explicitly and check the
 * result, or use UninitializeGuard.
 */
class Initializable {
 public:
  virtual ~Initializable() {}

  /**
   * @brief Acquires resources in this object, usually called right after constructor.
   * @pre is_initialized() == FALSE
   * @details
   * If and only if the return value was not an error, is_initialized() will return TRUE.
   * An implementation releases whatever it acquired when it fails halfway.
   * Not thread-safe.
   */
  virtual ErrorStack  initialize() = 0;

  /** Returns whether the object has been already initialized or not. */
  virtual bool        is_initialized() const = 0;

  /**
   * @brief An \e idempotent method to release all resources of this object, if any.
   * @details
   * Releases as many resources as possible even when some of them fail, and reports multiple
   * failures with ErrorStackBatch. Not thread-safe.
   */
  virtual ErrorStack  uninitialize() = 0;
};

/**
 * @brief Typical implementation of Initializable as a skeleton base class.
 * @ingroup IDIOMS
 * @details
 * Derived classes implement initialize_once() and uninitialize_once(). This class provides
 * initialize-once and idempotent uninitialize on top of them.
 */
class DefaultInitializable : public virtual Initializable {
 public:
  DefaultInitializable() : initialized_(false) {}
  virtual ~DefaultInitializable() {}

  DefaultInitializable(const DefaultInitializable&) CXX11_FUNC_DELETE;
  DefaultInitializable& operator=(const DefaultInitializable&) CXX11_FUNC_DELETE;

  ErrorStack  initialize() CXX11_OVERRIDE CXX11_FINAL {
    if (is_initialized()) {
      return ERROR_STACK(kErrorCodeAlreadyInitialized);
    }
    ErrorStack init_error = initialize_once();
    if (init_error.is_error()) {
      // release what we acquired halfway
      CHECK_ERROR(uninitialize_once());
      return init_error;
    }
    initialized_ = true;
    return kRetOk;
  }

  ErrorStack  uninitialize() CXX11_OVERRIDE CXX11_FINAL {
    if (!is_initialized()) {
      return kRetOk;
    }
    CHECK_ERROR(uninitialize_once());
    initialized_ = false;
    return kRetOk;
  }

  bool        is_initialized() const CXX11_OVERRIDE CXX11_FINAL {
    return initialized_;
  }

  virtual ErrorStack  initialize_once() = 0;
  virtual ErrorStack  uninitialize_once() = 0;

 private:
  bool    initialized_;
};

/**
 * @brief Calls Initializable#uninitialize() automatically when it gets out of scope.
 * @ingroup IDIOMS
 * @details
 * A safety net for early returns. An uninitialize() error cannot be propagated from a
 * destructor, so the policy decides what to do with it. Calling uninitialize() explicitly is
 * still the right way.
 */
class UninitializeGuard {
 public:
  enum Policy {
    /** Terminates the program if uninitialize() wasn't called explicitly. */
    kAbortIfNotExplicitlyUninitialized = 0,
    /** Calls uninitialize() and terminates the program if it fails. The default. */
    kAbortIfUninitializeError,
    /** Calls uninitialize() and complains to stderr if it fails. */
    kWarnIfUninitializeError,
    /** Calls uninitialize() and says nothing. NOT RECOMMENDED. */
    kSilent,
  };
  explicit UninitializeGuard(Initializable *target, Policy policy = kAbortIfUninitializeError)
    : target_(target), policy_(policy) {}
  ~UninitializeGuard();

 private:
  Initializable*  target_;
  Policy          policy_;
};

}  // namespace strata
#endif  // STRATA_INITIALIZABLE_HPP_
