#pragma once

#include "Lock.h"

namespace concurrency
{

/**
 * @brief RAII lock guard, holds the lock for the lifetime of the guard
 *
 * Every public session operation opens with one of these so a transport delivering
 * requests and frames from different threads still sees one operation at a time.
 */
class LockGuard
{
  public:
    explicit LockGuard(Lock *lock);
    ~LockGuard();

    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;

  private:
    Lock *const lock;
};

} // namespace concurrency
