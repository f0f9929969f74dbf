#pragma once

#include <pthread.h>

namespace concurrency
{

/**
 * @brief Simple wrapper around a pthread mutex for implementing a lock
 */
class Lock
{
  public:
    Lock();
    ~Lock();

    Lock(const Lock &) = delete;
    Lock &operator=(const Lock &) = delete;

    /// Locks the lock.
    //
    // Not recursive, must not be taken twice by the same thread.
    void lock();

    // Unlocks the lock.
    void unlock();

  private:
    pthread_mutex_t handle;
};

} // namespace concurrency
