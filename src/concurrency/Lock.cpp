#include "Lock.h"

namespace concurrency
{

Lock::Lock()
{
    pthread_mutex_init(&handle, NULL);
}

Lock::~Lock()
{
    pthread_mutex_destroy(&handle);
}

void Lock::lock()
{
    pthread_mutex_lock(&handle);
}

void Lock::unlock()
{
    pthread_mutex_unlock(&handle);
}

} // namespace concurrency
