//
//  ZMLock.hpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#ifndef _ZMLOCK_HPP_
#define _ZMLOCK_HPP_

#include <pthread.h>

/*! Thin wrapper around a pthread mutex.  Static instances are fine:
 *  the mutex is initialized in the constructor. */
class ZMLock {
  public:
                            ZMLock() { pthread_mutex_init(&_mutex, NULL); }
                            ~ZMLock() { pthread_mutex_destroy(&_mutex); }

    void                    lock() { pthread_mutex_lock(&_mutex); }
    void                    unlock() { pthread_mutex_unlock(&_mutex); }

  private:
                            ZMLock(const ZMLock &);  // Not copyable
    ZMLock                  &operator=(const ZMLock &);

    pthread_mutex_t         _mutex;
};

/*! Holds the lock for the lifetime of the object */
class ZMLockHolder {
  public:
                            ZMLockHolder(ZMLock *lock)
    :   _lock(lock)
    {
        _lock->lock();
    }
                            ~ZMLockHolder() { _lock->unlock(); }

  private:
    ZMLock                  *_lock;
};

#endif  // _ZMLOCK_HPP_
