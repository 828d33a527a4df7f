/*!
 * \file util_private.hpp
 * \brief file util_private.hpp
 *
 * Copyright 2016 by Intel.
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 */


#pragma once

#include <boost/thread/mutex.hpp>

#include <vector>
#include <iostream>
#include <vellum/util/util.hpp>
#include <vellum/util/c_array.hpp>

/*!\def VELLUMwarn_assert
 * Under debug builds, if the condition fails, prints a warning
 * with the location to std::cerr; never aborts.
 */
#ifdef VELLUM_DEBUG
#define VELLUMwarn_assert(X) do {                           \
    if (!(X)) {                                             \
      std::cerr << "[" << __FILE__ << "," << __LINE__       \
                << "]: Warning '" #X "' failed\n";          \
    }                                                       \
  } while(0)
#else
#define VELLUMwarn_assert(X)
#endif

namespace vellum
{
  /*!
   * Wrapper over mutex type so that we can replace
   * mutex implementation easily.
   */
  class mutex:vellum::noncopyable
  {
  public:
    void
    lock(void)
    {
      m_mutex.lock();
    }

    void
    unlock(void)
    {
      m_mutex.unlock();
    }

    bool
    try_lock(void)
    {
      return m_mutex.try_lock();
    }

  private:
    boost::mutex m_mutex;
  };

  /*!
   * Locks mutex on ctor and unlocks un dtor.
   */
  class autolock_mutex:vellum::noncopyable
  {
  public:
    explicit
    autolock_mutex(mutex &m):
      m_mutex(m)
    {
      m_mutex.lock();
    }

    ~autolock_mutex()
    {
      m_mutex.unlock();
    }
  private:
    mutex &m_mutex;
  };

  template<typename T>
  c_array<T>
  make_c_array(std::vector<T> &p)
  {
    if (p.empty())
      {
        return c_array<T>();
      }
    else
      {
        return c_array<T>(&p[0], p.size());
      }
  }

  template<typename T>
  c_array<const T>
  make_c_array(const std::vector<T> &p)
  {
    if (p.empty())
      {
        return c_array<const T>();
      }
    else
      {
        return c_array<const T>(&p[0], p.size());
      }
  }
}
