/*!
 * \file reference_counted.hpp
 * \brief file reference_counted.hpp
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

#include <atomic>
#include <vellum/util/util.hpp>
#include <vellum/util/vellum_memory.hpp>

/*!
 * All functionality of Vellum is in the namespace vellum.
 */
namespace vellum
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * Intrusive reference counting pointer. The pointee type T
   * provides the static methods
   *  - T::add_reference(const T*)
   *  - T::remove_reference(const T*)
   *
   * which is the case for any class derived from
   * reference_counted<T>::concurrent. Two reference_counted_ptr
   * compare equal exactly when they point to the same object.
   */
  template<typename T>
  class reference_counted_ptr
  {
  private:
    typedef void (reference_counted_ptr::*unspecified_bool_type)(void) const;

    void
    fake_function(void) const
    {}

    void
    acquire(void)
    {
      if (m_p)
        {
          T::add_reference(m_p);
        }
    }

    void
    release(void)
    {
      if (m_p)
        {
          T::remove_reference(m_p);
          m_p = nullptr;
        }
    }

  public:
    /*!
     * Ctor, a null pointer.
     */
    reference_counted_ptr(void):
      m_p(nullptr)
    {}

    /*!
     * Ctor, takes a reference to p if p is not nullptr.
     */
    reference_counted_ptr(T *p):
      m_p(p)
    {
      acquire();
    }

    reference_counted_ptr(const reference_counted_ptr &obj):
      m_p(obj.m_p)
    {
      acquire();
    }

    /*!
     * Ctor from a pointer to a type U where U* converts
     * implicitly to T*, typically from non-const to const.
     */
    template<typename U>
    reference_counted_ptr(const reference_counted_ptr<U> &obj):
      m_p(obj.get())
    {
      acquire();
    }

    reference_counted_ptr(reference_counted_ptr &&obj):
      m_p(obj.m_p)
    {
      obj.m_p = nullptr;
    }

    ~reference_counted_ptr()
    {
      release();
    }

    reference_counted_ptr&
    operator=(const reference_counted_ptr &rhs)
    {
      if (m_p != rhs.m_p)
        {
          T *old(m_p);

          m_p = rhs.m_p;
          acquire();
          if (old)
            {
              T::remove_reference(old);
            }
        }
      return *this;
    }

    reference_counted_ptr&
    operator=(reference_counted_ptr &&rhs)
    {
      if (this != &rhs)
        {
          release();
          m_p = rhs.m_p;
          rhs.m_p = nullptr;
        }
      return *this;
    }

    /*!
     * Returns the pointer, without changing the
     * reference count.
     */
    T*
    get(void) const
    {
      return m_p;
    }

    T&
    operator*(void) const
    {
      VELLUMassert(m_p);
      return *m_p;
    }

    T*
    operator->(void) const
    {
      VELLUMassert(m_p);
      return m_p;
    }

    /*!
     * Test for non-null, so that one can write
     * \code
     * if (p) { ... }
     * \endcode
     */
    operator unspecified_bool_type() const
    {
      return m_p ? &reference_counted_ptr::fake_function : 0;
    }

    template<typename U>
    bool
    operator==(const reference_counted_ptr<U> &rhs) const
    {
      return m_p == rhs.get();
    }

    template<typename U>
    bool
    operator!=(const reference_counted_ptr<U> &rhs) const
    {
      return m_p != rhs.get();
    }

    /*!
     * Drops the reference, making the pointer null.
     */
    void
    clear(void)
    {
      release();
    }

  private:
    T *m_p;
  };

  /*!
   * \brief
   * Provides the base class for objects held by
   * reference_counted_ptr.
   */
  template<typename T>
  class reference_counted
  {
  public:
    /*!
     * \brief
     * Base class whose reference count is an atomic,
     * so that references may be taken and dropped from
     * several threads. When the count drops to zero the
     * object is deleted with \ref VELLUMdelete, so objects
     * must be created with \ref VELLUMnew.
     */
    class concurrent:noncopyable
    {
    public:
      concurrent(void):
        m_count(0)
      {}

      virtual
      ~concurrent()
      {
        VELLUMassert(m_count.load() == 0);
      }

      /*!
       * Increment the reference count of an object.
       */
      static
      void
      add_reference(const concurrent *p)
      {
        VELLUMassert(p);
        p->m_count.fetch_add(1, std::memory_order_relaxed);
      }

      /*!
       * Decrement the reference count of an object,
       * deleting it when the count reaches zero.
       */
      static
      void
      remove_reference(const concurrent *p)
      {
        VELLUMassert(p);
        if (p->m_count.fetch_sub(1, std::memory_order_release) == 1)
          {
            concurrent *q;

            std::atomic_thread_fence(std::memory_order_acquire);
            q = const_cast<concurrent*>(p);
            VELLUMdelete(q);
          }
      }

    private:
      mutable std::atomic<int> m_count;
    };
  };
/*! @} */

} //namespace vellum
