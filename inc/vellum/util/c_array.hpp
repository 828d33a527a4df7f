/*!
 * \file c_array.hpp
 * \brief file c_array.hpp
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

#include <cstddef>
#include <vellum/util/util.hpp>

namespace vellum
{

/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * A c_array is a non-owning view of a contiguous
 * run of elements, a pointer and a count. Element
 * access is bounds checked in debug builds.
 */
template<typename T>
class c_array
{
public:
  typedef T* iterator;
  typedef T value_type;
  typedef size_t size_type;

  /*!
   * Ctor, an empty array.
   */
  c_array(void):
    m_ptr(nullptr),
    m_size(0)
  {}

  /*!
   * Ctor.
   * \param ptr first element
   * \param sz number of elements ptr points to
   */
  template<typename U>
  c_array(U *ptr, size_type sz):
    m_ptr(ptr),
    m_size(sz)
  {
    VELLUMstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * Ctor from a c_array<U> where U* converts to T*,
   * typically to add const.
   */
  template<typename U>
  c_array(const c_array<U> &obj):
    m_ptr(obj.c_ptr()),
    m_size(obj.size())
  {
    VELLUMstatic_assert(sizeof(U) == sizeof(T));
  }

  /*!
   * View the same bytes as an array of S; the size
   * in bytes must be a multiple of sizeof(S).
   */
  template<typename S>
  c_array<S>
  reinterpret_pointer(void) const
  {
    size_type num_bytes(m_size * sizeof(T));

    VELLUMassert(num_bytes % sizeof(S) == 0);
    return c_array<S>(reinterpret_cast<S*>(m_ptr), num_bytes / sizeof(S));
  }

  T*
  c_ptr(void) const
  {
    return m_ptr;
  }

  T&
  operator[](size_type j) const
  {
    VELLUMassert(m_ptr != nullptr && j < m_size);
    return m_ptr[j];
  }

  bool
  empty(void) const
  {
    return m_size == 0;
  }

  size_type
  size(void) const
  {
    return m_size;
  }

  iterator
  begin(void) const
  {
    return m_ptr;
  }

  iterator
  end(void) const
  {
    return m_ptr + m_size;
  }

  T&
  front(void) const
  {
    return (*this)[0];
  }

  T&
  back(void) const
  {
    return (*this)[m_size - 1];
  }

private:
  T *m_ptr;
  size_type m_size;
};

/*! @} */

} //namespace
