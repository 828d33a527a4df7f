/*!
 * \file vecN.hpp
 * \brief file vecN.hpp
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

#include <vellum/util/util.hpp>
#include <vellum/util/math.hpp>

namespace vellum
{
/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * vecN is a simple static array class with no virtual
 * functions and no memory overhead. Supports runtime array
 * index checking (debug builds) and STL style iterators via
 * pointer iterators.
 *
 * \param T typename with a constructor that takes no arguments.
 * \param N size of array
 */
template<typename T, size_t N>
class vecN
{
public:
  enum
    {
      /*!
       * Enumeration value for length of array.
       */
      array_size = N
    };

  typedef T* pointer;
  typedef const T* const_pointer;
  typedef T& reference;
  typedef const T& const_reference;
  typedef T value_type;
  typedef size_t size_type;
  typedef ptrdiff_t difference_type;
  typedef pointer iterator;
  typedef const_pointer const_iterator;

  /*!
   * Ctor, no intiliaztion on POD types.
   */
  vecN(void)
  {}

  /*!
   * Ctor, each element is set to value.
   * \param value value to give every element
   */
  explicit
  vecN(const T &value)
  {
    for(size_type i = 0; i < N; ++i)
      {
        operator[](i) = value;
      }
  }

  /*!
   * Ctor from a vecN of a different type,
   * each element is converted with a cast.
   * \param obj value from which to copy
   */
  template<typename S>
  explicit
  vecN(const vecN<S, N> &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        operator[](i) = static_cast<T>(obj[i]);
      }
  }

  /*!
   * Ctor for a vecN of size 2.
   */
  vecN(const T &px, const T &py)
  {
    VELLUMstatic_assert(N == 2);
    operator[](0) = px;
    operator[](1) = py;
  }

  /*!
   * Ctor for a vecN of size 4.
   */
  vecN(const T &px, const T &py, const T &pz, const T &pw)
  {
    VELLUMstatic_assert(N == 4);
    operator[](0) = px;
    operator[](1) = py;
    operator[](2) = pz;
    operator[](3) = pw;
  }

  T*
  c_ptr(void) { return m_data; }

  const T*
  c_ptr(void) const { return m_data; }

  /*!
   * Access named element, under debug also
   * performs bounds checking.
   * \param j index
   */
  const_reference
  operator[](size_type j) const
  {
    VELLUMassert(j < N);
    return c_ptr()[j];
  }

  /*!
   * Access named element, under debug also
   * performs bounds checking.
   * \param j index
   */
  reference
  operator[](size_type j)
  {
    VELLUMassert(j < N);
    return c_ptr()[j];
  }

  reference
  x(void) { VELLUMstatic_assert(N >= 1); return c_ptr()[0]; }

  reference
  y(void) { VELLUMstatic_assert(N >= 2); return c_ptr()[1]; }

  reference
  z(void) { VELLUMstatic_assert(N >= 3); return c_ptr()[2]; }

  reference
  w(void) { VELLUMstatic_assert(N >= 4); return c_ptr()[3]; }

  const_reference
  x(void) const { VELLUMstatic_assert(N >= 1); return c_ptr()[0]; }

  const_reference
  y(void) const { VELLUMstatic_assert(N >= 2); return c_ptr()[1]; }

  const_reference
  z(void) const { VELLUMstatic_assert(N >= 3); return c_ptr()[2]; }

  const_reference
  w(void) const { VELLUMstatic_assert(N >= 4); return c_ptr()[3]; }

  vecN
  operator-(void) const
  {
    vecN retval;
    for(size_type i = 0; i < N; ++i)
      {
        retval[i] = -operator[](i);
      }
    return retval;
  }

  vecN
  operator+(const vecN &obj) const
  {
    vecN retval(*this);
    retval += obj;
    return retval;
  }

  vecN
  operator-(const vecN &obj) const
  {
    vecN retval(*this);
    retval -= obj;
    return retval;
  }

  /*!
   * Component-wise multiplication.
   * \param obj right hand side of * operator
   */
  vecN
  operator*(const vecN &obj) const
  {
    vecN retval(*this);
    for(size_type i = 0; i < N; ++i)
      {
        retval[i] *= obj[i];
      }
    return retval;
  }

  vecN
  operator*(const T &obj) const
  {
    vecN retval(*this);
    retval *= obj;
    return retval;
  }

  vecN
  operator/(const T &obj) const
  {
    vecN retval(*this);
    retval /= obj;
    return retval;
  }

  vecN&
  operator+=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        operator[](i) += obj[i];
      }
    return *this;
  }

  vecN&
  operator-=(const vecN &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        operator[](i) -= obj[i];
      }
    return *this;
  }

  vecN&
  operator*=(const T &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        operator[](i) *= obj;
      }
    return *this;
  }

  vecN&
  operator/=(const T &obj)
  {
    for(size_type i = 0; i < N; ++i)
      {
        operator[](i) /= obj;
      }
    return *this;
  }

  /*!
   * Component-wise multiplication operator against a singleton
   * \param obj left hand side of * operator
   * \param vec right hand side of * operator
   */
  friend
  vecN
  operator*(const T &obj, const vecN &vec)
  {
    return vec * obj;
  }

  /*!
   * Computes inner product.
   * \param obj right hand side of inner product
   */
  T
  dot(const vecN &obj) const
  {
    T retval(operator[](0) * obj[0]);
    for(size_type i = 1; i < N; ++i)
      {
        retval += operator[](i) * obj[i];
      }
    return retval;
  }

  T
  magnitudeSq(void) const
  {
    return dot(*this);
  }

  T
  magnitude(void) const
  {
    return t_sqrt(magnitudeSq());
  }

  bool
  operator==(const vecN &obj) const
  {
    for(size_type i = 0; i < N; ++i)
      {
        if (operator[](i) != obj[i])
          {
            return false;
          }
      }
    return true;
  }

  bool
  operator!=(const vecN &obj) const
  {
    return !operator==(obj);
  }

  /*!
   * Lexographical comparison, comparing element 0 first.
   */
  bool
  operator<(const vecN &obj) const
  {
    for(size_type i = 0; i < N; ++i)
      {
        if (operator[](i) != obj[i])
          {
            return operator[](i) < obj[i];
          }
      }
    return false;
  }

  /*!
   * Normalize this vecN up to a tolerance,
   * equivalent to
   * \code
   * *this /= t_max(tol, magnitude())
   * \endcode
   * \param tol tolerance to avoid dividing by zero
   */
  void
  normalize(T tol = T(0.00001))
  {
    T denom;
    denom = magnitude();
    denom = t_max(denom, tol);
    *this /= denom;
  }

  /*!
   * Returns the vector normalized.
   */
  vecN
  unit_vector(T tol = T(0.00001)) const
  {
    vecN retval(*this);
    retval.normalize(tol);
    return retval;
  }

  /*!
   * Computes the arctan of the vector, only
   * defined for size 2.
   */
  T
  atan(void) const
  {
    VELLUMstatic_assert(N == 2);
    return t_atan2(y(), x());
  }

  static
  size_type
  size(void) { return static_cast<size_type>(N); }

  iterator
  begin(void) { return iterator(c_ptr()); }

  const_iterator
  begin(void) const { return const_iterator(c_ptr()); }

  iterator
  end(void) { return iterator(c_ptr() + static_cast<difference_type>(size())); }

  const_iterator
  end(void) const { return const_iterator(c_ptr() + static_cast<difference_type>(size())); }

private:
  T m_data[N];
};

/*!
 * Conveniance function, equivalent to
 * \code
 * a.dot(b)
 * \endcode
 */
template<typename T, size_t N>
T
dot(const vecN<T, N> &a, const vecN<T, N> &b)
{
  return a.dot(b);
}

/*!
 * Returns the z-component of the cross product
 * of two 2D vectors.
 */
template<typename T>
T
cross(const vecN<T, 2> &a, const vecN<T, 2> &b)
{
  return a.x() * b.y() - a.y() * b.x();
}

/*!
 * Linear interpolation between two values.
 * \param a value at t = 0
 * \param b value at t = 1
 * \param t interpolate parameter
 */
template<typename T, size_t N>
vecN<T, N>
mix(const vecN<T, N> &a, const vecN<T, N> &b, T t)
{
  return a + t * (b - a);
}

/*!
 * Conveniance typedef to vecN<float, 2>
 */
typedef vecN<float, 2> vec2;

/*!
 * Conveniance typedef to vecN<float, 4>
 */
typedef vecN<float, 4> vec4;

/*!
 * Conveniance typedef to vecN<int32_t, 2>
 */
typedef vecN<int32_t, 2> ivec2;

/*!
 * Conveniance typedef to vecN<uint8_t, 4>
 */
typedef vecN<uint8_t, 4> u8vec4;

/*! @} */
} //namespace
