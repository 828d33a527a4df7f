/*!
 * \file util.hpp
 * \brief file util.hpp
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

#include <stdint.h>
#include <stddef.h>

namespace vellum
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * Typedef for a C-style string.
   */
  typedef const char *c_string;

  /*!
   * Enumeration for simple return codes for functions
   * for success or failure.
   */
  enum return_code
    {
      /*!
       * Routine failed
       */
      routine_fail,

      /*!
       * Routine suceeded
       */
      routine_success
    };

  /*!
   * Private function used by macro VELLUMassert, do NOT call.
   * Prints the message, the location and a backtrace (on
   * Linux) to std::cerr; if VELLUM_DEBUG is defined, also
   * calls std::abort().
   */
  void
  assert_fail(c_string str, c_string file, int line);

  /*!
   * A class reprenting the STL range
   * [m_begin, m_end).
   */
  template<typename T>
  class range_type
  {
  public:
    /*!
     * Ctor.
     * \param b value with which to initialize m_begin
     * \param e value with which to initialize m_end
     */
    range_type(T b, T e):
      m_begin(b),
      m_end(e)
    {}

    /*!
     * Empty ctor, m_begin and m_end are uninitialized.
     */
    range_type(void)
    {}

    /*!
     * Iterator to first element
     */
    T m_begin;

    /*!
     * iterator to one past the last element
     */
    T m_end;

    /*!
     * Provided as a conveniance, equivalent to
     * \code
     * m_end - m_begin
     * \endcode
     */
    T
    difference(void) const
    {
      return m_end - m_begin;
    }
  };

  /*!
   * Class for which copy ctor and assignment operator
   * are private functions.
   */
  class noncopyable
  {
  public:
    noncopyable(void)
    {}

  private:
    noncopyable(const noncopyable &obj);

    noncopyable&
    operator=(const noncopyable &rhs);
  };

/*! @} */
}

/*!\addtogroup Utility
 * @{
 */

/*!\def VELLUMunused
 * Macro to stop the compiler from reporting
 * an argument as unused. Typically used on
 * those arguments used in assert invocation
 * but otherwise unused.
 * \param X expression of which to ignore the value
 */
#define VELLUMunused(X) do { (void)(X); } while(0)

/*!\def VELLUMstatic_assert
 * Conveniance for static_assert with the tested
 * expression as the message.
 * \param X condition to check at compile time
 */
#define VELLUMstatic_assert(X) static_assert(X, #X)

/*!\def VELLUMassert
 * If VELLUM_DEBUG is defined, checks if the statement
 * is true and if it is not true prints to std::cerr and
 * then aborts. If VELLUM_DEBUG is not defined, then
 * macro is empty (and thus the condition is not evaluated).
 * \param X condition to check
 */
#ifdef VELLUM_DEBUG
#define VELLUMassert(X) do {                              \
    if (!(X)) {                                           \
      vellum::assert_fail("Assertion '" #X "' failed",    \
                          __FILE__, __LINE__);            \
    }                                                     \
  } while(0)
#else
#define VELLUMassert(X)
#endif

/*!\def VELLUMmessaged_assert
 * Like VELLUMassert but the condition is ALWAYS evaluated
 * and on failure the message is ALWAYS reported via
 * vellum::assert_fail(); only debug builds abort. Use it
 * for conditions that the caller also acts upon.
 * \param X condition to check
 * \param Y message to print if condition fails
 */
#define VELLUMmessaged_assert(X, Y) do {                  \
    if (!(X)) {                                           \
      vellum::assert_fail(Y, __FILE__, __LINE__);         \
    }                                                     \
  } while(0)

/*! @} */
