/*!
 * \file math.hpp
 * \brief file math.hpp
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

#include <math.h>
#include <stdlib.h>

namespace vellum
{
/*!\addtogroup Utility
 * @{
 */

/*!\def VELLUM_PI
 * Macro giving the value of pi as a float
 */
#define VELLUM_PI 3.14159265358979323846f

  /*!
   * Conveniance overload avoiding to rely on std::
   */
  template<typename T>
  inline
  const T&
  t_min(const T &a, const T &b)
  {
    return (a < b) ? a : b;
  }

  /*!
   * Conveniance overload avoiding to rely on std::
   */
  template<typename T>
  inline
  const T&
  t_max(const T &a, const T &b)
  {
    return (a < b) ? b : a;
  }

  /*!
   * Return the sign of a value.
   */
  template<typename T>
  inline
  T
  t_sign(const T &a)
  {
    return (a < T(0)) ? T(-1) : T(1);
  }

  /*!
   * Clamp a value to [a, b].
   */
  template<typename T>
  inline
  T
  t_clamp(const T &v, const T &a, const T &b)
  {
    return t_max(a, t_min(v, b));
  }

  inline
  float
  t_sin(float x) { return ::sinf(x); }

  inline
  float
  t_cos(float x) { return ::cosf(x); }

  inline
  float
  t_tan(float x) { return ::tanf(x); }

  inline
  float
  t_sqrt(float x) { return ::sqrtf(x); }

  inline
  float
  t_acos(float x) { return ::acosf(x); }

  inline
  float
  t_atan2(float y, float x) { return ::atan2f(y, x); }

  inline
  float
  t_fmod(float x, float y) { return ::fmodf(x, y); }

  inline
  float
  t_floor(float x) { return ::floorf(x); }

  inline
  float
  t_ceil(float x) { return ::ceilf(x); }

  inline
  double
  t_sin(double x) { return ::sin(x); }

  inline
  double
  t_cos(double x) { return ::cos(x); }

  inline
  double
  t_sqrt(double x) { return ::sqrt(x); }

  inline
  double
  t_atan2(double y, double x) { return ::atan2(y, x); }

  inline
  int
  t_abs(int x) { return ::abs(x); }

  inline
  float
  t_abs(float x) { return fabsf(x); }

  inline
  double
  t_abs(double x) { return fabs(x); }

  /*!
   * Returns true if the value is a NaN.
   */
  inline
  bool
  t_isnan(float x) { return x != x; }

  /*!
   * Convert an angle in degrees to radians.
   */
  inline
  float
  degrees_to_radians(float degrees)
  {
    return degrees * VELLUM_PI / 180.0f;
  }

/*! @} */
}
