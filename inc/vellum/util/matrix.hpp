/*!
 * \file matrix.hpp
 * \brief file matrix.hpp
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

#include <vellum/util/math.hpp>
#include <vellum/util/vecN.hpp>

namespace vellum {

/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * A generic matrix class. The operator() is overloaded
 * to access elements of the matrix as follows:
 * \verbatim
 * matrix(0    , 0) matrix(0    , 1) ... matrix(0    , M - 1)
 * .
 * .
 * matrix(N - 1, 0) matrix(N - 1, 1) ... matrix(N - 1, M - 1)
 * \endverbatim
 *
 * The data is represented internally with a 1-dimensional array with the
 * packing order
 *
 * \code
 * matrix(row, col) <--> raw_data()[row + N * col]
 * \endcode
 *
 *\tparam N height of matrix
 *\tparam M width of matrix
 *\tparam T matrix entry type
 */
template<size_t N, size_t M, typename T = float>
class matrixNxM
{
private:
  vecN<T, N * M> m_data;

public:
  enum
    {
      number_rows = N,
      number_cols = M
    };

  /*!
   * Ctor.
   * Initializes the matrix so that diagnols are 1
   * and other values are 0; for square matrices
   * that is the identity matrix.
   */
  matrixNxM(void)
  {
    reset();
  }

  /*!
   * Set matrix as identity.
   */
  void
  reset(void)
  {
    for (unsigned int i = 0; i < M; ++i)
      {
        for (unsigned int j = 0; j < N; ++j)
          {
            m_data[N * i + j] = (i == j) ? T(1): T(0);
          }
      }
  }

  /*!
   * Returns the named entry of the matrix
   * \param row row(vertical coordinate) in the matrix
   * \param col column(horizontal coordinate) in the matrix
   */
  T&
  operator()(unsigned int row, unsigned int col)
  {
    VELLUMassert(row < N);
    VELLUMassert(col < M);
    return m_data[N * col + row];
  }

  /*!
   * Returns the named entry of the matrix
   * \param row row(vertical coordinate) in the matrix
   * \param col column(horizontal coordinate) in the matrix
   */
  const T&
  operator()(unsigned int row, unsigned int col) const
  {
    VELLUMassert(row < N);
    VELLUMassert(col < M);
    return m_data[N * col + row];
  }

  /*!
   * Computes the value of \ref matrixNxM * \ref vecN
   * \param in right operand of multiplication
   */
  vecN<T, N>
  operator*(const vecN<T, M> &in) const
  {
    vecN<T, N> retval(T(0));
    for (unsigned int i = 0; i < N; ++i)
      {
        for (unsigned int j = 0; j < M; ++j)
          {
            retval[i] += operator()(i, j) * in[j];
          }
      }
    return retval;
  }

  /*!
   * Matrix product.
   */
  template<size_t K>
  matrixNxM<N, K, T>
  operator*(const matrixNxM<M, K, T> &rhs) const
  {
    matrixNxM<N, K, T> retval;
    for (unsigned int i = 0; i < N; ++i)
      {
        for (unsigned int j = 0; j < K; ++j)
          {
            retval(i, j) = T(0);
            for (unsigned int k = 0; k < M; ++k)
              {
                retval(i, j) += operator()(i, k) * rhs(k, j);
              }
          }
      }
    return retval;
  }
};

/*!
 * Convenience typedef for a 2x2 matrix of floats.
 */
typedef matrixNxM<2, 2, float> float2x2;

/*!
 * Returns the determinant of a 2x2 matrix.
 */
template<typename T>
T
determinant(const matrixNxM<2, 2, T> &m)
{
  return m(0, 0) * m(1, 1) - m(0, 1) * m(1, 0);
}

/*!
 * Returns the 2x2 matrix of a rotation by the
 * named angle (counter-clockwise in a y-up
 * coordinate system).
 * \param radians angle of rotation in radians
 */
inline
float2x2
rotation_matrix(float radians)
{
  float2x2 m;
  float s(t_sin(radians)), c(t_cos(radians));

  m(0, 0) = c;
  m(0, 1) = -s;
  m(1, 0) = s;
  m(1, 1) = c;
  return m;
}

/*!
 * Returns the 2x2 matrix of a scaling.
 */
inline
float2x2
scale_matrix(float sx, float sy)
{
  float2x2 m;
  m(0, 0) = sx;
  m(1, 1) = sy;
  return m;
}

/*! @} */

} //namespace
