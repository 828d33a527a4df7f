/*!
 * \file color.hpp
 * \brief file color.hpp
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

#include <vellum/util/vecN.hpp>

namespace vellum
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A ColorRGBA is an 8-bit per channel color with
   * non-premultiplied alpha. Equality is exact per
   * channel.
   */
  class ColorRGBA
  {
  public:
    /*!
     * Ctor, initializes as opaque black.
     */
    ColorRGBA(void):
      m_value(0, 0, 0, 255)
    {}

    /*!
     * Ctor.
     * \param r red channel
     * \param g green channel
     * \param b blue channel
     * \param a alpha channel, 255 is opaque
     */
    ColorRGBA(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255):
      m_value(r, g, b, a)
    {}

    uint8_t
    r(void) const { return m_value.x(); }

    uint8_t
    g(void) const { return m_value.y(); }

    uint8_t
    b(void) const { return m_value.z(); }

    uint8_t
    a(void) const { return m_value.w(); }

    /*!
     * Returns true if the alpha channel is zero; such a
     * color suppresses the fill or stroke it is used for.
     */
    bool
    transparent(void) const
    {
      return m_value.w() == 0;
    }

    /*!
     * Returns the channels normalized to [0, 1].
     */
    vec4
    normalized(void) const
    {
      return vec4(m_value) / 255.0f;
    }

    /*!
     * Returns the channels as a \ref u8vec4.
     */
    const u8vec4&
    value(void) const
    {
      return m_value;
    }

    bool
    operator==(const ColorRGBA &rhs) const
    {
      return m_value == rhs.m_value;
    }

    bool
    operator!=(const ColorRGBA &rhs) const
    {
      return m_value != rhs.m_value;
    }

    static
    ColorRGBA
    black(void) { return ColorRGBA(0, 0, 0, 255); }

    static
    ColorRGBA
    white(void) { return ColorRGBA(255, 255, 255, 255); }

    static
    ColorRGBA
    transparent_black(void) { return ColorRGBA(0, 0, 0, 0); }

  private:
    u8vec4 m_value;
  };

/*! @} */
}
