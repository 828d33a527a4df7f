/*!
 * \file draw_state.hpp
 * \brief file draw_state.hpp
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

#include <vellum/color.hpp>
#include <vellum/path_enums.hpp>
#include <vellum/stroke_style.hpp>

namespace vellum
{
/*!\addtogroup Canvas
 * @{
 */

  /*!
   * \brief
   * A DrawState holds the style with which a \ref Canvas draws
   * its shapes. Each \ref Layer keeps its own copy of the
   * DrawState in effect when it was drawn.
   */
  class DrawState
  {
  public:
    /*!
     * Ctor, initializes to the default style: opaque black
     * fill, transparent stroke of width 1 with butt caps and
     * an unbounded miter join, no dashes and nonzero fill rule.
     */
    DrawState(void):
      m_fill_color(ColorRGBA::black()),
      m_stroke_color(ColorRGBA::transparent_black()),
      m_stroke_width(1.0f),
      m_cap(PathEnums::butt_cap),
      m_fill_rule(PathEnums::nonzero_fill_rule)
    {}

    /*!
     * Set the value of \ref m_fill_color.
     */
    DrawState&
    fill_color(const ColorRGBA &v)
    {
      m_fill_color = v;
      return *this;
    }

    /*!
     * Set the value of \ref m_stroke_color.
     */
    DrawState&
    stroke_color(const ColorRGBA &v)
    {
      m_stroke_color = v;
      return *this;
    }

    /*!
     * Set the value of \ref m_stroke_width.
     */
    DrawState&
    stroke_width(float v)
    {
      m_stroke_width = v;
      return *this;
    }

    /*!
     * Set the value of \ref m_cap.
     */
    DrawState&
    cap(enum PathEnums::cap_style v)
    {
      m_cap = v;
      return *this;
    }

    /*!
     * Set the value of \ref m_joiner.
     */
    DrawState&
    joiner(const Joiner &v)
    {
      m_joiner = v;
      return *this;
    }

    /*!
     * Set the value of \ref m_dashes.
     */
    DrawState&
    dashes(const DashPattern &v)
    {
      m_dashes = v;
      return *this;
    }

    /*!
     * Set the value of \ref m_fill_rule.
     */
    DrawState&
    fill_rule(enum PathEnums::fill_rule_t v)
    {
      m_fill_rule = v;
      return *this;
    }

    /*!
     * Returns true if the fill paints, i.e. the fill
     * color is not transparent.
     */
    bool
    fill_active(void) const
    {
      return !m_fill_color.transparent();
    }

    /*!
     * Returns true if the stroke paints, i.e. the stroke
     * color is not transparent and the width is positive.
     */
    bool
    stroke_active(void) const
    {
      return !m_stroke_color.transparent() && m_stroke_width > 0.0f;
    }

    bool
    operator==(const DrawState &rhs) const
    {
      return m_fill_color == rhs.m_fill_color
        && m_stroke_color == rhs.m_stroke_color
        && m_stroke_width == rhs.m_stroke_width
        && m_cap == rhs.m_cap
        && m_joiner == rhs.m_joiner
        && m_dashes == rhs.m_dashes
        && m_fill_rule == rhs.m_fill_rule;
    }

    bool
    operator!=(const DrawState &rhs) const
    {
      return !operator==(rhs);
    }

    /*!
     * Color with which to fill.
     */
    ColorRGBA m_fill_color;

    /*!
     * Color with which to stroke.
     */
    ColorRGBA m_stroke_color;

    /*!
     * Width of the stroke.
     */
    float m_stroke_width;

    /*!
     * Cap style of the ends of open contours.
     */
    enum PathEnums::cap_style m_cap;

    /*!
     * Join style of the stroke.
     */
    Joiner m_joiner;

    /*!
     * Dash pattern of the stroke, empty for solid.
     */
    DashPattern m_dashes;

    /*!
     * Fill rule of the fill.
     */
    enum PathEnums::fill_rule_t m_fill_rule;
  };

/*! @} */
}
