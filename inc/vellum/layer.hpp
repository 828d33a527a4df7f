/*!
 * \file layer.hpp
 * \brief file layer.hpp
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

#include <vellum/path.hpp>
#include <vellum/draw_state.hpp>
#include <vellum/text/text.hpp>
#include <vellum/util/util.hpp>

namespace vellum
{
/*!\addtogroup Canvas
 * @{
 */

  /*!
   * \brief
   * A Layer is one shape of a \ref Canvas: either a path or a
   * positioned text, together with the \ref DrawState with
   * which it was drawn.
   */
  class Layer
  {
  public:
    /*!
     * \brief
     * Enumeration of the kinds of layer.
     */
    enum layer_type_t
      {
        /*!
         * The layer is a \ref Path, see path().
         */
        path_layer,

        /*!
         * The layer is a \ref Text, see text(),
         * position() and rotation().
         */
        text_layer,
      };

    /*!
     * Ctor, a path layer.
     * \param path path, in canvas coordinates
     * \param state style of the layer
     */
    Layer(const Path &path, const DrawState &state):
      m_type(path_layer),
      m_path(path),
      m_position(0.0f, 0.0f),
      m_rotation(0.0f),
      m_state(state)
    {}

    /*!
     * Ctor, a text layer.
     * \param text text of the layer
     * \param position position of the origin of the text
     * \param rotation counter-clockwise rotation in degrees
     *                 of the text about its origin
     * \param state style of the layer
     */
    Layer(const Text &text, const vec2 &position, float rotation,
          const DrawState &state):
      m_type(text_layer),
      m_text(text),
      m_position(position),
      m_rotation(rotation),
      m_state(state)
    {}

    /*!
     * Kind of layer.
     */
    enum layer_type_t
    type(void) const
    {
      return m_type;
    }

    /*!
     * The path of a path layer, already placed
     * in canvas coordinates.
     */
    const Path&
    path(void) const
    {
      VELLUMassert(m_type == path_layer);
      return m_path;
    }

    /*!
     * The text of a text layer.
     */
    const Text&
    text(void) const
    {
      VELLUMassert(m_type == text_layer);
      return m_text;
    }

    /*!
     * Position of the origin of the text of a text layer.
     */
    const vec2&
    position(void) const
    {
      return m_position;
    }

    /*!
     * Rotation in degrees of the text of a text layer.
     */
    float
    rotation(void) const
    {
      return m_rotation;
    }

    /*!
     * Style with which the layer was drawn.
     */
    const DrawState&
    draw_state(void) const
    {
      return m_state;
    }

  private:
    enum layer_type_t m_type;
    Path m_path;
    Text m_text;
    vec2 m_position;
    float m_rotation;
    DrawState m_state;
  };

/*! @} */
}
