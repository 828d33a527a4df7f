/*!
 * \file eps_writer.hpp
 * \brief file eps_writer.hpp
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

#include <string>
#include <iosfwd>
#include <vellum/util/util.hpp>
#include <vellum/color.hpp>
#include <vellum/path_enums.hpp>

namespace vellum
{
/*!\addtogroup Backend
 * @{
 */

  /*!
   * \brief
   * An EPSWriter writes an Encapsulated PostScript document
   * made of filled paths. The header, with the bounding box in
   * points, is written by the ctor; coordinates passed to the
   * writer are in millimetres. PostScript has no transparency,
   * the alpha of colors is ignored.
   */
  class EPSWriter:noncopyable
  {
  public:
    /*!
     * Ctor.
     * \param str stream to which to write, must outlive the EPSWriter
     * \param width width of the bounding box in millimetres
     * \param height height of the bounding box in millimetres
     */
    EPSWriter(std::ostream &str, float width, float height);

    /*!
     * Set the color with which to fill.
     */
    void
    set_color(const ColorRGBA &color);

    /*!
     * Append path construction operators, as returned by
     * Path::to_ps().
     */
    void
    append_path(const std::string &ops);

    /*!
     * Fill the current path.
     */
    void
    fill(enum PathEnums::fill_rule_t fill_rule = PathEnums::nonzero_fill_rule);

    /*!
     * Write the trailer. Returns routine_fail if the stream
     * is in error after writing.
     */
    enum return_code
    close(void);

  private:
    std::ostream &m_str;
    std::string m_color;
  };

/*! @} */
}
