/*!
 * \file eps_writer.cpp
 * \brief file eps_writer.cpp
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

#include <sstream>
#include <ostream>
#include <vellum/backend/eps_writer.hpp>
#include <vellum/units.hpp>
#include <vellum/util/math.hpp>
#include "../private/path_util_private.hpp"

///////////////////////////////////
// vellum::EPSWriter methods
vellum::EPSWriter::
EPSWriter(std::ostream &str, float width, float height):
  m_str(str)
{
  float w, h;

  w = width * units::pt_per_mm;
  h = height * units::pt_per_mm;
  m_str << "%!PS-Adobe-3.0 EPSF-3.0\n"
        << "%%Creator: vellum\n"
        << "%%BoundingBox: 0 0 "
        << static_cast<int>(t_ceil(w)) << " "
        << static_cast<int>(t_ceil(h)) << "\n"
        << "%%HiResBoundingBox: 0 0 ";
  detail::write_number(m_str, w);
  m_str << " ";
  detail::write_number(m_str, h);
  m_str << "\n%%EndComments\n";

  /* the document is drawn in millimetres */
  detail::write_number(m_str, units::pt_per_mm);
  m_str << " ";
  detail::write_number(m_str, units::pt_per_mm);
  m_str << " scale\n";
}

void
vellum::EPSWriter::
set_color(const ColorRGBA &color)
{
  std::ostringstream str;
  vec4 c(color.normalized());

  detail::write_number(str, c.x());
  str << " ";
  detail::write_number(str, c.y());
  str << " ";
  detail::write_number(str, c.z());
  str << " setrgbcolor";
  if (str.str() != m_color)
    {
      m_color = str.str();
      m_str << m_color << "\n";
    }
}

void
vellum::EPSWriter::
append_path(const std::string &ops)
{
  m_str << "newpath " << ops << "\n";
}

void
vellum::EPSWriter::
fill(enum PathEnums::fill_rule_t fill_rule)
{
  m_str << ((fill_rule == PathEnums::even_odd_fill_rule) ? "eofill\n" : "fill\n");
}

enum vellum::return_code
vellum::EPSWriter::
close(void)
{
  m_str << "showpage\n%%EOF\n";
  return (m_str) ? routine_success : routine_fail;
}
