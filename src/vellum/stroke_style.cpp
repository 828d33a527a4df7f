/*!
 * \file stroke_style.cpp
 * \brief file stroke_style.cpp
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

#include <vellum/stroke_style.hpp>
#include "private/util_private.hpp"

//////////////////////////////////
// vellum::Joiner methods
vellum::Joiner::
Joiner(enum PathEnums::join_style tp, float limit,
       enum PathEnums::join_style gap):
  m_type(tp),
  m_limit(limit),
  m_gap(gap)
{
  /* only round and bevel can fill the gap of a
   * clipped miter, anything else is treated as bevel.
   */
  VELLUMwarn_assert(gap == PathEnums::round_join || gap == PathEnums::bevel_join);
  if (m_gap != PathEnums::round_join)
    {
      m_gap = PathEnums::bevel_join;
    }

  VELLUMwarn_assert(t_isnan(limit) || limit >= 0.0f);
  if (!t_isnan(m_limit) && m_limit < 0.0f)
    {
      m_limit = 0.0f;
    }
}

//////////////////////////////////
// vellum::DashPattern methods
bool
vellum::DashPattern::
valid(void) const
{
  float total(0.0f);

  for (float v : m_lengths)
    {
      if (v < 0.0f || t_isnan(v))
        {
          return false;
        }
      total += v;
    }
  return total > 0.0f;
}
