/*!
 * \file path_dash_effect.cpp
 * \brief file path_dash_effect.cpp
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

#include <utility>
#include <vellum/path_dash_effect.hpp>
#include "private/util_private.hpp"

namespace
{
  void
  add_point(vellum::FlattenedPath::contour *C,
            const vellum::FlattenedPath::point &pt)
  {
    if (!C->m_points.empty()
        && (C->m_points.back().m_position - pt.m_position).magnitudeSq() <= 1e-12f)
      {
        C->m_points.back().m_corner = C->m_points.back().m_corner || pt.m_corner;
        C->m_points.back().m_curved = C->m_points.back().m_curved || pt.m_curved;
      }
    else
      {
        C->m_points.push_back(pt);
      }
  }
}

//////////////////////////////////////
// vellum::PathDashEffect methods
vellum::PathDashEffect::
PathDashEffect(const DashPattern &pattern)
{
  init(pattern.m_offset, make_c_array(pattern.m_lengths));
}

vellum::PathDashEffect::
PathDashEffect(float offset, c_array<const float> lengths)
{
  init(offset, lengths);
}

void
vellum::PathDashEffect::
init(float offset, c_array<const float> lengths)
{
  DashPattern pattern(offset, lengths);
  float total(0.0f);

  m_start_offset = 0.0f;
  if (pattern.empty())
    {
      return;
    }

  if (!pattern.valid())
    {
      /* negative lengths or a zero total length are
       * not a dash pattern, stroke solid.
       */
      VELLUMwarn_assert(!"Invalid dash pattern, stroking solid");
      return;
    }

  m_lengths = pattern.m_lengths;
  if (m_lengths.size() % 2 == 1)
    {
      m_lengths.insert(m_lengths.end(), pattern.m_lengths.begin(), pattern.m_lengths.end());
    }

  for (float v : m_lengths)
    {
      total += v;
    }

  m_start_offset = t_isnan(offset) ? 0.0f : t_fmod(offset, total);
  if (m_start_offset < 0.0f)
    {
      m_start_offset += total;
    }
}

void
vellum::PathDashEffect::
dash_contour(const FlattenedPath::contour &C, FlattenedPath *out) const
{
  const std::vector<FlattenedPath::point> &pts(C.m_points);
  unsigned int idx(0), num_edges, num_pts;
  float rem, pos;
  bool on, started_on;
  std::vector<FlattenedPath::contour> dashes;
  FlattenedPath::contour current;

  num_pts = pts.size();
  if (num_pts == 0)
    {
      return;
    }

  /* locate the element of the pattern and the distance
   * remaining in it at the start of the contour
   */
  pos = m_start_offset;
  for (unsigned int i = 0, endi = m_lengths.size(); i < endi && pos >= m_lengths[idx]; ++i)
    {
      pos -= m_lengths[idx];
      idx = (idx + 1) % m_lengths.size();
    }
  rem = t_max(0.0f, m_lengths[idx] - pos);
  on = started_on = (idx % 2 == 0);

  if (on)
    {
      add_point(&current, pts[0]);
    }

  num_edges = (C.m_closed) ? num_pts : num_pts - 1;
  for (unsigned int e = 0; e < num_edges; ++e)
    {
      const FlattenedPath::point &b(pts[(e + 1) % num_pts]);
      vec2 pa(pts[e].m_position), pb(b.m_position);
      float L, t(0.0f);

      L = (pb - pa).magnitude();
      while (L - t > rem)
        {
          vec2 p;

          t += rem;
          p = mix(pa, pb, t / L);
          add_point(&current, FlattenedPath::point(p, false, false));
          if (on)
            {
              dashes.push_back(FlattenedPath::contour());
              std::swap(dashes.back(), current);
            }
          on = !on;
          idx = (idx + 1) % m_lengths.size();
          rem = m_lengths[idx];
        }
      rem -= (L - t);

      if (on)
        {
          add_point(&current, b);
        }
    }

  if (on && !current.m_points.empty())
    {
      if (C.m_closed && started_on && dashes.empty())
        {
          /* the contour is never off */
          out->m_contours.push_back(C);
          return;
        }

      if (C.m_closed && started_on)
        {
          /* the last dash runs into the first one at
           * the start of the contour, join them.
           */
          for (const FlattenedPath::point &p : dashes.front().m_points)
            {
              add_point(&current, p);
            }
          std::swap(dashes.front(), current);
        }
      else
        {
          dashes.push_back(current);
        }
    }

  for (FlattenedPath::contour &D : dashes)
    {
      D.m_closed = false;
      out->m_contours.push_back(FlattenedPath::contour());
      std::swap(out->m_contours.back(), D);
    }
}

vellum::FlattenedPath
vellum::PathDashEffect::
apply(const FlattenedPath &path) const
{
  FlattenedPath return_value;

  if (solid())
    {
      return path;
    }

  for (const FlattenedPath::contour &C : path.m_contours)
    {
      dash_contour(C, &return_value);
    }
  return return_value;
}

vellum::FlattenedPath
vellum::PathDashEffect::
apply(const Path &path, const StrokeParams &params) const
{
  return apply(path.flatten(params.m_tolerance));
}
