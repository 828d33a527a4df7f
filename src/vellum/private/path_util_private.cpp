/*!
 * \file path_util_private.cpp
 * \brief file path_util_private.cpp
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

#include <ostream>
#include <cstdio>
#include <cstring>
#include "path_util_private.hpp"

namespace
{
  const unsigned int max_flatten_segments = 4096u;

  unsigned int
  clamp_segment_count(float f)
  {
    if (!(f >= 1.0f))
      {
        return 1u;
      }
    if (f >= float(max_flatten_segments))
      {
        return max_flatten_segments;
      }
    return static_cast<unsigned int>(vellum::t_ceil(f));
  }
}

///////////////////////////////////////
// vellum::detail::ArcGeometry methods
bool
vellum::detail::ArcGeometry::
compute(const vec2 &start, const vec2 &end, float angle)
{
  vec2 end_start, mid, n;
  float angle_coeff_dir, s, c, t;

  end_start = end - start;
  if (t_abs(angle) < 1e-6f || end_start.magnitudeSq() <= 0.0f)
    {
      return false;
    }

  /* the center is on the perpindicular bisector of start
   * and end, i.e. center = mid + t * n where |t| is given
   * by tan(angle/2) = 0.5 * ||n|| / ||t * n||
   */
  angle_coeff_dir = (angle > 0.0f) ? 1.0f : -1.0f;
  mid = (start + end) * 0.5f;
  n = vec2(-end_start.y(), end_start.x());
  s = t_sin(t_abs(angle) * 0.5f);
  c = t_cos(t_abs(angle) * 0.5f);
  if (t_abs(s) < 1e-6f)
    {
      return false;
    }
  t = angle_coeff_dir * 0.5f * c / s;
  m_center = mid + t * n;

  vec2 start_center(start - m_center);
  m_radius = start_center.magnitude();
  m_start_angle = start_center.atan();
  m_angle = angle;
  return true;
}

void
vellum::detail::
arc_to_cubics(const vec2 &start, float angle, const vec2 &end,
              std::vector<CubicPiece> *out)
{
  ArcGeometry arc;

  if (!arc.compute(start, end, angle))
    {
      CubicPiece P;

      P.m_control0 = mix(start, end, 1.0f / 3.0f);
      P.m_control1 = mix(start, end, 2.0f / 3.0f);
      P.m_end = end;
      out->push_back(P);
      return;
    }

  unsigned int cnt;
  float da, k;

  cnt = clamp_segment_count(t_abs(angle) / (0.5f * VELLUM_PI) - 1e-4f);
  da = angle / static_cast<float>(cnt);
  k = (4.0f / 3.0f) * t_tan(da * 0.25f) * arc.m_radius;

  for (unsigned int i = 0; i < cnt; ++i)
    {
      float theta0, theta1;
      vec2 p0, p1, tangent0, tangent1;
      CubicPiece P;

      theta0 = arc.m_start_angle + da * static_cast<float>(i);
      theta1 = theta0 + da;
      p0 = (i == 0) ? start : arc.point_at(theta0);
      p1 = (i + 1 == cnt) ? end : arc.point_at(theta1);
      tangent0 = vec2(-t_sin(theta0), t_cos(theta0));
      tangent1 = vec2(-t_sin(theta1), t_cos(theta1));

      P.m_control0 = p0 + k * tangent0;
      P.m_control1 = p1 - k * tangent1;
      P.m_end = p1;
      out->push_back(P);
    }
}

unsigned int
vellum::detail::
number_segments_for_arc(float radius, float angle, float tolerance)
{
  float step;

  if (radius <= tolerance)
    {
      step = 0.5f * VELLUM_PI;
    }
  else
    {
      step = 2.0f * t_acos(1.0f - tolerance / radius);
    }
  step = t_max(step, 1e-4f);
  return clamp_segment_count(t_abs(angle) / step);
}

void
vellum::detail::
flatten_quadratic(const vec2 &p0, const vec2 &p1, const vec2 &p2,
                  float tolerance, std::vector<vec2> *out)
{
  /* the second derivative of a quadratic is constant,
   * 2 * (p0 - 2p1 + p2), and the error of approximating
   * with N uniform chords is bounded by |B''| / (8N^2).
   */
  float dd;
  unsigned int cnt;

  dd = (p0 - 2.0f * p1 + p2).magnitude();
  cnt = clamp_segment_count(t_sqrt(0.25f * dd / tolerance));
  for (unsigned int i = 1; i < cnt; ++i)
    {
      float t, s;

      t = static_cast<float>(i) / static_cast<float>(cnt);
      s = 1.0f - t;
      out->push_back(s * s * p0 + 2.0f * s * t * p1 + t * t * p2);
    }
  out->push_back(p2);
}

void
vellum::detail::
flatten_cubic(const vec2 &p0, const vec2 &p1, const vec2 &p2,
              const vec2 &p3, float tolerance, std::vector<vec2> *out)
{
  float dd;
  unsigned int cnt;

  dd = t_max((p0 - 2.0f * p1 + p2).magnitude(),
             (p1 - 2.0f * p2 + p3).magnitude());
  cnt = clamp_segment_count(t_sqrt(0.75f * dd / tolerance));
  for (unsigned int i = 1; i < cnt; ++i)
    {
      float t, s;

      t = static_cast<float>(i) / static_cast<float>(cnt);
      s = 1.0f - t;
      out->push_back(s * s * s * p0
                     + 3.0f * s * s * t * p1
                     + 3.0f * s * t * t * p2
                     + t * t * t * p3);
    }
  out->push_back(p3);
}

void
vellum::detail::
flatten_arc(const vec2 &start, float angle, const vec2 &end,
            float tolerance, std::vector<vec2> *out)
{
  ArcGeometry arc;

  if (!arc.compute(start, end, angle))
    {
      out->push_back(end);
      return;
    }

  unsigned int cnt;
  cnt = number_segments_for_arc(arc.m_radius, angle, tolerance);
  for (unsigned int i = 1; i < cnt; ++i)
    {
      float theta;

      theta = arc.m_start_angle + angle * static_cast<float>(i) / static_cast<float>(cnt);
      out->push_back(arc.point_at(theta));
    }
  out->push_back(end);
}

void
vellum::detail::
write_number(std::ostream &str, float v)
{
  char buffer[64];
  int len;

  if (t_abs(v) < 0.5e-5f)
    {
      str << '0';
      return;
    }

  len = std::snprintf(buffer, sizeof(buffer), "%.5f", static_cast<double>(v));
  if (len <= 0 || len >= static_cast<int>(sizeof(buffer)))
    {
      str << '0';
      return;
    }

  /* strip trailing zeros and a trailing decimal point */
  if (std::strchr(buffer, '.'))
    {
      while (len > 0 && buffer[len - 1] == '0')
        {
          buffer[--len] = 0;
        }
      if (len > 0 && buffer[len - 1] == '.')
        {
          buffer[--len] = 0;
        }
    }

  if (std::strcmp(buffer, "-0") == 0)
    {
      str << '0';
    }
  else
    {
      str << buffer;
    }
}

void
vellum::detail::
write_point(std::ostream &str, const vec2 &p)
{
  write_number(str, p.x());
  str << ' ';
  write_number(str, p.y());
}
