/*!
 * \file path_stroker.cpp
 * \brief file path_stroker.cpp
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

#include <vector>
#include <vellum/path_stroker.hpp>
#include "private/util_private.hpp"
#include "private/path_util_private.hpp"

namespace
{
  typedef vellum::FlattenedPath::point point;

  vellum::vec2
  left_normal(const vellum::vec2 &d)
  {
    return vellum::vec2(-d.y(), d.x());
  }

  vellum::vec2
  direction(const vellum::vec2 &from, const vellum::vec2 &to)
  {
    return (to - from).unit_vector(1e-12f);
  }

  /* Builds the outline polygons of a stroke, one side
   * of a contour at a time. The side built is always the
   * left side of the direction of travel; the right side
   * is the left side of the reversed contour.
   */
  class OutlineBuilder
  {
  public:
    OutlineBuilder(float half_width, float tolerance,
                   enum vellum::PathEnums::cap_style cap,
                   const vellum::Joiner &joiner):
      m_half_width(half_width),
      m_tolerance(tolerance),
      m_cap(cap),
      m_joiner(joiner)
    {}

    void
    half_stroke(const std::vector<point> &pts, bool closed);

    void
    add_cap(const vellum::vec2 &p, const vellum::vec2 &d);

    void
    add_dot(const vellum::vec2 &p);

    void
    emit(vellum::Path *dst);

  private:
    void
    add(const vellum::vec2 &p);

    void
    add_arc(const vellum::vec2 &center, float start_angle,
            float sweep, const vellum::vec2 &end);

    void
    add_join(const point &P, const vellum::vec2 &din,
             const vellum::vec2 &dout);

    float m_half_width, m_tolerance;
    enum vellum::PathEnums::cap_style m_cap;
    vellum::Joiner m_joiner;
    std::vector<vellum::vec2> m_pts;
  };
}

////////////////////////////////////
// OutlineBuilder methods
void
OutlineBuilder::
add(const vellum::vec2 &p)
{
  if (m_pts.empty() || (m_pts.back() - p).magnitudeSq() > 1e-12f)
    {
      m_pts.push_back(p);
    }
}

void
OutlineBuilder::
add_arc(const vellum::vec2 &center, float start_angle,
        float sweep, const vellum::vec2 &end)
{
  unsigned int cnt;

  cnt = vellum::detail::number_segments_for_arc(m_half_width, sweep, m_tolerance);
  for (unsigned int i = 1; i < cnt; ++i)
    {
      float theta;

      theta = start_angle + sweep * static_cast<float>(i) / static_cast<float>(cnt);
      add(center + m_half_width * vellum::vec2(vellum::t_cos(theta), vellum::t_sin(theta)));
    }
  add(end);
}

void
OutlineBuilder::
add_join(const point &P, const vellum::vec2 &din, const vellum::vec2 &dout)
{
  vellum::vec2 p(P.m_position), nin, nout, a, b;
  float turn, along;
  enum vellum::PathEnums::join_style tp;

  nin = left_normal(din);
  nout = left_normal(dout);
  a = p + m_half_width * nin;
  b = p + m_half_width * nout;
  turn = vellum::cross(din, dout);
  along = vellum::dot(din, dout);

  if (turn > 1e-6f)
    {
      /* turning left, the left side is the inside of the
       * corner; passing through the corner point keeps
       * the nonzero fill of the outline correct.
       */
      add(a);
      add(p);
      add(b);
      return;
    }

  if (turn > -1e-6f && along > 0.0f)
    {
      add(a);
      add(b);
      return;
    }

  tp = (P.m_corner) ? m_joiner.type() : vellum::PathEnums::round_join;
  if (tp == vellum::PathEnums::miter_join || tp == vellum::PathEnums::arcs_join)
    {
      float cos_half_angle;
      bool exceeds;

      /* the miter length is width / cos(theta / 2) where theta
       * is the angle between the normals of the two edges
       */
      cos_half_angle = vellum::t_sqrt(vellum::t_max(0.0f, 0.5f * (1.0f + vellum::dot(nin, nout))));
      exceeds = (cos_half_angle < 1e-4f)
        || (m_joiner.bounded() && 1.0f / cos_half_angle > m_joiner.limit());

      if (exceeds)
        {
          tp = m_joiner.gap();
        }
      else if (tp == vellum::PathEnums::arcs_join && P.m_curved)
        {
          tp = vellum::PathEnums::round_join;
        }
      else
        {
          vellum::vec2 tip;

          tip = p + (m_half_width / (1.0f + vellum::dot(nin, nout))) * (nin + nout);
          add(a);
          add(tip);
          add(b);
          return;
        }
    }

  switch (tp)
    {
    case vellum::PathEnums::round_join:
      add(a);
      add_arc(p, nin.atan(),
              vellum::t_atan2(vellum::cross(nin, nout), vellum::dot(nin, nout)),
              b);
      break;

    case vellum::PathEnums::bevel_join:
      add(a);
      add(b);
      break;

    default:
      VELLUMassert(!"Invalid join style");
      add(a);
      add(b);
    }
}

void
OutlineBuilder::
half_stroke(const std::vector<point> &pts, bool closed)
{
  unsigned int n(pts.size());

  if (closed)
    {
      for (unsigned int k = 0; k < n; ++k)
        {
          const point &prev(pts[(k + n - 1) % n]);
          const point &next(pts[(k + 1) % n]);

          add_join(pts[k],
                   direction(prev.m_position, pts[k].m_position),
                   direction(pts[k].m_position, next.m_position));
        }
      return;
    }

  vellum::vec2 d0, dl;

  d0 = direction(pts[0].m_position, pts[1].m_position);
  add(pts[0].m_position + m_half_width * left_normal(d0));
  for (unsigned int k = 1; k + 1 < n; ++k)
    {
      add_join(pts[k],
               direction(pts[k - 1].m_position, pts[k].m_position),
               direction(pts[k].m_position, pts[k + 1].m_position));
    }
  dl = direction(pts[n - 2].m_position, pts[n - 1].m_position);
  add(pts[n - 1].m_position + m_half_width * left_normal(dl));
}

void
OutlineBuilder::
add_cap(const vellum::vec2 &p, const vellum::vec2 &d)
{
  vellum::vec2 n, a, b;

  n = left_normal(d);
  a = p + m_half_width * n;
  b = p - m_half_width * n;
  switch (m_cap)
    {
    case vellum::PathEnums::butt_cap:
      add(a);
      add(b);
      break;

    case vellum::PathEnums::square_cap:
      add(a + m_half_width * d);
      add(b + m_half_width * d);
      break;

    case vellum::PathEnums::round_cap:
      add(a);
      add_arc(p, n.atan(), -VELLUM_PI, b);
      break;

    default:
      VELLUMassert(!"Invalid cap style");
      add(a);
      add(b);
    }
}

void
OutlineBuilder::
add_dot(const vellum::vec2 &p)
{
  vellum::vec2 e(m_half_width, 0.0f);

  /* a zero length contour only shows with round
   * and square caps, oriented along the x-axis.
   */
  switch (m_cap)
    {
    case vellum::PathEnums::round_cap:
      add(p + e);
      add_arc(p, 0.0f, 2.0f * VELLUM_PI, p + e);
      break;

    case vellum::PathEnums::square_cap:
      add(p + vellum::vec2(m_half_width, m_half_width));
      add(p + vellum::vec2(-m_half_width, m_half_width));
      add(p + vellum::vec2(-m_half_width, -m_half_width));
      add(p + vellum::vec2(m_half_width, -m_half_width));
      break;

    default:
      break;
    }
}

void
OutlineBuilder::
emit(vellum::Path *dst)
{
  if (m_pts.size() > 1 && (m_pts.back() - m_pts.front()).magnitudeSq() <= 1e-12f)
    {
      m_pts.pop_back();
    }

  if (m_pts.size() >= 3)
    {
      dst->move_to(m_pts[0]);
      for (unsigned int i = 1, endi = m_pts.size(); i < endi; ++i)
        {
          dst->line_to(m_pts[i]);
        }
      dst->close_contour();
    }
  m_pts.clear();
}

///////////////////////////////////
// vellum::PathStroker methods
vellum::PathStroker::
PathStroker(float width, enum PathEnums::cap_style cap,
            const Joiner &joiner, const StrokeParams &params):
  m_width(width),
  m_cap(cap),
  m_joiner(joiner),
  m_params(params)
{
  m_params.m_tolerance = t_max(m_params.m_tolerance, 1e-5f);
}

vellum::Path
vellum::PathStroker::
apply(const FlattenedPath &path) const
{
  Path return_value;

  if (!(m_width > 0.0f))
    {
      return return_value;
    }

  OutlineBuilder builder(0.5f * m_width, m_params.m_tolerance, m_cap, m_joiner);
  std::vector<point> pts;

  for (const FlattenedPath::contour &C : path.m_contours)
    {
      pts.clear();
      for (const point &P : C.m_points)
        {
          if (pts.empty() || (pts.back().m_position - P.m_position).magnitudeSq() > 1e-12f)
            {
              pts.push_back(P);
            }
        }
      if (C.m_closed && pts.size() > 1
          && (pts.back().m_position - pts.front().m_position).magnitudeSq() <= 1e-12f)
        {
          pts.pop_back();
        }

      if (pts.empty())
        {
          continue;
        }

      if (pts.size() == 1)
        {
          if (!C.m_closed)
            {
              builder.add_dot(pts[0].m_position);
              builder.emit(&return_value);
            }
          continue;
        }

      std::vector<point> reversed(pts.rbegin(), pts.rend());
      if (C.m_closed)
        {
          builder.half_stroke(pts, true);
          builder.emit(&return_value);
          builder.half_stroke(reversed, true);
          builder.emit(&return_value);
        }
      else
        {
          unsigned int n(pts.size());

          builder.half_stroke(pts, false);
          builder.add_cap(pts[n - 1].m_position,
                          direction(pts[n - 2].m_position, pts[n - 1].m_position));
          builder.half_stroke(reversed, false);
          builder.add_cap(pts[0].m_position,
                          direction(pts[1].m_position, pts[0].m_position));
          builder.emit(&return_value);
        }
    }

  return return_value;
}

vellum::Path
vellum::PathStroker::
apply(const Path &path) const
{
  return apply(path.flatten(m_params.m_tolerance));
}
