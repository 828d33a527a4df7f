/*!
 * \file path.cpp
 * \brief file path.cpp
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
#include <sstream>
#include <utility>
#include <vellum/path.hpp>
#include <vellum/util/vellum_memory.hpp>
#include "private/util_private.hpp"
#include "private/path_util_private.hpp"

namespace
{
  class PathPrivate
  {
  public:
    PathPrivate(void):
      m_contour_open(false),
      m_start(0.0f, 0.0f),
      m_current(0.0f, 0.0f)
    {}

    /* start a contour at the current point if no contour is open */
    void
    ensure_contour(void);

    void
    add_edge(enum vellum::PathEnums::segment_type_t tp,
             const vellum::vec2 &c0, const vellum::vec2 &c1,
             const vellum::vec2 &end, float angle);

    std::vector<vellum::Path::Segment> m_segments;
    std::vector<vellum::vec2> m_pending_controls;
    bool m_contour_open;
    vellum::vec2 m_start, m_current;
  };

  /* Tracks the flags of the polyline of one contour as edges
   * are appended to it.
   */
  class ContourFlattener
  {
  public:
    explicit
    ContourFlattener(vellum::FlattenedPath *dst):
      m_dst(dst),
      m_active(false)
    {}

    void
    start(const vellum::vec2 &pt);

    void
    add_line(const vellum::vec2 &pt);

    void
    add_curve(const std::vector<vellum::vec2> &pts);

    void
    close(void);

    void
    finish(void);

  private:
    void
    add_point(const vellum::vec2 &pt, bool corner, bool curved);

    vellum::FlattenedPath *m_dst;
    vellum::FlattenedPath::contour m_contour;
    bool m_active;
  };

  bool
  is_similarity(const vellum::float2x2 &m)
  {
    float len0, len1, d, scale;

    len0 = m(0, 0) * m(0, 0) + m(1, 0) * m(1, 0);
    len1 = m(0, 1) * m(0, 1) + m(1, 1) * m(1, 1);
    d = m(0, 0) * m(0, 1) + m(1, 0) * m(1, 1);
    scale = vellum::t_max(len0, len1);

    return scale > 0.0f
      && vellum::t_abs(len0 - len1) <= 1e-5f * scale
      && vellum::t_abs(d) <= 1e-5f * scale;
  }

  bool
  close_enough(const vellum::vec2 &a, const vellum::vec2 &b, float tol)
  {
    return vellum::t_abs(a.x() - b.x()) <= tol
      && vellum::t_abs(a.y() - b.y()) <= tol;
  }

  vellum::vec2
  quadratic_control(const vellum::vec2 &p0, const vellum::vec2 &c, float t)
  {
    return p0 + t * (c - p0);
  }
}

////////////////////////////////////
// PathPrivate methods
void
PathPrivate::
ensure_contour(void)
{
  if (!m_contour_open)
    {
      vellum::Path::Segment S;

      S.m_type = vellum::PathEnums::move_segment;
      S.m_end = m_current;
      m_segments.push_back(S);
      m_start = m_current;
      m_contour_open = true;
    }
}

void
PathPrivate::
add_edge(enum vellum::PathEnums::segment_type_t tp,
         const vellum::vec2 &c0, const vellum::vec2 &c1,
         const vellum::vec2 &end, float angle)
{
  vellum::Path::Segment S;

  ensure_contour();
  S.m_type = tp;
  if (tp == vellum::PathEnums::quadratic_segment
      || tp == vellum::PathEnums::cubic_segment)
    {
      S.m_control0 = c0;
    }
  if (tp == vellum::PathEnums::cubic_segment)
    {
      S.m_control1 = c1;
    }
  if (tp == vellum::PathEnums::arc_segment)
    {
      S.m_angle = angle;
    }
  S.m_end = end;
  m_segments.push_back(S);
  m_current = end;
  m_pending_controls.clear();
}

////////////////////////////////////
// ContourFlattener methods
void
ContourFlattener::
start(const vellum::vec2 &pt)
{
  finish();
  m_active = true;
  m_contour.m_points.push_back(vellum::FlattenedPath::point(pt, true, false));
}

void
ContourFlattener::
add_point(const vellum::vec2 &pt, bool corner, bool curved)
{
  VELLUMassert(m_active && !m_contour.m_points.empty());

  vellum::FlattenedPath::point &last(m_contour.m_points.back());
  if ((last.m_position - pt).magnitudeSq() <= 1e-12f)
    {
      last.m_corner = last.m_corner || corner;
      last.m_curved = last.m_curved || curved;
    }
  else
    {
      m_contour.m_points.push_back(vellum::FlattenedPath::point(pt, corner, curved));
    }
}

void
ContourFlattener::
add_line(const vellum::vec2 &pt)
{
  add_point(pt, true, false);
}

void
ContourFlattener::
add_curve(const std::vector<vellum::vec2> &pts)
{
  VELLUMassert(!pts.empty());

  /* the join at the start of the curve involves a curved edge */
  m_contour.m_points.back().m_curved = true;
  for (unsigned int i = 0, endi = pts.size(); i + 1 < endi; ++i)
    {
      add_point(pts[i], false, false);
    }
  add_point(pts.back(), true, true);
}

void
ContourFlattener::
close(void)
{
  std::vector<vellum::FlattenedPath::point> &pts(m_contour.m_points);

  m_contour.m_closed = true;
  if (pts.size() > 1
      && (pts.back().m_position - pts.front().m_position).magnitudeSq() <= 1e-12f)
    {
      pts.front().m_curved = pts.front().m_curved || pts.back().m_curved;
      pts.pop_back();
    }
  finish();
}

void
ContourFlattener::
finish(void)
{
  if (m_active)
    {
      m_dst->m_contours.push_back(vellum::FlattenedPath::contour());
      std::swap(m_dst->m_contours.back(), m_contour);
      m_contour = vellum::FlattenedPath::contour();
      m_active = false;
    }
}

////////////////////////////////////
// vellum::Path methods
vellum::Path::
Path(void)
{
  m_d = VELLUMnew PathPrivate();
}

vellum::Path::
Path(const Path &obj)
{
  const PathPrivate *obj_d;

  obj_d = static_cast<const PathPrivate*>(obj.m_d);
  m_d = VELLUMnew PathPrivate(*obj_d);
}

vellum::Path::
~Path()
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  VELLUMdelete(d);
  m_d = nullptr;
}

vellum::Path&
vellum::Path::
operator=(const Path &rhs)
{
  if (this != &rhs)
    {
      Path v(rhs);
      swap(v);
    }
  return *this;
}

void
vellum::Path::
swap(Path &obj)
{
  std::swap(m_d, obj.m_d);
}

void
vellum::Path::
clear(void)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  *d = PathPrivate();
}

vellum::Path&
vellum::Path::
operator<<(const vec2 &pt)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  switch (d->m_pending_controls.size())
    {
    case 0:
      if (!d->m_contour_open)
        {
          move_to(pt);
        }
      else
        {
          line_to(pt);
        }
      break;

    case 1:
      quadratic_to(d->m_pending_controls[0], pt);
      break;

    default:
      VELLUMwarn_assert(d->m_pending_controls.size() == 2);
      cubic_to(d->m_pending_controls[0], d->m_pending_controls[1], pt);
      break;
    }
  return *this;
}

vellum::Path&
vellum::Path::
operator<<(const control_point &pt)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  d->m_pending_controls.push_back(pt.m_location);
  return *this;
}

vellum::Path&
vellum::Path::
operator<<(const arc &a)
{
  return arc_to(a.m_angle, a.m_pt);
}

vellum::Path&
vellum::Path::
operator<<(contour_close)
{
  return close_contour();
}

vellum::Path&
vellum::Path::
move_to(const vec2 &pt)
{
  PathPrivate *d;
  Segment S;

  d = static_cast<PathPrivate*>(m_d);
  S.m_type = PathEnums::move_segment;
  S.m_end = pt;

  /* consecutive moves collapse into one */
  if (d->m_contour_open
      && !d->m_segments.empty()
      && d->m_segments.back().m_type == PathEnums::move_segment)
    {
      d->m_segments.back() = S;
    }
  else
    {
      d->m_segments.push_back(S);
    }

  d->m_start = d->m_current = pt;
  d->m_contour_open = true;
  d->m_pending_controls.clear();
  return *this;
}

vellum::Path&
vellum::Path::
line_to(const vec2 &pt)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  d->add_edge(PathEnums::line_segment, pt, pt, pt, 0.0f);
  return *this;
}

vellum::Path&
vellum::Path::
quadratic_to(const vec2 &ct, const vec2 &pt)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  d->add_edge(PathEnums::quadratic_segment, ct, ct, pt, 0.0f);
  return *this;
}

vellum::Path&
vellum::Path::
cubic_to(const vec2 &ct1, const vec2 &ct2, const vec2 &pt)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  d->add_edge(PathEnums::cubic_segment, ct1, ct2, pt, 0.0f);
  return *this;
}

vellum::Path&
vellum::Path::
arc_to(float angle, const vec2 &pt)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  d->add_edge(PathEnums::arc_segment, pt, pt, pt, angle);
  return *this;
}

vellum::Path&
vellum::Path::
close_contour(void)
{
  PathPrivate *d;

  d = static_cast<PathPrivate*>(m_d);
  if (d->m_contour_open)
    {
      Segment S;

      S.m_type = PathEnums::close_segment;
      S.m_end = d->m_start;
      d->m_segments.push_back(S);
      d->m_current = d->m_start;
      d->m_contour_open = false;
    }
  d->m_pending_controls.clear();
  return *this;
}

vellum::Path&
vellum::Path::
add_path(const Path &path)
{
  c_array<const Segment> segs(path.segments());

  for (const Segment &S : segs)
    {
      switch (S.m_type)
        {
        case PathEnums::move_segment:
          move_to(S.m_end);
          break;
        case PathEnums::line_segment:
          line_to(S.m_end);
          break;
        case PathEnums::quadratic_segment:
          quadratic_to(S.m_control0, S.m_end);
          break;
        case PathEnums::cubic_segment:
          cubic_to(S.m_control0, S.m_control1, S.m_end);
          break;
        case PathEnums::arc_segment:
          arc_to(S.m_angle, S.m_end);
          break;
        case PathEnums::close_segment:
          close_contour();
          break;
        }
    }
  return *this;
}

vellum::c_array<const vellum::Path::Segment>
vellum::Path::
segments(void) const
{
  const PathPrivate *d;

  d = static_cast<const PathPrivate*>(m_d);
  return make_c_array(d->m_segments);
}

unsigned int
vellum::Path::
number_contours(void) const
{
  const PathPrivate *d;
  unsigned int return_value(0);

  d = static_cast<const PathPrivate*>(m_d);
  for (const Segment &S : d->m_segments)
    {
      if (S.m_type == PathEnums::move_segment)
        {
          ++return_value;
        }
    }
  return return_value;
}

bool
vellum::Path::
empty(void) const
{
  const PathPrivate *d;

  d = static_cast<const PathPrivate*>(m_d);
  for (const Segment &S : d->m_segments)
    {
      if (S.m_type != PathEnums::move_segment
          && S.m_type != PathEnums::close_segment)
        {
          return false;
        }
    }
  return true;
}

bool
vellum::Path::
last_contour_closed(void) const
{
  const PathPrivate *d;

  d = static_cast<const PathPrivate*>(m_d);
  return !d->m_segments.empty()
    && d->m_segments.back().m_type == PathEnums::close_segment;
}

vellum::Path
vellum::Path::
translate(float x, float y) const
{
  return transform(float2x2(), vec2(x, y));
}

vellum::Path
vellum::Path::
scale(float sx, float sy) const
{
  return transform(scale_matrix(sx, sy));
}

vellum::Path
vellum::Path::
rotate(float degrees, const vec2 &center) const
{
  float2x2 m;

  m = rotation_matrix(degrees_to_radians(degrees));
  return transform(m, center - m * center);
}

vellum::Path
vellum::Path::
transform(const float2x2 &m, const vec2 &t) const
{
  const PathPrivate *d;
  Path return_value;
  bool keep_arcs;
  float angle_sign;

  d = static_cast<const PathPrivate*>(m_d);
  keep_arcs = is_similarity(m);
  angle_sign = (determinant(m) < 0.0f) ? -1.0f : 1.0f;

  vec2 prev(0.0f, 0.0f);
  for (const Segment &S : d->m_segments)
    {
      switch (S.m_type)
        {
        case PathEnums::move_segment:
          return_value.move_to(m * S.m_end + t);
          break;

        case PathEnums::line_segment:
          return_value.line_to(m * S.m_end + t);
          break;

        case PathEnums::quadratic_segment:
          return_value.quadratic_to(m * S.m_control0 + t, m * S.m_end + t);
          break;

        case PathEnums::cubic_segment:
          return_value.cubic_to(m * S.m_control0 + t,
                                m * S.m_control1 + t,
                                m * S.m_end + t);
          break;

        case PathEnums::arc_segment:
          if (keep_arcs)
            {
              return_value.arc_to(angle_sign * S.m_angle, m * S.m_end + t);
            }
          else
            {
              std::vector<detail::CubicPiece> pieces;

              detail::arc_to_cubics(prev, S.m_angle, S.m_end, &pieces);
              for (const detail::CubicPiece &P : pieces)
                {
                  return_value.cubic_to(m * P.m_control0 + t,
                                        m * P.m_control1 + t,
                                        m * P.m_end + t);
                }
            }
          break;

        case PathEnums::close_segment:
          return_value.close_contour();
          break;
        }
      prev = S.m_end;
    }
  return return_value;
}

vellum::FlattenedPath
vellum::Path::
flatten(float tolerance) const
{
  const PathPrivate *d;
  FlattenedPath return_value;
  ContourFlattener F(&return_value);
  std::vector<vec2> pts;
  vec2 prev(0.0f, 0.0f);

  d = static_cast<const PathPrivate*>(m_d);
  tolerance = t_max(tolerance, 1e-5f);
  for (const Segment &S : d->m_segments)
    {
      pts.clear();
      switch (S.m_type)
        {
        case PathEnums::move_segment:
          F.start(S.m_end);
          break;

        case PathEnums::line_segment:
          F.add_line(S.m_end);
          break;

        case PathEnums::quadratic_segment:
          detail::flatten_quadratic(prev, S.m_control0, S.m_end, tolerance, &pts);
          F.add_curve(pts);
          break;

        case PathEnums::cubic_segment:
          detail::flatten_cubic(prev, S.m_control0, S.m_control1, S.m_end, tolerance, &pts);
          F.add_curve(pts);
          break;

        case PathEnums::arc_segment:
          detail::flatten_arc(prev, S.m_angle, S.m_end, tolerance, &pts);
          F.add_curve(pts);
          break;

        case PathEnums::close_segment:
          F.add_line(S.m_end);
          F.close();
          break;
        }
      prev = S.m_end;
    }
  F.finish();

  return return_value;
}

bool
vellum::Path::
operator==(const Path &rhs) const
{
  const PathPrivate *d, *rhs_d;

  d = static_cast<const PathPrivate*>(m_d);
  rhs_d = static_cast<const PathPrivate*>(rhs.m_d);
  return d->m_segments == rhs_d->m_segments;
}

bool
vellum::Path::
approximately_equal(const Path &rhs, float tolerance) const
{
  const PathPrivate *d, *rhs_d;

  d = static_cast<const PathPrivate*>(m_d);
  rhs_d = static_cast<const PathPrivate*>(rhs.m_d);
  if (d->m_segments.size() != rhs_d->m_segments.size())
    {
      return false;
    }

  for (unsigned int i = 0, endi = d->m_segments.size(); i < endi; ++i)
    {
      const Segment &a(d->m_segments[i]);
      const Segment &b(rhs_d->m_segments[i]);

      if (a.m_type != b.m_type
          || !close_enough(a.m_end, b.m_end, tolerance)
          || !close_enough(a.m_control0, b.m_control0, tolerance)
          || !close_enough(a.m_control1, b.m_control1, tolerance)
          || t_abs(a.m_angle - b.m_angle) > tolerance)
        {
          return false;
        }
    }
  return true;
}

std::string
vellum::Path::
to_svg(void) const
{
  const PathPrivate *d;
  std::ostringstream str;
  vec2 prev(0.0f, 0.0f);

  d = static_cast<const PathPrivate*>(m_d);
  if (empty())
    {
      return std::string();
    }

  for (const Segment &S : d->m_segments)
    {
      switch (S.m_type)
        {
        case PathEnums::move_segment:
          str << "M";
          detail::write_point(str, S.m_end);
          break;

        case PathEnums::line_segment:
          str << "L";
          detail::write_point(str, S.m_end);
          break;

        case PathEnums::quadratic_segment:
          str << "Q";
          detail::write_point(str, S.m_control0);
          str << " ";
          detail::write_point(str, S.m_end);
          break;

        case PathEnums::cubic_segment:
          str << "C";
          detail::write_point(str, S.m_control0);
          str << " ";
          detail::write_point(str, S.m_control1);
          str << " ";
          detail::write_point(str, S.m_end);
          break;

        case PathEnums::arc_segment:
          {
            detail::ArcGeometry arc;

            if (!arc.compute(prev, S.m_end, S.m_angle))
              {
                str << "L";
                detail::write_point(str, S.m_end);
              }
            else
              {
                unsigned int cnt;
                float da;

                /* arcs of more than half a turn are split so that
                 * the large-arc flag is always zero
                 */
                cnt = 1u;
                while (t_abs(S.m_angle) / static_cast<float>(cnt) > VELLUM_PI + 1e-5f)
                  {
                    ++cnt;
                  }
                da = S.m_angle / static_cast<float>(cnt);
                for (unsigned int i = 1; i <= cnt; ++i)
                  {
                    vec2 pt;

                    pt = (i == cnt) ? S.m_end : arc.point_at(arc.m_start_angle + da * static_cast<float>(i));
                    str << "A";
                    detail::write_number(str, arc.m_radius);
                    str << " ";
                    detail::write_number(str, arc.m_radius);
                    str << " 0 0 " << ((S.m_angle > 0.0f) ? 1 : 0) << " ";
                    detail::write_point(str, pt);
                  }
              }
          }
          break;

        case PathEnums::close_segment:
          str << "Z";
          break;
        }
      prev = S.m_end;
    }
  return str.str();
}

std::string
vellum::Path::
to_pdf(void) const
{
  const PathPrivate *d;
  std::ostringstream str;
  vec2 prev(0.0f, 0.0f);
  bool first(true);

  d = static_cast<const PathPrivate*>(m_d);
  if (empty())
    {
      return std::string();
    }

  for (const Segment &S : d->m_segments)
    {
      if (!first)
        {
          str << " ";
        }
      first = false;

      switch (S.m_type)
        {
        case PathEnums::move_segment:
          detail::write_point(str, S.m_end);
          str << " m";
          break;

        case PathEnums::line_segment:
          detail::write_point(str, S.m_end);
          str << " l";
          break;

        case PathEnums::quadratic_segment:
          detail::write_point(str, quadratic_control(prev, S.m_control0, 2.0f / 3.0f));
          str << " ";
          detail::write_point(str, quadratic_control(S.m_end, S.m_control0, 2.0f / 3.0f));
          str << " ";
          detail::write_point(str, S.m_end);
          str << " c";
          break;

        case PathEnums::cubic_segment:
          detail::write_point(str, S.m_control0);
          str << " ";
          detail::write_point(str, S.m_control1);
          str << " ";
          detail::write_point(str, S.m_end);
          str << " c";
          break;

        case PathEnums::arc_segment:
          {
            std::vector<detail::CubicPiece> pieces;

            detail::arc_to_cubics(prev, S.m_angle, S.m_end, &pieces);
            for (unsigned int i = 0, endi = pieces.size(); i < endi; ++i)
              {
                if (i != 0)
                  {
                    str << " ";
                  }
                detail::write_point(str, pieces[i].m_control0);
                str << " ";
                detail::write_point(str, pieces[i].m_control1);
                str << " ";
                detail::write_point(str, pieces[i].m_end);
                str << " c";
              }
          }
          break;

        case PathEnums::close_segment:
          str << "h";
          break;
        }
      prev = S.m_end;
    }
  return str.str();
}

std::string
vellum::Path::
to_ps(void) const
{
  const PathPrivate *d;
  std::ostringstream str;
  vec2 prev(0.0f, 0.0f);
  bool first(true);

  d = static_cast<const PathPrivate*>(m_d);
  if (empty())
    {
      return std::string();
    }

  for (const Segment &S : d->m_segments)
    {
      if (!first)
        {
          str << " ";
        }
      first = false;

      switch (S.m_type)
        {
        case PathEnums::move_segment:
          detail::write_point(str, S.m_end);
          str << " moveto";
          break;

        case PathEnums::line_segment:
          detail::write_point(str, S.m_end);
          str << " lineto";
          break;

        case PathEnums::quadratic_segment:
          detail::write_point(str, quadratic_control(prev, S.m_control0, 2.0f / 3.0f));
          str << " ";
          detail::write_point(str, quadratic_control(S.m_end, S.m_control0, 2.0f / 3.0f));
          str << " ";
          detail::write_point(str, S.m_end);
          str << " curveto";
          break;

        case PathEnums::cubic_segment:
          detail::write_point(str, S.m_control0);
          str << " ";
          detail::write_point(str, S.m_control1);
          str << " ";
          detail::write_point(str, S.m_end);
          str << " curveto";
          break;

        case PathEnums::arc_segment:
          {
            detail::ArcGeometry arc;

            if (!arc.compute(prev, S.m_end, S.m_angle))
              {
                detail::write_point(str, S.m_end);
                str << " lineto";
              }
            else
              {
                const float to_degrees(180.0f / VELLUM_PI);

                detail::write_point(str, arc.m_center);
                str << " ";
                detail::write_number(str, arc.m_radius);
                str << " ";
                detail::write_number(str, arc.m_start_angle * to_degrees);
                str << " ";
                detail::write_number(str, (arc.m_start_angle + S.m_angle) * to_degrees);
                str << ((S.m_angle > 0.0f) ? " arc" : " arcn");
              }
          }
          break;

        case PathEnums::close_segment:
          str << "closepath";
          break;
        }
      prev = S.m_end;
    }
  return str.str();
}
