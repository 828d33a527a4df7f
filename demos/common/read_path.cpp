#include <sstream>
#include <algorithm>
#include <vector>

#include "read_path.hpp"

namespace
{
  /* an outline is made of the points through which it
     passes; each point carries how to get to it from
     the previous point.
   */
  class edge
  {
  public:
    explicit
    edge(const vellum::vec2 &pt):
      m_pt(pt),
      m_is_arc(false),
      m_angle(0.0f)
    {}

    vellum::vec2 m_pt;
    std::vector<vellum::vec2> m_control_pts;
    bool m_is_arc;
    float m_angle;
  };

  class outline
  {
  public:
    explicit
    outline(bool closed):
      m_pending_arc(false),
      m_pending_angle(0.0f),
      m_is_closed(closed)
    {}

    std::vector<edge> m_edges;
    std::vector<vellum::vec2> m_pending_controls;
    bool m_pending_arc;
    float m_pending_angle;
    bool m_is_closed;
  };

  void
  add_outline(vellum::Path &path, const outline &O)
  {
    if (O.m_edges.empty())
      {
        return;
      }

    path << vellum::Path::contour_start(O.m_edges[0].m_pt);
    for (unsigned int i = 1; i < O.m_edges.size(); ++i)
      {
        const edge &E(O.m_edges[i]);

        if (E.m_is_arc)
          {
            path << vellum::Path::arc_degrees(E.m_angle, E.m_pt);
          }
        else
          {
            for (const vellum::vec2 &c : E.m_control_pts)
              {
                path << vellum::Path::control_point(c);
              }
            path << E.m_pt;
          }
      }

    if (O.m_is_closed)
      {
        path << vellum::Path::contour_close();
      }
  }
}

void
read_path(vellum::Path &path, const std::string &source)
{
  std::string filtered(source);

  std::replace(filtered.begin(), filtered.end(), '(', ' ');
  std::replace(filtered.begin(), filtered.end(), ')', ' ');
  std::replace(filtered.begin(), filtered.end(), ',', ' ');
  std::istringstream istr(filtered);

  std::vector<outline> data;
  bool adding_control_pts(false), arc_next(false), in_outline(false);
  float current_value[2];
  int current_slot(0);
  std::string token;

  while (istr >> token)
    {
      if (token == "]" || token == "}")
        {
          in_outline = false;
        }
      else if (token == "[" || token == "{")
        {
          in_outline = true;
          adding_control_pts = false;
          arc_next = false;
          current_slot = 0;
          data.push_back(outline(token == "["));
        }
      else if (token == "[[")
        {
          adding_control_pts = true;
        }
      else if (token == "]]")
        {
          adding_control_pts = false;
        }
      else if (token == "arc")
        {
          arc_next = true;
        }
      else if (in_outline)
        {
          /* not a marker, so it should be a number */
          float number;
          std::istringstream token_istr(token);

          if (!(token_istr >> number))
            {
              continue;
            }

          outline &O(data.back());
          if (arc_next && current_slot == 0 && !O.m_pending_arc)
            {
              O.m_pending_arc = true;
              O.m_pending_angle = number;
              arc_next = false;
              continue;
            }

          current_value[current_slot] = number;
          if (current_slot == 0)
            {
              current_slot = 1;
              continue;
            }

          vellum::vec2 pt(current_value[0], current_value[1]);
          current_slot = 0;
          if (adding_control_pts)
            {
              O.m_pending_controls.push_back(pt);
            }
          else
            {
              O.m_edges.push_back(edge(pt));
              O.m_edges.back().m_control_pts.swap(O.m_pending_controls);
              O.m_edges.back().m_is_arc = O.m_pending_arc;
              O.m_edges.back().m_angle = O.m_pending_angle;
              O.m_pending_arc = false;
            }
        }
    }

  for (const outline &O : data)
    {
      add_outline(path, O);
    }
}
