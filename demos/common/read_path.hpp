#pragma once

#include <string>
#include <vellum/path.hpp>

/* Read path data from an std::string and append that
   data to path. The format of the input is:

   [ marks the start of a closed outline
   ] marks the end of a closed outline
   { marks the start of an open outline
   } marks the end of an open outline
   [[ marks the start of a sequence of control points
   ]] marks the end of a sequence of control points
   arc marks an arc edge, the next value is the angle in degrees
   value0 value1 marks a coordinate (control point or edge point)

   Parentheses and commas are treated as white space.
 */
void
read_path(vellum::Path &path, const std::string &source);
