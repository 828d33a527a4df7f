#pragma once

#include <string>
#include <vector>

/* Read a dash pattern of alternating on and off lengths
   separated by white space or commas, as the value of an
   SVG stroke-dasharray. Returns false if an entry is not
   a non-negative number, in which case pattern_out holds
   the entries before it.
 */
bool
read_dash_pattern(std::vector<float> &pattern_out,
                  const std::string &source);
