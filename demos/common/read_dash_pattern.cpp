#include <algorithm>
#include <sstream>
#include "read_dash_pattern.hpp"

bool
read_dash_pattern(std::vector<float> &pattern_out,
                  const std::string &source)
{
  std::string filtered(source);
  float v;

  std::replace(filtered.begin(), filtered.end(), ',', ' ');
  std::istringstream input_stream(filtered);

  pattern_out.clear();
  while (input_stream >> v)
    {
      if (v < 0.0f)
        {
          return false;
        }
      pattern_out.push_back(v);
    }
  return input_stream.eof();
}
