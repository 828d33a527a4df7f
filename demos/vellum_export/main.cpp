#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <vellum/util/util.hpp>
#include <vellum/units.hpp>
#include <vellum/canvas.hpp>
#include <vellum/text/font_config.hpp>

#include "generic_command_line.hpp"
#include "read_path.hpp"
#include "read_dash_pattern.hpp"

using namespace vellum;

namespace
{
  bool
  is_help_request(const std::string &v)
  {
    return v == "-help" || v == "--help";
  }

  uint8_t
  to_channel(float v)
  {
    return static_cast<uint8_t>(t_max(0.0f, t_min(1.0f, v)) * 255.0f + 0.5f);
  }
}

class vellum_export:vellum::noncopyable
{
public:
  vellum_export(void);

  int
  main(int argc, char **argv);

private:
  Path
  make_path(void);

  void
  set_draw_state(Canvas &canvas);

  void
  add_text(Canvas &canvas);

  void
  report(c_string label, const std::string &filename, enum return_code R);

  command_line_register m_register;

  command_separator m_demo_options;
  command_line_argument_value<std::string> m_output;
  command_line_argument_value<float> m_width;
  command_line_argument_value<float> m_height;
  command_line_argument_value<float> m_dpi;
  command_line_argument_value<bool> m_compress;

  command_separator m_path_options;
  command_line_argument_value<std::string> m_path;
  command_line_argument_value<std::string> m_path_file;
  command_line_argument_value<float> m_path_x;
  command_line_argument_value<float> m_path_y;

  command_separator m_style_options;
  command_line_argument_value<float> m_fill_red;
  command_line_argument_value<float> m_fill_green;
  command_line_argument_value<float> m_fill_blue;
  command_line_argument_value<float> m_fill_alpha;
  enumerated_command_line_argument_value<enum PathEnums::fill_rule_t> m_fill_rule;
  command_line_argument_value<float> m_stroke_red;
  command_line_argument_value<float> m_stroke_green;
  command_line_argument_value<float> m_stroke_blue;
  command_line_argument_value<float> m_stroke_alpha;
  command_line_argument_value<float> m_stroke_width;
  enumerated_command_line_argument_value<enum PathEnums::cap_style> m_cap;
  enumerated_command_line_argument_value<enum PathEnums::join_style> m_join;
  command_line_argument_value<float> m_miter_limit;
  command_line_argument_value<std::string> m_dash_pattern;
  command_line_argument_value<float> m_dash_offset;

  command_separator m_text_options;
  command_line_argument_value<std::string> m_text;
  command_line_argument_value<std::string> m_font_family;
  command_line_argument_value<std::string> m_font_style;
  command_line_argument_value<float> m_text_size;
  command_line_argument_value<float> m_text_x;
  command_line_argument_value<float> m_text_y;
  command_line_argument_value<float> m_text_rotation;
};

vellum_export::
vellum_export(void):
  m_demo_options("Output Options", m_register),
  m_output("output", "output", "base name of the written files, the extensions "
           ".svg, .pdf, .eps and .png are appended", m_register),
  m_width(100.0f, "width", "width of the canvas in millimetres", m_register),
  m_height(50.0f, "height", "height of the canvas in millimetres", m_register),
  m_dpi(96.0f, "dpi", "resolution of the raster output in pixels per inch", m_register),
  m_compress(true, "compress", "if true, compress the content stream of the PDF", m_register),
  m_path_options("Path Options", m_register),
  m_path("", "path", "path to draw in the format: [ and ] around a closed outline, "
         "{ and } around an open outline, [[ and ]] around control points, "
         "arc followed by an angle in degrees for an arc edge and pairs of "
         "numbers for points. If empty a star and a wave are drawn", m_register),
  m_path_file("", "path_file", "if non-empty, read the path to draw from the named file "
              "instead of the path option", m_register),
  m_path_x(0.0f, "path_x", "x-translation of the path in millimetres", m_register),
  m_path_y(0.0f, "path_y", "y-translation of the path in millimetres", m_register),
  m_style_options("Style Options", m_register),
  m_fill_red(0.2f, "fill_red", "red channel of the fill color, in [0, 1]", m_register),
  m_fill_green(0.4f, "fill_green", "green channel of the fill color, in [0, 1]", m_register),
  m_fill_blue(0.8f, "fill_blue", "blue channel of the fill color, in [0, 1]", m_register),
  m_fill_alpha(1.0f, "fill_alpha", "alpha channel of the fill color, in [0, 1]", m_register),
  m_fill_rule(PathEnums::nonzero_fill_rule, "fill_rule", "fill rule of the fill", m_register),
  m_stroke_red(0.0f, "stroke_red", "red channel of the stroke color, in [0, 1]", m_register),
  m_stroke_green(0.0f, "stroke_green", "green channel of the stroke color, in [0, 1]", m_register),
  m_stroke_blue(0.0f, "stroke_blue", "blue channel of the stroke color, in [0, 1]", m_register),
  m_stroke_alpha(1.0f, "stroke_alpha", "alpha channel of the stroke color, in [0, 1]", m_register),
  m_stroke_width(1.0f, "stroke_width", "stroke width in millimetres, 0 for no stroke", m_register),
  m_cap(PathEnums::butt_cap, "cap", "cap style of the stroke", m_register),
  m_join(PathEnums::miter_join, "join", "join style of the stroke", m_register),
  m_miter_limit(-1.0f, "miter_limit", "miter limit of miter and arcs joins, "
                "a negative value for an unbounded limit", m_register),
  m_dash_pattern("", "dash_pattern", "alternating draw and space lengths of the "
                 "dash pattern, empty for a solid stroke", m_register),
  m_dash_offset(0.0f, "dash_offset", "offset into the dash pattern", m_register),
  m_text_options("Text Options", m_register),
  m_text("", "text", "if non-empty, text to draw", m_register),
  m_font_family("sans-serif", "font_family", "family of the font, selected by fontconfig", m_register),
  m_font_style("", "font_style", "if non-empty, style of the font", m_register),
  m_text_size(8.0f, "text_size", "size of the text in millimetres", m_register),
  m_text_x(5.0f, "text_x", "x-coordinate of the origin of the text", m_register),
  m_text_y(5.0f, "text_y", "y-coordinate of the origin of the text", m_register),
  m_text_rotation(0.0f, "text_rotation", "counter-clockwise rotation of the text in degrees", m_register)
{
  m_fill_rule
    .add_entry("nonzero", PathEnums::nonzero_fill_rule, "fill where the winding number is not zero")
    .add_entry("even_odd", PathEnums::even_odd_fill_rule, "fill where the winding number is odd");

  m_cap
    .add_entry("butt", PathEnums::butt_cap, "no cap")
    .add_entry("round", PathEnums::round_cap, "half disc cap")
    .add_entry("square", PathEnums::square_cap, "half square cap");

  m_join
    .add_entry("miter", PathEnums::miter_join, "miter join, beveled past the miter limit")
    .add_entry("round", PathEnums::round_join, "round join")
    .add_entry("bevel", PathEnums::bevel_join, "bevel join")
    .add_entry("arcs", PathEnums::arcs_join, "miter join that is round on curves");
}

Path
vellum_export::
make_path(void)
{
  Path path;
  std::string source;

  if (!m_path_file.m_value.empty())
    {
      std::ifstream file(m_path_file.m_value.c_str());
      std::ostringstream str;

      if (!file)
        {
          std::cerr << "Unable to open path file \"" << m_path_file.m_value << "\"\n";
          return path;
        }
      str << file.rdbuf();
      source = str.str();
    }
  else
    {
      source = m_path.m_value;
    }

  if (!source.empty())
    {
      read_path(path, source);
      return path;
    }

  /* a five pointed star and a wave */
  for (int i = 0; i < 5; ++i)
    {
      float theta;

      theta = VELLUM_PI * (0.5f + 0.8f * static_cast<float>(i));
      path << vec2(25.0f, 25.0f) + 18.0f * vec2(t_cos(theta), t_sin(theta));
    }
  path << Path::contour_close()
       << Path::contour_start(55.0f, 25.0f)
       << Path::control_point(65.0f, 45.0f)
       << vec2(75.0f, 25.0f)
       << Path::control_point(85.0f, 5.0f)
       << vec2(95.0f, 25.0f);
  return path;
}

void
vellum_export::
set_draw_state(Canvas &canvas)
{
  Joiner joiner;
  float limit;

  limit = (m_miter_limit.m_value >= 0.0f) ? m_miter_limit.m_value : Joiner::unbounded();
  switch (m_join.m_value)
    {
    case PathEnums::miter_join:
      joiner = Joiner::miter(limit);
      break;
    case PathEnums::arcs_join:
      joiner = Joiner::arcs(limit);
      break;
    case PathEnums::round_join:
      joiner = Joiner::round();
      break;
    case PathEnums::bevel_join:
      joiner = Joiner::bevel();
      break;
    }

  std::vector<float> dashes;
  if (!read_dash_pattern(dashes, m_dash_pattern.m_value))
    {
      std::cerr << "Ignoring invalid dash pattern \"" << m_dash_pattern.m_value << "\"\n";
      dashes.clear();
    }

  canvas.set_fill_color(ColorRGBA(to_channel(m_fill_red.m_value),
                                  to_channel(m_fill_green.m_value),
                                  to_channel(m_fill_blue.m_value),
                                  to_channel(m_fill_alpha.m_value)));
  canvas.set_fill_rule(m_fill_rule.m_value);
  canvas.set_stroke_color(ColorRGBA(to_channel(m_stroke_red.m_value),
                                    to_channel(m_stroke_green.m_value),
                                    to_channel(m_stroke_blue.m_value),
                                    to_channel(m_stroke_alpha.m_value)));
  canvas.set_stroke_width(m_stroke_width.m_value);
  canvas.set_stroke_capper(m_cap.m_value);
  canvas.set_stroke_joiner(joiner);
  canvas.set_dashes(m_dash_offset.m_value, dashes);
}

void
vellum_export::
add_text(Canvas &canvas)
{
  reference_counted_ptr<Font> font;
  Text text;

  if (m_text.m_value.empty())
    {
      return;
    }

  font = select_font(m_font_family.m_value.c_str(),
                     m_font_style.m_value.empty() ? nullptr : m_font_style.m_value.c_str());
  if (!font)
    {
      std::cerr << "No font found for family \"" << m_font_family.m_value << "\"\n";
      return;
    }

  std::cout << "Using font " << font->family() << " " << font->style() << "\n";
  text.add_span(font, m_text_size.m_value, ColorRGBA::black(), m_text.m_value);
  canvas.draw_text(m_text_x.m_value, m_text_y.m_value, text, m_text_rotation.m_value);
}

void
vellum_export::
report(c_string label, const std::string &filename, enum return_code R)
{
  if (R == routine_success)
    {
      std::cout << "Wrote " << label << " to " << filename << "\n";
    }
  else
    {
      std::cerr << "Failed to write " << label << " to " << filename << "\n";
    }
}

int
vellum_export::
main(int argc, char **argv)
{
  if (argc == 2 && is_help_request(argv[1]))
    {
      std::cout << "Export a path and a text to SVG, PDF, EPS and a raster image."
                << "\n\nUsage: " << argv[0];
      m_register.print_help(std::cout);
      m_register.print_detailed_help(std::cout);
      return 0;
    }

  std::cout << "\n\nRunning: \"";
  for (int i = 0; i < argc; ++i)
    {
      std::cout << argv[i] << " ";
    }
  m_register.parse_command_line(argc, argv);
  std::cout << "\n\n" << std::flush;

  Canvas canvas(m_width.m_value, m_height.m_value);
  set_draw_state(canvas);
  canvas.draw_path(m_path_x.m_value, m_path_y.m_value, make_path());
  canvas.reset_draw_state();
  add_text(canvas);

  std::cout << "Canvas of " << canvas.number_layers() << " layers\n";

  const std::string &base(m_output.m_value);
  ImageRGBA image;
  int return_value(0);

  report("SVG", base + ".svg", canvas.save_svg((base + ".svg").c_str()));
  report("PDF", base + ".pdf",
         canvas.save_pdf((base + ".pdf").c_str(),
                         PDFWriter::Params().compress_streams(m_compress.m_value)));
  report("EPS", base + ".eps", canvas.save_eps((base + ".eps").c_str()));

  if (canvas.write_image(m_dpi.m_value * units::inch_per_mm, &image) == routine_success)
    {
      std::cout << "Rasterized to " << image.width() << "x" << image.height() << " pixels\n";
      report("image", base + ".png", image.write_png((base + ".png").c_str()));
    }
  else
    {
      std::cerr << "Failed to rasterize\n";
      return_value = -1;
    }

  return return_value;
}

int
main(int argc, char **argv)
{
  vellum_export P;
  return P.main(argc, argv);
}
