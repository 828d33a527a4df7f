/*!
 * \file pdf_writer.cpp
 * \brief file pdf_writer.cpp
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

#include <zlib.h>

#include <map>
#include <vector>
#include <sstream>
#include <ostream>
#include <cstdio>
#include <vellum/backend/pdf_writer.hpp>
#include <vellum/units.hpp>
#include <vellum/util/vellum_memory.hpp>
#include "../private/util_private.hpp"
#include "../private/path_util_private.hpp"

namespace
{
  class PDFPageWriterPrivate
  {
  public:
    PDFPageWriterPrivate(void):
      m_fill_alpha(255),
      m_stroke_alpha(255)
    {}

    /* writes op to the content stream if it differs
     * from the last value written to current
     */
    void
    set_state(std::string *current, const std::string &op)
    {
      if (*current != op)
        {
          *current = op;
          m_content << op << "\n";
        }
    }

    void
    set_alpha(int *current, int alpha, vellum::c_string kind, vellum::c_string key);

    std::ostringstream m_content;
    std::map<std::string, std::string> m_ext_gstates;
    std::string m_fill_color, m_stroke_color, m_line_width;
    std::string m_line_cap, m_line_join, m_miter_limit, m_dashes;
    int m_fill_alpha, m_stroke_alpha;
  };

  class PDFWriterPrivate
  {
  public:
    PDFWriterPrivate(std::ostream &str, float width, float height,
                     const vellum::PDFWriter::Params &params):
      m_str(str),
      m_width(width),
      m_height(height),
      m_params(params),
      m_closed(false),
      m_offset(0)
    {}

    void
    write(const std::string &v)
    {
      m_str.write(v.data(), v.size());
      m_offset += v.size();
    }

    void
    begin_object(void)
    {
      std::ostringstream str;

      m_object_offsets.push_back(m_offset);
      str << m_object_offsets.size() << " 0 obj\n";
      write(str.str());
    }

    std::ostream &m_str;
    float m_width, m_height;
    vellum::PDFWriter::Params m_params;
    bool m_closed;
    size_t m_offset;
    std::vector<size_t> m_object_offsets;
    vellum::PDFPageWriter *m_page;
  };

  std::string
  number_string(float v)
  {
    std::ostringstream str;
    vellum::detail::write_number(str, v);
    return str.str();
  }

  std::string
  color_string(const vellum::ColorRGBA &color, vellum::c_string op)
  {
    std::ostringstream str;
    vellum::vec4 c(color.normalized());

    vellum::detail::write_number(str, c.x());
    str << " ";
    vellum::detail::write_number(str, c.y());
    str << " ";
    vellum::detail::write_number(str, c.z());
    str << " " << op;
    return str.str();
  }

  enum vellum::return_code
  deflate_string(const std::string &src, std::string *dst)
  {
    uLongf dst_size;
    std::vector<Bytef> buffer;
    int error_code;

    dst_size = compressBound(static_cast<uLong>(src.size()));
    buffer.resize(dst_size);
    error_code = compress2(&buffer[0], &dst_size,
                           reinterpret_cast<const Bytef*>(src.data()),
                           static_cast<uLong>(src.size()),
                           Z_BEST_SPEED);
    if (error_code != Z_OK)
      {
        return vellum::routine_fail;
      }

    dst->assign(reinterpret_cast<const char*>(&buffer[0]), dst_size);
    return vellum::routine_success;
  }
}

/////////////////////////////////////
// PDFPageWriterPrivate methods
void
PDFPageWriterPrivate::
set_alpha(int *current, int alpha, vellum::c_string kind, vellum::c_string key)
{
  if (*current == alpha)
    {
      return;
    }

  std::ostringstream name, dict;

  name << "GS" << kind << alpha;
  dict << "<< /Type /ExtGState /" << key << " ";
  vellum::detail::write_number(dict, static_cast<float>(alpha) / 255.0f);
  dict << " >>";
  m_ext_gstates[name.str()] = dict.str();

  m_content << "/" << name.str() << " gs\n";
  *current = alpha;
}

/////////////////////////////////////
// vellum::PDFPageWriter methods
vellum::PDFPageWriter::
PDFPageWriter(void)
{
  m_d = VELLUMnew PDFPageWriterPrivate();
}

vellum::PDFPageWriter::
~PDFPageWriter()
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  VELLUMdelete(d);
}

void
vellum::PDFPageWriter::
set_fill_color(const ColorRGBA &color)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  d->set_alpha(&d->m_fill_alpha, color.a(), "f", "ca");
  d->set_state(&d->m_fill_color, color_string(color, "rg"));
}

void
vellum::PDFPageWriter::
set_stroke_color(const ColorRGBA &color)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  d->set_alpha(&d->m_stroke_alpha, color.a(), "s", "CA");
  d->set_state(&d->m_stroke_color, color_string(color, "RG"));
}

void
vellum::PDFPageWriter::
set_line_width(float w)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  d->set_state(&d->m_line_width, number_string(w) + " w");
}

enum vellum::return_code
vellum::PDFPageWriter::
set_line_cap(enum PathEnums::cap_style cap)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  switch (cap)
    {
    case PathEnums::butt_cap:
      d->set_state(&d->m_line_cap, "0 J");
      return routine_success;

    case PathEnums::round_cap:
      d->set_state(&d->m_line_cap, "1 J");
      return routine_success;

    case PathEnums::square_cap:
      d->set_state(&d->m_line_cap, "2 J");
      return routine_success;

    default:
      VELLUMmessaged_assert(false, "Unsupported cap style");
      return routine_fail;
    }
}

enum vellum::return_code
vellum::PDFPageWriter::
set_line_join(enum PathEnums::join_style join)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  switch (join)
    {
    case PathEnums::miter_join:
      d->set_state(&d->m_line_join, "0 j");
      return routine_success;

    case PathEnums::round_join:
      d->set_state(&d->m_line_join, "1 j");
      return routine_success;

    case PathEnums::bevel_join:
      d->set_state(&d->m_line_join, "2 j");
      return routine_success;

    default:
      VELLUMmessaged_assert(false, "Unsupported join style");
      return routine_fail;
    }
}

void
vellum::PDFPageWriter::
set_miter_limit(float limit)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  d->set_state(&d->m_miter_limit, number_string(limit) + " M");
}

void
vellum::PDFPageWriter::
set_dashes(float offset, c_array<const float> lengths)
{
  PDFPageWriterPrivate *d;
  std::ostringstream str;

  d = static_cast<PDFPageWriterPrivate*>(m_d);
  str << "[";
  for (unsigned int i = 0; i < lengths.size(); ++i)
    {
      if (i != 0)
        {
          str << " ";
        }
      detail::write_number(str, lengths[i]);
    }
  str << "] ";
  detail::write_number(str, lengths.empty() ? 0.0f : offset);
  str << " d";
  d->set_state(&d->m_dashes, str.str());
}

void
vellum::PDFPageWriter::
append_path(const std::string &ops)
{
  PDFPageWriterPrivate *d;
  d = static_cast<PDFPageWriterPrivate*>(m_d);
  d->m_content << ops << "\n";
}

void
vellum::PDFPageWriter::
paint(enum paint_t op, enum PathEnums::fill_rule_t fill_rule)
{
  PDFPageWriterPrivate *d;
  c_string even_odd;

  d = static_cast<PDFPageWriterPrivate*>(m_d);
  even_odd = (fill_rule == PathEnums::even_odd_fill_rule) ? "*" : "";
  switch (op)
    {
    case paint_fill:
      d->m_content << "f" << even_odd << "\n";
      break;
    case paint_stroke:
      d->m_content << "S\n";
      break;
    case paint_close_stroke:
      d->m_content << "s\n";
      break;
    case paint_fill_stroke:
      d->m_content << "B" << even_odd << "\n";
      break;
    case paint_close_fill_stroke:
      d->m_content << "b" << even_odd << "\n";
      break;
    }
}

/////////////////////////////////////
// vellum::PDFWriter methods
vellum::PDFWriter::
PDFWriter(std::ostream &str, float width, float height,
          const Params &params)
{
  PDFWriterPrivate *d;

  d = VELLUMnew PDFWriterPrivate(str, width, height, params);
  d->m_page = VELLUMnew PDFPageWriter();
  m_d = d;
}

vellum::PDFWriter::
~PDFWriter()
{
  PDFWriterPrivate *d;
  d = static_cast<PDFWriterPrivate*>(m_d);
  VELLUMdelete(d->m_page);
  VELLUMdelete(d);
}

vellum::PDFPageWriter&
vellum::PDFWriter::
page(void)
{
  PDFWriterPrivate *d;
  d = static_cast<PDFWriterPrivate*>(m_d);
  return *d->m_page;
}

enum vellum::return_code
vellum::PDFWriter::
close(void)
{
  PDFWriterPrivate *d;
  PDFPageWriterPrivate *page_d;
  std::ostringstream content, str;
  std::string stream_data;
  unsigned int gs_object;
  size_t xref_offset;

  d = static_cast<PDFWriterPrivate*>(m_d);
  page_d = static_cast<PDFPageWriterPrivate*>(d->m_page->m_d);
  if (d->m_closed)
    {
      return routine_fail;
    }
  d->m_closed = true;

  /* the page is drawn in millimetres */
  detail::write_number(content, units::pt_per_mm);
  content << " 0 0 ";
  detail::write_number(content, units::pt_per_mm);
  content << " 0 0 cm\n" << page_d->m_content.str();

  if (d->m_params.m_compress_streams)
    {
      if (deflate_string(content.str(), &stream_data) == routine_fail)
        {
          return routine_fail;
        }
    }
  else
    {
      stream_data = content.str();
    }

  d->write("%PDF-1.4\n%\xE2\xE3\xCF\xD3\n");

  d->begin_object();
  d->write("<< /Type /Catalog /Pages 2 0 R >>\nendobj\n");

  d->begin_object();
  d->write("<< /Type /Pages /Kids [3 0 R] /Count 1 >>\nendobj\n");

  d->begin_object();
  str << "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 ";
  detail::write_number(str, d->m_width * units::pt_per_mm);
  str << " ";
  detail::write_number(str, d->m_height * units::pt_per_mm);
  str << "] /Resources <<";
  gs_object = 5;
  if (!page_d->m_ext_gstates.empty())
    {
      str << " /ExtGState <<";
      for (const auto &e : page_d->m_ext_gstates)
        {
          str << " /" << e.first << " " << gs_object++ << " 0 R";
        }
      str << " >>";
    }
  str << " >> /Contents 4 0 R >>\nendobj\n";
  d->write(str.str());

  d->begin_object();
  str.str("");
  str << "<< /Length " << stream_data.size();
  if (d->m_params.m_compress_streams)
    {
      str << " /Filter /FlateDecode";
    }
  str << " >>\nstream\n";
  d->write(str.str());
  d->write(stream_data);
  d->write("\nendstream\nendobj\n");

  for (const auto &e : page_d->m_ext_gstates)
    {
      d->begin_object();
      d->write(e.second + "\nendobj\n");
    }

  xref_offset = d->m_offset;
  str.str("");
  str << "xref\n0 " << d->m_object_offsets.size() + 1 << "\n"
      << "0000000000 65535 f \n";
  for (size_t offset : d->m_object_offsets)
    {
      char buffer[32];

      std::snprintf(buffer, sizeof(buffer), "%010lu 00000 n \n",
                    static_cast<unsigned long>(offset));
      str << buffer;
    }
  str << "trailer\n<< /Size " << d->m_object_offsets.size() + 1
      << " /Root 1 0 R >>\nstartxref\n" << xref_offset << "\n%%EOF\n";
  d->write(str.str());

  return (d->m_str) ? routine_success : routine_fail;
}
