/*!
 * \file font.cpp
 * \brief file font.cpp
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

#include <string>
#include <cstring>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <ft2build.h>
#include FT_OUTLINE_H
#include FT_FONT_FORMATS_H

#include <vellum/text/font.hpp>
#include <vellum/util/vellum_memory.hpp>
#include "../private/util_private.hpp"

namespace
{
  class FontPrivate
  {
  public:
    FontPrivate(const vellum::reference_counted_ptr<vellum::FreeTypeFace> &face,
                const vellum::reference_counted_ptr<const vellum::DataBuffer> &data);

    /* the face reads from the data, so the data is
     * declared first to be released last
     */
    vellum::reference_counted_ptr<const vellum::DataBuffer> m_data;
    vellum::reference_counted_ptr<vellum::FreeTypeFace> m_face;
    std::string m_family, m_style;
    vellum::c_string m_mime_type;
  };

  class PathCreator
  {
  public:
    static
    void
    decompose_to_path(FT_Outline *outline, float scale, vellum::Path *p)
    {
      PathCreator datum(p, scale);
      FT_Outline_Funcs funcs;

      funcs.move_to = &ft_outline_move_to;
      funcs.line_to = &ft_outline_line_to;
      funcs.conic_to = &ft_outline_conic_to;
      funcs.cubic_to = &ft_outline_cubic_to;
      funcs.shift = 0;
      funcs.delta = 0;
      FT_Outline_Decompose(outline, &funcs, &datum);
      p->close_contour();
    }

  private:
    PathCreator(vellum::Path *P, float scale):
      m_path(P),
      m_scale(scale)
    {}

    vellum::vec2
    convert(const FT_Vector *pt) const
    {
      return m_scale * vellum::vec2(static_cast<float>(pt->x),
                                    static_cast<float>(pt->y));
    }

    static
    int
    ft_outline_move_to(const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);

      /* FreeType contours are always closed */
      p->m_path->close_contour();
      p->m_path->move_to(p->convert(pt));
      return 0;
    }

    static
    int
    ft_outline_line_to(const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->m_path->line_to(p->convert(pt));
      return 0;
    }

    static
    int
    ft_outline_conic_to(const FT_Vector *control_pt,
                        const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->m_path->quadratic_to(p->convert(control_pt), p->convert(pt));
      return 0;
    }

    static
    int
    ft_outline_cubic_to(const FT_Vector *control_pt0,
                        const FT_Vector *control_pt1,
                        const FT_Vector *pt, void *user)
    {
      PathCreator *p;
      p = static_cast<PathCreator*>(user);
      p->m_path->cubic_to(p->convert(control_pt0),
                          p->convert(control_pt1),
                          p->convert(pt));
      return 0;
    }

    vellum::Path *m_path;
    float m_scale;
  };

  vellum::c_string
  compute_mime_type(vellum::c_array<const uint8_t> data, FT_Face face)
  {
    vellum::c_string format;

    if (data.size() >= 4)
      {
        if (std::memcmp(data.c_ptr(), "wOFF", 4) == 0)
          {
            return "font/woff";
          }
        if (std::memcmp(data.c_ptr(), "wOF2", 4) == 0)
          {
            return "font/woff2";
          }
        if (std::memcmp(data.c_ptr(), "OTTO", 4) == 0)
          {
            return "font/otf";
          }
      }

    format = FT_Get_Font_Format(face);
    if (format && std::strcmp(format, "TrueType") == 0)
      {
        return "font/ttf";
      }
    if (format && std::strcmp(format, "CFF") == 0)
      {
        return "font/otf";
      }
    return "application/octet-stream";
  }
}

////////////////////////////////
// FontPrivate methods
FontPrivate::
FontPrivate(const vellum::reference_counted_ptr<vellum::FreeTypeFace> &face,
            const vellum::reference_counted_ptr<const vellum::DataBuffer> &data):
  m_data(data),
  m_face(face)
{
  FT_Face ft_face(m_face->face());

  m_family = (ft_face->family_name) ? ft_face->family_name : "";
  m_style = (ft_face->style_name) ? ft_face->style_name : "";
  m_mime_type = compute_mime_type(m_data->data(), ft_face);
}

////////////////////////////////
// vellum::Font methods
vellum::Font::
Font(const reference_counted_ptr<FreeTypeFace> &face,
     const reference_counted_ptr<const DataBuffer> &data)
{
  m_d = VELLUMnew FontPrivate(face, data);
}

vellum::Font::
~Font()
{
  FontPrivate *d;
  d = static_cast<FontPrivate*>(m_d);
  VELLUMdelete(d);
}

vellum::reference_counted_ptr<vellum::Font>
vellum::Font::
create(c_string filename, int face_index,
       reference_counted_ptr<FreeTypeLib> lib)
{
  reference_counted_ptr<const DataBuffer> data;

  data = VELLUMnew DataBuffer(filename);
  return create(data, face_index, lib);
}

vellum::reference_counted_ptr<vellum::Font>
vellum::Font::
create(const reference_counted_ptr<const DataBuffer> &data, int face_index,
       reference_counted_ptr<FreeTypeLib> lib)
{
  reference_counted_ptr<FreeTypeFace> face;

  if (!data)
    {
      return reference_counted_ptr<Font>();
    }

  if (!lib)
    {
      lib = FreeTypeLib::shared();
    }

  face = FreeTypeFace::create(lib, data->data(), face_index);
  if (!face)
    {
      return reference_counted_ptr<Font>();
    }
  return VELLUMnew Font(face, data);
}

vellum::c_string
vellum::Font::
family(void) const
{
  FontPrivate *d;
  d = static_cast<FontPrivate*>(m_d);
  return d->m_family.c_str();
}

vellum::c_string
vellum::Font::
style(void) const
{
  FontPrivate *d;
  d = static_cast<FontPrivate*>(m_d);
  return d->m_style.c_str();
}

vellum::c_array<const uint8_t>
vellum::Font::
data(void) const
{
  FontPrivate *d;
  d = static_cast<FontPrivate*>(m_d);
  return d->m_data->data();
}

vellum::c_string
vellum::Font::
mime_type(void) const
{
  FontPrivate *d;
  d = static_cast<FontPrivate*>(m_d);
  return d->m_mime_type;
}

std::string
vellum::Font::
data_uri(void) const
{
  typedef boost::archive::iterators::transform_width<const char*, 6, 8> to_6_bits;
  typedef boost::archive::iterators::base64_from_binary<to_6_bits> to_base64;

  FontPrivate *d;
  c_array<const char> bytes;
  std::string return_value;

  d = static_cast<FontPrivate*>(m_d);
  bytes = d->m_data->data().reinterpret_pointer<const char>();

  return_value = "data:";
  return_value += d->m_mime_type;
  return_value += ";base64,";
  if (!bytes.empty())
    {
      return_value.append(to_base64(bytes.c_ptr()),
                          to_base64(bytes.c_ptr() + bytes.size()));
      return_value.append((3 - bytes.size() % 3) % 3, '=');
    }
  return return_value;
}

vellum::Path
vellum::Font::
glyph_path(uint32_t character_code, float size, float *advance) const
{
  FontPrivate *d;
  Path return_value;
  FT_Face face;
  FT_UInt glyph_index;
  FT_Error error_code;
  float scale;

  d = static_cast<FontPrivate*>(m_d);
  *advance = 0.0f;

  FreeTypeLock<FreeTypeFace> lock(d->m_face.get());
  face = d->m_face->face();
  if (face->units_per_EM == 0)
    {
      return return_value;
    }

  scale = size / static_cast<float>(face->units_per_EM);
  glyph_index = FT_Get_Char_Index(face, character_code);
  error_code = FT_Load_Glyph(face, glyph_index,
                             FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP
                             | FT_LOAD_NO_HINTING | FT_LOAD_IGNORE_TRANSFORM);
  if (error_code != 0)
    {
      return return_value;
    }

  *advance = scale * static_cast<float>(face->glyph->metrics.horiAdvance);
  if (face->glyph->format == FT_GLYPH_FORMAT_OUTLINE)
    {
      PathCreator::decompose_to_path(&face->glyph->outline, scale, &return_value);
    }
  return return_value;
}
