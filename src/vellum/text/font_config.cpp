/*!
 * \file font_config.cpp
 * \brief file font_config.cpp
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
#include <fontconfig/fontconfig.h>
#include <vellum/text/font_config.hpp>

namespace
{
  class FontConfig
  {
  public:
    static
    FcConfig*
    get(void)
    {
      static FontConfig R;
      return R.m_fc;
    }

    static
    int
    get_int(FcPattern *pattern, const char *label, int default_value = 0)
    {
      int value(0);
      if (FcPatternGetInteger(pattern, label, 0, &value) == FcResultMatch)
        {
          return value;
        }
      else
        {
          return default_value;
        }
    }

  private:
    FontConfig(void)
    {
      m_fc = FcInitLoadConfigAndFonts();
    }

    ~FontConfig(void)
    {
      if (m_fc)
        {
          FcConfigDestroy(m_fc);
        }
    }

    FcConfig* m_fc;
  };
}

vellum::reference_counted_ptr<vellum::Font>
vellum::
select_font(c_string family, c_string style,
            reference_counted_ptr<FreeTypeLib> lib)
{
  FcConfig *config = FontConfig::get();
  FcPattern* pattern;
  reference_counted_ptr<Font> font;

  if (!config)
    {
      return font;
    }

  pattern = FcPatternCreate();
  if (style)
    {
      FcPatternAddString(pattern, FC_STYLE, (const FcChar8*)style);
    }

  if (family)
    {
      FcPatternAddString(pattern, FC_FAMILY, (const FcChar8*)family);
    }
  FcPatternAddBool(pattern, FC_SCALABLE, FcTrue);

  FcConfigSubstitute(config, pattern, FcMatchPattern);
  FcDefaultSubstitute(pattern);

  FcResult r;
  FcPattern *font_pattern = FcFontMatch(config, pattern, &r);

  if (font_pattern)
    {
      FcChar8* filename(nullptr);
      if (FcPatternGetString(font_pattern, FC_FILE, 0, &filename) == FcResultMatch)
        {
          int face_index;

          face_index = FontConfig::get_int(font_pattern, FC_INDEX);
          font = Font::create((c_string)filename, face_index, lib);
        }
      FcPatternDestroy(font_pattern);
    }
  FcPatternDestroy(pattern);
  return font;
}
