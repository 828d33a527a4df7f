/*!
 * \file font.hpp
 * \brief file font.hpp
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


#pragma once

#include <string>
#include <stdint.h>
#include <vellum/util/reference_counted.hpp>
#include <vellum/util/data_buffer.hpp>
#include <vellum/text/freetype.hpp>
#include <vellum/path.hpp>

namespace vellum
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A Font is a scalable font face loaded with FreeType
   * together with the bytes of the font file, so that the font
   * can both produce glyph outlines and be embedded into an
   * exported document. Fonts are compared by identity.
   */
  class Font:public reference_counted<Font>::concurrent
  {
  public:
    /*!
     * Create a Font from a file. Returns a null pointer if the
     * file cannot be read or FreeType cannot load a scalable face
     * from it.
     * \param filename name of the font file
     * \param face_index index of the face within the file
     * \param lib FreeTypeLib to use, FreeTypeLib::shared() if null
     */
    static
    reference_counted_ptr<Font>
    create(c_string filename, int face_index = 0,
           reference_counted_ptr<FreeTypeLib> lib = reference_counted_ptr<FreeTypeLib>());

    /*!
     * Create a Font from the bytes of a font file held in
     * memory. Returns a null pointer on failure.
     * \param data bytes of the font file
     * \param face_index index of the face within the data
     * \param lib FreeTypeLib to use, FreeTypeLib::shared() if null
     */
    static
    reference_counted_ptr<Font>
    create(const reference_counted_ptr<const DataBuffer> &data, int face_index = 0,
           reference_counted_ptr<FreeTypeLib> lib = reference_counted_ptr<FreeTypeLib>());

    ~Font();

    /*!
     * Family name of the font.
     */
    c_string
    family(void) const;

    /*!
     * Style name of the font.
     */
    c_string
    style(void) const;

    /*!
     * The bytes of the font file.
     */
    c_array<const uint8_t>
    data(void) const;

    /*!
     * MIME type of the font data, for example font/ttf.
     */
    c_string
    mime_type(void) const;

    /*!
     * Returns the font data as a base64 data URI.
     */
    std::string
    data_uri(void) const;

    /*!
     * Returns the outline of the glyph of a character.
     * \param character_code unicode code point of the character
     * \param size size of the EM square in path coordinates
     * \param[out] advance location to which to write the
     *                     horizontal advance of the glyph
     */
    Path
    glyph_path(uint32_t character_code, float size, float *advance) const;

  private:
    Font(const reference_counted_ptr<FreeTypeFace> &face,
         const reference_counted_ptr<const DataBuffer> &data);

    void *m_d;
  };

/*! @} */
}
