/*!
 * \file pdf_writer.hpp
 * \brief file pdf_writer.hpp
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
#include <iosfwd>
#include <vellum/util/util.hpp>
#include <vellum/util/c_array.hpp>
#include <vellum/color.hpp>
#include <vellum/path_enums.hpp>

namespace vellum
{
/*!\addtogroup Backend
 * @{
 */

  class PDFWriter;

  /*!
   * \brief
   * A PDFPageWriter writes the content stream of the page of a
   * \ref PDFWriter. Graphics state operators are only written
   * when the value changes. Coordinates are in millimetres; the
   * conversion to points is done once at the start of the
   * content stream.
   */
  class PDFPageWriter:noncopyable
  {
  public:
    /*!
     * \brief
     * Enumeration of the painting operators.
     */
    enum paint_t
      {
        /*!
         * Fill, f or f*
         */
        paint_fill,

        /*!
         * Stroke, S
         */
        paint_stroke,

        /*!
         * Close and stroke, s
         */
        paint_close_stroke,

        /*!
         * Fill then stroke, B or B*
         */
        paint_fill_stroke,

        /*!
         * Close, fill then stroke, b or b*
         */
        paint_close_fill_stroke,
      };

    ~PDFPageWriter();

    /*!
     * Set the fill color; an alpha other than 255 selects a
     * graphics state setting the fill alpha.
     */
    void
    set_fill_color(const ColorRGBA &color);

    /*!
     * Set the stroke color; an alpha other than 255 selects
     * a graphics state setting the stroke alpha.
     */
    void
    set_stroke_color(const ColorRGBA &color);

    /*!
     * Set the line width.
     */
    void
    set_line_width(float w);

    /*!
     * Set the line cap. Returns routine_fail if the value is
     * not one of the cap styles.
     */
    enum return_code
    set_line_cap(enum PathEnums::cap_style cap);

    /*!
     * Set the line join. Returns routine_fail if the value
     * is not one of \ref PathEnums::miter_join, \ref
     * PathEnums::round_join or \ref PathEnums::bevel_join.
     */
    enum return_code
    set_line_join(enum PathEnums::join_style join);

    /*!
     * Set the miter limit.
     */
    void
    set_miter_limit(float limit);

    /*!
     * Set the dash pattern, an empty array for solid lines.
     */
    void
    set_dashes(float offset, c_array<const float> lengths);

    /*!
     * Append path construction operators, as returned by
     * Path::to_pdf().
     */
    void
    append_path(const std::string &ops);

    /*!
     * Paint the current path.
     * \param op painting operator
     * \param fill_rule fill rule of the fill operators
     */
    void
    paint(enum paint_t op,
          enum PathEnums::fill_rule_t fill_rule = PathEnums::nonzero_fill_rule);

  private:
    friend class PDFWriter;

    PDFPageWriter(void);

    void *m_d;
  };

  /*!
   * \brief
   * A PDFWriter writes a single page PDF 1.4 document.
   * The page is written with page(); close() then writes
   * the document, its cross-reference table and trailer to
   * the stream.
   */
  class PDFWriter:noncopyable
  {
  public:
    /*!
     * \brief
     * Parameters of the document.
     */
    class Params
    {
    public:
      Params(void):
        m_compress_streams(true)
      {}

      /*!
       * Set the value of \ref m_compress_streams.
       */
      Params&
      compress_streams(bool v)
      {
        m_compress_streams = v;
        return *this;
      }

      /*!
       * If true, the content stream is compressed
       * with FlateDecode. Default value is true.
       */
      bool m_compress_streams;
    };

    /*!
     * Ctor.
     * \param str stream to which to write, must outlive the PDFWriter
     * \param width width of the page in millimetres
     * \param height height of the page in millimetres
     * \param params document parameters
     */
    PDFWriter(std::ostream &str, float width, float height,
              const Params &params = Params());

    ~PDFWriter();

    /*!
     * The content of the page.
     */
    PDFPageWriter&
    page(void);

    /*!
     * Write the document to the stream. Returns routine_fail
     * if compression fails, if the stream is in error after
     * writing or if the document was already closed.
     */
    enum return_code
    close(void);

  private:
    void *m_d;
  };

/*! @} */
}
