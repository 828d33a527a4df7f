/*!
 * \file freetype.hpp
 * \brief file freetype.hpp
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

#include <stdint.h>
#include <ft2build.h>
#include FT_FREETYPE_H

#include <vellum/util/reference_counted.hpp>
#include <vellum/util/c_array.hpp>

namespace vellum
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A FreeTypeLib is a reference counted FT_Library together
   * with the mutex that serializes the creation and release of
   * the FT_Face objects made from it.
   */
  class FreeTypeLib:public reference_counted<FreeTypeLib>::concurrent
  {
  public:
    FreeTypeLib(void);

    ~FreeTypeLib();

    /*!
     * The process wide FreeTypeLib used when a font
     * is created without one.
     */
    static
    reference_counted_ptr<FreeTypeLib>
    shared(void);

    /*!
     * The FT_Library, nullptr if FreeType failed to
     * initialize.
     */
    FT_Library
    lib(void) const;

    void
    lock(void);

    void
    unlock(void);

  private:
    void *m_d;
  };

  /*!
   * \brief
   * A FreeTypeFace is a reference counted FT_Face with a mutex
   * to lock while the face is in use; an FT_Face can only be
   * used by one thread at a time.
   */
  class FreeTypeFace:public reference_counted<FreeTypeFace>::concurrent
  {
  public:
    /*!
     * Create a scalable face from font data held in memory.
     * Returns nullptr if FreeType cannot read the data or if
     * the face is not scalable.
     * \param lib library from which to make the face
     * \param bytes font data, must stay alive as long as the
     *              returned face
     * \param face_index index of the face within the data
     */
    static
    reference_counted_ptr<FreeTypeFace>
    create(const reference_counted_ptr<FreeTypeLib> &lib,
           c_array<const uint8_t> bytes, int face_index);

    ~FreeTypeFace();

    FT_Face
    face(void) const;

    void
    lock(void);

    void
    unlock(void);

  private:
    FreeTypeFace(FT_Face face, const reference_counted_ptr<FreeTypeLib> &lib);

    void *m_d;
  };

  /*!
   * \brief
   * Holds the lock of a FreeTypeLib or FreeTypeFace
   * for its lifetime.
   */
  template<typename T>
  class FreeTypeLock:noncopyable
  {
  public:
    explicit
    FreeTypeLock(T *p):
      m_p(p)
    {
      m_p->lock();
    }

    ~FreeTypeLock()
    {
      m_p->unlock();
    }

  private:
    T *m_p;
  };

/*! @} */
}
