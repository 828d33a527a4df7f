/*!
 * \file freetype.cpp
 * \brief file freetype.cpp
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

#include <vellum/text/freetype.hpp>
#include <vellum/util/vellum_memory.hpp>
#include "../private/util_private.hpp"

namespace
{
  class FreeTypeLibPrivate
  {
  public:
    FreeTypeLibPrivate(void):
      m_lib(nullptr)
    {
      if (FT_Init_FreeType(&m_lib) != 0)
        {
          m_lib = nullptr;
        }
      VELLUMmessaged_assert(m_lib, "Unable to initialize FreeType");
    }

    ~FreeTypeLibPrivate()
    {
      if (m_lib)
        {
          FT_Done_FreeType(m_lib);
        }
    }

    vellum::mutex m_mutex;
    FT_Library m_lib;
  };

  class FreeTypeFacePrivate
  {
  public:
    FreeTypeFacePrivate(FT_Face face,
                        const vellum::reference_counted_ptr<vellum::FreeTypeLib> &lib):
      m_face(face),
      m_lib(lib)
    {}

    vellum::mutex m_mutex;
    FT_Face m_face;
    vellum::reference_counted_ptr<vellum::FreeTypeLib> m_lib;
  };
}

/////////////////////////////
// vellum::FreeTypeLib methods
vellum::FreeTypeLib::
FreeTypeLib(void)
{
  m_d = VELLUMnew FreeTypeLibPrivate();
}

vellum::FreeTypeLib::
~FreeTypeLib()
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  VELLUMdelete(d);
}

vellum::reference_counted_ptr<vellum::FreeTypeLib>
vellum::FreeTypeLib::
shared(void)
{
  static reference_counted_ptr<FreeTypeLib> R(VELLUMnew FreeTypeLib());
  return R;
}

FT_Library
vellum::FreeTypeLib::
lib(void) const
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  return d->m_lib;
}

void
vellum::FreeTypeLib::
lock(void)
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  d->m_mutex.lock();
}

void
vellum::FreeTypeLib::
unlock(void)
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  d->m_mutex.unlock();
}

/////////////////////////////
// vellum::FreeTypeFace methods
vellum::FreeTypeFace::
FreeTypeFace(FT_Face face, const reference_counted_ptr<FreeTypeLib> &lib)
{
  m_d = VELLUMnew FreeTypeFacePrivate(face, lib);
}

vellum::FreeTypeFace::
~FreeTypeFace()
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  {
    FreeTypeLock<FreeTypeLib> lock(d->m_lib.get());
    FT_Done_Face(d->m_face);
  }
  VELLUMdelete(d);
}

vellum::reference_counted_ptr<vellum::FreeTypeFace>
vellum::FreeTypeFace::
create(const reference_counted_ptr<FreeTypeLib> &lib,
       c_array<const uint8_t> bytes, int face_index)
{
  FT_Face face(nullptr);
  FT_Error error_code;

  if (!lib || !lib->lib() || bytes.empty())
    {
      return reference_counted_ptr<FreeTypeFace>();
    }

  {
    FreeTypeLock<FreeTypeLib> lock(lib.get());

    error_code = FT_New_Memory_Face(lib->lib(),
                                    static_cast<const FT_Byte*>(bytes.c_ptr()),
                                    static_cast<FT_Long>(bytes.size()),
                                    face_index, &face);
    if (error_code == 0 && !FT_IS_SCALABLE(face))
      {
        /* only outlines can be turned into paths */
        FT_Done_Face(face);
        error_code = FT_Err_Invalid_File_Format;
      }
  }

  if (error_code != 0)
    {
      return reference_counted_ptr<FreeTypeFace>();
    }
  return VELLUMnew FreeTypeFace(face, lib);
}

FT_Face
vellum::FreeTypeFace::
face(void) const
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  return d->m_face;
}

void
vellum::FreeTypeFace::
lock(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  d->m_mutex.lock();
}

void
vellum::FreeTypeFace::
unlock(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  d->m_mutex.unlock();
}
