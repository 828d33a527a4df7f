/*!
 * \file vellum_memory.hpp
 * \brief file vellum_memory.hpp
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

#include <cstddef>

/*!\addtogroup Utility
 * @{
 */

void*
operator new(std::size_t n, const char *file, int line) throw ();

void
operator delete(void *ptr, const char *file, int line) throw();

namespace vellum
{
  /*!
   * \brief
   * Implementation of \ref VELLUMnew and \ref VELLUMdelete,
   * not to be called directly.
   */
  namespace memory
  {
    void*
    allocate(std::size_t size, const char *file, int line);

    void
    deallocate(void *ptr, const char *file, int line);

    template<typename T>
    void
    destroy(T *p, const char *file, int line)
    {
      if (p)
        {
          p->~T();
          deallocate(p, file, line);
        }
    }
  }
}

/*!\def VELLUMnew
 * Objects of Vellum are created with VELLUMnew instead of new.
 * Debug builds record the file and line of each allocation and
 * print the allocations never released by \ref VELLUMdelete when
 * the program exits. Not for arrays.
 */
#define VELLUMnew \
  ::new(__FILE__, __LINE__)

/*!\def VELLUMdelete
 * Deletes an object created with \ref VELLUMnew; a debug build
 * reports the deletion of an address VELLUMnew did not return.
 * \param ptr object to delete, may be nullptr
 */
#define VELLUMdelete(ptr) \
  vellum::memory::destroy(ptr, __FILE__, __LINE__)

/*! @} */
