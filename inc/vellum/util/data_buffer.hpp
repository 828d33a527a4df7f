/*!
 * \file data_buffer.hpp
 * \brief file data_buffer.hpp
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
#include <vellum/util/reference_counted.hpp>
#include <vellum/util/c_array.hpp>

namespace vellum
{
/*!\addtogroup Utility
 * @{
 */
  /*!
   * \brief
   * Represents an immutable buffer of bytes directly stored
   * in memory; used to hold the contents of font files so
   * that they can be handed to FreeType and embedded into
   * exported documents.
   */
  class DataBuffer:public reference_counted<DataBuffer>::concurrent
  {
  public:
    /*!
     * Ctor. Copies a file into memory. If the file
     * cannot be read, the buffer is empty.
     * \param filename name of file to open
     */
    explicit
    DataBuffer(c_string filename);

    /*!
     * Ctor. Allocates the memory and initializes it with data.
     */
    explicit
    DataBuffer(c_array<const uint8_t> init_data);

    ~DataBuffer();

    /*!
     * Return the memory as read-only
     */
    c_array<const uint8_t>
    data(void) const;

  private:
    void *m_d;
  };

/*! @} */
} //namespace vellum
