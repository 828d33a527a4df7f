/*!
 * \file data_buffer.cpp
 * \brief file data_buffer.cpp
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

#include <vector>
#include <fstream>
#include <cstring>
#include <vellum/util/data_buffer.hpp>
#include "../private/util_private.hpp"

namespace
{
  typedef std::vector<uint8_t> DataBufferPrivate;
}

vellum::DataBuffer::
DataBuffer(c_array<const uint8_t> init_data)
{
  DataBufferPrivate *d;

  d = VELLUMnew DataBufferPrivate(init_data.begin(), init_data.end());
  m_d = d;
}

vellum::DataBuffer::
DataBuffer(c_string filename)
{
  DataBufferPrivate *d;

  d = VELLUMnew DataBufferPrivate();
  m_d = d;

  std::ifstream file(filename, std::ios::binary);
  if (file)
    {
      std::ifstream::pos_type sz;

      file.seekg(0, std::ios::end);
      sz = file.tellg();
      if (sz > 0)
        {
          d->resize(static_cast<size_t>(sz));
          file.seekg(0, std::ios::beg);
          file.read(reinterpret_cast<char*>(&(*d)[0]), d->size());
          if (!file)
            {
              d->clear();
            }
        }
    }
}

vellum::DataBuffer::
~DataBuffer()
{
  DataBufferPrivate *d;
  d = static_cast<DataBufferPrivate*>(m_d);
  VELLUMdelete(d);
}

vellum::c_array<const uint8_t>
vellum::DataBuffer::
data(void) const
{
  const DataBufferPrivate *d;
  d = static_cast<const DataBufferPrivate*>(m_d);
  return make_c_array(*d);
}
