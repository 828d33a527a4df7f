/*!
 * \file vellum_memory.cpp
 * \brief file vellum_memory.cpp
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

#include <map>
#include <iostream>
#include <cstdlib>

#include <vellum/util/vellum_memory.hpp>
#include <vellum/util/math.hpp>
#include "../private/util_private.hpp"

#ifdef VELLUM_DEBUG

namespace
{
  class AllocationSite
  {
  public:
    AllocationSite(const char *file, int line):
      m_file(file),
      m_line(line)
    {}

    const char *m_file;
    int m_line;
  };

  /* Records the live allocations made through VELLUMnew,
   * reporting the ones left at exit.
   */
  class AllocationTracker:vellum::noncopyable
  {
  public:
    ~AllocationTracker()
    {
      if (!m_live.empty())
        {
          std::cerr << "Vellum: " << m_live.size() << " objects leaked:\n";
          for (const auto &e : m_live)
            {
              std::cerr << "\t@" << e.first << " allocated at ["
                        << e.second.m_file << "," << e.second.m_line << "]\n";
            }
        }
    }

    void
    add(const void *ptr, const char *file, int line)
    {
      vellum::autolock_mutex m(m_mutex);
      m_live.insert(std::make_pair(ptr, AllocationSite(file, line)));
    }

    bool
    remove(const void *ptr)
    {
      vellum::autolock_mutex m(m_mutex);
      return m_live.erase(ptr) != 0;
    }

  private:
    vellum::mutex m_mutex;
    std::map<const void*, AllocationSite> m_live;
  };

  AllocationTracker&
  tracker(void)
  {
    static AllocationTracker R;
    return R;
  }
}

#endif

/////////////////////////////////////
// vellum::memory methods
void*
vellum::memory::
allocate(std::size_t size, const char *file, int line)
{
  void *return_value;

  return_value = std::malloc(t_max(size, std::size_t(1)));
  #ifdef VELLUM_DEBUG
    {
      if (return_value)
        {
          tracker().add(return_value, file, line);
        }
      else
        {
          std::cerr << "Allocation of " << size << " bytes at ["
                    << file << "," << line << "] failed\n";
        }
    }
  #else
    {
      VELLUMunused(file);
      VELLUMunused(line);
    }
  #endif
  return return_value;
}

void
vellum::memory::
deallocate(void *ptr, const char *file, int line)
{
  #ifdef VELLUM_DEBUG
    {
      if (ptr && !tracker().remove(ptr))
        {
          std::cerr << "Deletion at [" << file << "," << line
                    << "] of untracked object @" << ptr << "\n"
                    << std::flush;
        }
    }
  #else
    {
      VELLUMunused(file);
      VELLUMunused(line);
    }
  #endif
  std::free(ptr);
}

void*
operator new(std::size_t n, const char *file, int line) throw ()
{
  return vellum::memory::allocate(n, file, line);
}

void
operator delete(void *ptr, const char *file, int line) throw()
{
  vellum::memory::deallocate(ptr, file, line);
}
