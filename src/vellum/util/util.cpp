/*!
 * \file util.cpp
 * \brief file util.cpp
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
#include <iostream>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#ifdef __linux__
#include <execinfo.h>
#include <unistd.h>
#include <cxxabi.h>
#endif

#include <vellum/util/util.hpp>

#ifdef __linux__
namespace
{
  std::string
  demangled_function_name(const char *backtrace_string)
  {
    if (!backtrace_string)
      {
        return "";
      }

    /* backtrace gives the symbol as follows:
     *  library_name(mangled_function_name+offset) [return_address]
     */
    const char *open_paren, *plus, *end;

    end = backtrace_string + std::strlen(backtrace_string);
    open_paren = std::find(backtrace_string, end, '(');
    if (open_paren == end)
      {
        return "";
      }
    ++open_paren;
    plus = std::find(open_paren, end, '+');
    if (plus == end)
      {
        return "";
      }

    char* demangle_c_string;
    int status;
    std::string tmp(open_paren, plus);

    demangle_c_string = abi::__cxa_demangle(tmp.c_str(), nullptr,
                                            nullptr, &status);
    if (demangle_c_string == nullptr)
      {
        return "";
      }

    std::string return_value(demangle_c_string);
    std::free(demangle_c_string);
    return return_value;
  }
}
#endif

void
vellum::
assert_fail(c_string str, c_string file, int line)
{
  std::cerr << "[" << file << "," << line << "]: " << str << "\n";

  #ifdef __linux__
    {
      enum { max_backtrace_size = 30 };
      void *backtrace_data[max_backtrace_size];
      char **backtrace_strings;
      int backtrace_size;

      std::cerr << "Backtrace:\n" << std::flush;
      backtrace_size = backtrace(backtrace_data, max_backtrace_size);
      backtrace_strings = backtrace_symbols(backtrace_data, backtrace_size);
      if (backtrace_strings)
        {
          for (int i = 0; i < backtrace_size; ++i)
            {
              std::cerr << "\t" << backtrace_strings[i]
                        << "{" << demangled_function_name(backtrace_strings[i])
                        << "}\n";
            }
          std::free(backtrace_strings);
        }
    }
  #endif

  #ifdef VELLUM_DEBUG
    {
      std::abort();
    }
  #endif
}
