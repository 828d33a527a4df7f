/*
  Copyright (c) 2009, Kevin Rogovin All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are
met:

    * Redistributions of source code must retain the above copyright
    * notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above
    * copyright notice, this list of conditions and the following
    * disclaimer in the documentation and/or other materials provided
    * with the distribution.  Neither the name of the Kevin Rogovin or
    * kRogue Technologies  nor the names of its contributors may
    * be used to endorse or promote products derived from this
    * software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
"AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
(INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/



/** \file generic_command_line.hpp */
#pragma once

#include <iostream>
#include <vector>
#include <algorithm>
#include <map>
#include <string>
#include <sstream>
#include <vellum/util/util.hpp>

class command_line_register;
class command_line_argument;

/*!
  A command_line_register walks a command line argument
  list, giving each of its command_line_argument children
  the chance to consume arguments from it.
 */
class command_line_register:vellum::noncopyable
{
public:
  command_line_register(void)
  {}

  ~command_line_register();

  void
  parse_command_line(int argc, char **argv);

  void
  parse_command_line(const std::vector<std::string> &strings);

  void
  print_help(std::ostream&) const;

  void
  print_detailed_help(std::ostream&) const;

private:
  friend class command_line_argument;

  std::vector<command_line_argument*> m_children;
};

/*!
  A command_line_argument reads from an argument
  list to set a value.
 */
class command_line_argument:vellum::noncopyable
{
public:
  explicit
  command_line_argument(command_line_register &parent):
    m_parent(&parent)
  {
    m_location = parent.m_children.size();
    parent.m_children.push_back(this);
  }

  virtual
  ~command_line_argument();

  command_line_register*
  parent(void)
  {
    return m_parent;
  }

  /*!
    To be implemented by a dervied class.
    \param args the arguments of main() as strings, args.size() is argc
    \param location current index into args[] being examined

    Returns the number of arguments consumed, 0 is allowed.
   */
  virtual
  int
  check_arg(const std::vector<std::string> &args, int location) = 0;

  virtual
  void
  print_command_line_description(std::ostream&) const = 0;

  virtual
  void
  print_detailed_description(std::ostream&) const = 0;

  static
  std::string
  format_description_string(const std::string &name, const std::string &desc);

  static
  std::string
  produce_formatted_detailed_description(const std::string &cmd,
                                         const std::string &desc);

  static
  std::string
  tabs_to_spaces(const std::string &pin);

private:
  friend class command_line_register;

  int m_location;
  command_line_register *m_parent;
};

/*
  not a command line option, but prints a separator for detailed help
 */
class command_separator:public command_line_argument
{
public:
  command_separator(const std::string &label,
                    command_line_register &parent):
    command_line_argument(parent),
    m_label(label)
  {}

  virtual
  int
  check_arg(const std::vector<std::string> &, int)
  {
    return 0;
  }

  virtual
  void
  print_command_line_description(std::ostream&) const
  {}

  virtual
  void
  print_detailed_description(std::ostream &ostr) const
  {
    ostr << "\n\n---------- " << m_label << " ------------------\n";
  }

private:
  std::string m_label;
};

template<typename T>
void
readvalue_from_string(T &value, const std::string &value_string)
{
  std::istringstream istr(value_string);
  istr >> value;
}

template<>
inline
void
readvalue_from_string(std::string &value, const std::string &value_string)
{
  value = value_string;
}

template<>
inline
void
readvalue_from_string(bool &value, const std::string &value_string)
{
  if (value_string == "on" || value_string == "true")
    {
      value = true;
    }
  else if (value_string == "off" || value_string == "false")
    {
      value = false;
    }
}

template<typename T>
void
writevalue_to_stream(const T &value, std::ostream &ostr)
{
  ostr << value;
}

template<>
inline
void
writevalue_to_stream(const bool &value, std::ostream &ostr)
{
  ostr << ((value) ? "on/true" : "off/false");
}

/*
  Base class for the options of the form name=value,
  name:value or name value. Derived classes implement
  set_from_string() to interpret the value.
 */
class command_line_named_argument:public command_line_argument
{
public:
  command_line_named_argument(const std::string &nm,
                              command_line_register &p,
                              bool print_at_set):
    command_line_argument(p),
    m_name(nm),
    m_set_by_command_line(false),
    m_print_at_set(print_at_set)
  {}

  const std::string&
  label(void) const
  {
    return m_name;
  }

  bool
  set_by_command_line(void) const
  {
    return m_set_by_command_line;
  }

  virtual
  int
  check_arg(const std::vector<std::string> &argv, int location);

  virtual
  void
  print_command_line_description(std::ostream &ostr) const;

  virtual
  void
  print_detailed_description(std::ostream &ostr) const
  {
    ostr << m_description;
  }

protected:
  virtual
  void
  set_from_string(const std::string &value_string) = 0;

  bool
  print_at_set(void) const
  {
    return m_print_at_set;
  }

  std::string m_description;

private:
  std::string m_name;
  bool m_set_by_command_line, m_print_at_set;
};

template<typename T>
class command_line_argument_value:public command_line_named_argument
{
public:
  T m_value;

  command_line_argument_value(T v, const std::string &nm,
                              const std::string &desc,
                              command_line_register &p,
                              bool print_at_set = true):
    command_line_named_argument(nm, p, print_at_set),
    m_value(v)
  {
    std::ostringstream ostr;

    ostr << "\n\t" << nm << " (default value=";
    writevalue_to_stream(m_value, ostr);
    ostr << ") " << format_description_string(nm, desc);
    m_description = tabs_to_spaces(ostr.str());
  }

protected:
  virtual
  void
  set_from_string(const std::string &value_string)
  {
    readvalue_from_string(m_value, value_string);
    if (print_at_set())
      {
        std::cout << "\n\t" << label() << " set to ";
        writevalue_to_stream(m_value, std::cout);
      }
  }
};

/*
  An option whose value is one of a fixed set
  of labels, each mapping to a value of T.
 */
template<typename T>
class enumerated_command_line_argument_value:public command_line_named_argument
{
public:
  T m_value;

  enumerated_command_line_argument_value(T v, const std::string &nm,
                                         const std::string &desc,
                                         command_line_register &p):
    command_line_named_argument(nm, p, true),
    m_value(v),
    m_default_desc(desc)
  {}

  enumerated_command_line_argument_value&
  add_entry(const std::string &label, T v, const std::string &description)
  {
    std::ostringstream ostr, ostr_desc;

    m_labels.push_back(label_entry(label, v, description));

    ostr << "\n\t" << this->label() << " (default value=";
    for (const label_entry &e : m_labels)
      {
        if (e.m_value == m_value)
          {
            ostr << e.m_label;
          }
      }
    ostr << ")";

    ostr_desc << m_default_desc << " Possible values:\n\n";
    for (const label_entry &e : m_labels)
      {
        ostr_desc << e.m_label << ":" << e.m_description << "\n\n";
      }
    ostr << format_description_string(this->label(), ostr_desc.str());
    m_description = tabs_to_spaces(ostr.str());
    return *this;
  }

protected:
  virtual
  void
  set_from_string(const std::string &value_string)
  {
    for (const label_entry &e : m_labels)
      {
        if (e.m_label == value_string)
          {
            m_value = e.m_value;
            std::cout << "\n\t" << label() << " set to " << value_string;
            return;
          }
      }
    std::cout << "\n\t" << label() << ": unknown value \"" << value_string << "\" ignored";
  }

private:
  class label_entry
  {
  public:
    label_entry(const std::string &label, T v, const std::string &desc):
      m_label(label),
      m_value(v),
      m_description(desc)
    {}

    std::string m_label;
    T m_value;
    std::string m_description;
  };

  std::string m_default_desc;
  std::vector<label_entry> m_labels;
};
