/*!
 * \file path_enums.cpp
 * \brief file path_enums.cpp
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

#include <vellum/path_enums.hpp>

vellum::c_string
vellum::PathEnums::
label(enum cap_style c)
{
  switch (c)
    {
    case butt_cap:
      return "butt_cap";
    case round_cap:
      return "round_cap";
    case square_cap:
      return "square_cap";
    default:
      return "invalid_cap_style";
    }
}

vellum::c_string
vellum::PathEnums::
label(enum join_style j)
{
  switch (j)
    {
    case miter_join:
      return "miter_join";
    case round_join:
      return "round_join";
    case bevel_join:
      return "bevel_join";
    case arcs_join:
      return "arcs_join";
    default:
      return "invalid_join_style";
    }
}

vellum::c_string
vellum::PathEnums::
label(enum fill_rule_t f)
{
  switch (f)
    {
    case nonzero_fill_rule:
      return "nonzero_fill_rule";
    case even_odd_fill_rule:
      return "even_odd_fill_rule";
    default:
      return "invalid_fill_rule";
    }
}
