//  log.cpp -- log message destinations and filter settings
//  Copyright (C) 2026  Insatsu contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Insatsu' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.


#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>

#include "insatsu/log.hpp"

namespace insatsu {

log::priority log::threshold = log::ERROR;
log::category log::matching  = log::ALL;

std::ostream& log::os_ = std::clog;

namespace {

const char *priority_names[] = {
  "fatal", "alert", "error", "brief", "trace", "debug",
};

const int priority_count = sizeof (priority_names) / sizeof (*priority_names);

}       // namespace

bool
log::to_priority (const std::string& name, priority& level)
{
  std::string s (boost::algorithm::to_lower_copy (name));

  for (int i = 0; i < priority_count; ++i)
    {
      if (s == priority_names[i])
        {
          level = static_cast< priority > (i);
          return true;
        }
    }

  int i;
  if (boost::conversion::try_lexical_convert (s, i)
      && FATAL <= i && i <= DEBUG)
    {
      level = static_cast< priority > (i);
      return true;
    }
  return false;
}

const char *
log::name (priority level)
{
  if (FATAL <= level && level <= DEBUG)
    return priority_names[level];
  return "unknown";
}

}       // namespace insatsu
