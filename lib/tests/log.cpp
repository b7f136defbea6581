//  log.cpp -- unit tests for log messages
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#include <algorithm>
#include <list>
#include <sstream>
#include <string>

#include <boost/test/parameterized_test.hpp>
#include <boost/test/unit_test.hpp>

#ifndef INSATSU_LOG_ARGUMENT_COUNT_CHECK_ENABLED
#error "The build files are supposed to set this to all possible values"
#endif

#include "insatsu/log.hpp"

using namespace insatsu;

struct fixture
{
  std::ostringstream s;
  std::streambuf *buf;

  //!  Ensure something gets logged
  fixture ()
  {
    log::threshold = log::BRIEF;
    log::matching  = log::ALL;

    buf = log::os_.rdbuf (s.rdbuf ());
  }
  ~fixture ()
  {
    log::os_.rdbuf (buf);
  }
};

BOOST_FIXTURE_TEST_CASE (format_overflow, fixture)
{
  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (log::message (log::FATAL, "%1%") % 1 % 2,
                         boost::io::too_many_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (log::message (log::FATAL, "%1%") % 1 % 2);
    }
}

BOOST_FIXTURE_TEST_CASE (format_reuse_overflow, fixture)
{
  log::message fmt (log::FATAL, "%1%");

  s << fmt % 1;
  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (fmt % 1 % 2, boost::io::too_many_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (fmt % 1 % 2);
    }
}

BOOST_FIXTURE_TEST_CASE (format_underflow, fixture)
{
  log::message fmt (log::FATAL, "%1% %2%");

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << fmt % 1, boost::io::too_few_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << fmt % 1);
    }
}

BOOST_FIXTURE_TEST_CASE (format_reuse_underflow, fixture)
{
  log::message fmt (log::FATAL, "%1% %2%");

  s << fmt % 1 % 2;
  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << fmt % 1, boost::io::too_few_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << fmt % 1);
    }
}

BOOST_FIXTURE_TEST_CASE (missing_args_keep_placeholder, fixture)
{
  BOOST_CHECK_NO_THROW ({ log::message (log::FATAL, "%1% %2%") % "one"; });

  BOOST_CHECK (std::string::npos != s.str ().find ("fatal: one %2%\n"));
  BOOST_CHECK_EQUAL (bool (log::arg_count_checking),
                     std::string::npos != s.str ().find ("too_few_args"));
}

BOOST_FIXTURE_TEST_CASE (noisy_named_ctor_overflow, fixture)
{
  BOOST_REQUIRE (log::threshold >= log::ALERT);

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << log::alert ("%1%") % 1 % 2,
                         boost::io::too_many_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << log::alert ("%1%") % 1 % 2);
    }
}

BOOST_FIXTURE_TEST_CASE (noisy_named_ctor_underflow, fixture)
{
  BOOST_REQUIRE (log::threshold >= log::ALERT);

  log::message fmt (log::ALERT, "%1%");

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << fmt, boost::io::too_few_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << fmt);
    }
}

BOOST_FIXTURE_TEST_CASE (quiet_named_ctor_overflow, fixture)
{
  BOOST_REQUIRE (log::threshold < log::TRACE);

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << log::trace ("%1%") % 1 % 2,
                         boost::io::too_many_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << log::trace ("%1%") % 1 % 2);
    }
}

BOOST_FIXTURE_TEST_CASE (quiet_named_ctor_underflow, fixture)
{
  BOOST_REQUIRE (log::threshold < log::TRACE);

  log::message fmt (log::TRACE, "%1%");

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << fmt, boost::io::too_few_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << fmt);
    }
}

BOOST_FIXTURE_TEST_CASE (category_mismatch_is_quiet, fixture)
{
  log::matching = log::CONNEXION;

  { log::brief (log::ESCPOS_DRIVER, "status: %1%") % "online"; }

  BOOST_CHECK (s.str ().empty ());
}

BOOST_FIXTURE_TEST_CASE (category_match_is_noisy, fixture)
{
  log::matching = log::ESCPOS_DRIVER;

  { log::brief (log::ESCPOS_DRIVER, "status: %1%") % "online"; }

  BOOST_CHECK (std::string::npos != s.str ().find ("status: online"));
}

BOOST_AUTO_TEST_CASE (priority_by_name)
{
  log::priority level = log::FATAL;

  BOOST_CHECK (log::to_priority ("Debug", level));
  BOOST_CHECK_EQUAL (log::DEBUG, level);
  BOOST_CHECK (log::to_priority ("alert", level));
  BOOST_CHECK_EQUAL (log::ALERT, level);
}

BOOST_AUTO_TEST_CASE (priority_by_number)
{
  log::priority level = log::FATAL;

  BOOST_CHECK (log::to_priority ("4", level));
  BOOST_CHECK_EQUAL (log::TRACE, level);
}

BOOST_AUTO_TEST_CASE (priority_unknown)
{
  log::priority level = log::BRIEF;

  BOOST_CHECK (!log::to_priority ("quark", level));
  BOOST_CHECK (!log::to_priority ("6", level));
  BOOST_CHECK (!log::to_priority ("", level));
  BOOST_CHECK_EQUAL (log::BRIEF, level);
}

BOOST_FIXTURE_TEST_CASE (tagged_by_priority, fixture)
{
  { log::error ("short write"); }

  BOOST_CHECK (std::string::npos != s.str ().find ("] error: short write\n"));
}

BOOST_FIXTURE_TEST_CASE (tagged_by_category, fixture)
{
  { log::brief (log::CONNEXION, "opened %1%") % "/dev/usb/lp0"; }

  BOOST_CHECK (std::string::npos
               != s.str ().find ("] brief/cnx: opened /dev/usb/lp0\n"));
}

BOOST_AUTO_TEST_CASE (priority_names)
{
  BOOST_CHECK_EQUAL ("fatal", std::string (log::name (log::FATAL)));
  BOOST_CHECK_EQUAL ("debug", std::string (log::name (log::DEBUG)));
}

template <typename fmtT>
void
verbosity (log::priority level)
{
  log::threshold = level;
  log::matching  = log::ALL;

  // construct an empty message format of a certain length
  std::string str;
  const int length = 5;
  str.resize (length);

  fmtT fmt (str);

  std::ostringstream s;
  std::streambuf *buf = log::os_.rdbuf (s.rdbuf ());

  // Make sure all messages are out of scope by the time we start
  // checking things.
  {
    log::fatal (fmt);
    log::alert (fmt);
    log::error (fmt);
    log::brief (fmt);
    log::trace (fmt);
    log::debug (fmt);
  }

  // This assumes that the message tags do not add any NUL characters
  // into the string it generates.
  int expect = length * (level + 1);
  std::string msg = s.str ();
  int result = std::count (msg.begin (), msg.end (), '\0');

  BOOST_CHECK_EQUAL (expect, result);

  log::os_.rdbuf (buf);
}

bool
init_test_runner ()
{
  namespace but = ::boost::unit_test;

  std::list<log::priority> levels;
  levels.push_back (log::FATAL);
  levels.push_back (log::TRACE);
  levels.push_back (log::ERROR);
  levels.push_back (log::DEBUG);
  levels.push_back (log::ALERT);
  levels.push_back (log::BRIEF);

  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE ((verbosity<std::string>),
                                 levels.begin (), levels.end ()));
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE ((verbosity<insatsu::format>),
                                 levels.begin (), levels.end ()));

  return true;
}

#include "insatsu/test/runner.ipp"
