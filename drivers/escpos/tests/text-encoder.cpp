//  text-encoder.cpp -- unit tests for text encoding
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

#include <string>

#include <boost/test/unit_test.hpp>

#include "../exception.hpp"
#include "../text-encoder.hpp"

using namespace insatsu::_drv_::escpos;

BOOST_AUTO_TEST_CASE (defaults)
{
  text_encoder enc;

  BOOST_CHECK_EQUAL ("UTF-8", enc.code_set ());
  BOOST_CHECK_EQUAL (text_encoder::REPLACE, enc.invalid_policy ());
}

BOOST_AUTO_TEST_CASE (utf8_passthrough)
{
  text_encoder enc;

  BOOST_CHECK_EQUAL ("caf\xc3\xa9 au lait", enc ("caf\xc3\xa9 au lait").str ());
}

BOOST_AUTO_TEST_CASE (empty_text)
{
  text_encoder enc ("ISO-8859-1");

  BOOST_CHECK (enc ("").empty ());
}

BOOST_AUTO_TEST_CASE (latin1_conversion)
{
  text_encoder enc ("ISO-8859-1");

  BOOST_CHECK_EQUAL ("caf\xe9", enc ("caf\xc3\xa9").str ());
}

BOOST_AUTO_TEST_CASE (long_text)
{
  text_encoder enc ("ISO-8859-1");
  std::string in;
  std::string out;

  for (int i = 0; i < 300; ++i)
    {
      in  += "\xc3\xa9";
      out += "\xe9";
    }

  BOOST_CHECK_EQUAL (out, enc (in).str ());
}

BOOST_AUTO_TEST_CASE (unrepresentable_replaced)
{
  text_encoder enc ("ISO-8859-1");

  BOOST_CHECK_EQUAL ("5 ? each", enc ("5 \xe2\x82\xac each").str ());
}

BOOST_AUTO_TEST_CASE (custom_replacement)
{
  text_encoder enc ("ISO-8859-1", text_encoder::REPLACE, '*');

  BOOST_CHECK_EQUAL ("5 * each", enc ("5 \xe2\x82\xac each").str ());
}

BOOST_AUTO_TEST_CASE (unrepresentable_skipped)
{
  text_encoder enc ("ISO-8859-1", text_encoder::SKIP);

  BOOST_CHECK_EQUAL ("5  each", enc ("5 \xe2\x82\xac each").str ());
}

BOOST_AUTO_TEST_CASE (unrepresentable_strict)
{
  text_encoder enc ("ISO-8859-1", text_encoder::STRICT);

  BOOST_CHECK_THROW (enc ("5 \xe2\x82\xac each"), invalid_argument);
  BOOST_CHECK_NO_THROW (enc ("5 EUR each"));
}

BOOST_AUTO_TEST_CASE (malformed_input)
{
  text_encoder enc ("ISO-8859-1");

  BOOST_CHECK_EQUAL ("a?b", enc ("a\xff" "b").str ());
}

BOOST_AUTO_TEST_CASE (truncated_input)
{
  text_encoder enc ("ISO-8859-1");

  BOOST_CHECK_EQUAL ("ab?", enc ("ab\xc3").str ());
}

BOOST_AUTO_TEST_CASE (unknown_code_set)
{
  text_encoder enc ("NO-SUCH-CODE-SET");

  BOOST_CHECK_THROW (enc ("text"), invalid_argument);
}

#include "insatsu/test/runner.ipp"
