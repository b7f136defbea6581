//  pbm.cpp -- unit tests for portable bitmap reading
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

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "../pbm.hpp"

using insatsu::pbm;

namespace {

std::string
p4 (const std::string& header, const std::string& pixels)
{
  return header + pixels;
}

}       // namespace

BOOST_AUTO_TEST_CASE (dimensions_and_pixels)
{
  std::istringstream is (p4 ("P4\n10 2\n", std::string ("\xc0\x40\x01\x80", 4)));

  pbm image (is);

  BOOST_CHECK_EQUAL (10, image.width ());
  BOOST_CHECK_EQUAL (2, image.height ());
  BOOST_CHECK_EQUAL (2, image.bitmap ().bytes_per_line ());
  BOOST_CHECK (image.bitmap ().is_black (0, 0));
  BOOST_CHECK (image.bitmap ().is_black (1, 0));
  BOOST_CHECK (!image.bitmap ().is_black (2, 0));
  BOOST_CHECK (image.bitmap ().is_black (9, 0));
  BOOST_CHECK (!image.bitmap ().is_black (6, 1));
  BOOST_CHECK (image.bitmap ().is_black (7, 1));
  BOOST_CHECK (image.bitmap ().is_black (8, 1));
}

BOOST_AUTO_TEST_CASE (header_comments)
{
  std::istringstream is (p4 ("P4\n# created by hand\n8\n# rows\n1\n",
                             std::string ("\xff", 1)));

  pbm image (is);

  BOOST_CHECK_EQUAL (8, image.width ());
  BOOST_CHECK_EQUAL (1, image.height ());
  BOOST_CHECK (image.bitmap ().is_black (7, 0));
}

BOOST_AUTO_TEST_CASE (ascii_bitmap_rejected)
{
  std::istringstream is ("P1\n2 2\n1 0\n0 1\n");

  BOOST_CHECK_THROW (pbm image (is), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (zero_width_rejected)
{
  std::istringstream is ("P4 0 4\n");

  BOOST_CHECK_THROW (pbm image (is), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (truncated_pixels)
{
  std::istringstream is (p4 ("P4 16 2\n", std::string ("\x01\x02\x03", 3)));

  BOOST_CHECK_THROW (pbm image (is), std::runtime_error);
}

#include "insatsu/test/runner.ipp"
