//  raster.cpp -- unit tests for image encoding
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
#include <vector>

#include <boost/test/unit_test.hpp>

#include "insatsu/test/script.hpp"

#include "../exception.hpp"
#include "../raster.hpp"

using namespace insatsu::_drv_::escpos;
using insatsu::streamsize;
using insatsu::test::octets;

namespace {

//  An all black image of the given size
struct black_image
{
  std::vector< byte > pixels;
  bitmap image;

  black_image (unsigned width, unsigned height)
    : pixels (((width + 7) / 8) * height, '\xff')
    , image (&pixels[0], width, height)
  {}
};

}       // namespace

BOOST_AUTO_TEST_SUITE (bitmap_view)

BOOST_AUTO_TEST_CASE (geometry)
{
  black_image b (10, 3);

  BOOST_CHECK_EQUAL (2, b.image.bytes_per_line ());
  BOOST_CHECK_EQUAL (6, b.image.size ());
}

BOOST_AUTO_TEST_CASE (pixel_order)
{
  const byte pixels[] = { '\x80', '\x01' };
  bitmap image (pixels, 8, 2);

  BOOST_CHECK (image.is_black (0, 0));
  BOOST_CHECK (!image.is_black (1, 0));
  BOOST_CHECK (image.is_black (7, 1));
  BOOST_CHECK (!image.is_black (0, 1));
}

BOOST_AUTO_TEST_CASE (outside_is_white)
{
  black_image b (8, 8);

  BOOST_CHECK (!b.image.is_black (8, 0));
  BOOST_CHECK (!b.image.is_black (0, 8));
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (raster_encoding)

BOOST_AUTO_TEST_CASE (header_and_payload)
{
  const byte pixels[] = { '\xf0', '\x0f', '\xaa', '\x55', '\x00', '\xff' };
  bitmap image (pixels, 12, 3);

  std::string expected
    (octets ("\x1d\x76\x30\x00" "\x02\x00" "\x03\x00", 8)
     + std::string (pixels, sizeof (pixels)));

  BOOST_CHECK_EQUAL (expected, raster (image).str ());
}

BOOST_AUTO_TEST_CASE (scale_modes)
{
  black_image b (8, 1);

  BOOST_CHECK_EQUAL ('\x01', raster (b.image, DOUBLE_WIDTH)[3]);
  BOOST_CHECK_EQUAL ('\x02', raster (b.image, DOUBLE_HEIGHT)[3]);
  BOOST_CHECK_EQUAL ('\x03', raster (b.image, QUADRUPLE)[3]);
}

BOOST_AUTO_TEST_CASE (little_endian_sizes)
{
  black_image b (8 * 300, 258);
  byte_buffer buf (raster (b.image));

  BOOST_CHECK_EQUAL (octets ("\x2c\x01" "\x02\x01", 4),
                     buf.str ().substr (4, 4));
  BOOST_CHECK_EQUAL (8 + b.image.size (), streamsize (buf.size ()));
}

//  Size checks come before any pixel is looked at
BOOST_AUTO_TEST_CASE (oversize_raster)
{
  const byte pixels[] = { '\xff' };

  BOOST_CHECK_THROW (raster (bitmap (pixels, 8, 65536)), invalid_argument);
  BOOST_CHECK_THROW (raster (bitmap (pixels, 8 * 65536, 1)),
                     invalid_argument);
}

BOOST_AUTO_TEST_CASE (mode_tokens)
{
  BOOST_CHECK_EQUAL (NORMAL, to_raster_mode ("normal"));
  BOOST_CHECK_EQUAL (DOUBLE_WIDTH, to_raster_mode ("DW"));
  BOOST_CHECK_EQUAL (DOUBLE_HEIGHT, to_raster_mode ("dh"));
  BOOST_CHECK_EQUAL (QUADRUPLE, to_raster_mode ("QD"));
  BOOST_CHECK_EQUAL (NORMAL, to_raster_mode ("huge"));
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (bit_image_encoding)

BOOST_AUTO_TEST_CASE (triple_density_banding)
{
  black_image b (4, 30);

  std::vector< byte_buffer > bands (bit_image (b.image, DOUBLE_24));

  BOOST_REQUIRE_EQUAL (2, bands.size ());

  // 24 rows, all of them black
  std::string first (octets ("\x1b\x2a\x21" "\x04\x00", 5));
  first += std::string (3 * 4, '\xff');
  first += '\n';
  BOOST_CHECK_EQUAL (first, bands[0].str ());

  // 6 black rows padded with 18 white ones
  std::string second (octets ("\x1b\x2a\x21" "\x04\x00", 5));
  for (int x = 0; x < 4; ++x)
    second += octets ("\xfc\x00\x00", 3);
  second += '\n';
  BOOST_CHECK_EQUAL (second, bands[1].str ());
}

BOOST_AUTO_TEST_CASE (one_line_feed_per_band)
{
  black_image b (16, 30);

  std::vector< byte_buffer > bands (bit_image (b.image, SINGLE_24));

  for (std::vector< byte_buffer >::size_type i = 0; i < bands.size (); ++i)
    {
      std::string s (bands[i].str ());
      BOOST_CHECK_EQUAL ('\n', s[s.size () - 1]);
      BOOST_CHECK_EQUAL (5 + 3 * 16 + 1, s.size ());
    }
}

BOOST_AUTO_TEST_CASE (single_density_banding)
{
  black_image b (2, 30);

  std::vector< byte_buffer > bands (bit_image (b.image, SINGLE_8));

  BOOST_REQUIRE_EQUAL (4, bands.size ());
  BOOST_CHECK_EQUAL (octets ("\x1b\x2a\x00" "\x02\x00" "\xff\xff" "\n", 8),
                     bands[0].str ());
  BOOST_CHECK_EQUAL (octets ("\x1b\x2a\x00" "\x02\x00" "\xfc\xfc" "\n", 8),
                     bands[3].str ());
}

BOOST_AUTO_TEST_CASE (column_order)
{
  //  a single black pixel at the top of the second column
  const byte pixels[] = { '\x40', '\x00', '\x00', '\x00',
                          '\x00', '\x00', '\x00', '\x00' };
  bitmap image (pixels, 2, 8);

  std::vector< byte_buffer > bands (bit_image (image, DOUBLE_8));

  BOOST_REQUIRE_EQUAL (1, bands.size ());
  BOOST_CHECK_EQUAL (octets ("\x1b\x2a\x01" "\x02\x00" "\x00\x80" "\n", 8),
                     bands[0].str ());
}

BOOST_AUTO_TEST_CASE (oversize_bit_image)
{
  const byte pixels[] = { '\xff' };

  BOOST_CHECK_THROW (bit_image (bitmap (pixels, 65536, 1)),
                     invalid_argument);
}

BOOST_AUTO_TEST_CASE (density_tokens)
{
  BOOST_CHECK_EQUAL (SINGLE_8, to_density ("s8"));
  BOOST_CHECK_EQUAL (DOUBLE_8, to_density ("D8"));
  BOOST_CHECK_EQUAL (SINGLE_24, to_density ("S24"));
  BOOST_CHECK_EQUAL (DOUBLE_24, to_density ("D24"));
  BOOST_CHECK_EQUAL (DOUBLE_24, to_density ("bogus"));
  BOOST_CHECK_EQUAL (1, column_bytes (SINGLE_8));
  BOOST_CHECK_EQUAL (3, column_bytes (DOUBLE_24));
}

BOOST_AUTO_TEST_SUITE_END ()

#include "insatsu/test/runner.ipp"
