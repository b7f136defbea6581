//  barcode.cpp -- unit tests for barcode encoding
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

#include "insatsu/test/script.hpp"

#include "../barcode.hpp"
#include "../exception.hpp"

using namespace insatsu::_drv_::escpos;
using insatsu::test::octets;

BOOST_AUTO_TEST_SUITE (codeset_c)

BOOST_AUTO_TEST_CASE (digit_pairs)
{
  BOOST_CHECK_EQUAL (octets ("\x00", 1), to_codeset_c ("00").str ());
  BOOST_CHECK_EQUAL (octets ("\x01", 1), to_codeset_c ("01").str ());
  BOOST_CHECK_EQUAL (octets ("\x0c\x22", 2), to_codeset_c ("1234").str ());
  BOOST_CHECK_EQUAL (octets ("\x63\x00\x2a", 3),
                     to_codeset_c ("990042").str ());
}

BOOST_AUTO_TEST_CASE (empty_text)
{
  BOOST_CHECK (to_codeset_c ("").empty ());
}

BOOST_AUTO_TEST_CASE (not_a_number_error)
{
  BOOST_CHECK_THROW (to_codeset_c ("foo"), not_a_number);
  BOOST_CHECK_THROW (to_codeset_c ("12a4"), not_a_number);
}

BOOST_AUTO_TEST_CASE (invalid_length_error)
{
  BOOST_CHECK_THROW (to_codeset_c ("123"), invalid_length);
}

BOOST_AUTO_TEST_CASE (digit_check_comes_first)
{
  BOOST_CHECK_THROW (to_codeset_c ("12x"), not_a_number);
}

BOOST_AUTO_TEST_CASE (errors_are_barcode_errors)
{
  BOOST_CHECK_THROW (to_codeset_c ("foo"), barcode_error);
  BOOST_CHECK_THROW (to_codeset_c ("123"), barcode_error);
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (selectors)

BOOST_AUTO_TEST_CASE (snbc_width_clamp)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x02", 3), enc.width (10).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x02", 3), enc.width (1).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x04", 3), enc.width (4).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x06", 3), enc.width (6).str ());
}

BOOST_AUTO_TEST_CASE (p3_width_clamp)
{
  barcode_encoder enc (dialect::get (dialect::P3));

  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x03", 3), enc.width (0).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x03", 3), enc.width (7).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x01", 3), enc.width (1).str ());
}

BOOST_AUTO_TEST_CASE (epic_fixed_width)
{
  barcode_encoder enc (dialect::get (dialect::EPIC));

  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x01", 3), enc.width (1).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x01", 3), enc.width (4).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x77\x01", 3), enc.width (0).str ());
}

BOOST_AUTO_TEST_CASE (unknown_width)
{
  barcode_encoder enc (dialect::get (dialect::UNKNOWN));

  BOOST_CHECK_THROW (enc.width (2), unsupported);
}

BOOST_AUTO_TEST_CASE (height_clamp)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_EQUAL (octets ("\x1d\x68\xa2", 3), enc.height (162).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x68\x01", 3), enc.height (0).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x68\xff", 3), enc.height (300).str ());
}

BOOST_AUTO_TEST_CASE (position_selector)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_EQUAL (octets ("\x1d\x48\x00", 3), enc.position (HRI_OFF).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x48\x01", 3), enc.position (HRI_ABOVE).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x48\x02", 3), enc.position (HRI_BELOW).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x48\x03", 3), enc.position (HRI_BOTH).str ());
}

BOOST_AUTO_TEST_CASE (font_selector)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_EQUAL (octets ("\x1d\x66\x00", 3), enc.font (STANDARD).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x66\x00", 3), enc.font (FONT_A).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x66\x01", 3), enc.font (COMPRESSED).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x66\x01", 3), enc.font (FONT_B).str ());
}

BOOST_AUTO_TEST_CASE (symbology_selector)
{
  barcode_encoder snbc (dialect::get (dialect::SNBC));
  barcode_encoder epic (dialect::get (dialect::EPIC));

  BOOST_CHECK_EQUAL (octets ("\x1d\x6b\x02", 3), snbc.type (EAN13).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x6b\x49", 3), snbc.type (CODE128).str ());
  BOOST_CHECK_EQUAL (octets ("\x1d\x6b\x08", 3), epic.type (CODE128).str ());
}

BOOST_AUTO_TEST_CASE (symbology_fallback)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_EQUAL (enc.type (EAN13), enc.type (UPCA));
  BOOST_CHECK_EQUAL (enc.type (EAN13), enc.type (CODE39));
  BOOST_CHECK_EQUAL (enc.type (EAN13), enc.type (PDF417));
}

BOOST_AUTO_TEST_CASE (order_independence)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));
  barcode_spec spec (CODE128, 3, 80, HRI_ABOVE, FONT_B);

  byte_buffer forward;
  forward << enc.width (spec.width)
          << enc.height (spec.height)
          << enc.position (spec.position)
          << enc.font (spec.font)
          << enc.type (spec.type);

  byte_buffer type (enc.type (spec.type));
  byte_buffer font (enc.font (spec.font));
  byte_buffer position (enc.position (spec.position));
  byte_buffer height (enc.height (spec.height));
  byte_buffer width (enc.width (spec.width));

  byte_buffer backward;
  backward << width << height << position << font << type;

  BOOST_CHECK_EQUAL (forward, backward);
  BOOST_CHECK_EQUAL (enc.encode (spec, "12345678"),
                     enc.encode (spec, "12345678"));
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (encoding)

BOOST_AUTO_TEST_CASE (snbc_codeset_c)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));
  barcode_spec spec;

  std::string expected
    ("\x1d\x77\x02"
     "\x1d\x68\xa2"
     "\x1d\x48\x02"
     "\x1d\x66\x00"
     "\x1d\x6b\x49"
     "\x04" "\x7b\x43" "\x0c\x22", 20);

  BOOST_CHECK_EQUAL (expected, enc.encode (spec, "1234").str ());
}

BOOST_AUTO_TEST_CASE (snbc_empty_text_uses_codeset_c)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));
  barcode_spec spec;

  std::string expected
    ("\x1d\x77\x02"
     "\x1d\x68\xa2"
     "\x1d\x48\x02"
     "\x1d\x66\x00"
     "\x1d\x6b\x49"
     "\x02" "\x7b\x43", 18);

  BOOST_CHECK_EQUAL (expected, enc.encode (spec, "").str ());
}

BOOST_AUTO_TEST_CASE (snbc_codeset_b)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));
  barcode_spec spec;

  std::string expected
    ("\x1d\x77\x02"
     "\x1d\x68\xa2"
     "\x1d\x48\x02"
     "\x1d\x66\x00"
     "\x1d\x6b\x49"
     "\x05" "\x7b\x42" "123", 21);

  BOOST_CHECK_EQUAL (expected, enc.encode (spec, "123").str ());
  BOOST_CHECK_EQUAL (std::string ("\x7b\x42" "AB-12", 7),
                     enc.encode (spec, "AB-12").str ().substr (16));
}

BOOST_AUTO_TEST_CASE (snbc_code128_only)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_THROW (enc.encode (barcode_spec (EAN13), "4006381333931"),
                     unsupported);
}

BOOST_AUTO_TEST_CASE (snbc_block_too_long)
{
  barcode_encoder enc (dialect::get (dialect::SNBC));

  BOOST_CHECK_NO_THROW (enc.encode (barcode_spec (), std::string (253, 'x')));
  BOOST_CHECK_THROW (enc.encode (barcode_spec (), std::string (254, 'x')),
                     invalid_length);
}

BOOST_AUTO_TEST_CASE (epic_compact)
{
  barcode_encoder enc (dialect::get (dialect::EPIC));
  barcode_spec spec (CODE128, 5, 100, HRI_OFF, FONT_B);

  std::string expected
    ("\x1d\x48\x02"
     "\x1d\x77\x01"
     "\x1d\x6b\x49"
     "\x04" "1234" "\x00", 15);

  BOOST_CHECK_EQUAL (expected, enc.encode (spec, "1234").str ());
}

BOOST_AUTO_TEST_CASE (epic_any_symbology)
{
  barcode_encoder enc (dialect::get (dialect::EPIC));

  BOOST_CHECK_EQUAL (enc.encode (barcode_spec (CODE128), "ABC"),
                     enc.encode (barcode_spec (EAN13), "ABC"));
}

BOOST_AUTO_TEST_CASE (p3_unsupported)
{
  barcode_encoder enc (dialect::get (dialect::P3));

  BOOST_CHECK_THROW (enc.encode (barcode_spec (), "1234"), unsupported);
}

BOOST_AUTO_TEST_CASE (unknown_unsupported)
{
  barcode_encoder enc (dialect::get (dialect::UNKNOWN));

  BOOST_CHECK_THROW (enc.encode (barcode_spec (), "1234"), unsupported);
}

BOOST_AUTO_TEST_SUITE_END ()

#include "insatsu/test/runner.ipp"
