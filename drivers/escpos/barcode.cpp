//  barcode.cpp -- 1D barcode command sequences
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

#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "barcode.hpp"
#include "exception.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

namespace {

const int max_block_size = 0xff;

bool
all_digits (const std::string& text)
{
  for (std::string::size_type i = 0; i < text.size (); ++i)
    {
      if (!('0' <= text[i] && text[i] <= '9'))
        return false;
    }
  return true;
}

inline byte_buffer
selector (byte function, byte value)
{
  byte_buffer rv;
  rv << GS << function << value;
  return rv;
}

}       // namespace

barcode_spec::barcode_spec (symbology type, int width, int height,
                            hri_position position, hri_font font)
  : width (width), height (height), font (font), type (type)
  , position (position)
{}

byte_buffer
to_codeset_c (const std::string& text)
{
  if (!all_digits (text))
    BOOST_THROW_EXCEPTION (not_a_number ());

  if (text.size () % 2)
    BOOST_THROW_EXCEPTION (invalid_length ());

  byte_buffer rv;
  rv.reserve (text.size () / 2);

  for (std::string::size_type i = 0; i < text.size (); i += 2)
    {
      rv << byte (10 * (text[i] - '0') + (text[i+1] - '0'));
    }
  return rv;
}

barcode_encoder::barcode_encoder (const dialect::ptr& model)
  : model_(model)
{}

byte_buffer
barcode_encoder::width (int requested) const
{
  return selector (LOWER_W, model_->barcode_width (requested));
}

byte_buffer
barcode_encoder::height (int requested) const
{
  int h = std::max (1, std::min (requested, 0xff));
  return selector (LOWER_H, h);
}

byte_buffer
barcode_encoder::position (hri_position pos) const
{
  return selector (UPPER_H, pos);
}

byte_buffer
barcode_encoder::font (hri_font font) const
{
  return selector (LOWER_F, (COMPRESSED == font || FONT_B == font));
}

//  Only EAN13 and Code128 have been verified on actual hardware.  All
//  other symbologies get the EAN13 selector.
byte_buffer
barcode_encoder::type (symbology sym) const
{
  byte code = EAN13;

  if (CODE128 == sym)
    code = (model_->supports (dialect::CODE128_BLOCK) ? 0x49 : 0x08);

  return selector (LOWER_K, code);
}

byte_buffer
barcode_encoder::encode (const barcode_spec& spec,
                         const std::string& text) const
{
  if (CODE128 == spec.type && model_->supports (dialect::CODE128_BLOCK))
    return code128_block_(spec, text);

  if (model_->supports (dialect::COMPACT_BARCODE))
    return compact_(text);

  log::brief (log::ESCPOS_DRIVER, "%1%: barcode type %2% not supported")
    % model_->name ()
    % spec.type;
  BOOST_THROW_EXCEPTION (unsupported ("barcode not supported by printer"));
}

//  The block is preceded by its own size.  The first two bytes of the
//  block select the code set that applies to the remainder.
byte_buffer
barcode_encoder::code128_block_(const barcode_spec& spec,
                                const std::string& text) const
{
  byte_buffer block;
  block << BRACE_L;

  if (0 == text.size () % 2
      && all_digits (text))
    {
      block << UPPER_C << to_codeset_c (text);
    }
  else
    {
      block << UPPER_B;
      block.append (text.data (), text.size ());
    }

  if (max_block_size < int (block.size ()))
    {
      log::error ("Code128 block too large: %1% bytes") % block.size ();
      BOOST_THROW_EXCEPTION (invalid_length ("barcode text too long"));
    }

  byte_buffer rv;
  rv << width (spec.width)
     << height (spec.height)
     << position (spec.position)
     << font (spec.font)
     << type (spec.type)
     << byte (block.size ())
     << block;
  return rv;
}

byte_buffer
barcode_encoder::compact_(const std::string& text) const
{
  if (max_block_size < int (text.size ()))
    BOOST_THROW_EXCEPTION (invalid_length ("barcode text too long"));

  byte_buffer rv;
  rv << position (HRI_BELOW)
     << width (0)
     << selector (LOWER_K, 0x49)
     << byte (text.size ());
  rv.append (text.data (), text.size ());
  rv << NUL;
  return rv;
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
