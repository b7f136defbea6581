//  raster.cpp -- monochrome bitmap command sequences
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

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "command.hpp"
#include "exception.hpp"
#include "raster.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

bitmap::bitmap (const byte *data, unsigned width, unsigned height)
  : data_(data), width_(width), height_(height)
{}

unsigned
bitmap::bytes_per_line () const
{
  return (width_ + 7) / 8;
}

streamsize
bitmap::size () const
{
  return streamsize (bytes_per_line ()) * height_;
}

bool
bitmap::is_black (unsigned x, unsigned y) const
{
  if (width_ <= x || height_ <= y) return false;

  return (0x80 >> (x % 8)) & data_[y * bytes_per_line () + x / 8];
}

raster_mode
to_raster_mode (const std::string& token)
{
  std::string s (boost::algorithm::to_upper_copy (token));

  /**/ if ("DW" == s) return DOUBLE_WIDTH;
  else if ("DH" == s) return DOUBLE_HEIGHT;
  else if ("QD" == s) return QUADRUPLE;

  return NORMAL;
}

bit_image_density
to_density (const std::string& token)
{
  std::string s (boost::algorithm::to_upper_copy (token));

  /**/ if ("S8"  == s) return SINGLE_8;
  else if ("D8"  == s) return DOUBLE_8;
  else if ("S24" == s) return SINGLE_24;

  return DOUBLE_24;
}

unsigned
column_bytes (bit_image_density density)
{
  return ((SINGLE_24 == density || DOUBLE_24 == density) ? 3 : 1);
}

byte_buffer
raster (const bitmap& image, raster_mode mode)
{
  if (0xffff < image.bytes_per_line () || 0xffff < image.height ())
    {
      log::error ("raster image too large: %1%x%2% pixels")
        % image.width ()
        % image.height ();
      BOOST_THROW_EXCEPTION
        (invalid_argument ("raster image exceeds 65535 bytes or rows"));
    }

  byte hdr[8] = { GS, LOWER_V, 0x30, byte (mode) };

  from_uint16_t (hdr + 4, image.bytes_per_line ());
  from_uint16_t (hdr + 6, image.height ());

  byte_buffer rv (hdr, sizeof (hdr));
  rv.append (image.data (), image.size ());
  return rv;
}

std::vector< byte_buffer >
bit_image (const bitmap& image, bit_image_density density)
{
  if (0xffff < image.width ())
    {
      log::error ("bit image too wide: %1% dots") % image.width ();
      BOOST_THROW_EXCEPTION
        (invalid_argument ("bit image exceeds 65535 dots per band"));
    }

  const unsigned n = column_bytes (density);
  const unsigned rows = 8 * n;

  std::vector< byte_buffer > rv;

  for (unsigned top = 0; top < image.height (); top += rows)
    {
      byte hdr[5] = { ESC, ASTERISK, byte (density) };
      from_uint16_t (hdr + 3, image.width ());

      byte_buffer band (hdr, sizeof (hdr));
      band.reserve (sizeof (hdr) + n * image.width () + 1);

      for (unsigned x = 0; x < image.width (); ++x)
        {
          for (unsigned k = 0; k < n; ++k)
            {
              int b = 0;
              for (unsigned bit = 0; bit < 8; ++bit)
                {
                  if (image.is_black (x, top + 8 * k + bit))
                    b |= 0x80 >> bit;
                }
              band << byte (b);
            }
        }
      band << LF;

      log::trace (log::ESCPOS_DRIVER, "bit image band at row %1%: %2% bytes")
        % top
        % band.size ();

      rv.push_back (band);
    }
  return rv;
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
