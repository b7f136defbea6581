//  raster.hpp -- monochrome bitmap command sequences
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

#ifndef drivers_escpos_raster_hpp_
#define drivers_escpos_raster_hpp_

#include <string>
#include <vector>

#include "buffer.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

//! Read-only view of a packed, one bit per pixel image
/*! Rows are stored top to bottom, each padded to a whole number of
 *  bytes.  The leftmost pixel is the most significant bit and a set
 *  bit prints as a black dot.  The view does not own the pixels.
 */
class bitmap
{
public:
  bitmap (const byte *data, unsigned width, unsigned height);

  unsigned width () const { return width_; }
  unsigned height () const { return height_; }

  unsigned bytes_per_line () const;
  streamsize size () const;
  const byte * data () const { return data_; }

  //! Whether the pixel at (\a x, \a y) is black
  /*! Pixels outside the image are white.
   */
  bool is_black (unsigned x, unsigned y) const;

private:
  const byte *data_;
  unsigned width_;
  unsigned height_;
};

typedef enum {
  NORMAL          = 0,
  DOUBLE_WIDTH    = 1,
  DOUBLE_HEIGHT   = 2,
  QUADRUPLE       = 3,
} raster_mode;

typedef enum {
  SINGLE_8  = 0x00,
  DOUBLE_8  = 0x01,
  SINGLE_24 = 0x20,
  DOUBLE_24 = 0x21,
} bit_image_density;

//! Maps \c NORMAL, \c DW, \c DH and \c QD to a raster mode
/*! Matching is case-insensitive.  Anything else yields \c NORMAL.
 */
raster_mode to_raster_mode (const std::string& token);

//! Maps \c S8, \c D8, \c S24 and \c D24 to a bit image density
/*! Matching is case-insensitive.  Anything else yields \c DOUBLE_24.
 */
bit_image_density to_density (const std::string& token);

//! Number of bytes per column in a band of the given \a density
unsigned column_bytes (bit_image_density density);

//! The print raster image command for \a image
byte_buffer raster (const bitmap& image, raster_mode mode = NORMAL);

//! The bit image commands for \a image, one per band
/*! Every band covers eight rows per column byte and is terminated by
 *  a line feed.  The final band is padded with white rows.  Printing
 *  the bands with zero line spacing reproduces the image.
 */
std::vector< byte_buffer > bit_image (const bitmap& image,
                                      bit_image_density density = DOUBLE_24);

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_raster_hpp_ */
