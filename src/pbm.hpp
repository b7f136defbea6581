//  pbm.hpp -- portable bitmap images
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

#ifndef src_pbm_hpp_
#define src_pbm_hpp_

#include <istream>
#include <vector>

#include "drivers/escpos/raster.hpp"

namespace insatsu {

//! A binary portable bitmap (P4) image
/*! The P4 pixel layout is that of an escpos::bitmap already: rows top
 *  to bottom, padded to whole bytes, leftmost pixel in the most
 *  significant bit and a set bit for black.
 */
class pbm
{
public:
  //! Reads a P4 image from \a is
  /*! Throws a \c std::runtime_error when the header is malformed or
   *  the pixel data is truncated.
   */
  explicit pbm (std::istream& is);

  unsigned width () const { return width_; }
  unsigned height () const { return height_; }

  //! A view of the pixels, valid as long as this image is
  _drv_::escpos::bitmap bitmap () const;

private:
  unsigned header_value_(std::istream& is);

  unsigned width_;
  unsigned height_;
  std::vector< _drv_::escpos::byte > pixels_;
};

} // namespace insatsu

#endif /* src_pbm_hpp_ */
