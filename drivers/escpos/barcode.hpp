//  barcode.hpp -- 1D barcode command sequences
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

#ifndef drivers_escpos_barcode_hpp_
#define drivers_escpos_barcode_hpp_

#include <string>

#include "buffer.hpp"
#include "dialect.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

typedef enum {
  UPCA     = 0,
  UPCE     = 1,
  EAN13    = 2,
  EAN8     = 3,
  CODE39   = 4,
  ITF      = 5,
  CODABAR  = 6,
  PDF417   = 10,
  QRCODE   = 11,
  MAXICODE = 12,
  GS1      = 13,
  CODE93   = 72,
  CODE128  = 73,
} symbology;

//! Where the human readable interpretation goes
typedef enum {
  HRI_OFF   = 0x00,
  HRI_ABOVE = 0x01,
  HRI_BELOW = 0x02,
  HRI_BOTH  = 0x03,
} hri_position;

//! HRI character font
/*! Vendors name the same two fonts differently.  \c STANDARD and \c
 *  FONT_A select the same font, as do \c COMPRESSED and \c FONT_B.
 */
typedef enum {
  STANDARD,
  COMPRESSED,
  FONT_A,
  FONT_B,
} hri_font;

struct barcode_spec
{
  int width;                    //!< module width, see dialect
  int height;                   //!< in dots, 1 to 255
  hri_font font;
  symbology type;
  hri_position position;

  barcode_spec (symbology type = CODE128,
                int width = 2, int height = 162,
                hri_position position = HRI_BELOW,
                hri_font font = STANDARD);
};

//! Packs an even number of decimal digits two to a byte
/*! Throws not_a_number if \a text contains anything but the digits
 *  \c 0 through \c 9 and invalid_length if the number of digits is
 *  odd.  The digit check comes first.
 */
byte_buffer to_codeset_c (const std::string& text);

//! Produces barcode command sequences for a particular dialect
/*! The selector member functions each produce one complete command.
 *  None of them depend on each other so the order in which they are
 *  called does not affect their results.
 */
class barcode_encoder
{
public:
  barcode_encoder (const dialect::ptr& model);

  byte_buffer width (int requested) const;
  byte_buffer height (int requested) const;
  byte_buffer position (hri_position pos) const;
  byte_buffer font (hri_font font) const;
  byte_buffer type (symbology sym) const;

  //! The complete command sequence to print \a text as a barcode
  /*! Throws unsupported if the dialect cannot print the requested
   *  barcode and barcode_error derivatives if \a text cannot be
   *  encoded.
   */
  byte_buffer encode (const barcode_spec& spec,
                      const std::string& text) const;

private:
  byte_buffer code128_block_(const barcode_spec& spec,
                             const std::string& text) const;
  byte_buffer compact_(const std::string& text) const;

  dialect::ptr model_;
};

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_barcode_hpp_ */
