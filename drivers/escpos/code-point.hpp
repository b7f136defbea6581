//  code-point.hpp -- named constants for ESC/POS protocol bytes
//  Copyright (C) 2012, 2013  SEIKO EPSON CORPORATION
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

#ifndef drivers_escpos_code_point_hpp_
#define drivers_escpos_code_point_hpp_

#include <insatsu/cstdint.hpp>
#include <insatsu/octet.hpp>

namespace insatsu {
namespace _drv_ {
namespace escpos {

//! Bit patterns in groups of eight.
/*! The printer command references talk about bytes throughout so the
 *  driver uses the same name.
 */
typedef insatsu::octet byte;

//! Documented code points of the ESC/POS command set and its vendor
//! variants.
/*! Commands are documented as sequences of named control characters
 *  and printable ASCII.  The code_point namespace defines readability
 *  constants for all the patterns used by the driver.
 *
 *  \note For ease of use \e all constants defined in the code_point
 *        namespace are imported into the escpos namespace.  Constants
 *        can be used without a code_point namespace qualification.
 */
namespace code_point {

  const byte NUL = 0x00;        //!< null
  const byte EOT = 0x04;        //!< end of transmission
  const byte HT  = 0x09;        //!< horizontal tab
  const byte LF  = 0x0a;        //!< line feed
  const byte VT  = 0x0b;        //!< vertical tab
  const byte FF  = 0x0c;        //!< form feed
  const byte CR  = 0x0d;        //!< carriage return
  const byte DLE = 0x10;        //!< data link escape
  const byte ESC = 0x1b;        //!< escape
  const byte FS  = 0x1c;        //!< file separator
  const byte GS  = 0x1d;        //!< group separator

  const byte SPACE    = 0x20;
  const byte EXCLAM   = 0x21;
  const byte ASTERISK = 0x2a;
  const byte MINUS    = 0x2d;
  const byte EQUAL    = 0x3d;
  const byte QUESTION = 0x3f;
  const byte AT_MARK  = 0x40;

  const byte UPPER_B = 0x42;
  const byte UPPER_C = 0x43;
  const byte UPPER_E = 0x45;
  const byte UPPER_H = 0x48;
  const byte UPPER_I = 0x49;
  const byte UPPER_L = 0x4c;
  const byte UPPER_M = 0x4d;
  const byte UPPER_Q = 0x51;
  const byte UPPER_R = 0x52;
  const byte UPPER_V = 0x56;
  const byte UPPER_Z = 0x5a;

  const byte BRACE_L = 0x7b;    //!< Code128 code set selector prefix

  const byte LOWER_A = 0x61;
  const byte LOWER_F = 0x66;
  const byte LOWER_H = 0x68;
  const byte LOWER_K = 0x6b;
  const byte LOWER_M = 0x6d;
  const byte LOWER_P = 0x70;
  const byte LOWER_R = 0x72;
  const byte LOWER_V = 0x76;
  const byte LOWER_W = 0x77;

  //! Box drawing horizontal in code page 437
  const byte BOX_HORIZONTAL = '\xc4';

  //! Vendor specific maintenance counter queries
  const byte MAINTENANCE_PAPER_REMAINING = '\xe1';
  const byte MAINTENANCE_CUT_COUNT       = '\xe2';
  const byte MAINTENANCE_PRINTED_LENGTH  = '\xe3';
  const byte MAINTENANCE_POWER_COUNT     = '\xe5';
  const byte MAINTENANCE_PAPER_END_LIMIT = '\xe6';
  const byte MAINTENANCE_SERIAL_NUMBER   = '\xea';

  //! An unused code_point for unit testing purposes
  /*! It may be used to check for out-of-bounds reads and writes in
   *  byte buffers in unit test implementations.
   */
  const byte TEST_BYTE = '\xff';

} // namespace code_point

using namespace code_point;

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_code_point_hpp_ */
