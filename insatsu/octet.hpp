//  octet.hpp -- eight bit units of printer traffic
//  Copyright (C) 2012, 2015  SEIKO EPSON CORPORATION
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

#ifndef insatsu_octet_hpp_
#define insatsu_octet_hpp_

#include <ios>
#include <string>

namespace insatsu {

//! A set of eight bits with no particular interpretation attached
/*! Although it is common to use plain \c char or a \c byte type for
 *  this purpose, the former has an interpretation attached and the
 *  latter does not necessarily consist of eight bits.
 *
 *  \sa  http://en.wikipedia.org/wiki/Octet_(computing)
 */
typedef char octet;

//! Traits extensions for octets exchanged with a printer
struct traits
  : std::char_traits< octet >
{
  //! Convert \a c to its equivalent integer representation
  /*! \note This is meant to work with both signed and unsigned octet
   *        types.  The result is always in the 0x00 to 0xff range.
   */
  static int_type to_int_type (const char_type& c);

  //! Convert an integer in the 0x00 to 0xff range to an octet
  static char_type to_char_type (const int_type& i);
};

//! Signed integral type that can be used to count octets
using std::streamsize;

} // namespace insatsu

#endif /* insatsu_octet_hpp_ */
