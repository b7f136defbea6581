//  hexdump.hpp -- octet dumping connexion decorator
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

#ifndef connexions_hexdump_hpp_
#define connexions_hexdump_hpp_

#include <iostream>

#include <insatsu/connexion.hpp>

namespace insatsu {

namespace _cnx_ {

//! Wraps \a instance so that its traffic is dumped to \c std::cerr
connexion::ptr make_hexdump (connexion::ptr instance);

//! Dump all printer traffic in hexadecimal and ASCII form
class hexdump
  : public decorator< connexion >
{
public:
  hexdump (connexion::ptr instance, std::ostream& os = std::cerr)
    : base_(instance), os_(os)
  {}

  virtual streamsize send (const octet *message, streamsize size);
  virtual streamsize send (const octet *message, streamsize size,
                           double timeout);
  virtual streamsize recv (octet *message, streamsize size);
  virtual streamsize recv (octet *message, streamsize size,
                           double timeout);

protected:
  void hexdump_(const octet *message, streamsize size,
                const std::string& io);

  std::ostream&  os_;
};

} // namespace _cnx_
} // namespace insatsu

#endif  /* connexions_hexdump_hpp_ */
