//  connexion.hpp -- byte transports between software and printer
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

#ifndef insatsu_connexion_hpp_
#define insatsu_connexion_hpp_

#include <string>

#include "memory.hpp"
#include "octet.hpp"

#include "pattern/decorator.hpp"

namespace insatsu {

//! Shuttle octets between software and a printer
/*! Implementations block until the transfer completes, fails or the
 *  timeout (in seconds) expires.  They return the number of octets
 *  actually transferred, which may be less than \a size when the
 *  device did not keep up in time.  Any other failure is reported by
 *  throwing a \c std::runtime_error.
 */
class connexion
{
public:
  typedef shared_ptr< connexion > ptr;

  virtual ~connexion () {}

  virtual streamsize send (const octet *message, streamsize size) = 0;
  virtual streamsize send (const octet *message, streamsize size,
                           double timeout) = 0;
  virtual streamsize recv (octet *message, streamsize size) = 0;
  virtual streamsize recv (octet *message, streamsize size,
                           double timeout) = 0;

  //! Creates a connexion of a given \a type
  /*! Supported types are \c "usb", with a \a path of the form \c
   *  VID:PID in hexadecimal notation, and \c "file", with a \a path
   *  naming a device node such as \c /dev/usb/lp0.  When \a debug is
   *  set, all traffic is dumped in hexadecimal form as well.
   */
  static connexion::ptr create (const std::string& type,
                                const std::string& path,
                                const bool debug = false);
};

template<>
class decorator< connexion >
  : public connexion
{
public:
  typedef shared_ptr< connexion > ptr;

  decorator (ptr instance);

  virtual streamsize send (const octet *message, streamsize size);
  virtual streamsize send (const octet *message, streamsize size,
                           double timeout);
  virtual streamsize recv (octet *message, streamsize size);
  virtual streamsize recv (octet *message, streamsize size,
                           double timeout);

protected:
  typedef decorator base_;

  ptr instance_;
};

}       // namespace insatsu

#endif  /* insatsu_connexion_hpp_ */
