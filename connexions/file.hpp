//  file.hpp -- printer device node connexion
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

#ifndef connexions_file_hpp_
#define connexions_file_hpp_

#include <string>

#include <insatsu/connexion.hpp>

namespace insatsu {

namespace _cnx_ {

connexion::ptr make_file (const std::string& path);

//! Talk to a printer through a character device node
/*! This covers the kernel's USB printer class driver (\c usblp) as
 *  well as serial and parallel port nodes.  Receiving waits for data
 *  to become available for at most the timeout.
 */
class file : public connexion
{
public:
  file (const std::string& path);

  virtual ~file (void);

  virtual streamsize send (const octet *message, streamsize size);
  virtual streamsize send (const octet *message, streamsize size,
                           double timeout);
  virtual streamsize recv (octet *message, streamsize size);
  virtual streamsize recv (octet *message, streamsize size,
                           double timeout);

private:
  bool wait_(short events, double timeout);

  int fd_;
  std::string path_;

  static double default_timeout_;
};

} // namespace _cnx_
} // namespace insatsu

#endif  /* connexions_file_hpp_ */
