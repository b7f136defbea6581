//  connexion.cpp -- byte transports between software and printer
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "insatsu/connexion.hpp"
#include "insatsu/log.hpp"
#include "connexions/file.hpp"
#include "connexions/hexdump.hpp"
#include "connexions/usb.hpp"

namespace insatsu {

using std::runtime_error;

connexion::ptr
connexion::create (const std::string& type, const std::string& path,
                   const bool debug)
{
  ptr cnx;

  /**/ if ("usb" == type)
    {
      cnx = _cnx_::make_usb (path);
    }
  else if ("file" == type)
    {
      cnx = _cnx_::make_file (path);
    }

  if (!cnx)
    {
      log::fatal ("unsupported connexion: '%1%:%2%'") % type % path;
      BOOST_THROW_EXCEPTION
        (runtime_error ("unsupported connexion type: '" + type + "'"));
    }

  if (debug)
    {
      cnx = _cnx_::make_hexdump (cnx);
    }

  return cnx;
}

decorator<connexion>::decorator (ptr instance)
  : instance_(instance)
{}

streamsize
decorator<connexion>::send (const octet *message, streamsize size)
{
  return instance_->send (message, size);
}

streamsize
decorator<connexion>::send (const octet *message, streamsize size,
                            double timeout)
{
  return instance_->send (message, size, timeout);
}

streamsize
decorator<connexion>::recv (octet *message, streamsize size)
{
  return instance_->recv (message, size);
}

streamsize
decorator<connexion>::recv (octet *message, streamsize size,
                            double timeout)
{
  return instance_->recv (message, size, timeout);
}

} // namespace insatsu
