//  list.cpp -- available printer lister
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstdlib>

#include <exception>
#include <iostream>
#include <vector>

#include <boost/exception/diagnostic_information.hpp>

#include <insatsu/format.hpp>
#include <insatsu/run-time.hpp>

#include "connexions/usb.hpp"
#include "drivers/escpos/dialect.hpp"

int
main (int argc, char *argv[])
{
  using insatsu::_cnx_::usb_device;
  using insatsu::_drv_::escpos::dialect;

  try
    {
      insatsu::run_time rt (argc, argv);

      if (rt.count ("help"))
        {
          std::cout << rt.help ("list available USB printers");
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      std::vector< usb_device > devices (usb_device::enumerate ());
      std::vector< usb_device >::const_iterator it;

      for (it = devices.begin (); devices.end () != it; ++it)
        {
          dialect::ptr model (dialect::infer (it->vendor_id, it->product_id,
                                              it->manufacturer));

          std::cout << insatsu::format ("%1$04x:%2$04x  %3$03d/%4$03d  "
                                        "%5%  %6% %7%\n")
            % it->vendor_id
            % it->product_id
            % it->bus
            % it->address
            % model->name ()
            % it->manufacturer
            % it->product;
        }
    }
  catch (const boost::exception& e)
    {
      std::cerr << boost::diagnostic_information (e);
      return EXIT_FAILURE;
    }
  catch (const std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
