//  exception.hpp -- ESC/POS driver failure conditions
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

#ifndef drivers_escpos_exception_hpp_
#define drivers_escpos_exception_hpp_

#include <exception>
#include <stdexcept>
#include <string>

namespace insatsu {
namespace _drv_ {
  namespace escpos
  {
    using std::runtime_error;

    class exception : public std::exception
    {
    public:
      exception (const std::string& message = std::string ())
        : message_(message)
      {}

      ~exception () throw ()
      {}

      const char *
      what () const throw ()
      {
        return message_.c_str ();
      }

    protected:
      std::string message_;
    };

    //!  The printer's dialect does not have the requested feature
    class unsupported : public exception
    {
    public:
      unsupported (const std::string& message
                   = "unsupported by printer dialect")
        : exception (message)
      {}
    };

    //!  A command argument is not one of the documented tokens
    class invalid_argument : public exception
    {
    public:
      invalid_argument (const std::string& message
                        = "invalid argument")
        : exception (message)
      {}
    };

    //!  Fewer octets than requested made it to the printer
    class timeout : public exception
    {
    public:
      timeout (const std::string& message
               = "short transfer")
        : exception (message)
      {}
    };

    //!  Barcode text cannot be encoded as requested
    class barcode_error : public exception
    {
    public:
      barcode_error (const std::string& message
                     = "barcode error")
        : exception (message)
      {}
    };

    class not_a_number : public barcode_error
    {
    public:
      not_a_number (const std::string& message
                    = "barcode text is not a number")
        : barcode_error (message)
      {}
    };

    class invalid_length : public barcode_error
    {
    public:
      invalid_length (const std::string& message
                      = "barcode text has invalid length")
        : barcode_error (message)
      {}
    };

  } // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_exception_hpp_ */
