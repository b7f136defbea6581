//  command.hpp -- chainable ESC/POS print commands
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

#ifndef drivers_escpos_command_hpp_
#define drivers_escpos_command_hpp_

#include <string>

#include <insatsu/cstdint.hpp>
#include <insatsu/functional.hpp>

#include "barcode.hpp"
#include "buffer.hpp"
#include "raster.hpp"

namespace insatsu {
namespace _drv_ {
  namespace escpos
  {
    class printer;

    //!  Converts a 16-bit unsigned integer into a 2-byte parameter.
    /*!  Numeric command parameters wider than a byte are sent least
         significant byte first.  This helper function encodes the
         value \a v into the two byte sequence expected by the printer.
         The bytes are stored starting at \a p.

         \sa to_uint16_t()
     */
    inline void
    from_uint16_t (byte *p, uint16_t v)
    {
      p[0] = 0xff &  v;
      p[1] = 0xff & (v >> 8);
    }

    //!  Converts a 2-byte sequence into a 16-bit unsigned integer.
    /*!  \sa from_uint16_t()
     */
    inline uint16_t
    to_uint16_t (const byte *p)
    {
      return (traits::to_int_type (p[0])
              | traits::to_int_type (p[1]) << 8);
    }

    //!  Assembles a short, fixed command sequence
    inline byte_buffer
    make_command (byte b1, byte b2)
    {
      byte_buffer rv;
      rv << b1 << b2;
      return rv;
    }

    inline byte_buffer
    make_command (byte b1, byte b2, byte b3)
    {
      byte_buffer rv;
      rv << b1 << b2 << b3;
      return rv;
    }

    //!  A deferred print operation.
    /*!  Commands capture a printer operation together with its
         arguments so that a whole receipt can be written as a single
         expression.  Running a command invokes the corresponding
         printer member function.

         The cmd namespace has named constructors for all operations
         that do not return data.
     */
    class command
    {
    public:
      typedef function< streamsize (printer&) > operation;

      command (const operation& op)
        : op_(op)
      {}

      //!  Runs the command on a printer.
      /*!  Returns the number of octets sent.  Exceptions thrown by the
           printer propagate unchanged.
       */
      streamsize
      operator() (printer& p) const
      {
        return op_(p);
      }

    private:
      operation op_;
    };

    namespace cmd
    {
      command init ();
      command enable ();
      command disable ();
      command align (const std::string& token);
      command font (const std::string& token);
      command style (const std::string& token);
      command underline (const std::string& token);
      command size (int width, int height);
      command char_size (uint8_t n);
      command line_space (int n);
      command feed (int lines);
      command control (const std::string& token);
      command cashdraw (int pin);
      command print (const std::string& text);
      command println (const std::string& text);
      command text (const std::string& text);
      command hr (int width);
      command cut ();
      command partial_cut ();
      command barcode (const barcode_spec& spec, const std::string& text);
      command qrcode (const std::string& text, int version = 3,
                      const std::string& level = "L", int size = 3);

      //  Only the bitmap view is captured.  Its pixels have to stay
      //  around until the command has run.
      command raster (const bitmap& image, raster_mode mode = NORMAL);
      command bit_image (const bitmap& image,
                         bit_image_density density = DOUBLE_24);

      command enable_asb ();
      command set_paper_end_limit (int cm);
    }

    //!  Runs a command on a printer.
    /*!  This binary operator provides the syntactic sugar that allows
         one to write highly succinct code that runs multiple commands
         in a sequence.  Because a reference to the printer is
         returned, you can do things like
         \code
         p << cmd::init () << cmd::align ("CT") << cmd::println ("Hi");
         \endcode
         The first command that throws ends the sequence.
     */
    printer& operator<< (printer& p, const command& cmd);

  } // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_command_hpp_ */
