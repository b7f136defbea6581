//  getter.hpp -- fixed size reply device information queries
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

#ifndef drivers_escpos_getter_hpp_
#define drivers_escpos_getter_hpp_

#include <cstring>

#include <locale>
#include <string>

#include <boost/throw_exception.hpp>

#include <insatsu/connexion.hpp>
#include <insatsu/log.hpp>

#include "buffer.hpp"
#include "command.hpp"
#include "exception.hpp"

namespace insatsu {
namespace _drv_ {
  namespace escpos
  {
    //!  Fixed size reply device information queries.
    /*!  Several vendor extensions let one read maintenance counters
         and identification strings from the printer.  They all send
         a short command and get a reply of a (compile-time) fixed
         size back.  This template caters to all of these.

         Replies are not validated.  Their content is device specific
         and the printer pads them with NUL or space characters.
     */
    template <streamsize size>
    class getter
    {
    public:
      virtual ~getter (void) {}

      void
      operator>> (connexion& cnx)
      {
        streamsize n = cnx.send (cmd_.data (), cmd_.size ());
        if (n != streamsize (cmd_.size ()))
          {
            log::error ("short write: %1% of %2% octets")
              % n
              % cmd_.size ();
            BOOST_THROW_EXCEPTION (timeout ());
          }

        traits::assign (blk_, size, 0);
        received_ = cnx.recv (blk_, size);
      }

      //!  The reply as a string, without trailing padding
      std::string
      value (void) const
      {
        return to_string (blk_, received_);
      }

      streamsize
      received (void) const
      {
        return received_;
      }

    protected:
      getter (const byte_buffer& cmd)
        : cmd_(cmd), received_(0)
      {
        traits::assign (blk_, size, 0);
      }

      byte_buffer cmd_;          //!<  command bytes
      byte blk_[size];           //!<  reply block
      streamsize received_;

      //!  Converts a sequence of \a sz reply bytes into a string.
      /*!  Trailing NUL and whitespace (as per "C" locale) is deemed
           irrelevant and will be removed.
       */
      static std::string
      to_string (const byte *p, streamsize sz)
      {
        std::string str (p, sz);

        while (!str.empty ()
               && ('\0' == str[str.size () - 1]
                   || isspace (str[str.size () - 1], std::locale::classic ())))
          {
            str.erase (str.size () - 1);
          }
        return str;
      }
    };

    class get_serial_number : public getter<16>
    {
    public:
      get_serial_number ()
        : getter<16> (make_command (FS, MAINTENANCE_SERIAL_NUMBER, UPPER_R))
      {}
    };

    class get_cut_count : public getter<16>
    {
    public:
      get_cut_count ()
        : getter<16> (make_command (GS, MAINTENANCE_CUT_COUNT))
      {}
    };

    class get_rom_version : public getter<4>
    {
    public:
      get_rom_version ()
        : getter<4> (make_command (GS, UPPER_I, 0x03))
      {}
    };

    class get_power_on_count : public getter<8>
    {
    public:
      get_power_on_count ()
        : getter<8> (make_command (GS, MAINTENANCE_POWER_COUNT))
      {}
    };

    class get_printed_length : public getter<8>
    {
    public:
      get_printed_length ()
        : getter<8> (make_command (GS, MAINTENANCE_PRINTED_LENGTH))
      {}
    };

    class get_remaining_paper : public getter<8>
    {
    public:
      get_remaining_paper ()
        : getter<8> (make_command (GS, MAINTENANCE_PAPER_REMAINING))
      {}
    };

    //!  Paper roll sensor status
    class get_paper_sensor : public getter<1>
    {
    public:
      get_paper_sensor ()
        : getter<1> (make_command (GS, LOWER_R, 0x01))
      {}

      //!  Whether paper is loaded
      /*!  The sensor reports a zero byte when paper is present.  No
           reply counts as no paper.
       */
      bool
      is_loaded (void) const
      {
        return (1 == received_ && 0x00 == blk_[0]);
      }
    };

    //!  Runs a query on the other end of a connexion.
    /*!  This binary operator provides the syntactic sugar that allows
         one to write succinct code like
         \code
         cnx << query1 << query2;
         \endcode
     */
    template <streamsize size>
    connexion&
    operator<< (connexion& cnx, getter<size>& query)
    {
      query >> cnx;
      return cnx;
    }

  } // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_getter_hpp_ */
