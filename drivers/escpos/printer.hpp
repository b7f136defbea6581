//  printer.hpp -- dialect aware ESC/POS printer sessions
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

#ifndef drivers_escpos_printer_hpp_
#define drivers_escpos_printer_hpp_

#include <string>

#include <boost/optional.hpp>

#include <insatsu/connexion.hpp>
#include <insatsu/functional.hpp>

#include "barcode.hpp"
#include "buffer.hpp"
#include "dialect.hpp"
#include "raster.hpp"
#include "status.hpp"
#include "text-encoder.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

//! Blocks the calling thread for a number of \a seconds
void sleep_for (double seconds);

//! A printing session over a connexion
/*! The printer translates print operations into the command bytes of
 *  its dialect and sends them down the connexion straight away.  The
 *  only state kept is the dialect and the connexion.  The connexion
 *  is used exclusively by the session until release() hands it back.
 *
 *  Operations return the number of octets sent.  Anything short of
 *  the complete command results in a timeout exception.  Feature and
 *  argument problems are detected before anything is sent and result
 *  in unsupported and invalid_argument exceptions respectively.
 *  Transport failures propagate unchanged.
 *
 *  String tokens are matched case-insensitively.
 */
class printer
{
public:
  //! Called with the number of seconds a cut needs to settle
  typedef function< void (double) > sleeper;

  printer (connexion::ptr cnx, const dialect::ptr& model,
           const text_encoder& encoder = text_encoder (),
           const sleeper& settle = sleep_for);

  const dialect::ptr& model () const;

  //! Hands the connexion back, ending the session
  /*! Any subsequent operation throws a \c std::logic_error.
   */
  connexion::ptr release ();

  streamsize write (const byte_buffer& bytes);
  streamsize write_u8 (uint8_t n);
  streamsize write_u16le (uint16_t n);

  //! Resets print modes to their power-on defaults
  /*! This does not clear the printer's receive buffer.
   */
  streamsize init ();
  streamsize enable ();
  streamsize disable ();

  //! Selects \c LT, \c CT or \c RT alignment
  streamsize align (const std::string& token);
  //! Selects font \c A, \c B or \c C
  streamsize font (const std::string& token);
  //! Selects \c B, \c U, \c U2, \c BU or \c BU2 emphasis
  /*! Anything else turns both bold and underline off.
   */
  streamsize style (const std::string& token);
  //! Selects \c OFF, \c ON or \c THICK underlining, default \c OFF
  streamsize underline (const std::string& token);
  //! Selects double width and/or height if either is 2
  streamsize size (int width, int height);
  streamsize char_size (uint8_t n);
  //! Sets line spacing to \a n dots, or the default if out of range
  streamsize line_space (int n);
  streamsize feed (int lines);
  //! Sends one of the \c LF, \c FF, \c CR, \c HT or \c VT controls
  streamsize control (const std::string& token);
  //! Kicks the cash drawer connected to \a pin 2 or 5
  streamsize cashdraw (int pin);

  streamsize print (const std::string& content);
  streamsize println (const std::string& content);
  streamsize text (const std::string& content);
  //! Prints a horizontal rule of \a width characters
  streamsize hr (int width);

  streamsize cut ();
  streamsize partial_cut ();

  streamsize barcode (const barcode_spec& spec, const std::string& text);
  streamsize qrcode (const std::string& text, int version = 3,
                     const std::string& level = "L", int size = 3);
  streamsize raster (const bitmap& image, raster_mode mode = NORMAL);
  streamsize bit_image (const bitmap& image,
                        bit_image_density density = DOUBLE_24);

  //! Queries the printer for its current condition
  /*! Communication failures are reported as part of the status, not
   *  as exceptions.
   */
  status get_status ();

  //! Turns on automatic status back
  streamsize enable_asb ();
  //! Reads one status block of up to 16 bytes into \a buf
  streamsize read_status (byte *buf);

  std::string get_serial_number ();
  std::string get_cut_count ();
  std::string get_rom_version ();
  std::string get_power_on_count ();
  std::string get_printed_length ();
  std::string get_remaining_paper ();
  bool is_paper_loaded ();
  //! Sets the paper near end warning to \a cm centimetres of paper
  streamsize set_paper_end_limit (int cm);

  static const streamsize status_block_size = 16;

private:
  connexion& cnx_();
  streamsize send_(const byte_buffer& bytes);
  streamsize cut_(dialect::operation op);
  status poll_status_();

  connexion::ptr cnx_ptr_;
  dialect::ptr model_;
  text_encoder encoder_;
  sleeper settle_;
};

//! Watches the status a printer pushes by itself
/*! Automatic status back needs to be enabled on the printer first.
 */
class status_monitor
{
public:
  status_monitor (printer& p);

  //! Reads a status block and decodes it if it changed
  /*! Only the first byte is compared with the last block seen.  No
   *  status is returned when it did not change or nothing could be
   *  read.
   */
  boost::optional< status > poll ();

private:
  printer& printer_;
  byte last_;
};

} // namespace escpos
} // namespace _drv_
} // namespace insatsu

#endif  /* drivers_escpos_printer_hpp_ */
