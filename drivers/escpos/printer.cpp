//  printer.cpp -- dialect aware ESC/POS printer sessions
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

#include <errno.h>
#include <time.h>

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/throw_exception.hpp>

#include <insatsu/log.hpp>

#include "command.hpp"
#include "exception.hpp"
#include "getter.hpp"
#include "printer.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

using boost::algorithm::to_upper_copy;

namespace {

inline byte_buffer bold_mode (bool on)     { return make_command (ESC, UPPER_E, on); }
inline byte_buffer underline_mode (int n)  { return make_command (ESC, MINUS, n); }

}       // namespace

void
sleep_for (double seconds)
{
  struct timespec t;
  t.tv_sec  = seconds;
  t.tv_nsec = 1e9 * (seconds - t.tv_sec);

  while (0 != nanosleep (&t, &t) && EINTR == errno)
    ;
}

printer::printer (connexion::ptr cnx, const dialect::ptr& model,
                  const text_encoder& encoder, const sleeper& settle)
  : cnx_ptr_(cnx), model_(model), encoder_(encoder), settle_(settle)
{
  log::brief (log::ESCPOS_DRIVER, "printing in %1% dialect")
    % model_->name ();
}

const dialect::ptr&
printer::model () const
{
  return model_;
}

connexion::ptr
printer::release ()
{
  connexion::ptr rv;
  rv.swap (cnx_ptr_);
  return rv;
}

streamsize
printer::write (const byte_buffer& bytes)
{
  return send_(bytes);
}

streamsize
printer::write_u8 (uint8_t n)
{
  byte_buffer buf;
  buf << byte (n);
  return send_(buf);
}

streamsize
printer::write_u16le (uint16_t n)
{
  byte b[2];
  from_uint16_t (b, n);
  return send_(byte_buffer (b, 2));
}

streamsize
printer::init ()
{
  return send_(make_command (ESC, AT_MARK));
}

streamsize
printer::enable ()
{
  return send_(model_->command (dialect::SELECT_PRINTER));
}

streamsize
printer::disable ()
{
  return send_(model_->command (dialect::DESELECT_PRINTER));
}

streamsize
printer::align (const std::string& token)
{
  std::string s (to_upper_copy (token));
  byte n;

  /**/ if ("LT" == s) n = 0;
  else if ("CT" == s) n = 1;
  else if ("RT" == s) n = 2;
  else
    BOOST_THROW_EXCEPTION
      (invalid_argument ("unknown alignment: '" + token + "'"));

  return send_(make_command (ESC, LOWER_A, n));
}

streamsize
printer::font (const std::string& token)
{
  std::string s (to_upper_copy (token));
  byte n;

  /**/ if ("A" == s) n = 0;
  else if ("B" == s) n = 1;
  else if ("C" == s) n = 2;
  else
    BOOST_THROW_EXCEPTION
      (invalid_argument ("unknown font: '" + token + "'"));

  return send_(make_command (ESC, UPPER_M, n));
}

streamsize
printer::style (const std::string& token)
{
  std::string s (to_upper_copy (token));
  byte_buffer buf;

  /**/ if ("B"   == s) buf << underline_mode (0) << bold_mode (true);
  else if ("U"   == s) buf << bold_mode (false) << underline_mode (1);
  else if ("U2"  == s) buf << bold_mode (false) << underline_mode (2);
  else if ("BU"  == s) buf << bold_mode (true) << underline_mode (1);
  else if ("BU2" == s) buf << bold_mode (true) << underline_mode (2);
  else                 buf << bold_mode (false) << underline_mode (0);

  return send_(buf);
}

streamsize
printer::underline (const std::string& token)
{
  std::string s (to_upper_copy (token));
  int n = 0;

  /**/ if ("ON"    == s) n = 1;
  else if ("THICK" == s) n = 2;

  return send_(underline_mode (n));
}

streamsize
printer::size (int width, int height)
{
  byte_buffer buf (make_command (ESC, EXCLAM, 0x00));

  if (2 == width)  buf << make_command (ESC, EXCLAM, 0x20);
  if (2 == height) buf << make_command (ESC, EXCLAM, 0x10);

  return send_(buf);
}

streamsize
printer::char_size (uint8_t n)
{
  return send_(make_command (GS, EXCLAM, n));
}

streamsize
printer::line_space (int n)
{
  if (0 <= n && n <= 0xff)
    return send_(make_command (ESC, 0x33, n));

  return send_(make_command (ESC, 0x32));
}

streamsize
printer::feed (int lines)
{
  return send_(byte_buffer (std::max (lines, 1), LF));
}

streamsize
printer::control (const std::string& token)
{
  std::string s (to_upper_copy (token));
  byte c;

  /**/ if ("LF" == s) c = LF;
  else if ("FF" == s) c = FF;
  else if ("CR" == s) c = CR;
  else if ("HT" == s) c = HT;
  else if ("VT" == s) c = VT;
  else
    {
      log::brief (log::ESCPOS_DRIVER, "unsupported control code: '%1%'")
        % token;
      BOOST_THROW_EXCEPTION
        (unsupported ("unsupported control code: '" + token + "'"));
    }

  return send_(byte_buffer (1, c));
}

//  Drawer kick pulses are 50 ms on and 500 ms off.
streamsize
printer::cashdraw (int pin)
{
  byte_buffer buf (make_command (ESC, LOWER_P, (5 == pin ? 0x01 : 0x00)));
  buf << byte (0x19) << byte ('\xfa');

  return send_(buf);
}

streamsize
printer::print (const std::string& content)
{
  return send_(encoder_(content));
}

streamsize
printer::println (const std::string& content)
{
  return print (content + "\n");
}

streamsize
printer::text (const std::string& content)
{
  return println (content);
}

streamsize
printer::hr (int width)
{
  byte_buffer buf (std::max (width, 1), BOX_HORIZONTAL);
  buf << LF;

  return send_(buf);
}

streamsize
printer::cut ()
{
  return cut_(dialect::CUT_PAPER);
}

streamsize
printer::partial_cut ()
{
  return cut_(dialect::CUT_PAPER_PARTIALLY);
}

streamsize
printer::barcode (const barcode_spec& spec, const std::string& text)
{
  barcode_encoder enc (model_);

  return send_(enc.encode (spec, text));
}

streamsize
printer::qrcode (const std::string& text, int version,
                 const std::string& level, int size)
{
  std::string s (to_upper_copy (level));
  byte l = UPPER_L;

  /**/ if ("M" == s) l = UPPER_M;
  else if ("Q" == s) l = UPPER_Q;
  else if ("H" == s) l = UPPER_H;

  byte len[2];
  from_uint16_t (len, text.size ());

  byte_buffer buf (make_command (GS, UPPER_Z, 0x02));
  buf << ESC << UPPER_Z
      << byte (version) << l << byte (size)
      << byte_buffer (len, 2);
  buf.append (text.data (), text.size ());

  return send_(buf);
}

streamsize
printer::raster (const bitmap& image, raster_mode mode)
{
  return send_(escpos::raster (image, mode));
}

streamsize
printer::bit_image (const bitmap& image, bit_image_density density)
{
  std::vector< byte_buffer > bands (escpos::bit_image (image, density));

  streamsize n = line_space (0);

  std::vector< byte_buffer >::const_iterator it;
  for (it = bands.begin (); bands.end () != it; ++it)
    {
      n += send_(*it);
    }
  return n;
}

status
printer::get_status ()
{
  status rv;

  switch (model_->status_protocol_type ())
    {
    case dialect::STATUS_BLOCK:
      {
        byte buf[status_block_size];
        streamsize n = 0;

        try
          {
            n = read_status (buf);
          }
        catch (const std::runtime_error& e)
          {
            log::error ("status read failed: %1%") % e.what ();
          }

        if (4 > n)
          rv.insert (status::COMMUNICATION);
        else
          rv = status::decode (buf, n, status::block_rules ());
      }
      break;
    case dialect::STATUS_POLLS:
      rv = poll_status_();
      break;
    case dialect::STATUS_UNDECODED:
      {
        if (model_->has_command (dialect::REQUEST_STATUS))
          {
            const byte_buffer& cmd
              (model_->command (dialect::REQUEST_STATUS));

            try
              {
                if (streamsize (cmd.size ())
                    != cnx_().send (cmd.data (), cmd.size ()))
                  rv.insert (status::COMMUNICATION);
              }
            catch (const std::runtime_error& e)
              {
                log::error ("status request failed: %1%") % e.what ();
                rv.insert (status::COMMUNICATION);
              }
          }

        log::brief (log::ESCPOS_DRIVER, "%1%: status not decoded")
          % model_->name ();
      }
      break;
    }

  log::trace (log::ESCPOS_DRIVER, "status: %1%") % rv;
  return rv;
}

//  Each of the four real-time polls is answered with a single byte.
//  A failing poll is recorded but does not stop the others.
status
printer::poll_status_()
{
  byte data[4] = { 0x00, 0x00, 0x00, 0x00 };
  bool failed = false;

  for (int i = 0; i < 4; ++i)
    {
      byte_buffer cmd (make_command (ESC, AT_MARK));
      cmd << make_command (DLE, EOT, i + 1);

      try
        {
          if (streamsize (cmd.size ())
              != cnx_().send (cmd.data (), cmd.size ()))
            failed = true;
        }
      catch (const std::runtime_error& e)
        {
          log::error ("status poll %1%: %2%") % (i + 1) % e.what ();
          failed = true;
        }

      try
        {
          if (1 != cnx_().recv (data + i, 1))
            failed = true;
        }
      catch (const std::runtime_error& e)
        {
          log::error ("status poll %1%: %2%") % (i + 1) % e.what ();
          failed = true;
        }
    }

  status rv (status::decode (data, sizeof (data), status::poll_rules ()));
  if (failed) rv.insert (status::COMMUNICATION);
  return rv;
}

streamsize
printer::enable_asb ()
{
  if (!model_->supports (dialect::STATUS_PUSH))
    {
      log::brief (log::ESCPOS_DRIVER, "%1%: no automatic status back")
        % model_->name ();
      BOOST_THROW_EXCEPTION
        (unsupported ("automatic status back not supported"));
    }
  return send_(make_command (GS, LOWER_A, 0x01));
}

streamsize
printer::read_status (byte *buf)
{
  return cnx_().recv (buf, status_block_size);
}

std::string
printer::get_serial_number ()
{
  if (!model_->supports (dialect::SERIAL_NUMBER))
    {
      log::brief (log::ESCPOS_DRIVER, "%1%: no serial number query")
        % model_->name ();
      BOOST_THROW_EXCEPTION
        (unsupported ("serial number query not supported"));
    }

  escpos::get_serial_number query;
  cnx_() << query;
  return query.value ();
}

std::string
printer::get_cut_count ()
{
  escpos::get_cut_count query;
  cnx_() << query;
  return query.value ();
}

std::string
printer::get_rom_version ()
{
  escpos::get_rom_version query;
  cnx_() << query;
  return query.value ();
}

std::string
printer::get_power_on_count ()
{
  escpos::get_power_on_count query;
  cnx_() << query;
  return query.value ();
}

std::string
printer::get_printed_length ()
{
  escpos::get_printed_length query;
  cnx_() << query;
  return query.value ();
}

std::string
printer::get_remaining_paper ()
{
  escpos::get_remaining_paper query;
  cnx_() << query;
  return query.value ();
}

bool
printer::is_paper_loaded ()
{
  get_paper_sensor query;
  cnx_() << query;
  return query.is_loaded ();
}

//  The limit is sent as a big-endian pair, unlike all other numeric
//  parameters.
streamsize
printer::set_paper_end_limit (int cm)
{
  cm = std::max (0, std::min (cm, 0xffff));

  byte_buffer buf (make_command (GS, MAINTENANCE_PAPER_END_LIMIT));
  buf << byte (cm / 256) << byte (cm % 256);

  return send_(buf);
}

connexion&
printer::cnx_()
{
  if (!cnx_ptr_)
    BOOST_THROW_EXCEPTION
      (std::logic_error ("printer connexion has been released"));

  return *cnx_ptr_;
}

streamsize
printer::send_(const byte_buffer& bytes)
{
  streamsize n = cnx_().send (bytes.data (), bytes.size ());

  if (n != streamsize (bytes.size ()))
    {
      log::error ("short write: %1% of %2% octets")
        % n
        % bytes.size ();
      BOOST_THROW_EXCEPTION (timeout ());
    }

  log::debug (log::ESCPOS_DRIVER, "wrote %1% octets") % n;
  return n;
}

streamsize
printer::cut_(dialect::operation op)
{
  streamsize n = send_(model_->command (op));

  double t = model_->settle_time ();
  if (0 < t)
    {
      log::trace (log::ESCPOS_DRIVER, "letting cutter settle for %1%s") % t;
      settle_(t);
    }
  return n;
}

status_monitor::status_monitor (printer& p)
  : printer_(p), last_(0x00)
{}

boost::optional< status >
status_monitor::poll ()
{
  byte buf[printer::status_block_size];

  streamsize n = printer_.read_status (buf);

  if (0 >= n || buf[0] == last_)
    return boost::none;

  last_ = buf[0];
  return status::decode (buf, n, status::block_rules ());
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
