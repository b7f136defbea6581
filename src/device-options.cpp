//  device-options.cpp -- printer selection on the command-line
//  Copyright (C) 2012-2015  SEIKO EPSON CORPORATION
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
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include <insatsu/connexion.hpp>
#include <insatsu/log.hpp>

#include "connexions/usb.hpp"
#include "device-options.hpp"

namespace insatsu {

namespace po = boost::program_options;

using _cnx_::usb_device;
using _drv_::escpos::dialect;
using _drv_::escpos::printer;
using _drv_::escpos::text_encoder;

device_options::device_options ()
  : desc_("Device options")
{
  desc_
    .add_options ()
    ("usb", po::value< std::string > (),
     "USB printer to use, as hexadecimal VID:PID")
    ("device", po::value< std::string > (),
     "printer device node to use, such as /dev/usb/lp0")
    ("model", (po::value< std::string > ()
               -> default_value ("auto")),
     "printer dialect: auto, snbc, p3, epic or unknown.  Only USB"
     " printers can be recognized automatically.")
    ("debug", "log printer I/O in hexdump format")
    ;
}

const po::options_description&
device_options::description () const
{
  return desc_;
}

shared_ptr< printer >
device_options::open (const po::variables_map& vm,
                      const text_encoder& encoder) const
{
  bool debug (vm.count ("debug"));
  std::string model (vm["model"].as< std::string > ());
  connexion::ptr cnx;
  std::string usb_path;

  /**/ if (vm.count ("usb"))
    {
      usb_path = vm["usb"].as< std::string > ();
      cnx = connexion::create ("usb", usb_path, debug);
    }
  else if (vm.count ("device"))
    {
      cnx = connexion::create ("file", vm["device"].as< std::string > (),
                               debug);
    }
  else
    {
      BOOST_THROW_EXCEPTION
        (std::runtime_error ("no printer selected, use --usb or --device"));
    }

  return make_shared< printer > (cnx, dialect_(model, usb_path), encoder);
}

dialect::ptr
device_options::dialect_(const std::string& model,
                         const std::string& usb_path) const
{
  if ("auto" != boost::algorithm::to_lower_copy (model))
    return dialect::lookup (model);

  if (usb_path.empty ())
    {
      log::alert ("cannot recognize the printer model of a device node");
      return dialect::get (dialect::UNKNOWN);
    }

  uint16_t vid;
  uint16_t pid;
  _cnx_::parse_usb_path (usb_path, vid, pid);

  std::vector< usb_device > devices (usb_device::enumerate ());
  std::vector< usb_device >::const_iterator it;

  for (it = devices.begin (); devices.end () != it; ++it)
    {
      if (vid == it->vendor_id && pid == it->product_id)
        return dialect::infer (vid, pid, it->manufacturer);
    }

  return dialect::infer (vid, pid, std::string ());
}

} // namespace insatsu
